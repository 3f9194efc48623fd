#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

namespace fc {
    class MediaSurface;

    // Fixed-size BGR buffer the current surface frame is drawn into.
    class FrameCanvas {
    public:
        FrameCanvas(int width, int height);

        // Reads the surface frame and scales it to the canvas size when the
        // decoded size differs. A canvas sized <= 0 keeps the decoded size.
        bool draw(MediaSurface& src);

        bool encode_jpeg(int quality, std::vector<uint8_t>& out) const;

        const cv::Mat& pixels() const { return buf_; }
        int width() const { return width_; }
        int height() const { return height_; }

    private:
        int width_;
        int height_;
        cv::Mat buf_;
    };
}
