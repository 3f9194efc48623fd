#include <capture/frame_canvas.hpp>
#include <common/resize.hpp>
#include <ingest/media_surface.hpp>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <iostream>

namespace fc {
    FrameCanvas::FrameCanvas(int width, int height)
        : width_(width), height_(height) {}

    bool FrameCanvas::draw(MediaSurface& src) {
        buf_.release();

        cv::Mat frame;
        if (!src.read_frame(frame) || frame.empty()) return false;
        if (frame.type() != CV_8UC3) {
            std::cerr << "[Canvas](draw) unexpected frame type " << frame.type()
                      << " from " << src.id() << "\n";
            return false;
        }

        buf_ = resize_frame(frame, width_, height_);
        return !buf_.empty();
    }

    bool FrameCanvas::encode_jpeg(int quality, std::vector<uint8_t>& out) const {
        out.clear();
        if (buf_.empty()) return false;

        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)};
        try {
            if (!cv::imencode(".jpg", buf_, out, params)) return false;
        } catch (const cv::Exception& e) {
            std::cerr << "[Canvas](encode_jpeg) imencode failed: " << e.what() << "\n";
            out.clear();
            return false;
        }
        return !out.empty();
    }
}
