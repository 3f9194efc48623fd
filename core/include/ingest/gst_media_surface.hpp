#pragma once

#include <ingest/media_surface.hpp>
#include <ingest/seek_tickets.hpp>

#include <cstdint>
#include <string>

struct _GstElement;
using GstElement = _GstElement;
struct _GstBus;
using GstBus = _GstBus;

namespace fc {
    // Paused decode pipeline ending in an appsink. A flushing seek makes the
    // sink preroll the target frame; the pipeline's ASYNC_DONE message is the
    // settle signal and the sink's last sample is the rendered frame.
    class GstMediaSurface : public MediaSurface {
    public:
        GstMediaSurface(std::string pipeline, std::string id, std::string sink_name, bool accurate_seek);

        bool open(int preroll_timeout_ms = 5000);
        void close();

        const std::string& id() const override { return id_; }

        double position() const override;
        double duration() const override { return duration_s_; }
        int natural_width() const override { return width_; }
        int natural_height() const override { return height_; }
        bool paused() const override;

        uint64_t request_seek(double seconds) override;
        bool wait_settle(SettleSignal& out, int timeout_ms) override;
        bool read_frame(cv::Mat& out) override;

        ~GstMediaSurface() override;

    private:
        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;
        bool accurate_seek_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;
        GstBus* bus_ = nullptr;

        double duration_s_ = 0.0;
        double last_target_s_ = 0.0;
        int width_ = 0;
        int height_ = 0;

        SeekTickets tickets_;
    };
}
