#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace fc {
    struct SettleSignal {
        uint64_t ticket = 0;
        bool ok = true;
        std::string error;
    };

    // A seekable video surface. The capture driver only repositions it and
    // reads the frame that is currently rendered.
    class MediaSurface {
    public:
        virtual ~MediaSurface() = default;

        virtual const std::string& id() const = 0;

        virtual double position() const = 0;
        virtual double duration() const = 0;
        virtual int natural_width() const = 0;
        virtual int natural_height() const = 0;
        virtual bool paused() const = 0;

        // Issues a reposition request and returns the ticket carried by the
        // settle signal that answers it. 0 means the request was not issued.
        virtual uint64_t request_seek(double seconds) = 0;

        // Pops the next settle signal, answering any request. Returns false on
        // timeout. timeout_ms < 0 waits forever.
        virtual bool wait_settle(SettleSignal& out, int timeout_ms) = 0;

        // Copies the currently rendered frame as BGR.
        virtual bool read_frame(cv::Mat& out) = 0;

        // Single-flight lease held by a capture run.
        bool try_begin_run() {
            bool expected = false;
            return run_active_.compare_exchange_strong(expected, true);
        }
        void end_run() { run_active_.store(false); }
        bool run_active() const { return run_active_.load(); }

    private:
        std::atomic<bool> run_active_{false};
    };
}
