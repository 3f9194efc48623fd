#pragma once

#include <atomic>
#include <string>
#include <utility>
#include <vector>

#include <capture/types.hpp>

namespace fc {
    class MediaSurface;
    class FrameCanvas;

    using CancelToken = std::atomic<bool>;

    class CaptureDriver {
    public:
        struct Options {
            int jpeg_quality = 90;
            int step_timeout_ms = 5000; // 0 waits forever for a settle signal
            std::string image_ext = "jpeg";
        };

        CaptureDriver() = default;
        explicit CaptureDriver(Options opt) : opt_(std::move(opt)) {}

        // Seeks the surface to each planned instant in order, one request in
        // flight at a time, and captures the settled frame. Returns exactly
        // plan.size() outcomes in plan order. The surface position is put back
        // to its pre-call value on every exit path.
        //
        // Throws CaptureError (NotPaused, Busy) before any seek is issued.
        std::vector<CaptureOutcome> capture(MediaSurface& surface,
                                            const CapturePlan& plan,
                                            const std::string& base_name,
                                            const CancelToken* cancel = nullptr) const;

        const Options& options() const { return opt_; }

    private:
        enum class Settle { Done, Failed, TimedOut, Cancelled };

        CaptureOutcome capture_one_(MediaSurface& surface,
                                    FrameCanvas& canvas,
                                    size_t index,
                                    double t,
                                    const std::string& base_name,
                                    const CancelToken* cancel) const;
        Settle await_settle_(MediaSurface& surface, uint64_t ticket, const CancelToken* cancel) const;
        void restore_position_(MediaSurface& surface, double position) const;

        friend class PipelineRun;

        Options opt_;
    };
}
