#include <capture/capture_driver.hpp>
#include <capture/frame_canvas.hpp>
#include <capture/frame_name.hpp>
#include <ingest/media_surface.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fc {
    static constexpr int kSettlePollMs = 100;

    static bool is_cancelled(const CancelToken* cancel) {
        return cancel && cancel->load(std::memory_order_relaxed);
    }

    // State of one capture() call. Owns the surface lease and puts the
    // position back when it goes out of scope.
    class PipelineRun {
    public:
        PipelineRun(const CaptureDriver& driver, MediaSurface& surface, double restore_point)
            : driver_(driver), surface_(surface), restore_point_(restore_point) {}

        ~PipelineRun() {
            if (seeked_) {
                try {
                    driver_.restore_position_(surface_, restore_point_);
                } catch (const std::exception& e) {
                    std::cerr << "[Capture](run) restore failed on " << surface_.id()
                              << ": " << e.what() << "\n";
                }
            }
            surface_.end_run();
        }

        PipelineRun(const PipelineRun&) = delete;
        PipelineRun& operator=(const PipelineRun&) = delete;

        void mark_seeked() { seeked_ = true; }

        std::vector<CaptureOutcome> outcomes;

    private:
        const CaptureDriver& driver_;
        MediaSurface& surface_;
        double restore_point_;
        bool seeked_ = false;
    };

    std::vector<CaptureOutcome> CaptureDriver::capture(MediaSurface& surface,
                                                       const CapturePlan& plan,
                                                       const std::string& base_name,
                                                       const CancelToken* cancel) const {
        if (!surface.paused()) {
            throw CaptureError(CaptureError::Code::NotPaused,
                               "[Capture] surface " + surface.id() + " must be paused before capture");
        }
        const double restore_point = surface.position();
        if (!surface.try_begin_run()) {
            throw CaptureError(CaptureError::Code::Busy,
                               "[Capture] surface " + surface.id() + " already has a capture in flight");
        }

        PipelineRun run(*this, surface, restore_point);
        run.outcomes.reserve(plan.size());

        FrameCanvas canvas(surface.natural_width(), surface.natural_height());

        size_t failed = 0;
        for (size_t i = 0; i < plan.size(); ++i) {
            if (is_cancelled(cancel)) {
                std::cerr << "[Capture](capture) cancelled on " << surface.id()
                          << " at " << i << "/" << plan.size() << "\n";
                for (size_t j = i; j < plan.size(); ++j) {
                    CaptureOutcome c;
                    c.timestamp = plan[j];
                    c.failure = CaptureFailure::Cancelled;
                    run.outcomes.push_back(std::move(c));
                }
                failed += plan.size() - i;
                break;
            }

            run.mark_seeked();
            CaptureOutcome out = capture_one_(surface, canvas, i, plan[i], base_name, cancel);
            if (!out.ok()) ++failed;
            run.outcomes.push_back(std::move(out));
        }

        if (failed != 0) {
            std::cerr << "[Capture](capture) " << surface.id() << ": " << failed
                      << " of " << plan.size() << " timestamps not captured\n";
        }
        return std::move(run.outcomes);
    }

    CaptureOutcome CaptureDriver::capture_one_(MediaSurface& surface,
                                               FrameCanvas& canvas,
                                               size_t index,
                                               double t,
                                               const std::string& base_name,
                                               const CancelToken* cancel) const {
        CaptureOutcome out;
        out.timestamp = t;

        const uint64_t ticket = surface.request_seek(t);
        if (ticket == 0) {
            std::cerr << "[Capture](capture_one_) seek request rejected at t=" << t << "\n";
            out.failure = CaptureFailure::SeekFailed;
            return out;
        }

        switch (await_settle_(surface, ticket, cancel)) {
            case Settle::Done:
                break;
            case Settle::Cancelled:
                out.failure = CaptureFailure::Cancelled;
                return out;
            case Settle::TimedOut:
                std::cerr << "[Capture](capture_one_) no settle signal within "
                          << opt_.step_timeout_ms << "ms at t=" << t << "\n";
                out.failure = CaptureFailure::SeekFailed;
                return out;
            case Settle::Failed:
                out.failure = CaptureFailure::SeekFailed;
                return out;
        }

        bool drawn = false;
        try {
            drawn = canvas.draw(surface);
        } catch (const std::exception& e) {
            std::cerr << "[Capture](capture_one_) draw threw at t=" << t << ": " << e.what() << "\n";
        }
        if (!drawn) {
            std::cerr << "[Capture](capture_one_) could not read frame at t=" << t << "\n";
            out.failure = CaptureFailure::DrawFailed;
            return out;
        }

        std::vector<uint8_t> jpeg;
        if (!canvas.encode_jpeg(opt_.jpeg_quality, jpeg)) {
            std::cerr << "[Capture](capture_one_) jpeg encode failed at t=" << t << "\n";
            out.failure = CaptureFailure::EncodeFailed;
            return out;
        }

        out.frame.timestamp = t;
        out.frame.image = std::make_shared<const std::vector<uint8_t>>(std::move(jpeg));
        out.frame.suggested_name = frame_file_name(base_name, index, t, opt_.image_ext);
        return out;
    }

    CaptureDriver::Settle CaptureDriver::await_settle_(MediaSurface& surface,
                                                       uint64_t ticket,
                                                       const CancelToken* cancel) const {
        using clock = std::chrono::steady_clock;
        const bool bounded = opt_.step_timeout_ms > 0;
        const auto deadline = clock::now() + std::chrono::milliseconds(opt_.step_timeout_ms);

        while (true) {
            if (is_cancelled(cancel)) return Settle::Cancelled;

            int slice = kSettlePollMs;
            if (bounded) {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - clock::now()).count();
                if (left <= 0) return Settle::TimedOut;
                slice = static_cast<int>(std::min<long long>(slice, left));
            }

            SettleSignal sig;
            if (!surface.wait_settle(sig, slice)) continue;

            // answer to an earlier, abandoned request
            if (sig.ticket != ticket) continue;

            if (!sig.ok) {
                std::cerr << "[Capture](await_settle_) " << surface.id() << ": " << sig.error << "\n";
                return Settle::Failed;
            }
            return Settle::Done;
        }
    }

    void CaptureDriver::restore_position_(MediaSurface& surface, double position) const {
        const uint64_t ticket = surface.request_seek(position);
        if (ticket == 0) {
            std::cerr << "[Capture](restore) seek back to " << position << " rejected on "
                      << surface.id() << "\n";
            return;
        }
        if (await_settle_(surface, ticket, nullptr) != Settle::Done) {
            std::cerr << "[Capture](restore) " << surface.id() << " did not settle at "
                      << position << "\n";
        }
    }
}
