#include <capture/capture_driver.hpp>
#include <capture/plan.hpp>
#include <ingest/media_surface.hpp>
#include <ingest/seek_tickets.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    // In-memory surface: a seek moves the position immediately and queues
    // its settle signal, like a paused player that decodes synchronously.
    class MockSurface : public fc::MediaSurface {
    public:
        MockSurface(double duration, double position, int width = 64, int height = 48)
            : duration_(duration), position_(position), width_(width), height_(height) {}

        const std::string& id() const override { return id_; }
        double position() const override { return position_; }
        double duration() const override { return duration_; }
        int natural_width() const override { return width_; }
        int natural_height() const override { return height_; }
        bool paused() const override { return paused_; }

        uint64_t request_seek(double seconds) override {
            const uint64_t ticket = ++last_ticket_;
            seek_log.push_back(seconds);
            unsettled_.insert(ticket);
            max_pending = std::max(max_pending, unsettled_.size());
            position_ = seconds;

            if (duplicate_previous_settle && ticket > 1) {
                signals_.push_back({ticket - 1, true, ""});
            }
            if (!silent_at.count(seconds)) {
                fc::SettleSignal sig;
                sig.ticket = ticket;
                sig.ok = !error_at.count(seconds);
                if (!sig.ok) sig.error = "decode error";
                signals_.push_back(sig);
            }
            if (on_seek) on_seek(seek_log.size());
            return ticket;
        }

        bool wait_settle(fc::SettleSignal& out, int timeout_ms) override {
            if (signals_.empty()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms < 0 ? 10 : timeout_ms));
                return false;
            }
            out = signals_.front();
            signals_.pop_front();
            unsettled_.erase(out.ticket);
            return true;
        }

        bool read_frame(cv::Mat& out) override {
            read_log.push_back(position_);
            if (throw_at.count(position_)) throw std::runtime_error("surface torn down");
            if (draw_fail_at.count(position_)) return false;
            const int w = frame_w > 0 ? frame_w : width_;
            const int h = frame_h > 0 ? frame_h : height_;
            out = cv::Mat(h, w, CV_8UC3, cv::Scalar(40, 80, static_cast<int>(position_ * 20) % 256));
            return true;
        }

        void set_paused(bool p) { paused_ = p; }

        std::vector<double> seek_log;
        std::vector<double> read_log;
        size_t max_pending = 0;

        std::set<double> silent_at;
        std::set<double> error_at;
        std::set<double> draw_fail_at;
        std::set<double> throw_at;
        bool duplicate_previous_settle = false;
        int frame_w = 0;
        int frame_h = 0;
        std::function<void(size_t)> on_seek;

    private:
        std::string id_ = "mock";
        double duration_;
        double position_;
        int width_;
        int height_;
        bool paused_ = true;

        uint64_t last_ticket_ = 0;
        std::set<uint64_t> unsettled_;
        std::deque<fc::SettleSignal> signals_;
    };

    fc::CapturePlan default_plan() {
        return fc::plan_timestamps(2.0, 2.0, 0.5, 5.0);
    }

    size_t count_ok(const std::vector<fc::CaptureOutcome>& outcomes) {
        return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                                 [](const fc::CaptureOutcome& o) { return o.ok(); }));
    }

    void test_end_to_end_capture() {
        MockSurface surface(5.0, 2.0);
        const auto plan = default_plan();
        check(plan == std::vector<double>({2.0, 2.5, 3.0, 3.5, 4.0}), "scenario plan mismatch");

        fc::CaptureDriver driver;
        const auto outcomes = driver.capture(surface, plan, "clip");

        check(outcomes.size() == 5, "should return one outcome per timestamp");
        check(count_ok(outcomes) == 5, "every timestamp should be captured");
        for (size_t i = 0; i < outcomes.size() && i < plan.size(); ++i) {
            check(outcomes[i].timestamp == plan[i], "outcome " + std::to_string(i) + " out of plan order");
            check(outcomes[i].frame.timestamp == plan[i], "frame timestamp mismatch at " + std::to_string(i));
        }
        if (outcomes.size() == 5) {
            check(outcomes[0].frame.suggested_name == "clip_frame_000_t0002000ms.jpeg",
                  "first frame name mismatch: " + outcomes[0].frame.suggested_name);
            check(outcomes[4].frame.suggested_name == "clip_frame_004_t0004000ms.jpeg",
                  "last frame name mismatch: " + outcomes[4].frame.suggested_name);
        }

        check(surface.position() == 2.0, "position should be restored to 2.0");
        check(surface.max_pending == 1, "never more than one seek in flight");
        check(surface.seek_log.size() == 6, "five captures plus one restore seek");
        check(surface.read_log == plan, "each frame should be read at its own settled position");
        check(!surface.run_active(), "lease should be released after the run");
        check(surface.paused(), "capture should not change paused state");
    }

    void test_jpeg_matches_natural_size() {
        MockSurface surface(5.0, 0.0, 64, 48);
        surface.frame_w = 32;
        surface.frame_h = 24;

        fc::CaptureDriver driver;
        const auto outcomes = driver.capture(surface, {1.0}, "clip");
        check(outcomes.size() == 1 && outcomes[0].ok(), "single capture should succeed");
        if (outcomes.size() != 1 || !outcomes[0].ok()) return;

        const auto& bytes = *outcomes[0].frame.image;
        check(bytes.size() > 2 && bytes[0] == 0xFF && bytes[1] == 0xD8, "image should be a jpeg");

        const cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
        check(decoded.cols == 64 && decoded.rows == 48, "jpeg should be sized to the natural dimensions");
    }

    void test_not_paused_aborts_before_seeking() {
        MockSurface surface(5.0, 2.0);
        surface.set_paused(false);

        fc::CaptureDriver driver;
        bool threw = false;
        try {
            (void)driver.capture(surface, default_plan(), "clip");
        } catch (const fc::CaptureError& e) {
            threw = e.code() == fc::CaptureError::Code::NotPaused;
        }
        check(threw, "capture on a playing surface should raise NotPaused");
        check(surface.seek_log.empty(), "NotPaused should issue no seeks");
        check(!surface.run_active(), "NotPaused should not take the lease");
    }

    void test_busy_surface_is_rejected() {
        MockSurface surface(5.0, 2.0);
        check(surface.try_begin_run(), "first lease should be granted");

        fc::CaptureDriver driver;
        bool threw = false;
        try {
            (void)driver.capture(surface, default_plan(), "clip");
        } catch (const fc::CaptureError& e) {
            threw = e.code() == fc::CaptureError::Code::Busy;
        }
        check(threw, "second run on the same surface should raise Busy");
        check(surface.seek_log.empty(), "Busy should issue no seeks");
        check(surface.run_active(), "Busy should not release the other run's lease");
        surface.end_run();

        const auto outcomes = driver.capture(surface, default_plan(), "clip");
        check(outcomes.size() == 5, "surface should be usable once the other run ends");
    }

    void test_partial_failures_continue_the_walk() {
        MockSurface surface(5.0, 2.0);
        surface.draw_fail_at = {2.5};
        surface.error_at = {3.0};
        surface.throw_at = {3.5};

        fc::CaptureDriver driver;
        const auto outcomes = driver.capture(surface, default_plan(), "clip");

        check(outcomes.size() == 5, "failures should not drop outcomes");
        if (outcomes.size() == 5) {
            check(outcomes[0].ok(), "t=2.0 should be captured");
            check(outcomes[1].failure == fc::CaptureFailure::DrawFailed, "t=2.5 should be DrawFailed");
            check(outcomes[2].failure == fc::CaptureFailure::SeekFailed, "t=3.0 should be SeekFailed");
            check(outcomes[3].failure == fc::CaptureFailure::DrawFailed, "throwing read should be DrawFailed");
            check(outcomes[4].ok(), "t=4.0 should be captured after failures");
            check(outcomes[2].timestamp == 3.0, "failure should carry its timestamp");
            check(!outcomes[1].frame.image, "failed outcome should carry no image");
        }
        check(surface.position() == 2.0, "position should be restored after partial failure");
    }

    void test_stale_settle_signals_are_ignored() {
        MockSurface surface(5.0, 2.0);
        surface.duplicate_previous_settle = true;

        fc::CaptureDriver driver;
        const auto plan = default_plan();
        const auto outcomes = driver.capture(surface, plan, "clip");

        check(count_ok(outcomes) == 5, "stale signals should not fail captures");
        check(surface.read_log == plan, "frames should be read only after their own settle");
        check(surface.max_pending == 1, "stale signals should not open a second seek");
        check(surface.position() == 2.0, "position should be restored");
    }

    void test_seek_tickets_forwarded_seqnums() {
        fc::SeekTickets tickets;
        tickets.issued(10);
        tickets.issued(11);

        check(tickets.attribute(11) == 11, "matching seqnum should settle its own seek");
        check(tickets.seqnum_forwarded(), "a match should mark seqnums as forwarded");
        check(tickets.attribute(10) == 10, "late settle of a superseded seek keeps its own ticket");
        check(tickets.tracked() == 0, "settled seqnums should be forgotten");

        tickets.issued(12);
        check(tickets.attribute(999) == 999, "unknown seqnum should stay unknown once forwarding is seen");
        check(tickets.attribute(12) == 12, "the real settle should still match afterwards");
    }

    void test_seek_tickets_without_forwarding() {
        fc::SeekTickets tickets;
        tickets.issued(20);
        check(tickets.attribute(500) == 20, "foreign seqnum should be credited to the latest seek");
        check(tickets.attribute(501) == 501, "the latest seek should only be credited once");
        check(!tickets.seqnum_forwarded(), "fallback credit should not mark forwarding");

        tickets.issued(21);
        check(tickets.attribute(502) == 21, "next seek should get the fallback credit");
    }

    void test_seek_tickets_stay_bounded() {
        fc::SeekTickets tickets;
        for (uint32_t s = 1; s <= 1000; ++s) tickets.issued(s);
        check(tickets.tracked() == fc::SeekTickets::kTracked, "unsettled seqnums should be capped");
        check(tickets.latest() == 1000, "latest seqnum should be the last issued");
        check(tickets.attribute(1000) == 1000, "latest seek should still match");

        tickets.clear();
        check(tickets.tracked() == 0 && tickets.latest() == 0 && !tickets.seqnum_forwarded(),
              "clear should reset the ledger");
    }

    void test_missing_settle_times_out() {
        MockSurface surface(5.0, 2.0);
        surface.silent_at = {2.5};

        fc::CaptureDriver::Options opt;
        opt.step_timeout_ms = 50;
        fc::CaptureDriver driver(opt);

        const auto start = std::chrono::steady_clock::now();
        const auto outcomes = driver.capture(surface, default_plan(), "clip");
        const auto elapsed = std::chrono::steady_clock::now() - start;

        check(outcomes.size() == 5, "timeout should not drop outcomes");
        if (outcomes.size() == 5) {
            check(outcomes[1].failure == fc::CaptureFailure::SeekFailed, "stalled step should be SeekFailed");
            check(outcomes[2].ok() && outcomes[4].ok(), "walk should advance past the stalled step");
        }
        check(elapsed >= std::chrono::milliseconds(50), "stalled step should wait for the timeout");
        check(surface.position() == 2.0, "position should be restored after a timeout");
    }

    void test_cancel_between_steps() {
        MockSurface surface(5.0, 2.0);
        fc::CancelToken cancel(false);
        surface.on_seek = [&cancel](size_t n) {
            if (n == 2) cancel = true;
        };

        fc::CaptureDriver driver;
        const auto outcomes = driver.capture(surface, default_plan(), "clip", &cancel);

        check(outcomes.size() == 5, "cancellation should keep one outcome per timestamp");
        if (outcomes.size() == 5) {
            check(outcomes[0].ok(), "step before cancellation should be captured");
            for (size_t i = 1; i < 5; ++i) {
                check(outcomes[i].failure == fc::CaptureFailure::Cancelled,
                      "step " + std::to_string(i) + " should be Cancelled");
            }
        }
        check(surface.seek_log.size() == 3, "no seek after cancellation except the restore");
        check(surface.position() == 2.0, "position should be restored after cancellation");
        check(!surface.run_active(), "lease should be released after cancellation");
    }

    void test_empty_plan() {
        MockSurface surface(5.0, 1.0);
        fc::CaptureDriver driver;
        const auto outcomes = driver.capture(surface, {}, "clip");

        check(outcomes.empty(), "empty plan should give no outcomes");
        check(surface.seek_log.empty(), "empty plan should not seek");
        check(!surface.run_active(), "lease should be released for an empty plan");
    }
}

int main() {
    test_end_to_end_capture();
    test_jpeg_matches_natural_size();
    test_not_paused_aborts_before_seeking();
    test_busy_surface_is_rejected();
    test_partial_failures_continue_the_walk();
    test_stale_settle_signals_are_ignored();
    test_seek_tickets_forwarded_seqnums();
    test_seek_tickets_without_forwarding();
    test_seek_tickets_stay_bounded();
    test_missing_settle_times_out();
    test_cancel_between_steps();
    test_empty_plan();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all capture driver tests passed\n";
    return 0;
}
