#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fc {
    // Ordered, strictly increasing capture instants in seconds.
    using CapturePlan = std::vector<double>;

    enum class CaptureFailure {
        None,
        SeekFailed,   // settle signal timed out or the surface reported an error
        DrawFailed,
        EncodeFailed,
        Cancelled
    };

    const char* to_string(CaptureFailure f);

    struct CapturedFrame {
        double timestamp = 0.0;
        std::shared_ptr<const std::vector<uint8_t>> image; // jpeg bytes
        std::string suggested_name;
    };

    struct CaptureOutcome {
        double timestamp = 0.0;
        CaptureFailure failure = CaptureFailure::None;
        CapturedFrame frame; // set only when ok()

        bool ok() const { return failure == CaptureFailure::None; }
    };

    // Whole-run abort. Raised before any seek is issued.
    class CaptureError : public std::runtime_error {
    public:
        enum class Code {
            NotPaused,
            Busy
        };

        CaptureError(Code code, const std::string& what)
            : std::runtime_error(what), code_(code) {}

        Code code() const { return code_; }
    private:
        Code code_;
    };
}
