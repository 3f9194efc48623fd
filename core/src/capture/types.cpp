#include <capture/types.hpp>

namespace fc {
    const char* to_string(CaptureFailure f) {
        switch (f) {
            case CaptureFailure::None: return "none";
            case CaptureFailure::SeekFailed: return "seek_failed";
            case CaptureFailure::DrawFailed: return "draw_failed";
            case CaptureFailure::EncodeFailed: return "encode_failed";
            case CaptureFailure::Cancelled: return "cancelled";
        }
        return "unknown";
    }
}
