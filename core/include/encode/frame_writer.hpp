#pragma once

#include <string>
#include <vector>

#include <capture/types.hpp>

namespace fc {
    // Writes each captured frame to dir/<suggested_name>, creating dir.
    // Returns the number of files written; failed outcomes are skipped.
    size_t write_frames(const std::vector<CaptureOutcome>& outcomes, const std::string& dir);
}
