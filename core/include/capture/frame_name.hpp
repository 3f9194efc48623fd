#pragma once

#include <cstddef>
#include <string>

namespace fc {
    // <base>_frame_<index:03>_t<round(t*1000):07>ms.<ext>
    std::string frame_file_name(const std::string& base_name,
                                size_t index,
                                double timestamp,
                                const std::string& ext = "jpeg");

    // File stem of the video path, "video" when there is none.
    std::string default_base_name(const std::string& video_path);
}
