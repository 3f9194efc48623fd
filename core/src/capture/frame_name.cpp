#include <capture/frame_name.hpp>

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fc {
    std::string frame_file_name(const std::string& base_name,
                                size_t index,
                                double timestamp,
                                const std::string& ext) {
        const long long ms = std::llround(timestamp * 1000.0);

        std::ostringstream oss;
        oss << base_name
            << "_frame_" << std::setw(3) << std::setfill('0') << index
            << "_t" << std::setw(7) << std::setfill('0') << ms
            << "ms." << ext;
        return oss.str();
    }

    std::string default_base_name(const std::string& video_path) {
        const std::string stem = std::filesystem::path(video_path).stem().string();
        return stem.empty() ? "video" : stem;
    }
}
