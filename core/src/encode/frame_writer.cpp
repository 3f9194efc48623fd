#include <encode/frame_writer.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fc {
    size_t write_frames(const std::vector<CaptureOutcome>& outcomes, const std::string& dir) {
        namespace fs = std::filesystem;

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[Writer] cannot create " << dir << ": " << ec.message() << "\n";
            return 0;
        }

        size_t written = 0;
        for (const auto& o : outcomes) {
            if (!o.ok() || !o.frame.image) continue;

            const fs::path path = fs::path(dir) / o.frame.suggested_name;
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                std::cerr << "[Writer] failed to open " << path.string() << "\n";
                continue;
            }
            out.write(reinterpret_cast<const char*>(o.frame.image->data()),
                      static_cast<std::streamsize>(o.frame.image->size()));
            if (!out) {
                std::cerr << "[Writer] failed to write " << path.string() << "\n";
                continue;
            }
            ++written;
        }
        return written;
    }
}
