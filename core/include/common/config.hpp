#pragma once

#include <string>

namespace fc {
    // Bounds enforced on user-facing capture settings.
    constexpr double kMinRangeSec = 1.0;
    constexpr double kMaxRangeSec = 10.0;
    constexpr double kMinStepSec = 0.1;
    constexpr double kMaxStepSec = 0.5;

    struct SourceConfig {
        std::string path;
        std::string id = "video";
        bool accurate_seek = true;
        int preroll_timeout_ms = 5000;
    };

    struct CaptureConfig {
        double start = 0.0;
        double range = 2.0;
        double step = 0.5;
        std::string base_name; // empty -> video file stem
        int jpeg_quality = 90;
        int step_timeout_ms = 5000;
    };

    struct OutputConfig {
        std::string dir = "frames";
        bool write_files = true;
    };

    struct ServerConfig {
        bool enabled = false;
        std::string url = "0.0.0.0";
        int port = 8080;
    };

    struct AppConfig {
        SourceConfig source;
        CaptureConfig capture;
        OutputConfig output;
        ServerConfig gallery;
    };

    AppConfig load_config_yaml(const std::string& path);

    // Throw std::runtime_error("[Config] ...") on the first invalid field.
    void validate_capture_config(const CaptureConfig& c);
    void validate_config(const AppConfig& cfg);
}
