#include <common/config.hpp>
#include <cmath>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fc {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static SourceConfig parse_source_config(const YAML::Node& s) {
        SourceConfig c;
        if (!s) return c;
        c.path = get_str(s, "path", c.path);
        c.id = get_str(s, "id", c.id);
        c.accurate_seek = get_bool(s, "accurate_seek", c.accurate_seek);
        c.preroll_timeout_ms = get_int(s, "preroll_timeout_ms", c.preroll_timeout_ms);
        return c;
    }

    static CaptureConfig parse_capture_config(const YAML::Node& cc) {
        CaptureConfig c;
        if (!cc) return c;
        c.start = get_double(cc, "start", c.start);
        c.range = get_double(cc, "range", c.range);
        c.step = get_double(cc, "step", c.step);
        c.base_name = get_str(cc, "base_name", c.base_name);
        c.jpeg_quality = get_int(cc, "jpeg_quality", c.jpeg_quality);
        c.step_timeout_ms = get_int(cc, "step_timeout_ms", c.step_timeout_ms);
        return c;
    }

    static OutputConfig parse_output_config(const YAML::Node& o) {
        OutputConfig c;
        if (!o) return c;
        c.dir = get_str(o, "dir", c.dir);
        c.write_files = get_bool(o, "write_files", c.write_files);
        return c;
    }

    static ServerConfig parse_server_config(const YAML::Node& srv) {
        ServerConfig c;
        if (!srv) return c;
        c.enabled = get_bool(srv, "enabled", c.enabled);
        c.url = get_str(srv, "host", c.url);
        c.port = get_int(srv, "port", c.port);
        return c;
    }

    void validate_capture_config(const CaptureConfig& c) {
        if (!std::isfinite(c.start) || !std::isfinite(c.range) || !std::isfinite(c.step)) {
            throw std::runtime_error("[Config] capture.start, range and step must be finite numbers");
        }
        if (c.range < kMinRangeSec || c.range > kMaxRangeSec) {
            throw std::runtime_error("[Config] capture.range must be within ["
                                     + std::to_string(kMinRangeSec) + ", "
                                     + std::to_string(kMaxRangeSec) + "] seconds");
        }
        if (c.step < kMinStepSec || c.step > kMaxStepSec) {
            throw std::runtime_error("[Config] capture.step must be within ["
                                     + std::to_string(kMinStepSec) + ", "
                                     + std::to_string(kMaxStepSec) + "] seconds");
        }
        if (c.jpeg_quality < 1 || c.jpeg_quality > 100) {
            throw std::runtime_error("[Config] capture.jpeg_quality must be within [1, 100]");
        }
        if (c.step_timeout_ms < 0) {
            throw std::runtime_error("[Config] capture.step_timeout_ms must be >= 0");
        }
    }

    void validate_config(const AppConfig& cfg) {
        if (cfg.source.path.empty()) {
            throw std::runtime_error("[Config] source.path is required!");
        }
        if (cfg.source.preroll_timeout_ms <= 0) {
            throw std::runtime_error("[Config] source.preroll_timeout_ms must be > 0");
        }
        validate_capture_config(cfg.capture);
        if (cfg.output.write_files && cfg.output.dir.empty()) {
            throw std::runtime_error("[Config] output.dir is empty but output.write_files is set");
        }
        if (cfg.gallery.enabled && (cfg.gallery.port < 1 || cfg.gallery.port > 65535)) {
            throw std::runtime_error("[Config] gallery.port " + std::to_string(cfg.gallery.port)
                                     + " is out of range!");
        }
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.source = parse_source_config(root["source"]);
        cfg.capture = parse_capture_config(root["capture"]);
        cfg.output = parse_output_config(root["output"]);
        cfg.gallery = parse_server_config(root["gallery"]);

        validate_config(cfg);
        return cfg;
    }
}
