#include <capture/capture_driver.hpp>
#include <capture/frame_name.hpp>
#include <capture/plan.hpp>
#include <common/config.hpp>
#include <encode/frame_gallery.hpp>
#include <encode/frame_writer.hpp>
#include <ingest/media_surface_factory.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_running(true);
static fc::CancelToken g_cancel(false);
static void handle_sigint(int) {
    g_running = false;
    g_cancel = true;
}

static void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [CONFIG] [OPTIONS]\n"
              << "Options:\n"
              << "  -i, --input PATH    Video file (overrides source.path)\n"
              << "  -s, --start SEC     Capture start time\n"
              << "  -r, --range SEC     Capture window, 1..10 (default: 2)\n"
              << "  -t, --step SEC      Step between frames, 0.1..0.5 (default: 0.5)\n"
              << "  -n, --name BASE     Base name for frame files\n"
              << "  -o, --out DIR       Output directory (default: frames)\n"
              << "  --no-write          Do not write frames to disk\n"
              << "  --serve             Serve the captured frames over HTTP\n"
              << "  -h, --help          Show this help\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    fc::AppConfig cfg;
    std::string cfg_path;
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && args[0].rfind("-", 0) != 0) {
        cfg_path = args[0];
        args.erase(args.begin());
    }

    try {
        if (!cfg_path.empty()) cfg = fc::load_config_yaml(cfg_path);

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            auto value = [&]() -> const std::string& {
                if (i + 1 >= args.size()) throw std::runtime_error("missing value for " + arg);
                return args[++i];
            };

            if (arg == "-i" || arg == "--input") {
                cfg.source.path = value();
            } else if (arg == "-s" || arg == "--start") {
                cfg.capture.start = std::stod(value());
            } else if (arg == "-r" || arg == "--range") {
                cfg.capture.range = std::stod(value());
            } else if (arg == "-t" || arg == "--step") {
                cfg.capture.step = std::stod(value());
            } else if (arg == "-n" || arg == "--name") {
                cfg.capture.base_name = value();
            } else if (arg == "-o" || arg == "--out") {
                cfg.output.dir = value();
            } else if (arg == "--no-write") {
                cfg.output.write_files = false;
            } else if (arg == "--serve") {
                cfg.gallery.enabled = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        fc::validate_config(cfg);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    auto surface = fc::make_media_surface(cfg.source);
    if (!surface->open(cfg.source.preroll_timeout_ms)) {
        std::cerr << "[app] Failed to open " << cfg.source.path << "\n";
        return 1;
    }

    const std::string base_name = cfg.capture.base_name.empty()
        ? fc::default_base_name(cfg.source.path)
        : cfg.capture.base_name;

    fc::CapturePlan plan;
    try {
        plan = fc::plan_timestamps(cfg.capture.start,
                                   cfg.capture.range,
                                   cfg.capture.step,
                                   surface->duration());
    } catch (const std::invalid_argument& e) {
        std::cerr << "[app] " << e.what() << "\n";
        return 1;
    }
    if (plan.empty()) {
        std::cerr << "[app] No timestamps in [" << cfg.capture.start << ", "
                  << cfg.capture.start + cfg.capture.range << "] fall inside the video ("
                  << surface->duration() << "s)\n";
        return 1;
    }
    std::cout << "[app] Capturing " << plan.size() << " frames from " << cfg.source.path
              << " starting at " << plan.front() << "s\n";

    fc::CaptureDriver::Options opt;
    opt.jpeg_quality = cfg.capture.jpeg_quality;
    opt.step_timeout_ms = cfg.capture.step_timeout_ms;
    fc::CaptureDriver driver(opt);

    std::vector<fc::CaptureOutcome> outcomes;
    try {
        outcomes = driver.capture(*surface, plan, base_name, &g_cancel);
    } catch (const fc::CaptureError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    size_t captured = 0;
    for (const auto& o : outcomes) {
        if (o.ok()) ++captured;
        else std::cerr << "[app] t=" << o.timestamp << "s: " << fc::to_string(o.failure) << "\n";
    }
    std::cout << "[app] Captured " << captured << "/" << outcomes.size() << " frames\n";

    if (cfg.output.write_files) {
        const size_t written = fc::write_frames(outcomes, cfg.output.dir);
        std::cout << "[app] Wrote " << written << " files to " << cfg.output.dir << "\n";
    }

    if (cfg.gallery.enabled && g_running) {
        fc::FrameGallery gallery(cfg.gallery.url, cfg.gallery.port);
        gallery.publish(surface->id(), outcomes);
        gallery.start();

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cerr << "Shutting down...\n";
        gallery.stop();
    }

    surface->close();
    return captured == 0 ? 1 : 0;
}
