#include <ingest/media_surface_factory.hpp>

#include <stdexcept>
#include <string>

namespace fc {
    static std::string file_pipeline(const SourceConfig& c, const std::string& sink_name) {
        return "filesrc location=\"" + c.path + "\" ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=1 sync=false";
    }

    std::unique_ptr<GstMediaSurface> make_media_surface(const SourceConfig& cfg) {
        if (cfg.path.empty()) {
            throw std::runtime_error("source.path is empty in config");
        }
        const std::string sink_name = "sink_" + cfg.id;
        return std::make_unique<GstMediaSurface>(file_pipeline(cfg, sink_name), cfg.id, sink_name, cfg.accurate_seek);
    }
}
