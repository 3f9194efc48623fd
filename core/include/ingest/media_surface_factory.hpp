#pragma once

#include <memory>

#include <common/config.hpp>
#include <ingest/gst_media_surface.hpp>

namespace fc {
    // Unopened surface decoding cfg.path into BGR frames.
    std::unique_ptr<GstMediaSurface> make_media_surface(const SourceConfig& cfg);
}
