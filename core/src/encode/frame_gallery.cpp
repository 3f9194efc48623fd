#include <encode/frame_gallery.hpp>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>
#include <httplib.h>

namespace fc {
    struct FrameGallery::Impl {
        httplib::Server svr;
    };

    static std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    static std::string html_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                case '\'': out += "&#39;"; break;
                default: out.push_back(c);
            }
        }
        return out;
    }

    // RFC 3986 unreserved characters pass through, everything else is %XX
    static std::string url_encode(const std::string& s) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(s.size());
        for (unsigned char c : s) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('%');
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0x0F]);
            }
        }
        return out;
    }

    std::string FrameGallery::content_disposition(const std::string& name) {
        std::string fallback;
        fallback.reserve(name.size());
        for (unsigned char c : name) {
            if (c < 0x20 || c >= 0x7F || c == '"' || c == '\\') fallback.push_back('_');
            else fallback.push_back(static_cast<char>(c));
        }
        return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + url_encode(name);
    }

    FrameGallery::FrameGallery(std::string host, int port)
        : impl_(std::make_unique<Impl>()),
          host_(std::move(host)),
          port_(port) {}

    FrameGallery::~FrameGallery() {
        stop();
    }

    void FrameGallery::publish(const std::string& source_id, const std::vector<CaptureOutcome>& outcomes) {
        std::vector<CapturedFrame> frames;
        size_t failed = 0;
        frames.reserve(outcomes.size());
        for (const auto& o : outcomes) {
            if (o.ok()) frames.push_back(o.frame);
            else ++failed;
        }

        std::lock_guard lk(frames_mtx_);
        source_id_ = source_id;
        frames_ = std::move(frames);
        failed_ = failed;
    }

    std::string FrameGallery::frames_json() const {
        std::lock_guard lk(frames_mtx_);
        std::ostringstream oss;
        oss << "{\"source\":\"" << json_escape(source_id_) << "\","
            << "\"failed\":" << failed_ << ","
            << "\"frames\":[";
        for (size_t i = 0; i < frames_.size(); ++i) {
            const auto& f = frames_[i];
            oss << "{\"name\":\"" << json_escape(f.suggested_name) << "\","
                << "\"timestamp\":" << std::fixed << std::setprecision(6) << f.timestamp << ","
                << "\"bytes\":" << (f.image ? f.image->size() : 0) << "}";
            if (i + 1 < frames_.size()) oss << ",";
        }
        oss << "]}";
        return oss.str();
    }

    std::string FrameGallery::index_html() const {
        std::ostringstream html;
        html << "<!doctype html><html><head><title>framecap</title></head><body>";
        {
            std::lock_guard lk(frames_mtx_);
            html << "<h3>" << html_escape(source_id_) << ": " << frames_.size() << " frames";
            if (failed_ != 0) html << ", " << failed_ << " missing";
            html << "</h3><div>";
            for (const auto& f : frames_) {
                const std::string url = "/frames/" + url_encode(f.suggested_name);
                html << "<a href=\"" << url << "?download=1\">"
                     << "<img src=\"" << url << "\" width=\"240\" "
                     << "title=\"" << html_escape(f.suggested_name) << "\"></a>";
            }
        }
        html << "</div></body></html>";
        return html.str();
    }

    std::shared_ptr<const std::vector<uint8_t>> FrameGallery::find_image(const std::string& name) const {
        std::lock_guard lk(frames_mtx_);
        for (const auto& f : frames_) {
            if (f.suggested_name == name) return f.image;
        }
        return nullptr;
    }

    bool FrameGallery::start() {
        if (running_) return true;
        running_ = true;

        // /frames -> JSON listing of the latest run
        impl_->svr.Get("/frames", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(frames_json(), "application/json");
            res.set_header("Cache-Control", "no-cache");
        });

        // /frames/<name>[?download=1]
        impl_->svr.Get(R"(/frames/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (req.matches.size() < 2) { res.status = 400; return; }
            const std::string name = req.matches[1];

            auto jpeg = find_image(name);
            if (!jpeg || jpeg->empty()) { res.status = 404; return; }

            res.set_content(reinterpret_cast<const char *>(jpeg->data()), jpeg->size(), "image/jpeg");
            res.set_header("Cache-Control", "no-cache");
            if (req.has_param("download")) {
                res.set_header("Content-Disposition", content_disposition(name));
            }
        });

        // / -> thumbnail grid
        impl_->svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(index_html(), "text/html");
        });

        impl_->svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        server_thread_ = std::thread([this] {
            std::cout << "[Gallery] Frames: http://" << host_ << ":" << port_ << "/\n";
            if (!impl_->svr.listen(host_.c_str(), port_)) {
                std::cerr << "[Gallery] listen failed on " << host_ << ":" << port_ << "\n";
            }
        });

        return true;
    }

    void FrameGallery::stop() {
        if (!running_) return;
        running_ = false;

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
