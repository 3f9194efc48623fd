#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <capture/types.hpp>

namespace fc {
    // Serves the frames of the latest capture run over HTTP.
    class FrameGallery {
    public:
        FrameGallery(std::string host, int port);
        ~FrameGallery();

        FrameGallery(const FrameGallery&) = delete;
        FrameGallery& operator=(const FrameGallery&) = delete;

        // Start http server in bg thread
        bool start();
        void stop();

        // replace the published run; failed outcomes only count toward "failed"
        void publish(const std::string& source_id, const std::vector<CaptureOutcome>& outcomes);

        // JSON listing served at /frames
        std::string frames_json() const;

        // HTML grid served at /; names are percent-encoded in URLs and escaped in text
        std::string index_html() const;

        // attachment header value that cannot break out of the quoted filename
        static std::string content_disposition(const std::string& name);

        std::shared_ptr<const std::vector<uint8_t>> find_image(const std::string& name) const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::string host_;
        int port_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};

        mutable std::mutex frames_mtx_;
        std::string source_id_;
        std::vector<CapturedFrame> frames_;
        size_t failed_ = 0;
    };
}
