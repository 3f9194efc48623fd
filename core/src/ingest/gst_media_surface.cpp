#include <ingest/gst_media_surface.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>

#include <iostream>
#include <mutex>
#include <utility>

namespace fc {
    static bool sample_to_bgr(GstSample* sample, cv::Mat& out, int* w = nullptr, int* h = nullptr) {
        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) return false;

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);
        if (width <= 0 || height <= 0) return false;

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) return false;
        if (!map.data || map.size == 0) {
            gst_buffer_unmap(buffer, &map);
            return false;
        }

        GstVideoInfo vinfo;
        int stride = width * 3;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) stride = s0;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            return false;
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        out = tmp.clone();
        gst_buffer_unmap(buffer, &map);

        if (w) *w = width;
        if (h) *h = height;
        return true;
    }

    static GstSample* last_sample(GstElement* sink) {
        GstSample* sample = nullptr;
        g_object_get(G_OBJECT(sink), "last-sample", &sample, nullptr);
        return sample;
    }

    GstMediaSurface::GstMediaSurface(std::string pipeline, std::string id, std::string sink_name, bool accurate_seek)
        : pipeline_str_(std::move(pipeline)),
          id_(std::move(id)),
          sink_name_(std::move(sink_name)),
          accurate_seek_(accurate_seek) {}

    bool GstMediaSurface::open(int preroll_timeout_ms) {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (!pipeline_) {
            if (err) {
                std::cerr << "[GStreamer](open) parse_launch error: " << err->message << "\n";
                g_error_free(err);
            } else {
                std::cerr << "[GStreamer](open) parse_launch failed (unk error)\n";
            }
            return false;
        }
        if (err) {
            // recoverable parse warning, pipeline still usable
            std::cerr << "[GStreamer](open) parse_launch warning: " << err->message << "\n";
            g_error_free(err);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            std::cerr << "[GStreamer](open) appsink named " << sink_name_ << " not found.\n";
            close();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_max_buffers(appsink, 1);
        gst_app_sink_set_emit_signals(appsink, FALSE);
        g_object_set(G_OBJECT(sink_), "enable-last-sample", TRUE, nullptr);

        bus_ = gst_element_get_bus(pipeline_);

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PAUSED);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer](open) Failed to set pipeline to PAUSED\n";
            close();
            return false;
        }

        GstState state = GST_STATE_NULL;
        ret = gst_element_get_state(pipeline_, &state, nullptr,
                                    static_cast<GstClockTime>(preroll_timeout_ms) * GST_MSECOND);
        if (ret == GST_STATE_CHANGE_FAILURE || ret == GST_STATE_CHANGE_ASYNC || state != GST_STATE_PAUSED) {
            std::cerr << "[GStreamer](open) " << id_ << " did not preroll within "
                      << preroll_timeout_ms << "ms\n";
            close();
            return false;
        }

        // the preroll's own ASYNC_DONE answers no seek
        while (GstMessage* msg = gst_bus_pop(bus_)) gst_message_unref(msg);

        gint64 dur_ns = 0;
        if (gst_element_query_duration(pipeline_, GST_FORMAT_TIME, &dur_ns) && dur_ns > 0) {
            duration_s_ = static_cast<double>(dur_ns) / GST_SECOND;
        } else {
            std::cerr << "[GStreamer](open) " << id_ << " has unknown duration\n";
            duration_s_ = 0.0;
        }

        GstSample* sample = last_sample(sink_);
        cv::Mat first;
        const bool have_frame = sample && sample_to_bgr(sample, first, &width_, &height_);
        if (sample) gst_sample_unref(sample);
        if (!have_frame) {
            std::cerr << "[GStreamer](open) " << id_ << " prerolled without a readable frame\n";
            close();
            return false;
        }

        last_target_s_ = position();
        std::cout << "[GStreamer](open) " << id_ << ": " << width_ << "x" << height_
                  << ", " << duration_s_ << "s\n";
        return true;
    }

    double GstMediaSurface::position() const {
        if (!pipeline_) return last_target_s_;
        gint64 pos_ns = 0;
        if (!gst_element_query_position(pipeline_, GST_FORMAT_TIME, &pos_ns) || pos_ns < 0) {
            return last_target_s_;
        }
        return static_cast<double>(pos_ns) / GST_SECOND;
    }

    bool GstMediaSurface::paused() const {
        if (!pipeline_) return false;
        GstState state = GST_STATE_NULL;
        gst_element_get_state(pipeline_, &state, nullptr, 0);
        return state == GST_STATE_PAUSED;
    }

    uint64_t GstMediaSurface::request_seek(double seconds) {
        if (!pipeline_) return 0;

        const auto flags = static_cast<GstSeekFlags>(
            GST_SEEK_FLAG_FLUSH | (accurate_seek_ ? GST_SEEK_FLAG_ACCURATE : GST_SEEK_FLAG_KEY_UNIT));
        const gint64 target_ns = static_cast<gint64>(seconds * GST_SECOND);

        GstEvent* seek = gst_event_new_seek(1.0, GST_FORMAT_TIME, flags,
                                            GST_SEEK_TYPE_SET, target_ns,
                                            GST_SEEK_TYPE_NONE, GST_CLOCK_TIME_NONE);
        const uint32_t seqnum = gst_util_seqnum_next();
        gst_event_set_seqnum(seek, seqnum);

        if (!gst_element_send_event(pipeline_, seek)) {
            std::cerr << "[GStreamer](request_seek) " << id_ << " rejected seek to " << seconds << "s\n";
            return 0;
        }

        tickets_.issued(seqnum);
        last_target_s_ = seconds;
        return seqnum;
    }

    bool GstMediaSurface::wait_settle(SettleSignal& out, int timeout_ms) {
        if (!bus_) return false;

        const GstClockTime timeout = timeout_ms < 0
            ? GST_CLOCK_TIME_NONE
            : static_cast<GstClockTime>(timeout_ms) * GST_MSECOND;
        const auto types = static_cast<GstMessageType>(GST_MESSAGE_ASYNC_DONE | GST_MESSAGE_ERROR);

        GstMessage* msg = gst_bus_timed_pop_filtered(bus_, timeout, types);
        if (!msg) return false;

        out = SettleSignal{};
        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            out.ticket = tickets_.latest();
            out.ok = false;
            out.error = err ? err->message : "unknown pipeline error";
            if (err) g_error_free(err);
            if (dbg) g_free(dbg);
        } else {
            // elements that do not forward the seek seqnum post ASYNC_DONE with
            // a fresh one
            out.ticket = tickets_.attribute(gst_message_get_seqnum(msg));
        }
        gst_message_unref(msg);
        return true;
    }

    bool GstMediaSurface::read_frame(cv::Mat& out) {
        if (!sink_) return false;

        GstSample* sample = last_sample(sink_);
        if (!sample) return false;

        const bool ok = sample_to_bgr(sample, out);
        gst_sample_unref(sample);
        return ok;
    }

    void GstMediaSurface::close() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (bus_) {
                gst_object_unref(bus_);
                bus_ = nullptr;
            }
            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
        tickets_.clear();
    }

    GstMediaSurface::~GstMediaSurface() {
        close();
    }
}
