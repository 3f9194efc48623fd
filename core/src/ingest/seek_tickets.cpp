#include <ingest/seek_tickets.hpp>

#include <algorithm>

namespace fc {
    void SeekTickets::issued(uint32_t seqnum) {
        recent_.push_back(seqnum);
        while (recent_.size() > kTracked) recent_.pop_front();
        latest_ = seqnum;
    }

    uint32_t SeekTickets::attribute(uint32_t seqnum) {
        auto it = std::find(recent_.begin(), recent_.end(), seqnum);
        if (it != recent_.end()) {
            recent_.erase(it);
            forwarded_ = true;
            return seqnum;
        }
        if (forwarded_) return seqnum;

        // the latest seek settles only once
        auto last = std::find(recent_.begin(), recent_.end(), latest_);
        if (last == recent_.end()) return seqnum;
        recent_.erase(last);
        return latest_;
    }

    void SeekTickets::clear() {
        recent_.clear();
        latest_ = 0;
        forwarded_ = false;
    }
}
