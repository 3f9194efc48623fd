#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace fc {
    // Maps settle messages back to the seek that caused them. Only the most
    // recent kTracked seqnums are remembered; each one is forgotten once its
    // settle message has been attributed.
    class SeekTickets {
    public:
        static constexpr size_t kTracked = 8;

        void issued(uint32_t seqnum);

        // Ticket to report for a settle message carrying `seqnum`. Before any
        // element has echoed a seek seqnum, unknown seqnums are credited to the
        // latest seek; afterwards they are returned as-is, so the caller sees
        // a ticket it never asked for and drops it.
        uint32_t attribute(uint32_t seqnum);

        uint32_t latest() const { return latest_; }
        size_t tracked() const { return recent_.size(); }
        bool seqnum_forwarded() const { return forwarded_; }

        void clear();

    private:
        std::deque<uint32_t> recent_;
        uint32_t latest_ = 0;
        bool forwarded_ = false;
    };
}
