#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include "protocol/event_contract.hpp"
#include "protocol/iteration_contract.hpp"

namespace protoforge::session {

// Append-only event log for one session. One writer appends; any number of
// readers replay from sequence 0 and then wait for live events until the
// stream is closed.
class Transcript {
public:
    // Assigns the next sequence number (and a timestamp when none is set).
    // Appends after close() are dropped and return the current size.
    std::uint64_t append(protocol::TranscriptEvent event);

    void close();
    bool closed() const;

    // Events with sequence >= from, without blocking.
    std::vector<protocol::TranscriptEvent> read_from(std::uint64_t from) const;

    // Blocks until an event with sequence >= from exists, the stream is
    // closed, or the timeout expires. Returns whatever is available then.
    std::vector<protocol::TranscriptEvent> wait_for(std::uint64_t from,
                                                    std::chrono::milliseconds timeout) const;

    std::vector<protocol::IterationRecord> records() const;
    std::optional<protocol::IterationRecord> last_record() const;
    std::size_t size() const;

private:
    std::vector<protocol::TranscriptEvent> copy_from(std::uint64_t from) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<protocol::TranscriptEvent> events_;
    bool closed_ = false;
};

std::int64_t now_unix_ms();

}  // namespace protoforge::session
