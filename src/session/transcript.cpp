#include "session/transcript.hpp"

#include <utility>

namespace protoforge::session {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::uint64_t Transcript::append(protocol::TranscriptEvent event) {
    std::uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return events_.size();
        }
        sequence = events_.size();
        event.sequence = sequence;
        if (event.timestamp_unix_ms == 0) {
            event.timestamp_unix_ms = now_unix_ms();
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
    return sequence;
}

void Transcript::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Transcript::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<protocol::TranscriptEvent> Transcript::copy_from(const std::uint64_t from) const {
    if (from >= events_.size()) {
        return {};
    }
    return std::vector<protocol::TranscriptEvent>(
        events_.begin() + static_cast<std::ptrdiff_t>(from), events_.end());
}

std::vector<protocol::TranscriptEvent> Transcript::read_from(const std::uint64_t from) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copy_from(from);
}

std::vector<protocol::TranscriptEvent> Transcript::wait_for(
    const std::uint64_t from, const std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]() { return closed_ || events_.size() > from; });
    return copy_from(from);
}

std::vector<protocol::IterationRecord> Transcript::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<protocol::IterationRecord> out;
    for (const auto& event : events_) {
        if (event.record.has_value()) {
            out.push_back(event.record.value());
        }
    }
    return out;
}

std::optional<protocol::IterationRecord> Transcript::last_record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->record.has_value()) {
            return it->record;
        }
    }
    return std::nullopt;
}

std::size_t Transcript::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace protoforge::session
