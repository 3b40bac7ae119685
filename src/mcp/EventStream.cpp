#include "EventStream.hpp"
#include <spdlog/spdlog.h>
#include <atomic>

namespace mcpd {

namespace {

StreamHandle allocate_handle() {
    static std::atomic<StreamHandle> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

EventStream::EventStream(std::string session_id, size_t retention, size_t queue_limit)
    : handle_(allocate_handle()),
      session_id_(std::move(session_id)),
      retention_(retention),
      queue_limit_(queue_limit == 0 ? 1 : queue_limit) {
}

bool EventStream::push(const json& message) {
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) {
            return false;
        }

        StreamEvent event{next_cursor_++, message};
        if (retention_ > 0) {
            retained_.push_back(event);
            while (retained_.size() > retention_) {
                retained_.pop_front();
            }
        }

        if (attached_) {
            if (pending_.size() < queue_limit_) {
                pending_.push_back(std::move(event));
                queued = true;
            } else {
                ++dropped_;
            }
        }
    }

    if (queued) {
        cv_.notify_all();
    }
    return queued;
}

EventStream::Attachment EventStream::attach(std::optional<std::uint64_t> last_cursor) {
    Attachment attachment;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attachment.generation = ++generation_;
        attached_ = true;
        pending_.clear();

        if (last_cursor) {
            const std::uint64_t newest = next_cursor_ - 1;
            if (*last_cursor < newest) {
                const std::uint64_t oldest = retained_.empty() ? next_cursor_ : retained_.front().cursor;
                if (*last_cursor + 1 >= oldest) {
                    for (const auto& event : retained_) {
                        if (event.cursor > *last_cursor) {
                            pending_.push_back(event);
                        }
                    }
                    attachment.replayed = pending_.size();
                } else {
                    attachment.gap = true;
                }
            }
        }
    }

    // wake a superseded consumer
    cv_.notify_all();

    if (attachment.gap) {
        spdlog::warn("Stream {} resumed after cursor {} outside retention window, events lost",
                     handle_, *last_cursor);
    } else if (attachment.replayed > 0) {
        spdlog::debug("Stream {} replaying {} events after cursor {}", handle_, attachment.replayed, *last_cursor);
    }
    return attachment;
}

void EventStream::detach(std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        attached_ = false;
        pending_.clear();
    }
    cv_.notify_all();
}

EventStream::WaitStatus EventStream::next(std::uint64_t generation, std::chrono::milliseconds timeout,
                                          StreamEvent& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [&] {
        return closed_ || generation != generation_ || !pending_.empty() || finished_;
    };
    if (!cv_.wait_for(lock, timeout, ready)) {
        return WaitStatus::Timeout;
    }

    if (closed_ || generation != generation_) {
        return WaitStatus::Closed;
    }
    if (!pending_.empty()) {
        out = std::move(pending_.front());
        pending_.pop_front();
        return WaitStatus::Event;
    }
    return WaitStatus::Finished;
}

void EventStream::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        attached_ = false;
        pending_.clear();
    }
    cv_.notify_all();
    spdlog::debug("Closed stream {} of session {}", handle_, session_id_);
}

bool EventStream::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool EventStream::has_consumer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_ && !closed_;
}

std::uint64_t EventStream::last_cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_cursor_ - 1;
}

size_t EventStream::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::string EventStream::format(const StreamEvent& event) {
    return "id: " + std::to_string(event.cursor) + "\ndata: " + event.message.dump() + "\n\n";
}

} // namespace mcpd
