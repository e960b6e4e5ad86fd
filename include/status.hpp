#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace chunkcast {

enum class StatusKind : uint8_t {
    Requested,
    Waiting,
    Started,
    Progress,
    PlaybackReady,
    Complete,
    NotFound,
    Timeout,
    TransportError,
    Rejected
};

const char* status_kind_name(StatusKind k);
bool is_terminal(StatusKind k);

struct StatusEvent {
    StatusKind kind{StatusKind::Progress};
    std::string filename;
    std::string text;
    uint64_t bytes{0};
};

// Hand-off from network threads to whatever context renders status. push()
// never waits on the consumer.
class StatusChannel {
public:
    void push(StatusEvent ev);
    bool try_pop(StatusEvent& out);
    // False on timeout, or once closed and drained.
    bool wait_pop(StatusEvent& out, std::chrono::milliseconds timeout);
    void close();
    bool closed() const;
    std::size_t size() const;
private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<StatusEvent> q_;
    bool closed_{false};
};

} // namespace chunkcast
