#pragma once
#include <atomic>
#include <ostream>
#include <thread>
#include "status.hpp"

namespace chunkcast {

// Renders StatusEvents on its own thread, away from the network threads.
class ConsoleSink {
public:
    ConsoleSink(StatusChannel& ch, std::ostream& out) : ch_(ch), out_(out) {}
    ~ConsoleSink();
    void start();
    // Closes the channel, prints whatever is still queued, joins.
    void stop();
    std::size_t printed() const { return printed_.load(); }

    static std::string format(const StatusEvent& ev);

private:
    void run();
    StatusChannel& ch_;
    std::ostream& out_;
    std::thread th_;
    std::atomic<std::size_t> printed_{0};
};

} // namespace chunkcast
