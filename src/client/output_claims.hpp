#pragma once
#include <mutex>
#include <set>
#include <string>

namespace chunkcast {

// Output files currently being written by some ReceiveEngine in this process.
// Shared by every worker so two requests never truncate the same sink.
class OutputClaims {
public:
    // False when another session already holds `path`.
    bool claim(const std::string& path);
    void release(const std::string& path);
    bool held(const std::string& path) const;
    std::size_t size() const;

private:
    static std::string key(const std::string& path);

    mutable std::mutex mtx_;
    std::set<std::string> active_;
};

} // namespace chunkcast
