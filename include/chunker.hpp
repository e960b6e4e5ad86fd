#pragma once
#include <cstdint>
#include <cstddef>
#include <istream>
#include <vector>

namespace chunkcast {

class ChunkSizer {
public:
    virtual ~ChunkSizer() = default;
    // Size of the next read; always within the sizer's closed bounds.
    virtual std::size_t next() = 0;
};

// Uniform draw from [min_size, max_size] per call, backed by libsodium.
class RandomChunkSizer : public ChunkSizer {
public:
    RandomChunkSizer(std::size_t min_size, std::size_t max_size);
    std::size_t next() override;
    std::size_t min_size() const { return min_; }
    std::size_t max_size() const { return max_; }
private:
    std::size_t min_;
    std::size_t max_;
};

// Throws std::invalid_argument unless 0 < min <= max <= kMaxDatagram.
void validate_chunk_bounds(std::size_t min_size, std::size_t max_size);

// Sequential, non-overlapping reads of sizer-chosen length. The last chunk
// may be short; an exhausted stream yields no chunk at all.
class ChunkReader {
public:
    ChunkReader(std::istream& in, ChunkSizer& sizer) : in_(in), sizer_(sizer) {}
    // False once the stream is exhausted or broken; see failed().
    bool next(std::vector<uint8_t>& out);
    bool failed() const { return failed_; }
    uint64_t bytes_read() const { return total_; }
private:
    std::istream& in_;
    ChunkSizer& sizer_;
    uint64_t total_{0};
    bool failed_{false};
};

} // namespace chunkcast
