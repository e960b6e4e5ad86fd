#include "chunker.hpp"
#include "protocol.hpp"
#include <sodium.h>
#include <stdexcept>
#include <string>

namespace chunkcast {

void validate_chunk_bounds(std::size_t min_size, std::size_t max_size) {
  if (min_size == 0 || min_size > max_size || max_size > kMaxDatagram)
    throw std::invalid_argument("chunk bounds must satisfy 0 < min <= max <= " +
                                std::to_string(kMaxDatagram));
}

RandomChunkSizer::RandomChunkSizer(std::size_t min_size, std::size_t max_size)
    : min_(min_size), max_(max_size) {
  validate_chunk_bounds(min_, max_);
  // sodium_init returns 1 when already initialised
  if (sodium_init() < 0)
    throw std::runtime_error("libsodium initialisation failed");
}

std::size_t RandomChunkSizer::next() {
  uint32_t span = (uint32_t)(max_ - min_ + 1);
  return min_ + (std::size_t)randombytes_uniform(span);
}

bool ChunkReader::next(std::vector<uint8_t> &out) {
  out.clear();
  if (failed_)
    return false;
  if (in_.bad()) {
    failed_ = true;
    return false;
  }
  if (!in_.good())
    return false;
  std::size_t want = sizer_.next();
  out.resize(want);
  in_.read(reinterpret_cast<char *>(out.data()), (std::streamsize)want);
  std::size_t got = (std::size_t)in_.gcount();
  if (in_.bad()) {
    failed_ = true;
    out.clear();
    return false;
  }
  out.resize(got);
  total_ += got;
  return got > 0;
}

} // namespace chunkcast
