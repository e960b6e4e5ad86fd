#include "output_claims.hpp"
#include <filesystem>

namespace chunkcast {

std::string OutputClaims::key(const std::string &path) {
  // "./a" and "a" are the same sink; lexical so a removed file keys the same
  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  if (ec)
    abs = path;
  return abs.lexically_normal().string();
}

bool OutputClaims::claim(const std::string &path) {
  auto k = key(path);
  std::lock_guard<std::mutex> lk(mtx_);
  return active_.insert(k).second;
}

void OutputClaims::release(const std::string &path) {
  auto k = key(path);
  std::lock_guard<std::mutex> lk(mtx_);
  active_.erase(k);
}

bool OutputClaims::held(const std::string &path) const {
  auto k = key(path);
  std::lock_guard<std::mutex> lk(mtx_);
  return active_.count(k) != 0;
}

std::size_t OutputClaims::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return active_.size();
}

} // namespace chunkcast
