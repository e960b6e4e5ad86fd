#include "protocol.hpp"
#include "util.hpp"
#include <cstring>

namespace chunkcast {

static bool equals_sentinel(const uint8_t *data, std::size_t len,
                            std::string_view s) {
  return len == s.size() && (len == 0 || std::memcmp(data, s.data(), len) == 0);
}

ControlReply classify_control(const uint8_t *data, std::size_t len) {
  return equals_sentinel(data, len, kReplyFound) ? ControlReply::Found
                                                 : ControlReply::NotFound;
}

bool is_terminator(const uint8_t *data, std::size_t len) {
  return equals_sentinel(data, len, kTerminator);
}

std::vector<uint8_t> encode_request(const std::string &filename) {
  std::string t = trim_copy(filename);
  return std::vector<uint8_t>(t.begin(), t.end());
}

std::string decode_request(const uint8_t *data, std::size_t len) {
  return trim_copy(std::string(reinterpret_cast<const char *>(data), len));
}

std::vector<uint8_t> sentinel_bytes(std::string_view s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::string output_name_for(const std::string &prefix,
                            const std::string &filename) {
  auto pos = filename.find_last_of("/\\");
  std::string base =
      pos == std::string::npos ? filename : filename.substr(pos + 1);
  return prefix + base;
}

} // namespace chunkcast
