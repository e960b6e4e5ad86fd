#include "util.hpp"
#include <cctype>
#include <limits>

namespace chunkcast {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  std::string h = s.substr(0, pos);
  // [::1]:9999
  if (h.size() >= 2 && h.front() == '[' && h.back() == ']')
    h = h.substr(1, h.size() - 2);
  uint64_t p = 0;
  if (!parse_uint(s.substr(pos + 1), p) || p > 65535)
    return false;
  host = h;
  port = (uint16_t)p;
  return true;
}

bool parse_uint(const std::string &s, uint64_t &out) {
  if (s.empty())
    return false;
  uint64_t v = 0;
  for (char c : s) {
    if (!std::isdigit((unsigned char)c))
      return false;
    uint64_t d = (uint64_t)(c - '0');
    if (v > (std::numeric_limits<uint64_t>::max() - d) / 10)
      return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

std::string trim_copy(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b]))
    b++;
  while (e > b && std::isspace((unsigned char)s[e - 1]))
    e--;
  return s.substr(b, e - b);
}

} // namespace chunkcast
