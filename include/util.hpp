#pragma once
#include <string>
#include <cstdint>

namespace chunkcast {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
// Whole-string unsigned parse; rejects signs, trailing junk and overflow.
bool parse_uint(const std::string& s, uint64_t& out);
std::string trim_copy(const std::string& s);

} // namespace chunkcast
