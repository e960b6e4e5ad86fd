#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chunkcast {

constexpr uint16_t kDefaultPort = 9999;

// Control sentinels share the datagram channel with file bytes. A datagram is
// a sentinel only when it is byte-for-byte equal to one of these.
constexpr std::string_view kReplyFound = "OK";
constexpr std::string_view kReplyNotFound = "ERROR";
constexpr std::string_view kTerminator = "EOF";

constexpr std::size_t kDefaultChunkMin = 1000;
constexpr std::size_t kDefaultChunkMax = 2000;

// Largest UDP payload over IPv4.
constexpr std::size_t kMaxDatagram = 65507;
// Request datagrams carry a filename only.
constexpr std::size_t kRequestBufferSize = 4096;

enum class ControlReply : uint8_t { Found = 1, NotFound = 2 };

// Anything that is not exactly the FOUND sentinel counts as NotFound,
// including garbage and a premature terminator.
ControlReply classify_control(const uint8_t* data, std::size_t len);
bool is_terminator(const uint8_t* data, std::size_t len);

std::vector<uint8_t> encode_request(const std::string& filename);
// UTF-8 bytes are passed through; surrounding whitespace is stripped.
std::string decode_request(const uint8_t* data, std::size_t len);

std::vector<uint8_t> sentinel_bytes(std::string_view s);

// Output sink name for a requested file: prefix + final path component.
std::string output_name_for(const std::string& prefix, const std::string& filename);

} // namespace chunkcast
