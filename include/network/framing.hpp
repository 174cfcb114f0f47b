#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pasteall {
namespace network {

// Every TCP message is a 4-byte big-endian length followed by that many bytes of JSON
constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
constexpr std::uint32_t MAX_FRAME_SIZE = 1024 * 1024;

using LengthPrefix = std::array<std::uint8_t, LENGTH_PREFIX_SIZE>;

LengthPrefix encode_length(std::uint32_t length);
std::uint32_t decode_length(const LengthPrefix& prefix);

// Prefix + body in one buffer, throws NetworkError when body exceeds max_size
std::vector<std::uint8_t> encode_frame(const std::string& body, std::uint32_t max_size = MAX_FRAME_SIZE);

// Throws NetworkError for zero or oversized lengths
void check_frame_length(std::uint32_t length, std::uint32_t max_size);

} // namespace network
} // namespace pasteall
