#include "network/framing.hpp"
#include "core/error.hpp"
#include <cstring>
#include <boost/endian/conversion.hpp>

namespace pasteall {
namespace network {

LengthPrefix encode_length(std::uint32_t length) {
  LengthPrefix prefix;
  const std::uint32_t big = boost::endian::native_to_big(length);
  std::memcpy(prefix.data(), &big, sizeof(big));
  return prefix;
}

std::uint32_t decode_length(const LengthPrefix& prefix) {
  std::uint32_t big = 0;
  std::memcpy(&big, prefix.data(), sizeof(big));
  return boost::endian::big_to_native(big);
}

void check_frame_length(std::uint32_t length, std::uint32_t max_size) {
  if (length == 0) {
    throw core::NetworkError("Empty frame");
  }
  if (length > max_size) {
    throw core::NetworkError("Frame of " + std::to_string(length) +
                             " bytes exceeds limit of " + std::to_string(max_size));
  }
}

std::vector<std::uint8_t> encode_frame(const std::string& body, std::uint32_t max_size) {
  if (body.size() > max_size) {
    throw core::NetworkError("Outgoing frame too large: " + std::to_string(body.size()) + " bytes");
  }
  const auto prefix = encode_length(static_cast<std::uint32_t>(body.size()));

  std::vector<std::uint8_t> frame;
  frame.reserve(prefix.size() + body.size());
  frame.insert(frame.end(), prefix.begin(), prefix.end());
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

} // namespace network
} // namespace pasteall
