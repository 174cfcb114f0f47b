#ifndef PASTEALL_CRYPTO_BASE64_HPP
#define PASTEALL_CRYPTO_BASE64_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace pasteall::crypto {

// Standard alphabet with padding, no line breaks
std::string base64_encode(const std::vector<std::uint8_t>& data);
std::string base64_encode(const std::string& data);

// Throws EncodingError on malformed input
std::vector<std::uint8_t> base64_decode(const std::string& encoded);

} // namespace pasteall::crypto

#endif // PASTEALL_CRYPTO_BASE64_HPP
