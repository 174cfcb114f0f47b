#include "crypto/base64.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/evp.h>

namespace pasteall::crypto {

namespace {

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string encode_raw(const unsigned char* data, std::size_t length) {
  if (length == 0) {
    return {};
  }
  std::string output(4 * ((length + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                                      data, static_cast<int>(length));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

} // namespace

std::string base64_encode(const std::vector<std::uint8_t>& data) {
  return encode_raw(data.data(), data.size());
}

std::string base64_encode(const std::string& data) {
  return encode_raw(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::vector<std::uint8_t> base64_decode(const std::string& encoded) {
  if (encoded.empty()) {
    return {};
  }
  if (encoded.size() % 4 != 0) {
    throw EncodingError("base64 length is not a multiple of 4");
  }

  // EVP_DecodeBlock accepts whitespace and does not report padding, so validate first
  std::size_t padding = 0;
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const char c = encoded[i];
    if (c == '=') {
      if (i < encoded.size() - 2) {
        throw EncodingError("misplaced base64 padding");
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      throw EncodingError("invalid base64 character");
    }
  }

  std::vector<std::uint8_t> output(3 * encoded.size() / 4);
  const int decoded = EVP_DecodeBlock(output.data(),
                                      reinterpret_cast<const unsigned char*>(encoded.data()),
                                      static_cast<int>(encoded.size()));
  if (decoded < 0) {
    throw EncodingError("base64 decoding failed");
  }
  output.resize(static_cast<std::size_t>(decoded) - padding);
  return output;
}

} // namespace pasteall::crypto
