#ifndef PASTEALL_CORE_CLIPBOARD_HPP
#define PASTEALL_CORE_CLIPBOARD_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pasteall::core {

struct EmptyContent {
    bool operator==(const EmptyContent&) const { return true; }
};

struct TextContent {
    std::string text;
    bool operator==(const TextContent& other) const { return text == other.text; }
};

// Encoded image bytes (PNG or whatever the source platform produced)
struct ImageContent {
    std::vector<std::uint8_t> data;
    bool operator==(const ImageContent& other) const { return data == other.data; }
};

struct FilesContent {
    std::vector<std::string> paths;
    bool operator==(const FilesContent& other) const { return paths == other.paths; }
};

using ClipboardContent = std::variant<EmptyContent, TextContent, ImageContent, FilesContent>;

// One line summary for logs and the shell
std::string describe(const ClipboardContent& content);

bool is_empty(const ClipboardContent& content);

// CBOR encoding used as the plaintext of clipboard transfers
std::vector<std::uint8_t> encode_clipboard(const ClipboardContent& content);
// Throws SerializationError on malformed input
ClipboardContent decode_clipboard(const std::vector<std::uint8_t>& bytes);

} // namespace pasteall::core

#endif // PASTEALL_CORE_CLIPBOARD_HPP
