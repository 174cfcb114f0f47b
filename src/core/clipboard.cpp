#include "core/clipboard.hpp"
#include "core/error.hpp"
#include <nlohmann/json.hpp>

namespace pasteall::core {

namespace {

// Exhaustive visitor helper
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string describe(const ClipboardContent& content) {
  return std::visit(overloaded{
    [](const EmptyContent&) -> std::string {
      return "empty";
    },
    [](const TextContent& c) -> std::string {
      return "text (" + std::to_string(c.text.size()) + " bytes)";
    },
    [](const ImageContent& c) -> std::string {
      return "image (" + std::to_string(c.data.size()) + " bytes)";
    },
    [](const FilesContent& c) -> std::string {
      return "files (" + std::to_string(c.paths.size()) + " entries)";
    }
  }, content);
}

bool is_empty(const ClipboardContent& content) {
  return std::holds_alternative<EmptyContent>(content);
}

std::vector<std::uint8_t> encode_clipboard(const ClipboardContent& content) {
  nlohmann::json j = std::visit(overloaded{
    [](const EmptyContent&) {
      return nlohmann::json{{"kind", "empty"}};
    },
    [](const TextContent& c) {
      return nlohmann::json{{"kind", "text"}, {"text", c.text}};
    },
    [](const ImageContent& c) {
      return nlohmann::json{{"kind", "image"}, {"data", nlohmann::json::binary(c.data)}};
    },
    [](const FilesContent& c) {
      return nlohmann::json{{"kind", "files"}, {"paths", c.paths}};
    }
  }, content);
  return nlohmann::json::to_cbor(j);
}

ClipboardContent decode_clipboard(const std::vector<std::uint8_t>& bytes) {
  try {
    auto j = nlohmann::json::from_cbor(bytes);
    const auto kind = j.at("kind").get<std::string>();
    if (kind == "empty") {
      return EmptyContent{};
    }
    if (kind == "text") {
      return TextContent{j.at("text").get<std::string>()};
    }
    if (kind == "image") {
      const auto& binary = j.at("data").get_binary();
      return ImageContent{std::vector<std::uint8_t>(binary.begin(), binary.end())};
    }
    if (kind == "files") {
      return FilesContent{j.at("paths").get<std::vector<std::string>>()};
    }
    throw SerializationError("Unknown clipboard kind: " + kind);
  } catch (const nlohmann::json::exception& e) {
    throw SerializationError(std::string("Malformed clipboard payload: ") + e.what());
  }
}

} // namespace pasteall::core
