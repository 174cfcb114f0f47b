#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"

namespace pasteall {
namespace discovery {

// Thread-safe map of devices seen on the network, keyed by device id.
// Entries are never removed automatically.
class DeviceTable {
public:
  // ---- UPDATES ----
  // Inserts a new device or merges a fresh observation into the known one.
  // Returns the stored entry.
  core::DeviceInfo upsert(const core::DeviceInfo& device);
  bool set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted);
  // Marks devices silent for longer than max_age offline, returns how many changed
  std::size_t mark_stale(std::chrono::seconds max_age, std::uint64_t now);
  void clear();


  // ---- QUERIES ----
  std::vector<core::DeviceInfo> list() const;
  std::optional<core::DeviceInfo> find(const std::string& device_id) const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, core::DeviceInfo> devices_;
};

} // namespace discovery
} // namespace pasteall
