#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace pasteall {
namespace discovery {

// Invoked once for every accepted announcement, never under a lock
using DeviceCallback = std::function<void(const core::DeviceInfo&)>;

/**
 * Contract shared by every discovery transport.
 * start() on a running service logs and returns true; stop() is the only way
 * the background work ends and is safe to call repeatedly.
 */
class DiscoveryService {
public:
  virtual ~DiscoveryService() = default;

  // ---- INITIALIZATION AND TEARDOWN ----
  virtual bool start(DeviceCallback callback) = 0;
  virtual void stop() = 0;
  virtual bool is_running() const = 0;

  // ---- DEVICE TABLE ----
  virtual std::vector<core::DeviceInfo> get_devices() const = 0;
  virtual std::optional<core::DeviceInfo> get_device(const std::string& device_id) const = 0;
  // Records the outcome of a pairing so later announcements keep it
  virtual bool set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted) = 0;
  // Marks devices not heard from within max_age offline, returns how many changed
  virtual std::size_t mark_stale(std::chrono::seconds max_age) = 0;
};

} // namespace discovery
} // namespace pasteall
