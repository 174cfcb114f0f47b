#include "discovery/device_table.hpp"
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace discovery {

core::DeviceInfo DeviceTable::upsert(const core::DeviceInfo& device) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device.id);
  if (it == devices_.end()) {
    BOOST_LOG_TRIVIAL(info) << "Device table: New device " << device.name << " (" << device.id << ")";
    return devices_.emplace(device.id, device).first->second;
  }

  it->second.update_from(device);
  BOOST_LOG_TRIVIAL(trace) << "Device table: Updated device " << device.id;
  return it->second;
}

bool DeviceTable::set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return false;
  }
  it->second.pairing_status = status;
  it->second.trusted = trusted;
  return true;
}

std::size_t DeviceTable::mark_stale(std::chrono::seconds max_age, std::uint64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t changed = 0;
  const auto age = static_cast<std::uint64_t>(max_age.count());
  for (auto& [id, device] : devices_) {
    if (device.online && device.last_seen + age < now) {
      device.online = false;
      ++changed;
      BOOST_LOG_TRIVIAL(debug) << "Device table: Device " << id << " went offline";
    }
  }
  return changed;
}

void DeviceTable::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_.clear();
}

std::vector<core::DeviceInfo> DeviceTable::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<core::DeviceInfo> result;
  result.reserve(devices_.size());
  for (const auto& [id, device] : devices_) {
    result.push_back(device);
  }
  return result;
}

std::optional<core::DeviceInfo> DeviceTable::find(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t DeviceTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

} // namespace discovery
} // namespace pasteall
