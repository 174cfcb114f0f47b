#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace pasteall {
namespace store {

using Bytes = std::vector<std::uint8_t>;

struct StoredIdentity {
  std::string device_id;
  Bytes key_agreement_secret;
  Bytes signing_seed;
};

// Persistence the core relies on. Implementations throw core::StorageError.
class DeviceStore {
public:
  virtual ~DeviceStore() = default;

  virtual void save_device(const core::DeviceInfo& device) = 0;
  virtual std::optional<core::DeviceInfo> get_device(const std::string& device_id) const = 0;
  virtual std::vector<core::DeviceInfo> get_all_devices() const = 0;
  virtual bool delete_device(const std::string& device_id) = 0;

  // key_data is the remote public key the shared key was derived from
  virtual void save_shared_key(const std::string& device_id, const Bytes& key_data) = 0;
  virtual std::optional<Bytes> get_shared_key(const std::string& device_id) const = 0;

  virtual void save_identity(const StoredIdentity& identity) = 0;
  virtual std::optional<StoredIdentity> load_identity() const = 0;
};

/**
 * DeviceStore on the local file system.
 * Records live under hashed paths:
 * {base}/{kind}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
 */
class FileDeviceStore : public DeviceStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileDeviceStore(const std::string& base_path);


  // ---- DEVICES ----
  void save_device(const core::DeviceInfo& device) override;
  std::optional<core::DeviceInfo> get_device(const std::string& device_id) const override;
  std::vector<core::DeviceInfo> get_all_devices() const override;
  bool delete_device(const std::string& device_id) override;


  // ---- KEYS ----
  void save_shared_key(const std::string& device_id, const Bytes& key_data) override;
  std::optional<Bytes> get_shared_key(const std::string& device_id) const override;
  void save_identity(const StoredIdentity& identity) override;
  std::optional<StoredIdentity> load_identity() const override;


  // ---- MAINTENANCE ----
  // Removes all stored data and recreates the base directory
  void clear();
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // ---- HASHED PATHS ----
  // SHA-256 of the key as lowercase hex
  std::string hash_key(const std::string& key) const;
  std::filesystem::path get_path_for_hash(const std::string& kind, const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& kind, const std::string& key) const;


  // ---- FILE HELPERS ----
  void write_file(const std::filesystem::path& path, const std::string& contents) const;
  std::optional<std::string> read_file(const std::filesystem::path& path) const;
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace pasteall
