#include "store/device_store.hpp"
#include "core/error.hpp"
#include "crypto/base64.hpp"
#include "crypto/crypto_error.hpp"
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace pasteall {
namespace store {

namespace {

const char* DEVICES_DIR = "devices";
const char* KEYS_DIR = "keys";
const char* IDENTITY_FILE = "identity.json";

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileDeviceStore::FileDeviceStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing device store at: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw core::StorageError("Cannot create store directory: " + std::string(e.what()));
  }
}


//==============================================
// DEVICES
//==============================================

void FileDeviceStore::save_device(const core::DeviceInfo& device) {
  if (device.id.empty()) {
    throw core::StorageError("Cannot save a device without id");
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Saving device " << device.id;
  const nlohmann::json j = device;
  write_file(resolve_key_path(DEVICES_DIR, device.id), j.dump(2));
}

std::optional<core::DeviceInfo> FileDeviceStore::get_device(const std::string& device_id) const {
  auto contents = read_file(resolve_key_path(DEVICES_DIR, device_id));
  if (!contents) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(*contents).get<core::DeviceInfo>();
  } catch (const nlohmann::json::exception& e) {
    throw core::StorageError("Corrupt device record for " + device_id + ": " + e.what());
  }
}

std::vector<core::DeviceInfo> FileDeviceStore::get_all_devices() const {
  std::vector<core::DeviceInfo> devices;
  const auto root = base_path_ / DEVICES_DIR;
  if (!std::filesystem::exists(root)) {
    return devices;
  }

  for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    if (!entry.is_regular_file() || entry.path().extension() == ".tmp") {
      continue;
    }
    auto contents = read_file(entry.path());
    if (!contents) {
      continue;
    }
    try {
      devices.push_back(nlohmann::json::parse(*contents).get<core::DeviceInfo>());
    } catch (const nlohmann::json::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Skipping corrupt record " << entry.path() << ": " << e.what();
    }
  }
  return devices;
}

bool FileDeviceStore::delete_device(const std::string& device_id) {
  BOOST_LOG_TRIVIAL(info) << "Store: Deleting device " << device_id;
  std::error_code ec;
  const bool removed_device = std::filesystem::remove(resolve_key_path(DEVICES_DIR, device_id), ec);
  const bool removed_key = std::filesystem::remove(resolve_key_path(KEYS_DIR, device_id), ec);
  return removed_device || removed_key;
}


//==============================================
// KEYS
//==============================================

void FileDeviceStore::save_shared_key(const std::string& device_id, const Bytes& key_data) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Saving key material for " << device_id;
  write_file(resolve_key_path(KEYS_DIR, device_id), crypto::base64_encode(key_data));
}

std::optional<Bytes> FileDeviceStore::get_shared_key(const std::string& device_id) const {
  auto contents = read_file(resolve_key_path(KEYS_DIR, device_id));
  if (!contents) {
    return std::nullopt;
  }
  try {
    return crypto::base64_decode(*contents);
  } catch (const crypto::EncodingError& e) {
    throw core::StorageError("Corrupt key record for " + device_id + ": " + e.what());
  }
}

void FileDeviceStore::save_identity(const StoredIdentity& identity) {
  const nlohmann::json j{
    {"device_id", identity.device_id},
    {"key_agreement_secret", crypto::base64_encode(identity.key_agreement_secret)},
    {"signing_seed", crypto::base64_encode(identity.signing_seed)}
  };
  const auto path = base_path_ / IDENTITY_FILE;
  write_file(path, j.dump(2));

  std::error_code ec;
  std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Cannot restrict identity file permissions: " << ec.message();
  }
}

std::optional<StoredIdentity> FileDeviceStore::load_identity() const {
  auto contents = read_file(base_path_ / IDENTITY_FILE);
  if (!contents) {
    return std::nullopt;
  }
  try {
    const auto j = nlohmann::json::parse(*contents);
    return StoredIdentity{
      j.at("device_id").get<std::string>(),
      crypto::base64_decode(j.at("key_agreement_secret").get<std::string>()),
      crypto::base64_decode(j.at("signing_seed").get<std::string>())
    };
  } catch (const nlohmann::json::exception& e) {
    throw core::StorageError(std::string("Corrupt identity file: ") + e.what());
  } catch (const crypto::EncodingError& e) {
    throw core::StorageError(std::string("Corrupt identity file: ") + e.what());
  }
}


//==============================================
// MAINTENANCE
//==============================================

void FileDeviceStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing store at: " << base_path_;
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}


//==============================================
// HASHED PATHS
//==============================================

std::string FileDeviceStore::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw core::StorageError("Failed to create hash context");
  }
  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx.get(), key.data(), key.size()) ||
      !EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw core::StorageError("Failed to hash key");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path FileDeviceStore::get_path_for_hash(const std::string& kind, const std::string& hash) const {
  std::filesystem::path path = base_path_ / kind;
  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  path /= hash.substr(6);
  return path;
}

std::filesystem::path FileDeviceStore::resolve_key_path(const std::string& kind, const std::string& key) const {
  return get_path_for_hash(kind, hash_key(key));
}


//==============================================
// FILE HELPERS
//==============================================

// Writes to a sibling .tmp file, then renames over the target
void FileDeviceStore::write_file(const std::filesystem::path& path, const std::string& contents) const {
  try {
    check_directory_exists(path.parent_path());
    auto tmp = path;
    tmp += ".tmp";
    {
      std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw core::StorageError("Failed to create file: " + tmp.string());
      }
      file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
      if (!file) {
        throw core::StorageError("Failed to write file: " + tmp.string());
      }
    }
    std::filesystem::rename(tmp, path);
  } catch (const std::filesystem::filesystem_error& e) {
    throw core::StorageError(std::string("File system error: ") + e.what());
  }
}

std::optional<std::string> FileDeviceStore::read_file(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw core::StorageError("Failed to open file: " + path.string());
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

void FileDeviceStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace pasteall
