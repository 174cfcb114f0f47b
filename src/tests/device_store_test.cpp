#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include "core/error.hpp"
#include "store/device_store.hpp"
#include "test_utils.hpp"

using namespace pasteall;
using namespace pasteall::store;

class DeviceStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FileDeviceStore> store;

  void SetUp() override {
    test::init_logging();
    test_dir = test::make_temp_dir("device_store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<FileDeviceStore>(test_dir.string());
  }

  void TearDown() override {
    if (store) {
      store->clear();
      store.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  static core::DeviceInfo make_device(const std::string& id) {
    core::DeviceInfo device;
    device.id = id;
    device.name = "name-" + id;
    device.device_type = core::DeviceType::Mobile;
    device.public_key = "cGs=";
    device.ip_address = "192.168.1.20";
    device.pairing_status = core::PairingStatus::Paired;
    device.trusted = true;
    device.pairing_port = 45680;
    return device;
  }
};

TEST_F(DeviceStoreTest, SaveAndLoadDevice) {
  store->save_device(make_device("phone"));

  auto loaded = store->get_device("phone");
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded->name, "name-phone");
  EXPECT_EQ(loaded->device_type, core::DeviceType::Mobile);
  EXPECT_EQ(loaded->ip_address, "192.168.1.20");
  EXPECT_EQ(loaded->pairing_status, core::PairingStatus::Paired);
  EXPECT_TRUE(loaded->trusted);
  EXPECT_EQ(loaded->pairing_port, 45680);

  EXPECT_FALSE(store->get_device("missing"));
}

TEST_F(DeviceStoreTest, SaveOverwrites) {
  auto device = make_device("phone");
  store->save_device(device);
  device.name = "renamed";
  store->save_device(device);

  EXPECT_EQ(store->get_device("phone")->name, "renamed");
  EXPECT_EQ(store->get_all_devices().size(), 1u);
}

TEST_F(DeviceStoreTest, ListAndDelete) {
  store->save_device(make_device("a"));
  store->save_device(make_device("b"));
  store->save_shared_key("a", {1, 2, 3});
  EXPECT_EQ(store->get_all_devices().size(), 2u);

  EXPECT_TRUE(store->delete_device("a"));
  EXPECT_FALSE(store->get_device("a"));
  EXPECT_FALSE(store->get_shared_key("a"));
  EXPECT_FALSE(store->delete_device("a"));
  EXPECT_EQ(store->get_all_devices().size(), 1u);
}

TEST_F(DeviceStoreTest, SharedKeyMaterial) {
  const Bytes key(32, 0xAB);
  store->save_shared_key("peer", key);
  auto loaded = store->get_shared_key("peer");
  ASSERT_TRUE(loaded);
  EXPECT_EQ(*loaded, key);
}

TEST_F(DeviceStoreTest, RecordsLiveUnderHashedPaths) {
  store->save_device(make_device("phone"));

  std::size_t files = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir / "devices")) {
    if (entry.is_regular_file()) {
      ++files;
      // devices/xx/yy/zz/rest
      const auto relative = std::filesystem::relative(entry.path(), test_dir / "devices");
      EXPECT_EQ(std::distance(relative.begin(), relative.end()), 4);
      EXPECT_EQ(relative.filename().string().size(), 64u - 6u);
    }
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(DeviceStoreTest, IdentityRoundTrip) {
  EXPECT_FALSE(store->load_identity());

  StoredIdentity identity{"my-id", Bytes(32, 1), Bytes(32, 2)};
  store->save_identity(identity);

  auto loaded = store->load_identity();
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded->device_id, "my-id");
  EXPECT_EQ(loaded->key_agreement_secret, identity.key_agreement_secret);
  EXPECT_EQ(loaded->signing_seed, identity.signing_seed);

  const auto perms = std::filesystem::status(test_dir / "identity.json").permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_read, std::filesystem::perms::none);
}

TEST_F(DeviceStoreTest, CorruptRecordsAreReported) {
  store->save_device(make_device("phone"));
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir / "devices")) {
    if (entry.is_regular_file()) {
      std::ofstream(entry.path(), std::ios::trunc) << "{broken";
    }
  }
  EXPECT_THROW(store->get_device("phone"), core::StorageError);
  // Listing skips what it cannot read
  EXPECT_TRUE(store->get_all_devices().empty());
}
