#include <gtest/gtest.h>
#include "discovery/device_table.hpp"
#include "test_utils.hpp"

using namespace pasteall;
using namespace pasteall::discovery;

class DeviceTableTest : public ::testing::Test {
protected:
  DeviceTable table;

  void SetUp() override {
    test::init_logging();
  }

  static core::DeviceInfo make_device(const std::string& id, const std::string& name) {
    core::DeviceInfo device;
    device.id = id;
    device.name = name;
    device.public_key = "key-" + name;
    device.ip_address = "10.0.0.1";
    device.set_online(true);
    return device;
  }
};

TEST_F(DeviceTableTest, InsertAndFind) {
  table.upsert(make_device("a", "alpha"));
  ASSERT_EQ(table.size(), 1u);

  auto found = table.find("a");
  ASSERT_TRUE(found);
  EXPECT_EQ(found->name, "alpha");
  EXPECT_FALSE(table.find("missing"));
}

TEST_F(DeviceTableTest, UpsertPreservesIdentityAndTrust) {
  table.upsert(make_device("a", "alpha"));
  ASSERT_TRUE(table.set_pairing_status("a", core::PairingStatus::Paired, true));

  auto fresher = make_device("a", "renamed");
  fresher.ip_address = "10.0.0.2";
  fresher.pairing_status = core::PairingStatus::Unpaired;
  fresher.trusted = false;
  const auto stored = table.upsert(fresher);

  EXPECT_EQ(stored.id, "a");
  EXPECT_EQ(stored.name, "renamed");
  EXPECT_EQ(stored.ip_address, "10.0.0.2");
  EXPECT_EQ(stored.pairing_status, core::PairingStatus::Paired);
  EXPECT_TRUE(stored.trusted);
  EXPECT_EQ(table.size(), 1u);
}

TEST_F(DeviceTableTest, SetPairingStatusOfUnknownDevice) {
  EXPECT_FALSE(table.set_pairing_status("ghost", core::PairingStatus::Paired, true));
}

TEST_F(DeviceTableTest, MarkStaleOnlyTouchesSilentDevices) {
  auto old_device = make_device("old", "old");
  old_device.last_seen = 1000;
  auto new_device = make_device("new", "new");
  new_device.last_seen = 1095;
  table.upsert(old_device);
  table.upsert(new_device);

  EXPECT_EQ(table.mark_stale(std::chrono::seconds(30), 1100), 1u);
  EXPECT_FALSE(table.find("old")->online);
  EXPECT_TRUE(table.find("new")->online);
  // Never removed
  EXPECT_EQ(table.size(), 2u);
}

TEST_F(DeviceTableTest, Clear) {
  table.upsert(make_device("a", "alpha"));
  table.upsert(make_device("b", "beta"));
  EXPECT_EQ(table.list().size(), 2u);
  table.clear();
  EXPECT_EQ(table.size(), 0u);
}
