#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "core/error.hpp"
#include "crypto/base64.hpp"
#include "crypto/crypto_engine.hpp"
#include "network/framing.hpp"
#include "network/tcp_client.hpp"
#include "network/wire.hpp"
#include "pairing/pairing_manager.hpp"
#include "store/device_store.hpp"
#include "test_utils.hpp"

using namespace pasteall;
using namespace pasteall::pairing;
using boost::asio::ip::tcp;

namespace {

crypto::Bytes to_bytes(const std::string& text) {
  return crypto::Bytes(text.begin(), text.end());
}

// A device with its own identity and pairing listener on loopback
struct TestPeer {
  std::unique_ptr<crypto::CryptoEngine> crypto;
  core::DeviceInfo device;
  std::unique_ptr<PairingManager> manager;

  static PairingOptions loopback_options() {
    PairingOptions options;
    options.listen_address = "127.0.0.1";
    options.listen_port = 0;
    options.io_timeout = std::chrono::milliseconds(3000);
    return options;
  }

  TestPeer(const std::string& name, store::DeviceStore* store = nullptr,
           std::unique_ptr<crypto::CryptoEngine> engine = nullptr,
           const PairingOptions& options = loopback_options())
    : crypto(engine ? std::move(engine) : std::make_unique<crypto::CryptoEngine>()) {
    device = core::DeviceInfo::create(name, core::DeviceType::Desktop, crypto->public_key_base64());
    device.signing_public_key = crypto->signing_key_base64();
    device.ip_address = "127.0.0.1";
    manager = std::make_unique<PairingManager>(*crypto, device, options, store);
  }

  // How others see this peer once it listens
  core::DeviceInfo advertised() const {
    core::DeviceInfo copy = device;
    copy.pairing_port = manager->listening_port();
    return copy;
  }
};

} // namespace

class PairingManagerTest : public ::testing::Test {
protected:
  std::unique_ptr<TestPeer> alice;
  std::unique_ptr<TestPeer> bob;
  std::atomic<int> bob_prompts{0};
  std::string bob_last_pin;
  std::mutex pin_mutex;

  void SetUp() override {
    test::init_logging();
    alice = std::make_unique<TestPeer>("alice");
    bob = std::make_unique<TestPeer>("bob");
    ASSERT_TRUE(bob->manager->start_listening());
    ASSERT_NE(bob->manager->listening_port(), 0);
  }

  void TearDown() override {
    alice->manager->stop_listening();
    bob->manager->stop_listening();
  }

  void bob_approves(bool approve) {
    bob->manager->set_pairing_request_callback(
      [this, approve](const core::DeviceInfo&, const std::string& pin) {
        ++bob_prompts;
        std::lock_guard<std::mutex> lock(pin_mutex);
        bob_last_pin = pin;
        return approve;
      });
  }

  // Hand-built request from alice, as request_pairing would send it
  network::AuthRequestPacket signed_request(const std::string& nonce, const TestPeer* target = nullptr) {
    const TestPeer& recipient = target ? *target : *bob;
    network::AuthRequestPacket request;
    request.device_id = alice->device.id;
    request.nonce = nonce;
    request.device_name = alice->device.name;
    request.public_key = alice->device.public_key;
    request.signing_public_key = alice->device.signing_public_key;
    request.sealed_pin = crypto::base64_encode(
      alice->crypto->seal_for_first_contact(recipient.device.public_key, to_bytes("123456")));
    request.signature = crypto::base64_encode(alice->crypto->sign(to_bytes(request.signed_payload())));
    return request;
  }

  network::PairingResponse send_raw(const network::AuthRequestPacket& request, std::uint16_t port = 0) {
    network::TcpClient client(std::chrono::milliseconds(3000));
    client.connect("127.0.0.1", port != 0 ? port : bob->manager->listening_port());
    client.write_frame(network::serialize(request));
    return network::parse_pairing_response(client.read_frame());
  }
};

TEST_F(PairingManagerTest, ApprovedRequestPairsBothSides) {
  bob_approves(true);
  std::vector<core::PairingStatus> alice_statuses;
  alice->manager->set_status_callback([&alice_statuses](const core::DeviceInfo&, core::PairingStatus status) {
    alice_statuses.push_back(status);
  });

  const auto paired = alice->manager->request_pairing(bob->advertised());

  EXPECT_EQ(paired.id, bob->device.id);
  EXPECT_EQ(paired.pairing_status, core::PairingStatus::Paired);
  EXPECT_TRUE(paired.trusted);
  EXPECT_EQ(bob_prompts, 1);
  EXPECT_TRUE(alice->manager->is_paired(bob->device.id));
  ASSERT_TRUE(test::wait_until([this] { return bob->manager->is_paired(alice->device.id); }));
  EXPECT_EQ(bob->manager->get_pairing_status(alice->device.id), core::PairingStatus::Paired);
  EXPECT_EQ(alice_statuses,
            (std::vector<core::PairingStatus>{core::PairingStatus::RequestSent, core::PairingStatus::Paired}));

  // Both ends derived the same key
  const auto sealed = alice->crypto->encrypt(bob->device.id, to_bytes("over the wire"));
  EXPECT_EQ(bob->crypto->decrypt(alice->device.id, sealed), to_bytes("over the wire"));

  const auto remembered = bob->manager->get_paired_device(alice->device.id);
  ASSERT_TRUE(remembered);
  EXPECT_EQ(remembered->name, "alice");
  EXPECT_EQ(remembered->ip_address.value_or(""), "127.0.0.1");
}

TEST_F(PairingManagerTest, UnsolicitedRequestWithoutApproverIsRejected) {
  EXPECT_THROW(alice->manager->request_pairing(bob->advertised()), core::PairingError);
  EXPECT_FALSE(alice->manager->is_paired(bob->device.id));
  EXPECT_EQ(alice->manager->get_pairing_status(bob->device.id), core::PairingStatus::Unpaired);
  EXPECT_FALSE(bob->manager->is_paired(alice->device.id));
  EXPECT_FALSE(alice->crypto->has_shared_key(bob->device.id));
}

TEST_F(PairingManagerTest, DeclinedRequestResetsResponder) {
  bob_approves(false);
  EXPECT_THROW(alice->manager->request_pairing(bob->advertised()), core::PairingError);
  EXPECT_EQ(bob_prompts, 1);
  EXPECT_EQ(bob->manager->get_pairing_status(alice->device.id), core::PairingStatus::Unpaired);

  // A later attempt can still succeed
  bob_approves(true);
  EXPECT_NO_THROW(alice->manager->request_pairing(bob->advertised()));
}

TEST_F(PairingManagerTest, ResponderSeesInitiatorPin) {
  bob_approves(true);
  alice->manager->request_pairing(bob->advertised());

  std::lock_guard<std::mutex> lock(pin_mutex);
  EXPECT_EQ(bob_last_pin.size(), 6u);
  EXPECT_TRUE(std::all_of(bob_last_pin.begin(), bob_last_pin.end(), [](char c) { return c >= '0' && c <= '9'; }));
}

TEST_F(PairingManagerTest, PinMismatchFailsPairing) {
  boost::asio::io_context io;
  tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const auto port = acceptor.local_endpoint().port();

  std::thread fake([&acceptor, &io]() {
    tcp::socket socket(io);
    acceptor.accept(socket);
    network::LengthPrefix prefix;
    boost::asio::read(socket, boost::asio::buffer(prefix));
    std::string body(network::decode_length(prefix), '\0');
    boost::asio::read(socket, boost::asio::buffer(&body[0], body.size()));
    const auto frame = network::encode_frame(network::serialize(network::PairingResponse{true, "not-the-pin"}));
    boost::asio::write(socket, boost::asio::buffer(frame));
  });

  auto target = bob->device;
  target.pairing_port = port;
  EXPECT_THROW(alice->manager->request_pairing(target), core::PairingError);
  fake.join();

  EXPECT_FALSE(alice->manager->is_paired(bob->device.id));
  EXPECT_EQ(alice->manager->get_pairing_status(bob->device.id), core::PairingStatus::Unpaired);
}

TEST_F(PairingManagerTest, UnreachablePeerIsNetworkError) {
  boost::asio::io_context io;
  tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  auto target = bob->device;
  target.pairing_port = acceptor.local_endpoint().port();
  acceptor.close();

  EXPECT_THROW(alice->manager->request_pairing(target), core::NetworkError);
  EXPECT_EQ(alice->manager->get_pairing_status(bob->device.id), core::PairingStatus::Unpaired);
}

TEST_F(PairingManagerTest, InvalidTargetsAreRejectedUpFront) {
  auto self = alice->device;
  EXPECT_THROW(alice->manager->request_pairing(self), core::InvalidArgumentError);

  auto nowhere = bob->device;
  nowhere.ip_address.reset();
  EXPECT_THROW(alice->manager->request_pairing(nowhere), core::InvalidArgumentError);
}

TEST_F(PairingManagerTest, AlreadyPairedResponderAcceptsAgain) {
  bob_approves(true);
  alice->manager->request_pairing(bob->advertised());
  ASSERT_TRUE(test::wait_until([this] { return bob->manager->is_paired(alice->device.id); }));
  const auto key_before = bob->manager->get_paired_device(alice->device.id)->public_key;

  // Alice forgets bob, bob still trusts alice and is not asked again
  ASSERT_TRUE(alice->manager->unpair(bob->device.id));
  EXPECT_FALSE(alice->crypto->has_shared_key(bob->device.id));
  EXPECT_FALSE(alice->manager->unpair(bob->device.id));

  EXPECT_NO_THROW(alice->manager->request_pairing(bob->advertised()));
  EXPECT_EQ(bob_prompts, 1);
  EXPECT_TRUE(alice->manager->is_paired(bob->device.id));

  // Bob kept the key and record from the first pairing
  EXPECT_EQ(bob->manager->get_paired_device(alice->device.id)->public_key, key_before);
  EXPECT_EQ(bob->manager->get_paired_devices().size(), 1u);
  const auto sealed = alice->crypto->encrypt(bob->device.id, to_bytes("same key as before"));
  EXPECT_EQ(bob->crypto->decrypt(alice->device.id, sealed), to_bytes("same key as before"));

  EXPECT_THROW(alice->manager->request_pairing(bob->advertised()), core::PairingError);
}

TEST_F(PairingManagerTest, ReplayedNonceIsRejected) {
  bob_approves(true);
  const auto request = signed_request("bm9uY2Utb25jZQ==");

  EXPECT_TRUE(send_raw(request).accepted);
  EXPECT_FALSE(send_raw(request).accepted);
}

TEST_F(PairingManagerTest, ForgedSignatureIsRejected) {
  bob_approves(true);
  auto request = signed_request("Zm9yZ2Vk");
  request.device_id = "someone-else";

  EXPECT_FALSE(send_raw(request).accepted);
  EXPECT_EQ(bob_prompts, 0);
  EXPECT_FALSE(bob->manager->is_paired("someone-else"));
}

TEST_F(PairingManagerTest, MalformedRequestGetsNoAnswer) {
  network::TcpClient client(std::chrono::milliseconds(2000));
  client.connect("127.0.0.1", bob->manager->listening_port());
  client.write_frame(R"({"type":"pairing_request"})");
  EXPECT_THROW(client.read_frame(), core::NetworkError);
}

TEST_F(PairingManagerTest, PairedDevicesSurviveRestart) {
  const auto dir = test::make_temp_dir("pairing_store");
  {
    store::FileDeviceStore store(dir.string());
    auto carol = std::make_unique<TestPeer>("carol", &store);
    ASSERT_TRUE(carol->manager->start_listening());
    carol->manager->set_pairing_request_callback([](const core::DeviceInfo&, const std::string&) { return true; });

    alice->manager->request_pairing(carol->advertised());
    ASSERT_TRUE(test::wait_until([&carol, this] { return carol->manager->is_paired(alice->device.id); }));
    carol->manager->stop_listening();

    // Same identity, fresh process
    auto engine = std::make_unique<crypto::CryptoEngine>(carol->crypto->key_pair(), carol->crypto->sign_key_pair());
    TestPeer restarted("carol", &store, std::move(engine));
    EXPECT_EQ(restarted.manager->restore_paired(), 1u);
    EXPECT_TRUE(restarted.manager->is_paired(alice->device.id));
    EXPECT_TRUE(restarted.crypto->has_shared_key(alice->device.id));

    const auto sealed = alice->crypto->encrypt(carol->device.id, to_bytes("after restart"));
    EXPECT_EQ(restarted.crypto->decrypt(alice->device.id, sealed), to_bytes("after restart"));

    auto remembered = restarted.manager->get_paired_device(alice->device.id);
    ASSERT_TRUE(remembered);
    EXPECT_FALSE(remembered->online);
  }
  std::filesystem::remove_all(dir);
}

TEST_F(PairingManagerTest, PairedDeviceCannotSwapItsKey) {
  const auto dir = test::make_temp_dir("pairing_rekey");
  {
    store::FileDeviceStore store(dir.string());
    auto carol = std::make_unique<TestPeer>("carol", &store);
    carol->manager->set_pairing_request_callback([](const core::DeviceInfo&, const std::string&) { return true; });
    ASSERT_TRUE(carol->manager->start_listening());

    // Recorded by someone watching the network
    const auto recorded = signed_request("cmVjb3JkZWQ=", carol.get());
    ASSERT_TRUE(send_raw(recorded, carol->manager->listening_port()).accepted);
    ASSERT_TRUE(test::wait_until([&carol, this] { return carol->manager->is_paired(alice->device.id); }));
    carol->manager->stop_listening();

    // Restart forgets every nonce
    auto engine = std::make_unique<crypto::CryptoEngine>(carol->crypto->key_pair(), carol->crypto->sign_key_pair());
    TestPeer restarted("carol", &store, std::move(engine));
    ASSERT_EQ(restarted.manager->restore_paired(), 1u);
    ASSERT_TRUE(restarted.manager->start_listening());
    const auto port = restarted.manager->listening_port();

    crypto::CryptoEngine mallory;
    auto replayed = recorded;
    replayed.public_key = mallory.public_key_base64();
    EXPECT_FALSE(send_raw(replayed, port).accepted);

    // Even a correctly signed request may not bring a new key
    network::AuthRequestPacket rekey;
    rekey.device_id = alice->device.id;
    rekey.nonce = "cmVrZXk=";
    rekey.public_key = mallory.public_key_base64();
    rekey.signing_public_key = alice->device.signing_public_key;
    rekey.signature = crypto::base64_encode(alice->crypto->sign(to_bytes(rekey.signed_payload())));
    EXPECT_FALSE(send_raw(rekey, port).accepted);

    // The original request replayed as is still changes nothing
    EXPECT_TRUE(send_raw(recorded, port).accepted);

    mallory.derive_shared_key(restarted.device.id, restarted.crypto->public_key_base64());
    const auto sealed = restarted.crypto->encrypt(alice->device.id, to_bytes("for alice only"));
    EXPECT_THROW(mallory.decrypt(restarted.device.id, sealed), crypto::AuthenticationFailedError);

    alice->crypto->derive_shared_key(restarted.device.id, restarted.crypto->public_key_base64());
    EXPECT_EQ(alice->crypto->decrypt(restarted.device.id, sealed), to_bytes("for alice only"));
    EXPECT_EQ(restarted.manager->get_paired_device(alice->device.id)->public_key, alice->device.public_key);
    EXPECT_EQ(store.get_device(alice->device.id)->public_key, alice->device.public_key);
    restarted.manager->stop_listening();
  }
  std::filesystem::remove_all(dir);
}

TEST_F(PairingManagerTest, SlowApprovalStillPairsBothSides) {
  // Longer than alice's 3 s io timeout
  bob->manager->set_pairing_request_callback([this](const core::DeviceInfo&, const std::string&) {
    ++bob_prompts;
    std::this_thread::sleep_for(std::chrono::milliseconds(4500));
    return true;
  });

  auto pairing = std::async(std::launch::async, [this]() {
    return alice->manager->request_pairing(bob->advertised());
  });
  ASSERT_TRUE(test::wait_until([this] { return bob_prompts == 1; }));

  // Other connections are answered while the prompt is open
  auto forged = signed_request("d2hpbGUtd2FpdGluZw==");
  forged.device_id = "someone-else";
  const auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(send_raw(forged).accepted);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
  EXPECT_EQ(bob->manager->get_pairing_status(alice->device.id), core::PairingStatus::RequestReceived);
  EXPECT_FALSE(bob->manager->is_paired(alice->device.id));

  EXPECT_NO_THROW(pairing.get());
  EXPECT_TRUE(alice->manager->is_paired(bob->device.id));
  ASSERT_TRUE(test::wait_until([this] { return bob->manager->is_paired(alice->device.id); }));

  const auto sealed = alice->crypto->encrypt(bob->device.id, to_bytes("after a long wait"));
  EXPECT_EQ(bob->crypto->decrypt(alice->device.id, sealed), to_bytes("after a long wait"));
}

TEST_F(PairingManagerTest, InitiatorGivingUpLeavesResponderUnpaired) {
  // Alice stops waiting long before bob answers
  auto options = TestPeer::loopback_options();
  options.io_timeout = std::chrono::milliseconds(500);
  options.approval_timeout = std::chrono::milliseconds(0);
  TestPeer impatient("impatient", nullptr, nullptr, options);

  std::promise<void> released;
  auto release = released.get_future().share();
  bob->manager->set_pairing_request_callback([this, release](const core::DeviceInfo&, const std::string&) {
    ++bob_prompts;
    release.wait();
    return true;
  });

  EXPECT_THROW(impatient.manager->request_pairing(bob->advertised()), core::NetworkError);
  EXPECT_FALSE(impatient.manager->is_paired(bob->device.id));
  EXPECT_FALSE(bob->manager->is_paired(impatient.device.id));
  EXPECT_EQ(bob->manager->get_pairing_status(impatient.device.id), core::PairingStatus::RequestReceived);

  released.set_value();
  bob->manager->stop_listening();
}
