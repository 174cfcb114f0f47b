#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "core/types.hpp"
#include "crypto/crypto_engine.hpp"
#include "network/wire.hpp"
#include "pairing/pairing_state.hpp"
#include "store/device_store.hpp"

namespace pasteall {
namespace pairing {

// Asked when an unknown device wants to pair; return true to accept.
// pin is the code the initiator displays.
using PairingRequestCallback = std::function<bool(const core::DeviceInfo& device, const std::string& pin)>;
using PairingStatusCallback = std::function<void(const core::DeviceInfo& device, core::PairingStatus status)>;

struct PairingOptions {
  std::string listen_address = "0.0.0.0";
  std::uint16_t listen_port = 45680;
  // Used when a peer did not advertise its pairing port
  std::uint16_t default_peer_port = 45680;
  // Transfer port we advertise to peers
  std::uint16_t transfer_port = 45681;
  std::chrono::milliseconds io_timeout{10000};
  // Extra time the initiator waits while the peer's user decides
  std::chrono::milliseconds approval_timeout{60000};
  // Approval hooks run here, off the listener thread
  std::size_t approval_threads = 4;
  std::uint32_t max_frame_size = 64 * 1024;
};

/**
 * PIN-verified pairing over TCP.
 *
 * The listener runs on its own io_context thread and answers every inbound
 * request in a separate session. Approval hooks run on a small worker pool so
 * a pending prompt never stalls other sessions; the responder commits a new
 * pairing only after its acceptance has been written. request_pairing() is the
 * blocking initiator path. A device is Paired exactly when the crypto engine
 * holds a shared key for it.
 */
class PairingManager {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PairingManager(crypto::CryptoEngine& crypto, const core::DeviceInfo& local_device,
                 PairingOptions options, store::DeviceStore* store = nullptr);
  ~PairingManager();

  PairingManager(const PairingManager&) = delete;
  PairingManager& operator=(const PairingManager&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listener on the configured port; idempotent
  bool start_listening();
  bool start_listening(std::uint16_t port);
  void stop_listening();
  bool is_listening() const { return is_running_; }
  // Actual bound port, useful when listening on port 0
  std::uint16_t listening_port() const;


  // ---- HANDSHAKE ----
  // Blocks until the peer answers. Throws PairingError when already paired,
  // rejected or on PIN mismatch, NetworkError when the peer is unreachable.
  core::DeviceInfo request_pairing(const core::DeviceInfo& device);
  // Forgets the device and its shared key, false if it was not paired
  bool unpair(const std::string& device_id);
  // Reloads paired devices from the store and re-derives their keys
  std::size_t restore_paired();


  // ---- QUERIES ----
  bool is_paired(const std::string& device_id) const;
  core::PairingStatus get_pairing_status(const std::string& device_id) const;
  std::vector<core::DeviceInfo> get_paired_devices() const;
  std::optional<core::DeviceInfo> get_paired_device(const std::string& device_id) const;


  // ---- CALLBACKS ----
  void set_pairing_request_callback(PairingRequestCallback callback);
  void set_status_callback(PairingStatusCallback callback);

private:
  class Session;
  friend class Session;

  static constexpr std::size_t MAX_REMEMBERED_NONCES = 4096;

  // What a session does with a verified request
  struct InboundDecision {
    network::PairingResponse response;
    // Paired once the response has been delivered
    std::optional<core::DeviceInfo> commit;
    // When set the hook decides, response and commit are filled in afterwards
    PairingRequestCallback approver;
    std::string pin;
  };

  // ---- PARAMETERS ----
  crypto::CryptoEngine& crypto_;
  core::DeviceInfo local_device_;
  PairingOptions options_;
  store::DeviceStore* store_;

  // Each table has its own lock, never held together
  mutable std::mutex state_mutex_;
  std::unordered_map<std::string, PairingState> states_;

  mutable std::mutex awaiting_mutex_;
  std::unordered_map<std::string, std::string> awaiting_;

  mutable std::mutex paired_mutex_;
  std::unordered_map<std::string, core::DeviceInfo> paired_;

  std::mutex nonce_mutex_;
  std::unordered_set<std::string> seen_nonces_;
  std::deque<std::string> nonce_order_;

  mutable std::mutex callback_mutex_;
  PairingRequestCallback request_callback_;
  PairingStatusCallback status_callback_;

  // Listener state
  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> io_thread_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  boost::asio::thread_pool approval_pool_;


  // ---- LISTENER ----
  void start_accept();


  // ---- RESPONDER ----
  InboundDecision handle_request(const network::AuthRequestPacket& request,
                                 const std::string& remote_address);
  // Runs the approval hook and turns its answer into a decision
  InboundDecision decide_approval(const core::DeviceInfo& device, const std::string& pin,
                                  const PairingRequestCallback& approver);
  // Called once the response was written, or failed to be
  void finish_inbound(const core::DeviceInfo& device, bool delivered);
  bool verify_request(const network::AuthRequestPacket& request) const;
  bool remember_nonce(const std::string& nonce);
  std::optional<std::string> open_sealed_pin(const network::AuthRequestPacket& request) const;
  core::DeviceInfo device_from_request(const network::AuthRequestPacket& request,
                                       const std::string& remote_address) const;


  // ---- INITIATOR ----
  network::AuthRequestPacket build_request(const core::DeviceInfo& target, const std::string& pin) const;


  // ---- STATE ----
  // Derives the shared key, records the device as paired and persists it
  void complete_pairing(core::DeviceInfo device);
  bool transition(const std::string& device_id, core::PairingStatus status);
  void reset_to_unpaired(const core::DeviceInfo& device);
  std::optional<std::string> awaiting_pin(const std::string& device_id) const;
  void notify_status(const core::DeviceInfo& device, core::PairingStatus status);
};

} // namespace pairing
} // namespace pasteall
