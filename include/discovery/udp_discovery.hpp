#pragma once

#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "discovery/device_table.hpp"
#include "discovery/discovery_service.hpp"

namespace pasteall {
namespace discovery {

struct UdpDiscoveryOptions {
  std::string broadcast_address = "255.255.255.255";
  std::uint16_t broadcast_port = 45678;
  std::string listen_address = "0.0.0.0";
  std::uint16_t listen_port = 45678;
  std::chrono::milliseconds interval{5000};
  // Pairing port advertised in every announcement
  std::uint16_t pairing_port = 45680;
};

/**
 * Presence announcements over UDP broadcast.
 *
 * One io_context on its own thread drives a periodic broadcast timer and a
 * receive loop. Every well formed packet from another device is merged into the
 * device table and reported to the callback; our own packets are ignored.
 */
class UdpDiscovery : public DiscoveryService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UdpDiscovery(const core::DeviceInfo& local_device, UdpDiscoveryOptions options);
  ~UdpDiscovery() override;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start(DeviceCallback callback) override;
  void stop() override;
  bool is_running() const override { return is_running_; }


  // ---- DEVICE TABLE ----
  std::vector<core::DeviceInfo> get_devices() const override;
  std::optional<core::DeviceInfo> get_device(const std::string& device_id) const override;
  bool set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted) override;
  std::size_t mark_stale(std::chrono::seconds max_age) override;


  // ---- ANNOUNCEMENTS ----
  // Replaces what we advertise from the next broadcast on
  void set_local_device(const core::DeviceInfo& local_device);
  // Sends one announcement immediately, false if not running or the send failed
  bool announce_now();
  std::uint16_t bound_port() const;

private:
  static constexpr std::size_t MAX_DATAGRAM_SIZE = 65507;

  // ---- PARAMETERS ----
  UdpDiscoveryOptions options_;
  mutable std::mutex local_mutex_;
  core::DeviceInfo local_device_;
  std::string local_id_;

  DeviceTable devices_;
  DeviceCallback callback_;

  // Server state
  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> io_thread_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::udp::socket> listen_socket_;
  std::unique_ptr<boost::asio::ip::udp::socket> send_socket_;
  std::unique_ptr<boost::asio::steady_timer> broadcast_timer_;
  boost::asio::ip::udp::endpoint broadcast_endpoint_;

  // Receive state, only touched on the io thread
  std::array<char, MAX_DATAGRAM_SIZE> receive_buffer_{};
  boost::asio::ip::udp::endpoint sender_endpoint_;


  // ---- BROADCAST LOOP ----
  void schedule_broadcast();
  bool send_announcement();


  // ---- LISTEN LOOP ----
  void start_receive();
  void handle_datagram(std::size_t bytes_received);
};

} // namespace discovery
} // namespace pasteall
