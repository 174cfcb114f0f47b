#include "discovery/udp_discovery.hpp"
#include "core/error.hpp"
#include "network/wire.hpp"
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace discovery {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UdpDiscovery::UdpDiscovery(const core::DeviceInfo& local_device, UdpDiscoveryOptions options)
  : options_(std::move(options))
  , local_device_(local_device)
  , local_id_(local_device.id) {
  BOOST_LOG_TRIVIAL(info) << "UDP discovery: Initializing for device " << local_id_
                          << ", listening on port " << options_.listen_port;
}

UdpDiscovery::~UdpDiscovery() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool UdpDiscovery::start(DeviceCallback callback) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "UDP discovery: Already running";
    return true;
  }

  try {
    using boost::asio::ip::udp;

    // Listener
    listen_socket_ = std::make_unique<udp::socket>(io_context_);
    udp::endpoint listen_endpoint(boost::asio::ip::make_address(options_.listen_address), options_.listen_port);
    listen_socket_->open(listen_endpoint.protocol());
    listen_socket_->set_option(boost::asio::socket_base::reuse_address(true));
    listen_socket_->bind(listen_endpoint);
    BOOST_LOG_TRIVIAL(debug) << "UDP discovery: Listener bound to " << listen_socket_->local_endpoint();

    // Sender
    send_socket_ = std::make_unique<udp::socket>(io_context_, udp::endpoint(udp::v4(), 0));
    send_socket_->set_option(boost::asio::socket_base::broadcast(true));
    broadcast_endpoint_ = udp::endpoint(boost::asio::ip::make_address(options_.broadcast_address),
                                             options_.broadcast_port);

    broadcast_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP discovery: Failed to start: " << e.what();
    listen_socket_.reset();
    send_socket_.reset();
    broadcast_timer_.reset();
    return false;
  }

  callback_ = std::move(callback);
  is_running_ = true;

  // First announcement goes out immediately
  boost::asio::post(io_context_, [this]() {
    send_announcement();
    schedule_broadcast();
  });
  start_receive();

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "UDP discovery: IO context error: " << e.what();
      is_running_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "UDP discovery: Started, broadcasting to " << broadcast_endpoint_
                          << " every " << options_.interval.count() << " ms";
  return true;
}

void UdpDiscovery::stop() {
  if (!io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "UDP discovery: Stopping";
  is_running_ = false;

  io_context_.stop();
  if (io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Safe to touch the sockets now that the io thread is gone
  boost::system::error_code ec;
  if (listen_socket_) {
    listen_socket_->close(ec);
  }
  if (send_socket_) {
    send_socket_->close(ec);
  }
  listen_socket_.reset();
  send_socket_.reset();
  broadcast_timer_.reset();
  io_context_.restart();

  BOOST_LOG_TRIVIAL(info) << "UDP discovery: Stopped";
}


//==============================================
// DEVICE TABLE
//==============================================

std::vector<core::DeviceInfo> UdpDiscovery::get_devices() const {
  return devices_.list();
}

std::optional<core::DeviceInfo> UdpDiscovery::get_device(const std::string& device_id) const {
  return devices_.find(device_id);
}

bool UdpDiscovery::set_pairing_status(const std::string& device_id, core::PairingStatus status, bool trusted) {
  return devices_.set_pairing_status(device_id, status, trusted);
}

std::size_t UdpDiscovery::mark_stale(std::chrono::seconds max_age) {
  return devices_.mark_stale(max_age, core::unix_timestamp());
}


//==============================================
// ANNOUNCEMENTS
//==============================================

void UdpDiscovery::set_local_device(const core::DeviceInfo& local_device) {
  std::lock_guard<std::mutex> lock(local_mutex_);
  local_device_ = local_device;
}

bool UdpDiscovery::announce_now() {
  if (!is_running_) {
    return false;
  }
  boost::asio::post(io_context_, [this]() { send_announcement(); });
  return true;
}

std::uint16_t UdpDiscovery::bound_port() const {
  if (!listen_socket_ || !listen_socket_->is_open()) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = listen_socket_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}


//==============================================
// BROADCAST LOOP
//==============================================

void UdpDiscovery::schedule_broadcast() {
  if (!is_running_ || !broadcast_timer_) {
    return;
  }

  broadcast_timer_->expires_after(options_.interval);
  broadcast_timer_->async_wait([this](const boost::system::error_code& error) {
    if (error == boost::asio::error::operation_aborted || !is_running_) {
      return;
    }
    send_announcement();
    schedule_broadcast();
  });
}

bool UdpDiscovery::send_announcement() {
  if (!send_socket_) {
    return false;
  }

  network::DiscoveryPacket packet;
  {
    std::lock_guard<std::mutex> lock(local_mutex_);
    packet = network::DiscoveryPacket::from_device(local_device_, options_.pairing_port);
  }
  const std::string payload = network::serialize(packet);

  boost::system::error_code ec;
  send_socket_->send_to(boost::asio::buffer(payload), broadcast_endpoint_, 0, ec);
  if (ec) {
    // The next tick retries
    BOOST_LOG_TRIVIAL(warning) << "UDP discovery: Broadcast failed: " << ec.message();
    return false;
  }
  BOOST_LOG_TRIVIAL(trace) << "UDP discovery: Sent announcement (" << payload.size() << " bytes)";
  return true;
}


//==============================================
// LISTEN LOOP
//==============================================

void UdpDiscovery::start_receive() {
  if (!is_running_ || !listen_socket_) {
    return;
  }

  listen_socket_->async_receive_from(
    boost::asio::buffer(receive_buffer_), sender_endpoint_,
    [this](const boost::system::error_code& error, std::size_t bytes_received) {
      if (error == boost::asio::error::operation_aborted || !is_running_) {
        return;
      }
      if (error) {
        BOOST_LOG_TRIVIAL(warning) << "UDP discovery: Receive error: " << error.message();
      } else {
        handle_datagram(bytes_received);
      }
      start_receive();
    });
}

void UdpDiscovery::handle_datagram(std::size_t bytes_received) {
  const std::string data(receive_buffer_.data(), bytes_received);

  network::DiscoveryPacket packet;
  try {
    packet = network::parse_discovery_packet(data);
  } catch (const core::SerializationError& e) {
    BOOST_LOG_TRIVIAL(debug) << "UDP discovery: Dropped datagram from " << sender_endpoint_ << ": " << e.what();
    return;
  }

  if (packet.device_id == local_id_) {
    return;
  }

  core::DeviceInfo device = packet.to_device_info();
  if (!device.ip_address) {
    device.ip_address = sender_endpoint_.address().to_string();
  }

  const core::DeviceInfo stored = devices_.upsert(device);
  BOOST_LOG_TRIVIAL(debug) << "UDP discovery: Announcement from " << stored.name << " at "
                           << stored.ip_address.value_or("?");

  if (callback_) {
    try {
      callback_(stored);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "UDP discovery: Device callback threw: " << e.what();
    }
  }
}

} // namespace discovery
} // namespace pasteall
