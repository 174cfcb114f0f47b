#include "pairing/pairing_manager.hpp"
#include "core/error.hpp"
#include "crypto/base64.hpp"
#include "network/framing.hpp"
#include "network/tcp_client.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace pairing {

namespace {

constexpr std::size_t NONCE_BYTES = 16;

crypto::Bytes to_bytes(const std::string& value) {
  return crypto::Bytes(value.begin(), value.end());
}

bool is_valid_pin(const std::string& pin) {
  return pin.size() == 6 && std::all_of(pin.begin(), pin.end(), [](char c) { return c >= '0' && c <= '9'; });
}

network::PairingResponse rejected() {
  return network::PairingResponse{false, ""};
}

} // namespace

//==============================================
// INBOUND SESSION
//==============================================

// One inbound pairing connection: read request, answer, close
class PairingManager::Session : public std::enable_shared_from_this<PairingManager::Session> {
public:
  Session(PairingManager& manager, boost::asio::ip::tcp::socket socket)
    : manager_(manager)
    , socket_(std::move(socket))
    , deadline_(socket_.get_executor()) {
  }

  void start() {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Connection vanished before handshake: " << ec.message();
      close();
      return;
    }
    remote_address_ = endpoint.address().to_string();
    BOOST_LOG_TRIVIAL(debug) << "Pairing: Incoming connection from " << remote_address_;

    arm_deadline();
    read_size();
  }

private:
  PairingManager& manager_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer deadline_;
  std::string remote_address_;
  network::LengthPrefix prefix_{};
  std::string body_;
  std::vector<std::uint8_t> response_;
  std::optional<core::DeviceInfo> commit_;

  void arm_deadline() {
    auto self = shared_from_this();
    deadline_.expires_after(manager_.options_.io_timeout);
    deadline_.async_wait([self](const boost::system::error_code& error) {
      if (!error) {
        BOOST_LOG_TRIVIAL(warning) << "Pairing: Session with " << self->remote_address_ << " timed out";
        self->close();
      }
    });
  }

  void read_size() {
    boost::asio::async_read(
      socket_,
      boost::asio::buffer(prefix_),
      std::bind(&Session::handle_read_size, shared_from_this(),
                std::placeholders::_1,
                std::placeholders::_2));
  }

  void handle_read_size(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Pairing: Size read from " << remote_address_ << " failed: " << ec.message();
      close();
      return;
    }

    const std::uint32_t length = network::decode_length(prefix_);
    try {
      network::check_frame_length(length, manager_.options_.max_frame_size);
    } catch (const core::NetworkError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Dropping " << remote_address_ << ": " << e.what();
      close();
      return;
    }

    body_.resize(length);
    boost::asio::async_read(
      socket_,
      boost::asio::buffer(&body_[0], body_.size()),
      std::bind(&Session::handle_read_body, shared_from_this(),
                std::placeholders::_1,
                std::placeholders::_2));
  }

  void handle_read_body(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Pairing: Body read from " << remote_address_ << " failed: " << ec.message();
      close();
      return;
    }

    PairingManager::InboundDecision decision;
    try {
      const auto request = network::parse_auth_request(body_);
      decision = manager_.handle_request(request, remote_address_);
    } catch (const core::SerializationError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Malformed request from " << remote_address_ << ": " << e.what();
      close();
      return;
    }

    if (!decision.approver) {
      respond(std::move(decision));
      return;
    }

    // The hook may wait for a person, the session stays open without a deadline
    deadline_.cancel();
    auto self = shared_from_this();
    auto work = boost::asio::make_work_guard(socket_.get_executor());
    boost::asio::post(manager_.approval_pool_, [self, work, decision]() {
      auto decided = self->manager_.decide_approval(*decision.commit, decision.pin, decision.approver);
      boost::asio::post(work.get_executor(), [self, decided]() mutable {
        self->arm_deadline();
        self->respond(std::move(decided));
      });
    });
  }

  void respond(PairingManager::InboundDecision decision) {
    commit_ = std::move(decision.commit);
    response_ = network::encode_frame(network::serialize(decision.response));
    boost::asio::async_write(
      socket_,
      boost::asio::buffer(response_),
      std::bind(&Session::handle_write, shared_from_this(),
                std::placeholders::_1,
                std::placeholders::_2));
  }

  void handle_write(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Failed to answer " << remote_address_ << ": " << ec.message();
    }
    if (commit_) {
      manager_.finish_inbound(*commit_, !ec);
    }
    close();
  }

  void close() {
    deadline_.cancel();
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PairingManager::PairingManager(crypto::CryptoEngine& crypto, const core::DeviceInfo& local_device,
                               PairingOptions options, store::DeviceStore* store)
  : crypto_(crypto)
  , local_device_(local_device)
  , options_(std::move(options))
  , store_(store)
  , approval_pool_(std::max<std::size_t>(1, options_.approval_threads)) {
  BOOST_LOG_TRIVIAL(info) << "Pairing: Initializing pairing manager for device " << local_device_.id;
}

PairingManager::~PairingManager() {
  stop_listening();
  approval_pool_.join();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool PairingManager::start_listening() {
  return start_listening(options_.listen_port);
}

bool PairingManager::start_listening(std::uint16_t port) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Listener already running";
    return true;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(options_.listen_address), port);
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pairing: Failed to listen on port " << port << ": " << e.what();
    acceptor_.reset();
    return false;
  }

  is_running_ = true;
  start_accept();

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Pairing: IO context error: " << e.what();
      is_running_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Pairing: Listening on " << options_.listen_address << ":" << listening_port();
  return true;
}

void PairingManager::stop_listening() {
  if (!io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Pairing: Stopping listener";
  is_running_ = false;

  // In-flight sessions finish on their own deadline once the acceptor is gone.
  // A session waiting on the approval hook keeps the io thread alive until it answers.
  boost::asio::post(io_context_, [this]() {
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "Pairing: Error closing acceptor: " << ec.message();
      }
    }
  });

  if (io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();
  io_context_.restart();

  BOOST_LOG_TRIVIAL(info) << "Pairing: Listener stopped";
}

std::uint16_t PairingManager::listening_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

void PairingManager::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        std::make_shared<Session>(*this, std::move(socket))->start();
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "Pairing: Accept error: " << error.message();
      }
      start_accept();
    });
}


//==============================================
// RESPONDER
//==============================================

PairingManager::InboundDecision PairingManager::handle_request(const network::AuthRequestPacket& request,
                                                               const std::string& remote_address) {
  const std::string& id = request.device_id;
  BOOST_LOG_TRIVIAL(info) << "Pairing: Request from device " << id << " at " << remote_address;

  InboundDecision decision;
  decision.response = rejected();

  if (id == local_device_.id) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Rejecting request carrying our own id";
    return decision;
  }
  if (!verify_request(request)) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Bad signature from device " << id;
    return decision;
  }
  if (!remember_nonce(request.nonce)) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Replayed nonce from device " << id;
    return decision;
  }

  core::DeviceInfo device = device_from_request(request, remote_address);

  // Already paired: accept again with the key we paired with, never a new one
  if (is_paired(id)) {
    std::optional<core::DeviceInfo> updated;
    {
      std::lock_guard<std::mutex> lock(paired_mutex_);
      auto it = paired_.find(id);
      if (it != paired_.end()) {
        if (!device.public_key.empty() && device.public_key != it->second.public_key) {
          BOOST_LOG_TRIVIAL(warning) << "Pairing: Device " << id << " presented a different key, unpair first";
          return decision;
        }
        auto& known = it->second;
        known.name = device.name;
        known.device_type = device.device_type;
        known.ip_address = device.ip_address;
        if (device.pairing_port != 0) {
          known.pairing_port = device.pairing_port;
        }
        if (device.transfer_port != 0) {
          known.transfer_port = device.transfer_port;
        }
        known.set_online(true);
        updated = known;
      }
    }
    if (updated && store_) {
      try {
        store_->save_device(*updated);
      } catch (const core::StorageError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Pairing: Failed to persist " << id << ": " << e.what();
      }
    }
    BOOST_LOG_TRIVIAL(info) << "Pairing: Device " << id << " was already paired";
    decision.response = network::PairingResponse{true, open_sealed_pin(request).value_or("")};
    return decision;
  }

  // A new pairing needs a usable key before anything is promised
  try {
    crypto::decode_key(device.public_key, crypto::CryptoEngine::KEY_SIZE);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Unusable public key from " << id << ": " << e.what();
    return decision;
  }

  // Both sides asked at once: accept with the code we are waiting for
  if (auto pin = awaiting_pin(id)) {
    decision.response = network::PairingResponse{true, *pin};
    decision.commit = device;
    return decision;
  }

  PairingRequestCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = request_callback_;
  }
  auto pin = open_sealed_pin(request);
  if (!callback || !pin) {
    BOOST_LOG_TRIVIAL(info) << "Pairing: Rejecting unsolicited request from " << id;
    return decision;
  }

  if (!transition(id, core::PairingStatus::RequestReceived)) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Handshake with " << id << " already in progress";
    return decision;
  }
  notify_status(device, core::PairingStatus::RequestReceived);

  decision.commit = device;
  decision.approver = std::move(callback);
  decision.pin = *pin;
  return decision;
}

PairingManager::InboundDecision PairingManager::decide_approval(const core::DeviceInfo& device,
                                                                const std::string& pin,
                                                                const PairingRequestCallback& approver) {
  bool approved = false;
  try {
    approved = approver(device, pin);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pairing: Request callback threw: " << e.what();
  }

  InboundDecision decision;
  if (!approved) {
    BOOST_LOG_TRIVIAL(info) << "Pairing: Request from " << device.id << " declined";
    reset_to_unpaired(device);
    decision.response = rejected();
    return decision;
  }
  decision.response = network::PairingResponse{true, pin};
  decision.commit = device;
  return decision;
}

void PairingManager::finish_inbound(const core::DeviceInfo& device, bool delivered) {
  if (!delivered) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Acceptance for " << device.id << " was not delivered";
    reset_to_unpaired(device);
    return;
  }
  try {
    complete_pairing(device);
  } catch (const core::Error& e) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Cannot pair with " << device.id << ": " << e.what();
    reset_to_unpaired(device);
  }
}

bool PairingManager::verify_request(const network::AuthRequestPacket& request) const {
  std::optional<std::string> known_key;
  {
    std::lock_guard<std::mutex> lock(paired_mutex_);
    auto it = paired_.find(request.device_id);
    if (it != paired_.end()) {
      known_key = it->second.signing_public_key;
    }
  }

  // A paired device must keep signing with the key it paired with
  if (known_key && request.signing_public_key && *known_key != *request.signing_public_key) {
    return false;
  }
  const auto signer = known_key ? known_key : request.signing_public_key;
  if (!signer) {
    return false;
  }

  try {
    const auto signature = crypto::base64_decode(request.signature);
    return crypto_.verify(signature, to_bytes(request.signed_payload()), *signer);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Pairing: Signature check failed: " << e.what();
    return false;
  }
}

bool PairingManager::remember_nonce(const std::string& nonce) {
  std::lock_guard<std::mutex> lock(nonce_mutex_);
  if (!seen_nonces_.insert(nonce).second) {
    return false;
  }
  nonce_order_.push_back(nonce);
  if (nonce_order_.size() > MAX_REMEMBERED_NONCES) {
    seen_nonces_.erase(nonce_order_.front());
    nonce_order_.pop_front();
  }
  return true;
}

std::optional<std::string> PairingManager::open_sealed_pin(const network::AuthRequestPacket& request) const {
  if (!request.sealed_pin) {
    return std::nullopt;
  }
  try {
    const auto opened = crypto_.open_first_contact(crypto::base64_decode(*request.sealed_pin));
    std::string pin(opened.begin(), opened.end());
    if (!is_valid_pin(pin)) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Sealed PIN from " << request.device_id << " is not a PIN";
      return std::nullopt;
    }
    return pin;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Cannot open sealed PIN from " << request.device_id << ": " << e.what();
    return std::nullopt;
  }
}

core::DeviceInfo PairingManager::device_from_request(const network::AuthRequestPacket& request,
                                                     const std::string& remote_address) const {
  core::DeviceInfo device;
  device.id = request.device_id;
  device.name = request.device_name.value_or(request.device_id);
  device.device_type = request.device_type.value_or(core::DeviceType::Unknown);
  device.public_key = request.public_key.value_or("");
  device.signing_public_key = request.signing_public_key;
  device.ip_address = remote_address;
  device.pairing_port = request.port.value_or(0);
  device.transfer_port = request.transfer_port.value_or(0);
  device.set_online(true);
  return device;
}


//==============================================
// INITIATOR
//==============================================

core::DeviceInfo PairingManager::request_pairing(const core::DeviceInfo& device) {
  if (device.id.empty() || device.id == local_device_.id) {
    throw core::InvalidArgumentError("Cannot pair with device '" + device.id + "'");
  }
  if (!device.ip_address || device.ip_address->empty()) {
    throw core::InvalidArgumentError("Device " + device.id + " has no known address");
  }
  if (is_paired(device.id)) {
    throw core::PairingError("Device already paired: " + device.id);
  }
  if (!transition(device.id, core::PairingStatus::RequestSent)) {
    throw core::PairingError("Pairing with " + device.id + " already in progress");
  }

  const std::string pin = crypto::CryptoEngine::generate_pin();
  {
    std::lock_guard<std::mutex> lock(awaiting_mutex_);
    awaiting_[device.id] = pin;
  }
  notify_status(device, core::PairingStatus::RequestSent);
  BOOST_LOG_TRIVIAL(info) << "Pairing: Requesting pairing with " << device.name << ", PIN " << pin;

  // Returns the device to Unpaired unless the handshake committed
  struct PendingRequest {
    PairingManager& manager;
    const core::DeviceInfo& device;
    bool committed = false;
    ~PendingRequest() {
      if (!committed) {
        manager.reset_to_unpaired(device);
      }
    }
  } pending{*this, device};

  const std::uint16_t port = device.pairing_port != 0 ? device.pairing_port : options_.default_peer_port;
  const auto request = build_request(device, pin);

  network::TcpClient client(options_.io_timeout);
  client.connect(*device.ip_address, port);
  client.write_frame(network::serialize(request), options_.max_frame_size);
  // The peer may be asking its user first
  client.set_timeout(options_.io_timeout + options_.approval_timeout);
  const auto response = network::parse_pairing_response(client.read_frame(options_.max_frame_size));
  client.close();

  if (!response.accepted) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: Device " << device.id << " rejected the request";
    throw core::PairingError("Pairing rejected by " + device.id);
  }
  if (response.pin != pin) {
    BOOST_LOG_TRIVIAL(warning) << "Pairing: PIN mismatch from device " << device.id;
    throw core::PairingError("PIN mismatch from " + device.id);
  }

  core::DeviceInfo paired = device;
  paired.set_online(true);
  complete_pairing(paired);
  pending.committed = true;

  {
    std::lock_guard<std::mutex> lock(awaiting_mutex_);
    awaiting_.erase(device.id);
  }
  return get_paired_device(device.id).value_or(paired);
}

network::AuthRequestPacket PairingManager::build_request(const core::DeviceInfo& target, const std::string& pin) const {
  network::AuthRequestPacket request;
  request.device_id = local_device_.id;
  request.nonce = crypto::base64_encode(crypto::CryptoEngine::random_bytes(NONCE_BYTES));
  request.signature = crypto::base64_encode(crypto_.sign(to_bytes(request.signed_payload())));
  request.device_name = local_device_.name;
  request.device_type = local_device_.device_type;
  request.public_key = crypto_.public_key_base64();
  request.signing_public_key = crypto_.signing_key_base64();

  const std::uint16_t bound = listening_port();
  request.port = bound != 0 ? bound : options_.listen_port;
  request.transfer_port = options_.transfer_port;

  if (!target.public_key.empty()) {
    request.sealed_pin = crypto::base64_encode(crypto_.seal_for_first_contact(target.public_key, to_bytes(pin)));
  }
  return request;
}


//==============================================
// STATE
//==============================================

void PairingManager::complete_pairing(core::DeviceInfo device) {
  if (device.public_key.empty()) {
    throw core::PairingError("Device " + device.id + " sent no public key");
  }
  crypto_.derive_shared_key(device.id, device.public_key);

  device.pairing_status = core::PairingStatus::Paired;
  device.trusted = true;
  {
    std::lock_guard<std::mutex> lock(paired_mutex_);
    paired_[device.id] = device;
  }

  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& state = states_[device.id];
    if (state.get_state() != core::PairingStatus::Paired) {
      if (!state.transition_to(core::PairingStatus::Paired)) {
        state = PairingState::restored();
      }
      changed = true;
    }
  }

  if (store_) {
    try {
      store_->save_device(device);
      store_->save_shared_key(device.id, crypto::decode_key(device.public_key, crypto::CryptoEngine::KEY_SIZE));
    } catch (const core::StorageError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Failed to persist " << device.id << ": " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Pairing: Paired with " << device.name << " (" << device.id << ")";
  if (changed) {
    notify_status(device, core::PairingStatus::Paired);
  }
}

bool PairingManager::transition(const std::string& device_id, core::PairingStatus status) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto& state = states_[device_id];
  const auto from = state.get_state();
  if (!state.transition_to(status)) {
    BOOST_LOG_TRIVIAL(debug) << "Pairing: Invalid transition for " << device_id << ": "
                             << PairingState::state_to_string(from) << " -> "
                             << PairingState::state_to_string(status);
    return false;
  }
  return true;
}

void PairingManager::reset_to_unpaired(const core::DeviceInfo& device) {
  {
    std::lock_guard<std::mutex> lock(awaiting_mutex_);
    awaiting_.erase(device.id);
  }

  bool reset = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(device.id);
    if (it != states_.end() && it->second.is_in_flight()) {
      reset = it->second.transition_to(core::PairingStatus::Unpaired);
    }
  }
  if (reset) {
    notify_status(device, core::PairingStatus::Unpaired);
  }
}

std::optional<std::string> PairingManager::awaiting_pin(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(awaiting_mutex_);
  auto it = awaiting_.find(device_id);
  if (it == awaiting_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void PairingManager::notify_status(const core::DeviceInfo& device, core::PairingStatus status) {
  PairingStatusCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = status_callback_;
  }
  if (!callback) {
    return;
  }
  try {
    callback(device, status);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pairing: Status callback threw: " << e.what();
  }
}

bool PairingManager::unpair(const std::string& device_id) {
  std::optional<core::DeviceInfo> removed;
  {
    std::lock_guard<std::mutex> lock(paired_mutex_);
    auto it = paired_.find(device_id);
    if (it != paired_.end()) {
      removed = std::move(it->second);
      paired_.erase(it);
    }
  }
  if (!removed) {
    return false;
  }

  crypto_.remove_shared_key(device_id);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    states_.erase(device_id);
  }
  if (store_) {
    try {
      store_->delete_device(device_id);
    } catch (const core::StorageError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Failed to delete " << device_id << " from store: " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Pairing: Unpaired device " << device_id;
  removed->pairing_status = core::PairingStatus::Unpaired;
  removed->trusted = false;
  notify_status(*removed, core::PairingStatus::Unpaired);
  return true;
}

std::size_t PairingManager::restore_paired() {
  if (!store_) {
    return 0;
  }

  std::size_t restored = 0;
  for (auto device : store_->get_all_devices()) {
    if (device.pairing_status != core::PairingStatus::Paired) {
      continue;
    }
    try {
      const auto key_data = store_->get_shared_key(device.id);
      const std::string remote_key = key_data ? crypto::base64_encode(*key_data) : device.public_key;
      crypto_.derive_shared_key(device.id, remote_key);
    } catch (const core::Error& e) {
      BOOST_LOG_TRIVIAL(warning) << "Pairing: Cannot restore " << device.id << ": " << e.what();
      continue;
    }

    device.trusted = true;
    device.online = false;
    {
      std::lock_guard<std::mutex> lock(paired_mutex_);
      paired_[device.id] = device;
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      states_[device.id] = PairingState::restored();
    }
    ++restored;
  }

  BOOST_LOG_TRIVIAL(info) << "Pairing: Restored " << restored << " paired devices";
  return restored;
}


//==============================================
// QUERIES
//==============================================

bool PairingManager::is_paired(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(paired_mutex_);
  return paired_.count(device_id) > 0;
}

core::PairingStatus PairingManager::get_pairing_status(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = states_.find(device_id);
  return it == states_.end() ? core::PairingStatus::Unpaired : it->second.get_state();
}

std::vector<core::DeviceInfo> PairingManager::get_paired_devices() const {
  std::lock_guard<std::mutex> lock(paired_mutex_);
  std::vector<core::DeviceInfo> devices;
  devices.reserve(paired_.size());
  for (const auto& [id, device] : paired_) {
    devices.push_back(device);
  }
  return devices;
}

std::optional<core::DeviceInfo> PairingManager::get_paired_device(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(paired_mutex_);
  auto it = paired_.find(device_id);
  if (it == paired_.end()) {
    return std::nullopt;
  }
  return it->second;
}


//==============================================
// CALLBACKS
//==============================================

void PairingManager::set_pairing_request_callback(PairingRequestCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  request_callback_ = std::move(callback);
}

void PairingManager::set_status_callback(PairingStatusCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  status_callback_ = std::move(callback);
}

} // namespace pairing
} // namespace pasteall
