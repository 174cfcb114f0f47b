#include "node/node.hpp"
#include "core/error.hpp"
#include "discovery/udp_discovery.hpp"
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace node {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Node::Node(config::Config config, DiscoveryFactory discovery_factory)
  : config_(std::move(config)) {

  BOOST_LOG_TRIVIAL(info) << "Node: Initializing node '" << config_.device_name << "'";

  try {
    config_.validate();

    store_ = std::make_unique<store::FileDeviceStore>(config_.storage_path);
    BOOST_LOG_TRIVIAL(debug) << "Node: Store opened";

    load_identity();
    build_local_device();
    BOOST_LOG_TRIVIAL(debug) << "Node: Local device " << local_device_.id;

    if (discovery_factory) {
      discovery_ = discovery_factory(local_device_);
    } else {
      discovery::UdpDiscoveryOptions options;
      options.broadcast_address = config_.broadcast_address;
      options.broadcast_port = config_.discovery_port;
      options.listen_port = config_.discovery_port;
      options.interval = config_.discovery_interval;
      options.pairing_port = config_.pairing_port;
      discovery_ = std::make_unique<discovery::UdpDiscovery>(local_device_, options);
    }
    if (!discovery_) {
      throw core::DiscoveryError("Discovery factory returned no transport");
    }
    BOOST_LOG_TRIVIAL(debug) << "Node: Discovery created";

    pairing::PairingOptions pairing_options;
    pairing_options.listen_port = config_.pairing_port;
    pairing_options.default_peer_port = config_.pairing_port;
    pairing_options.transfer_port = config_.effective_transfer_port();
    pairing_options.io_timeout = config_.io_timeout;
    pairing_options.approval_timeout = config_.pairing_approval_timeout;
    pairing_ = std::make_unique<pairing::PairingManager>(*crypto_, local_device_, pairing_options, store_.get());
    pairing_->restore_paired();
    BOOST_LOG_TRIVIAL(debug) << "Node: Pairing manager created";

    transfer::TransferOptions transfer_options;
    transfer_options.listen_port = config_.effective_transfer_port();
    transfer_options.default_peer_port = config_.effective_transfer_port();
    transfer_options.download_dir = config_.download_dir;
    transfer_options.io_timeout = config_.io_timeout;
    transfer_ = std::make_unique<transfer::TransferService>(*crypto_, local_device_, transfer_options);
    BOOST_LOG_TRIVIAL(debug) << "Node: Transfer service created";

    wire_callbacks();
    BOOST_LOG_TRIVIAL(info) << "Node: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to initialize components: " << e.what();
    throw;
  }
}

Node::~Node() {
  try {
    if (!shutdown()) {
      BOOST_LOG_TRIVIAL(error) << "Node: Failed to shutdown cleanly in destructor";
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Error during destructor shutdown: " << e.what();
  }
}


//==============================================
// SETUP
//==============================================

void Node::load_identity() {
  if (auto identity = store_->load_identity()) {
    crypto_ = std::make_unique<crypto::CryptoEngine>(
      crypto::KeyPair::from_secret(identity->key_agreement_secret),
      crypto::SignKeyPair::from_seed(identity->signing_seed));
    local_device_.id = config_.device_id.empty() ? identity->device_id : config_.device_id;
    BOOST_LOG_TRIVIAL(info) << "Node: Loaded identity from store";
    return;
  }

  crypto_ = std::make_unique<crypto::CryptoEngine>();
  local_device_.id = config_.device_id.empty() ? core::generate_uuid() : config_.device_id;

  const auto keys = crypto_->key_pair();
  const auto sign_keys = crypto_->sign_key_pair();
  store_->save_identity(store::StoredIdentity{local_device_.id, keys.secret_key, sign_keys.seed});
  BOOST_LOG_TRIVIAL(info) << "Node: Created new identity";
}

void Node::build_local_device() {
  local_device_.name = config_.device_name;
  local_device_.device_type = config_.device_type;
  local_device_.public_key = crypto_->public_key_base64();
  local_device_.signing_public_key = crypto_->signing_key_base64();
  local_device_.capabilities = config_.capabilities;
  local_device_.app_version = APP_VERSION;
  local_device_.pairing_port = config_.pairing_port;
  local_device_.transfer_port = config_.effective_transfer_port();
  local_device_.pairing_status = core::PairingStatus::Unpaired;
  local_device_.set_online(true);
}

void Node::wire_callbacks() {
  pairing_->set_status_callback([this](const core::DeviceInfo& device, core::PairingStatus status) {
    on_pairing_status(device, status);
  });
  pairing_->set_pairing_request_callback([this](const core::DeviceInfo& device, const std::string& pin) {
    return on_pairing_request(device, pin);
  });
  transfer_->set_progress_callback([this](const core::TransferProgress& progress) {
    events_.produce(core::TransferEvent{progress});
  });
  transfer_->set_clipboard_callback([this](const std::string& device_id, const core::ClipboardContent& content) {
    BOOST_LOG_TRIVIAL(info) << "Node: Clipboard from " << device_id << ": " << core::describe(content);
    events_.produce(core::ClipboardReceivedEvent{device_id, content});
  });
}


//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool Node::start() {
  if (started_) {
    BOOST_LOG_TRIVIAL(warning) << "Node: Already started";
    return true;
  }

  try {
    if (!pairing_->start_listening()) {
      BOOST_LOG_TRIVIAL(error) << "Node: Failed to start pairing listener";
      return false;
    }
    if (!transfer_->start_server()) {
      BOOST_LOG_TRIVIAL(error) << "Node: Failed to start transfer server";
      pairing_->stop_listening();
      return false;
    }
    if (!discovery_->start([this](const core::DeviceInfo& device) { on_device_discovered(device); })) {
      BOOST_LOG_TRIVIAL(error) << "Node: Failed to start discovery";
      transfer_->stop_server();
      pairing_->stop_listening();
      return false;
    }

    // Devices restored from storage keep their status in the discovery table
    for (const auto& device : pairing_->get_paired_devices()) {
      discovery_->set_pairing_status(device.id, core::PairingStatus::Paired, true);
    }

    started_ = true;
    BOOST_LOG_TRIVIAL(info) << "Node: Started as " << local_device_.name << " (" << local_device_.id << ")";
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to start: " << e.what();
    return false;
  }
}

bool Node::shutdown() {
  try {
    BOOST_LOG_TRIVIAL(info) << "Node: Initiating shutdown sequence";

    // Release anyone blocked on an approval so the pairing thread can exit
    {
      std::lock_guard<std::mutex> lock(approvals_mutex_);
      for (auto& [id, approval] : approvals_) {
        approval->set_value(false);
      }
      approvals_.clear();
    }

    if (discovery_) {
      BOOST_LOG_TRIVIAL(debug) << "Node: Stopping discovery";
      discovery_->stop();
    }
    if (transfer_) {
      BOOST_LOG_TRIVIAL(debug) << "Node: Stopping transfer server";
      transfer_->stop_server();
    }
    if (pairing_) {
      BOOST_LOG_TRIVIAL(debug) << "Node: Stopping pairing listener";
      pairing_->stop_listening();
    }

    started_ = false;
    BOOST_LOG_TRIVIAL(info) << "Node: Shutdown complete";
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Node: Error during shutdown: " << e.what();
    return false;
  }
}


//==============================================
// CALLBACK BRIDGES
//==============================================

void Node::on_device_discovered(const core::DeviceInfo& device) {
  BOOST_LOG_TRIVIAL(debug) << "Node: Discovered " << device.name << " (" << device.id << ")";
  events_.produce(core::DeviceDiscoveredEvent{device});
}

void Node::on_pairing_status(const core::DeviceInfo& device, core::PairingStatus status) {
  discovery_->set_pairing_status(device.id, status, status == core::PairingStatus::Paired);
  events_.produce(core::PairingStatusEvent{device.id, status});
}

bool Node::on_pairing_request(const core::DeviceInfo& device, const std::string& pin) {
  events_.produce(core::PairingRequestEvent{device, pin});

  if (config_.auto_accept_pairing) {
    BOOST_LOG_TRIVIAL(info) << "Node: Auto-accepting pairing with " << device.name;
    return true;
  }

  auto approval = std::make_shared<std::promise<bool>>();
  auto answer = approval->get_future();
  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    approvals_[device.id] = approval;
  }

  BOOST_LOG_TRIVIAL(info) << "Node: Waiting for approval of " << device.name << " (PIN " << pin << ")";
  const bool answered = answer.wait_for(config_.pairing_approval_timeout) == std::future_status::ready;

  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    auto it = approvals_.find(device.id);
    if (it != approvals_.end() && it->second == approval) {
      approvals_.erase(it);
    }
  }

  if (!answered) {
    BOOST_LOG_TRIVIAL(warning) << "Node: Pairing request from " << device.name << " timed out";
    return false;
  }
  return answer.get();
}


//==============================================
// PAIRING APPROVAL
//==============================================

bool Node::respond_to_pairing(const std::string& device_id, bool accept) {
  std::shared_ptr<std::promise<bool>> approval;
  {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    auto it = approvals_.find(device_id);
    if (it == approvals_.end()) {
      return false;
    }
    approval = it->second;
    approvals_.erase(it);
  }
  approval->set_value(accept);
  return true;
}

std::vector<std::string> Node::pending_pairing_requests() const {
  std::lock_guard<std::mutex> lock(approvals_mutex_);
  std::vector<std::string> ids;
  ids.reserve(approvals_.size());
  for (const auto& [id, approval] : approvals_) {
    ids.push_back(id);
  }
  return ids;
}


//==============================================
// LOOKUP
//==============================================

std::optional<core::DeviceInfo> Node::find_device(const std::string& device_id) const {
  if (auto device = discovery_->get_device(device_id)) {
    return device;
  }
  return pairing_->get_paired_device(device_id);
}

std::size_t Node::refresh_devices() {
  return discovery_->mark_stale(config_.stale_after);
}

} // namespace node
} // namespace pasteall
