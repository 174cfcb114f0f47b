#include "transfer/transfer_service.hpp"
#include "core/error.hpp"
#include "network/framing.hpp"
#include "network/tcp_client.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace transfer {

namespace {

const char* CLIPBOARD_FILE_NAME = "clipboard";

// Pushes written file contents to durable storage
bool sync_to_disk(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return false;
  }
  const bool synced = ::fsync(fd) == 0;
  ::close(fd);
  return synced;
}

} // namespace

//==============================================
// INBOUND SESSION
//==============================================

// Receives a sequence of header + body pairs from one connection
class TransferService::Session : public std::enable_shared_from_this<TransferService::Session> {
public:
  Session(TransferService& service, boost::asio::ip::tcp::socket socket)
    : service_(service)
    , socket_(std::move(socket))
    , deadline_(socket_.get_executor())
    , block_(BLOCK_SIZE) {
  }

  void start() {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
      close();
      return;
    }
    remote_address_ = endpoint.address().to_string();
    BOOST_LOG_TRIVIAL(debug) << "Transfer: Incoming connection from " << remote_address_;
    read_header_size();
  }

  // Aborts the session, an active transfer ends as Failed
  void stop() {
    if (header_) {
      fail("server stopped");
    } else {
      close();
    }
  }

private:
  TransferService& service_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer deadline_;
  std::string remote_address_;
  network::LengthPrefix prefix_{};
  std::string header_body_;
  std::vector<std::uint8_t> block_;

  // Set while a body is being received
  std::optional<network::FileHeader> header_;
  core::TransferProgress progress_;
  std::ofstream file_;
  std::filesystem::path destination_;
  std::vector<std::uint8_t> clipboard_;


  void arm_deadline() {
    auto self = shared_from_this();
    deadline_.expires_after(service_.options_.io_timeout);
    deadline_.async_wait([self](const boost::system::error_code& error) {
      if (!error) {
        BOOST_LOG_TRIVIAL(warning) << "Transfer: Connection from " << self->remote_address_ << " idle, closing";
        self->close();
      }
    });
  }

  //----------------------------------------------
  // HEADER
  //----------------------------------------------

  void read_header_size() {
    arm_deadline();
    boost::asio::async_read(
      socket_,
      boost::asio::buffer(prefix_),
      std::bind(&Session::handle_header_size, shared_from_this(),
                std::placeholders::_1,
                std::placeholders::_2));
  }

  void handle_header_size(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      // EOF between files is the normal end of a connection
      if (ec == boost::asio::error::eof) {
        BOOST_LOG_TRIVIAL(debug) << "Transfer: " << remote_address_ << " finished sending";
      } else if (ec != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(warning) << "Transfer: Header read from " << remote_address_ << " failed: " << ec.message();
      }
      close();
      return;
    }

    const std::uint32_t length = network::decode_length(prefix_);
    try {
      network::check_frame_length(length, network::MAX_FRAME_SIZE);
    } catch (const core::NetworkError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer: Dropping " << remote_address_ << ": " << e.what();
      close();
      return;
    }

    header_body_.resize(length);
    arm_deadline();
    boost::asio::async_read(
      socket_,
      boost::asio::buffer(&header_body_[0], header_body_.size()),
      std::bind(&Session::handle_header_body, shared_from_this(),
                std::placeholders::_1,
                std::placeholders::_2));
  }

  void handle_header_body(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer: Header read from " << remote_address_ << " failed: " << ec.message();
      close();
      return;
    }

    network::FileHeader header;
    try {
      header = network::parse_file_header(header_body_);
    } catch (const core::SerializationError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer: Malformed header from " << remote_address_ << ": " << e.what();
      close();
      return;
    }
    begin(std::move(header));
  }

  //----------------------------------------------
  // BODY
  //----------------------------------------------

  void begin(network::FileHeader header) {
    progress_ = core::TransferProgress{};
    progress_.id = header.transfer_id;
    progress_.device_id = header.sender_id.value_or(remote_address_);
    progress_.file_name = header.file_name;
    progress_.total_bytes = header.file_size;
    progress_.direction = core::TransferDirection::Incoming;
    header_ = header;

    BOOST_LOG_TRIVIAL(info) << "Transfer: Receiving '" << header.file_name << "' (" << header.file_size
                            << " bytes) from " << progress_.device_id;

    if (header.content_type == network::CONTENT_TYPE_CLIPBOARD) {
      if (!header.sender_id || !header.encrypted) {
        fail("clipboard transfer must be encrypted and name its sender");
        return;
      }
      if (header.file_size > service_.options_.max_clipboard_size) {
        fail("clipboard payload too large");
        return;
      }
      clipboard_.clear();
      clipboard_.reserve(static_cast<std::size_t>(header.file_size));
    } else if (header.content_type == network::CONTENT_TYPE_FILE) {
      if (header.encrypted) {
        fail("encrypted file transfers are not supported");
        return;
      }
      if (!open_destination(header.file_name)) {
        return;
      }
    } else {
      fail("unknown content type '" + header.content_type + "'");
      return;
    }

    service_.publish(progress_);
    progress_.status = core::TransferStatus::InProgress;
    service_.publish(progress_);

    if (header.file_size == 0) {
      finish();
    } else {
      read_block();
    }
  }

  bool open_destination(const std::string& file_name) {
    const auto name = sanitize_file_name(file_name);
    if (!name) {
      fail("invalid file name '" + file_name + "'");
      return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(service_.options_.download_dir, ec);
    if (ec) {
      fail("cannot create download directory: " + ec.message());
      return false;
    }

    destination_ = unique_destination(service_.options_.download_dir, *name);
    file_.open(destination_, std::ios::binary | std::ios::trunc);
    if (!file_) {
      fail("cannot create " + destination_.string());
      return false;
    }
    progress_.file_name = destination_.filename().string();
    return true;
  }

  void read_block() {
    const auto remaining = progress_.total_bytes - progress_.transferred_bytes;
    const auto size = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, BLOCK_SIZE));

    arm_deadline();
    boost::asio::async_read(
      socket_,
      boost::asio::buffer(block_.data(), size),
      std::bind(&Session::handle_block, shared_from_this(),
                std::placeholders::_1,
                std::placeholders::_2));
  }

  void handle_block(const boost::system::error_code& ec, std::size_t bytes_transferred) {
    if (!header_) {
      return;
    }

    if (bytes_transferred > 0) {
      if (header_->content_type == network::CONTENT_TYPE_CLIPBOARD) {
        clipboard_.insert(clipboard_.end(), block_.begin(), block_.begin() + bytes_transferred);
      } else {
        file_.write(reinterpret_cast<const char*>(block_.data()), static_cast<std::streamsize>(bytes_transferred));
        if (!file_) {
          fail("write to " + destination_.string() + " failed");
          return;
        }
      }
      progress_.transferred_bytes += bytes_transferred;
    }

    if (ec) {
      if (ec == boost::asio::error::eof) {
        fail("connection closed after " + std::to_string(progress_.transferred_bytes) + " of " +
             std::to_string(progress_.total_bytes) + " bytes");
      } else {
        fail(ec.message());
      }
      return;
    }

    service_.publish(progress_);
    if (progress_.transferred_bytes >= progress_.total_bytes) {
      finish();
    } else {
      read_block();
    }
  }

  void finish() {
    if (header_->content_type == network::CONTENT_TYPE_CLIPBOARD) {
      core::ClipboardContent content;
      try {
        const auto plaintext = service_.crypto_.decrypt(*header_->sender_id, clipboard_);
        content = core::decode_clipboard(plaintext);
      } catch (const core::Error& e) {
        fail(e.what());
        return;
      }
      clipboard_.clear();
      complete();
      service_.deliver_clipboard(progress_.device_id, content);
    } else {
      file_.flush();
      file_.close();
      if (file_.fail()) {
        fail("cannot finalize " + destination_.string());
        return;
      }
      if (!sync_to_disk(destination_)) {
        BOOST_LOG_TRIVIAL(warning) << "Transfer: fsync of " << destination_ << " failed";
      }
      complete();
    }

    read_header_size();
  }

  void complete() {
    progress_.status = core::TransferStatus::Completed;
    header_.reset();
    BOOST_LOG_TRIVIAL(info) << "Transfer: Received '" << progress_.file_name << "' from " << progress_.device_id;
    service_.publish(progress_);
  }

  void fail(const std::string& reason) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer: Incoming '" << progress_.file_name << "' from "
                               << progress_.device_id << " failed: " << reason;

    if (file_.is_open()) {
      file_.close();
      std::error_code ec;
      std::filesystem::remove(destination_, ec);
    }
    clipboard_.clear();
    header_.reset();

    progress_.status = core::TransferStatus::Failed;
    progress_.reason = reason;
    service_.publish(progress_);
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

TransferService::TransferService(crypto::CryptoEngine& crypto, const core::DeviceInfo& local_device,
                                 TransferOptions options)
  : crypto_(crypto)
  , local_device_(local_device)
  , options_(std::move(options)) {
  BOOST_LOG_TRIVIAL(info) << "Transfer: Initializing transfer service, downloads go to " << options_.download_dir;
}

TransferService::~TransferService() {
  stop_server();
}


//==============================================
// SERVER
//==============================================

bool TransferService::start_server() {
  return start_server(options_.listen_port);
}

bool TransferService::start_server(std::uint16_t port) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer: Server already running";
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
    BOOST_LOG_TRIVIAL(error) << "Transfer: Failed to listen on port " << port << ": " << e.what();
    acceptor_.reset();
    return false;
  }

  is_running_ = true;
  start_accept();

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Transfer: IO context error: " << e.what();
      is_running_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Transfer: Listening on " << options_.listen_address << ":" << listening_port();
  return true;
}

void TransferService::stop_server() {
  if (!io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer: Stopping server";
  is_running_ = false;

  boost::asio::post(io_context_, [this]() {
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
    for (auto& weak : sessions_) {
      if (auto session = weak.lock()) {
        session->stop();
      }
    }
    sessions_.clear();
  });

  if (io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();
  io_context_.restart();

  BOOST_LOG_TRIVIAL(info) << "Transfer: Server stopped";
}

std::uint16_t TransferService::listening_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

void TransferService::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<Session>& s) { return s.expired(); }),
                        sessions_.end());
        auto session = std::make_shared<Session>(*this, std::move(socket));
        sessions_.push_back(session);
        session->start();
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "Transfer: Accept error: " << error.message();
      }
      start_accept();
    });
}


//==============================================
// SENDING
//==============================================

std::string TransferService::send_file(const core::DeviceInfo& device, const std::filesystem::path& path,
                                       ProgressCallback callback) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw core::IoError("Not a regular file: " + path.string());
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw core::IoError("Cannot stat " + path.string() + ": " + ec.message());
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw core::IoError("Cannot open " + path.string());
  }

  network::FileHeader header;
  header.file_name = path.filename().string();
  header.file_size = size;
  header.content_type = network::CONTENT_TYPE_FILE;

  const ChunkSource source = [&input, &path](std::uint8_t* buffer, std::size_t length) -> std::size_t {
    input.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(length));
    if (input.bad()) {
      throw core::IoError("Read from " + path.string() + " failed");
    }
    return static_cast<std::size_t>(input.gcount());
  };
  return send_stream(device, std::move(header), source, callback);
}

std::string TransferService::send_bytes(const core::DeviceInfo& device, const std::string& name,
                                        const std::vector<std::uint8_t>& data, ProgressCallback callback) {
  network::FileHeader header;
  header.file_name = name;
  header.file_size = data.size();
  header.content_type = network::CONTENT_TYPE_FILE;

  std::size_t offset = 0;
  const ChunkSource source = [&data, &offset](std::uint8_t* buffer, std::size_t length) -> std::size_t {
    const std::size_t count = std::min(length, data.size() - offset);
    std::memcpy(buffer, data.data() + offset, count);
    offset += count;
    return count;
  };
  return send_stream(device, std::move(header), source, callback);
}

std::string TransferService::send_clipboard(const core::DeviceInfo& device, const core::ClipboardContent& content,
                                            ProgressCallback callback) {
  const auto ciphertext = crypto_.encrypt(device.id, core::encode_clipboard(content));
  BOOST_LOG_TRIVIAL(debug) << "Transfer: Sending clipboard (" << core::describe(content) << ") to " << device.id;

  network::FileHeader header;
  header.file_name = CLIPBOARD_FILE_NAME;
  header.file_size = ciphertext.size();
  header.content_type = network::CONTENT_TYPE_CLIPBOARD;
  header.encrypted = true;

  std::size_t offset = 0;
  const ChunkSource source = [&ciphertext, &offset](std::uint8_t* buffer, std::size_t length) -> std::size_t {
    const std::size_t count = std::min(length, ciphertext.size() - offset);
    std::memcpy(buffer, ciphertext.data() + offset, count);
    offset += count;
    return count;
  };
  return send_stream(device, std::move(header), source, callback);
}

std::string TransferService::send_stream(const core::DeviceInfo& device, network::FileHeader header,
                                         const ChunkSource& source, const ProgressCallback& callback) {
  if (!device.ip_address || device.ip_address->empty()) {
    throw core::InvalidArgumentError("Device " + device.id + " has no known address");
  }

  header.transfer_id = core::generate_uuid();
  header.sender_id = local_device_.id;

  core::TransferProgress progress;
  progress.id = header.transfer_id;
  progress.device_id = device.id;
  progress.file_name = header.file_name;
  progress.total_bytes = header.file_size;
  progress.direction = core::TransferDirection::Outgoing;
  publish(progress, callback);

  BOOST_LOG_TRIVIAL(info) << "Transfer: Sending '" << header.file_name << "' (" << header.file_size
                          << " bytes) to " << device.id;

  try {
    network::TcpClient client(options_.io_timeout);
    client.connect(*device.ip_address, peer_port(device));
    client.write_frame(network::serialize(header));

    progress.status = core::TransferStatus::InProgress;
    publish(progress, callback);

    std::vector<std::uint8_t> block(BLOCK_SIZE);
    while (progress.transferred_bytes < progress.total_bytes) {
      if (is_cancel_requested(progress.id)) {
        BOOST_LOG_TRIVIAL(info) << "Transfer: Canceled '" << header.file_name << "' after "
                                << progress.transferred_bytes << " bytes";
        client.close();
        progress.status = core::TransferStatus::Canceled;
        publish(progress, callback);
        return progress.id;
      }

      const auto remaining = progress.total_bytes - progress.transferred_bytes;
      const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, BLOCK_SIZE));
      const std::size_t count = source(block.data(), wanted);
      if (count == 0) {
        throw core::IoError("Source ended after " + std::to_string(progress.transferred_bytes) + " of " +
                            std::to_string(progress.total_bytes) + " bytes");
      }

      client.write_all(block.data(), count);
      progress.transferred_bytes += count;
      publish(progress, callback);
    }

    client.shutdown_send();
    client.close();
  } catch (const core::Error& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Sending '" << header.file_name << "' failed: " << e.what();
    progress.status = core::TransferStatus::Failed;
    progress.reason = e.what();
    publish(progress, callback);
    throw;
  }

  progress.status = core::TransferStatus::Completed;
  publish(progress, callback);
  BOOST_LOG_TRIVIAL(info) << "Transfer: Sent '" << header.file_name << "' to " << device.id;
  return progress.id;
}

std::uint16_t TransferService::peer_port(const core::DeviceInfo& device) const {
  return device.transfer_port != 0 ? device.transfer_port : options_.default_peer_port;
}

bool TransferService::cancel_transfer(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end() ||
      it->second.progress.direction != core::TransferDirection::Outgoing ||
      it->second.progress.is_finished()) {
    return false;
  }
  it->second.cancel_requested = true;
  return true;
}


//==============================================
// PROGRESS
//==============================================

void TransferService::publish(const core::TransferProgress& progress, const ProgressCallback& callback) {
  {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    transfers_[progress.id].progress = progress;
  }

  ProgressCallback global;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    global = progress_callback_;
  }

  try {
    if (callback) {
      callback(progress);
    }
    if (global) {
      global(progress);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Progress callback threw: " << e.what();
  }
}

bool TransferService::is_cancel_requested(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  auto it = transfers_.find(transfer_id);
  return it != transfers_.end() && it->second.cancel_requested;
}

void TransferService::deliver_clipboard(const std::string& device_id, const core::ClipboardContent& content) {
  ClipboardCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = clipboard_callback_;
  }
  if (!callback) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer: No clipboard handler, dropping content from " << device_id;
    return;
  }
  try {
    callback(device_id, content);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer: Clipboard callback threw: " << e.what();
  }
}

std::optional<core::TransferProgress> TransferService::get_progress(const std::string& transfer_id) const {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end()) {
    return std::nullopt;
  }
  return it->second.progress;
}

std::vector<core::TransferProgress> TransferService::get_transfers() const {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  std::vector<core::TransferProgress> transfers;
  transfers.reserve(transfers_.size());
  for (const auto& [id, entry] : transfers_) {
    transfers.push_back(entry.progress);
  }
  return transfers;
}

bool TransferService::clear_transfer(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  return transfers_.erase(transfer_id) > 0;
}

std::size_t TransferService::clear_finished() {
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  std::size_t removed = 0;
  for (auto it = transfers_.begin(); it != transfers_.end();) {
    if (it->second.progress.is_finished()) {
      it = transfers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}


//==============================================
// CALLBACKS
//==============================================

void TransferService::set_progress_callback(ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  progress_callback_ = std::move(callback);
}

void TransferService::set_clipboard_callback(ClipboardCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  clipboard_callback_ = std::move(callback);
}


//==============================================
// HELPERS
//==============================================

std::optional<std::string> TransferService::sanitize_file_name(const std::string& name) {
  const auto slash = name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
  if (base.empty() || base == "." || base == "..") {
    return std::nullopt;
  }
  return base;
}

std::filesystem::path TransferService::unique_destination(const std::filesystem::path& dir, const std::string& name) {
  auto candidate = dir / name;
  if (!std::filesystem::exists(candidate)) {
    return candidate;
  }

  const std::filesystem::path original(name);
  const auto stem = original.stem().string();
  const auto extension = original.extension().string();
  for (int n = 1;; ++n) {
    candidate = dir / (stem + " (" + std::to_string(n) + ")" + extension);
    if (!std::filesystem::exists(candidate)) {
      return candidate;
    }
  }
}

} // namespace transfer
} // namespace pasteall
