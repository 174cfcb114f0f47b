#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/clipboard.hpp"
#include "core/types.hpp"
#include "crypto/crypto_engine.hpp"
#include "network/wire.hpp"

namespace pasteall {
namespace transfer {

using ProgressCallback = std::function<void(const core::TransferProgress& progress)>;
using ClipboardCallback = std::function<void(const std::string& device_id, const core::ClipboardContent& content)>;

struct TransferOptions {
  std::string listen_address = "0.0.0.0";
  std::uint16_t listen_port = 45681;
  // Used when a peer did not advertise its transfer port
  std::uint16_t default_peer_port = 45681;
  std::filesystem::path download_dir = "downloads";
  // Idle limit for a single read or write
  std::chrono::milliseconds io_timeout{30000};
  // Clipboard payloads are buffered in memory up to this size
  std::uint64_t max_clipboard_size = 64 * 1024 * 1024;
};

/**
 * Streams files and clipboard content between devices.
 *
 * Each file travels as a length-prefixed FileHeader followed by exactly
 * file_size raw bytes. Several files may follow each other on one connection.
 * Sending is blocking; receiving runs on the server's io_context thread.
 */
class TransferService {
public:
  static constexpr std::size_t BLOCK_SIZE = 256 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferService(crypto::CryptoEngine& crypto, const core::DeviceInfo& local_device, TransferOptions options);
  ~TransferService();

  TransferService(const TransferService&) = delete;
  TransferService& operator=(const TransferService&) = delete;


  // ---- SERVER ----
  bool start_server();
  bool start_server(std::uint16_t port);
  void stop_server();
  bool is_running() const { return is_running_; }
  std::uint16_t listening_port() const;


  // ---- SENDING ----
  // All send methods block until the transfer ends and return its id.
  // Failures are recorded in the progress table and rethrown.
  std::string send_file(const core::DeviceInfo& device, const std::filesystem::path& path,
                        ProgressCallback callback = nullptr);
  std::string send_bytes(const core::DeviceInfo& device, const std::string& name,
                         const std::vector<std::uint8_t>& data, ProgressCallback callback = nullptr);
  // Encrypted with the device's shared key, throws NoSharedKeyError when unpaired
  std::string send_clipboard(const core::DeviceInfo& device, const core::ClipboardContent& content,
                             ProgressCallback callback = nullptr);
  // Stops an outgoing transfer at the next block boundary
  bool cancel_transfer(const std::string& transfer_id);


  // ---- PROGRESS ----
  std::optional<core::TransferProgress> get_progress(const std::string& transfer_id) const;
  std::vector<core::TransferProgress> get_transfers() const;
  bool clear_transfer(const std::string& transfer_id);
  std::size_t clear_finished();


  // ---- CALLBACKS ----
  // Called for every progress change, incoming and outgoing
  void set_progress_callback(ProgressCallback callback);
  void set_clipboard_callback(ClipboardCallback callback);


  // ---- HELPERS ----
  // Last path component of name, nullopt for empty, "." or ".."
  static std::optional<std::string> sanitize_file_name(const std::string& name);
  // dir/name, or dir/"stem (n).ext" for the first n that does not exist yet
  static std::filesystem::path unique_destination(const std::filesystem::path& dir, const std::string& name);

private:
  class Session;
  friend class Session;

  // Fills buffer with up to size bytes, returns 0 at end of input
  using ChunkSource = std::function<std::size_t(std::uint8_t* buffer, std::size_t size)>;

  struct Entry {
    core::TransferProgress progress;
    bool cancel_requested = false;
  };

  // ---- PARAMETERS ----
  crypto::CryptoEngine& crypto_;
  core::DeviceInfo local_device_;
  TransferOptions options_;

  mutable std::mutex transfers_mutex_;
  std::unordered_map<std::string, Entry> transfers_;

  mutable std::mutex callback_mutex_;
  ProgressCallback progress_callback_;
  ClipboardCallback clipboard_callback_;

  // Server state
  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> io_thread_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  // Only touched on the io thread
  std::vector<std::weak_ptr<Session>> sessions_;


  // ---- SERVER ----
  void start_accept();


  // ---- SENDING ----
  std::string send_stream(const core::DeviceInfo& device, network::FileHeader header,
                          const ChunkSource& source, const ProgressCallback& callback);
  std::uint16_t peer_port(const core::DeviceInfo& device) const;


  // ---- PROGRESS ----
  // Stores the snapshot and notifies, callbacks run outside the lock
  void publish(const core::TransferProgress& progress, const ProgressCallback& callback = nullptr);
  bool is_cancel_requested(const std::string& transfer_id) const;
  void deliver_clipboard(const std::string& device_id, const core::ClipboardContent& content);
};

} // namespace transfer
} // namespace pasteall
