#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include "network/framing.hpp"

namespace pasteall {
namespace network {

/**
 * Blocking TCP client where every operation is bounded by a timeout.
 * Operations run on a private io_context; on timeout the socket is closed and
 * NetworkError is thrown.
 */
class TcpClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TcpClient(std::chrono::milliseconds timeout);
  ~TcpClient();


  // ---- CONNECTION ----
  void connect(const std::string& host, std::uint16_t port);
  void close();
  bool is_open() const { return socket_.is_open(); }
  // Applies to every later operation
  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }


  // ---- FRAMED MESSAGES ----
  void write_frame(const std::string& body, std::uint32_t max_size = MAX_FRAME_SIZE);
  std::string read_frame(std::uint32_t max_size = MAX_FRAME_SIZE);


  // ---- RAW BYTES ----
  void write_all(const std::uint8_t* data, std::size_t size);
  // Flushes pending data and signals end of stream to the peer
  void shutdown_send();

private:
  // ---- PARAMETERS ----
  std::chrono::milliseconds timeout_;
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::socket socket_;
  std::string remote_;


  // ---- HELPERS ----
  // Runs pending handlers until they finish or the timeout expires
  void run(const char* operation);
  void read_exact(std::uint8_t* data, std::size_t size);
};

} // namespace network
} // namespace pasteall
