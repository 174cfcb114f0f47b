#include "network/tcp_client.hpp"
#include "core/error.hpp"
#include <boost/log/trivial.hpp>

namespace pasteall {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpClient::TcpClient(std::chrono::milliseconds timeout)
  : timeout_(timeout)
  , socket_(io_context_) {
}

TcpClient::~TcpClient() {
  close();
}


//==============================================
// CONNECTION
//==============================================

void TcpClient::connect(const std::string& host, std::uint16_t port) {
  remote_ = host + ":" + std::to_string(port);
  BOOST_LOG_TRIVIAL(debug) << "TCP client: Connecting to " << remote_;

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    throw core::NetworkError("Cannot resolve " + remote_ + ": " + ec.message());
  }

  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
    [&result](const boost::system::error_code& error, const boost::asio::ip::tcp::endpoint&) {
      result = error;
    });
  run("connect");

  if (result) {
    close();
    throw core::NetworkError("Connection to " + remote_ + " failed: " + result.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP client: Connected to " << remote_;
}

void TcpClient::close() {
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}

void TcpClient::shutdown_send() {
  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "TCP client: Shutdown of send side failed: " << ec.message();
  }
}


//==============================================
// FRAMED MESSAGES
//==============================================

void TcpClient::write_frame(const std::string& body, std::uint32_t max_size) {
  const auto frame = encode_frame(body, max_size);
  write_all(frame.data(), frame.size());
}

std::string TcpClient::read_frame(std::uint32_t max_size) {
  LengthPrefix prefix{};
  read_exact(prefix.data(), prefix.size());

  const std::uint32_t length = decode_length(prefix);
  check_frame_length(length, max_size);

  std::string body(length, '\0');
  read_exact(reinterpret_cast<std::uint8_t*>(&body[0]), body.size());
  return body;
}


//==============================================
// RAW BYTES
//==============================================

void TcpClient::write_all(const std::uint8_t* data, std::size_t size) {
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_write(socket_, boost::asio::buffer(data, size),
    [&result](const boost::system::error_code& error, std::size_t) {
      result = error;
    });
  run("write");

  if (result) {
    throw core::NetworkError("Write to " + remote_ + " failed: " + result.message());
  }
}

void TcpClient::read_exact(std::uint8_t* data, std::size_t size) {
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_read(socket_, boost::asio::buffer(data, size),
    [&result](const boost::system::error_code& error, std::size_t) {
      result = error;
    });
  run("read");

  if (result == boost::asio::error::eof) {
    throw core::NetworkError("Connection closed by " + remote_);
  }
  if (result) {
    throw core::NetworkError("Read from " + remote_ + " failed: " + result.message());
  }
}

void TcpClient::run(const char* operation) {
  io_context_.restart();
  io_context_.run_for(timeout_);

  // Timed out: closing the socket makes the pending operation complete with operation_aborted
  if (!io_context_.stopped()) {
    BOOST_LOG_TRIVIAL(warning) << "TCP client: " << operation << " to " << remote_ << " timed out";
    boost::system::error_code ec;
    socket_.close(ec);
    io_context_.run();
    throw core::NetworkError(std::string(operation) + " to " + remote_ + " timed out");
  }
}

} // namespace network
} // namespace pasteall
