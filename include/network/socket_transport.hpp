// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/pipe.hpp"
#include "util/cancellation.hpp"
#include <array>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <functional>
#include <memory>
#include <string>

namespace ftpctl {
namespace network {

/**
 * SocketPipeConnection - pumps a connected TCP socket into the transport side
 * of a socket DuplexPipe pair and back.
 *
 * - socket -> pipe: every received chunk is written to the pipe's output and
 *   flushed (the flush applies the pipe's backpressure to the socket reads).
 * - pipe -> socket: chunks read from the pipe's input are written to the
 *   socket with async_write.
 *
 * Socket EOF or error completes the pipe ends and closes the connection.
 * Completion of the pipe input by the other side shuts down the sending half
 * of the socket. The disconnect callback runs once, on the connection's
 * strand.
 */
class SocketPipeConnection
    : public std::enable_shared_from_this<SocketPipeConnection> {
private:
  struct PrivateTag {};

public:
  using DisconnectCallback = std::function<void()>;

  static constexpr size_t RECV_BUFFER_SIZE = 4096;

  static std::shared_ptr<SocketPipeConnection>
  create(boost::asio::ip::tcp::socket socket, DuplexPipe transport_pipe);

  SocketPipeConnection(PrivateTag, boost::asio::ip::tcp::socket socket,
                       DuplexPipe transport_pipe);
  ~SocketPipeConnection();

  SocketPipeConnection(const SocketPipeConnection &) = delete;
  SocketPipeConnection &operator=(const SocketPipeConnection &) = delete;

  void start();
  void close();

  bool is_open() const { return open_.load(); }
  const std::string &remote_address() const { return remote_addr_; }
  uint64_t connection_id() const { return id_; }

  // Fires when the connection is closed from either side
  util::CancellationToken closed_token() const { return closed_.token(); }

  void set_disconnect_callback(DisconnectCallback callback);

private:
  void read_socket();   // on strand
  void read_pipe();     // on strand
  void on_pipe_data(const boost::system::error_code &ec, ReadResult result);
  void close_impl();    // on strand

  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  DuplexPipe pipe_;
  std::array<uint8_t, RECV_BUFFER_SIZE> recv_buffer_{};
  util::CancellationSource closed_;

  std::atomic<bool> open_{true};
  std::string remote_addr_;
  uint64_t id_;
  DisconnectCallback disconnect_callback_;
};

/**
 * SocketListener - accepts inbound TCP connections.
 *
 * With an empty bind address it listens dual-stack (IPv6 with v6_only=false)
 * and falls back to IPv4-only. Port 0 binds an ephemeral port; see
 * listening_port(). Accepted sockets are handed to the callback on the
 * io_context's threads.
 */
class SocketListener {
public:
  using AcceptCallback = std::function<void(boost::asio::ip::tcp::socket socket)>;

  explicit SocketListener(boost::asio::io_context &io_context);
  ~SocketListener();

  SocketListener(const SocketListener &) = delete;
  SocketListener &operator=(const SocketListener &) = delete;

  // Returns false (and logs) if the address cannot be bound
  bool listen(const std::string &bind_address, uint16_t port,
              AcceptCallback accept_callback);
  void stop();

  uint16_t listening_port() const { return listen_port_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t listen_port_{0};
};

} // namespace network
} // namespace ftpctl
