// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/socket_transport.hpp"
#include "util/logging.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace ftpctl {
namespace network {

namespace {
std::atomic<uint64_t> g_next_connection_id{1};
}

// ============================================================================
// SocketPipeConnection
// ============================================================================

std::shared_ptr<SocketPipeConnection>
SocketPipeConnection::create(boost::asio::ip::tcp::socket socket,
                             DuplexPipe transport_pipe) {
  return std::make_shared<SocketPipeConnection>(PrivateTag{}, std::move(socket),
                                                std::move(transport_pipe));
}

SocketPipeConnection::SocketPipeConnection(PrivateTag,
                                           boost::asio::ip::tcp::socket socket,
                                           DuplexPipe transport_pipe)
    : socket_(std::move(socket)), strand_(boost::asio::make_strand(socket_.get_executor())),
      pipe_(std::move(transport_pipe)), id_(g_next_connection_id.fetch_add(1)) {
  boost::system::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  remote_addr_ = ec ? std::string("unknown")
                    : remote.address().to_string() + ":" + std::to_string(remote.port());
}

SocketPipeConnection::~SocketPipeConnection() {
  // Handlers hold shared_from_this(); reaching here means none is pending
  boost::system::error_code ec;
  socket_.close(ec);
}

void SocketPipeConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_) {
      return;
    }
    LOG_NET_DEBUG("connection {} ({}) started", self->id_, self->remote_addr_);
    self->read_socket();
    self->read_pipe();
  });
}

void SocketPipeConnection::set_disconnect_callback(DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [self = shared_from_this(), cb = std::move(callback)]() mutable {
    self->disconnect_callback_ = std::move(cb);
  });
}

void SocketPipeConnection::read_socket() {
  socket_.async_read_some(
      boost::asio::buffer(recv_buffer_),
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                               size_t bytes) {
            if (!self->open_) {
              return;
            }
            if (ec) {
              if (ec != boost::asio::error::eof &&
                  ec != boost::asio::error::operation_aborted) {
                LOG_NET_TRACE("read error from {}: {}", self->remote_addr_, ec.message());
              }
              self->close_impl();
              return;
            }

            LOG_NET_TRACE("tcp received {} bytes from {}", bytes, self->remote_addr_);
            self->pipe_.output().async_write(
                std::span<const uint8_t>(self->recv_buffer_.data(), bytes),
                util::CancellationToken::none(),
                [self](const boost::system::error_code &flush_ec, FlushResult flushed) {
                  boost::asio::dispatch(self->strand_, [self, flush_ec, flushed]() {
                    if (!self->open_) {
                      return;
                    }
                    if (flush_ec || flushed.is_completed) {
                      // Nobody reads from this connection any more
                      self->close_impl();
                      return;
                    }
                    self->read_socket();
                  });
                });
          }));
}

void SocketPipeConnection::read_pipe() {
  pipe_.input().async_read(
      closed_.token(), [self = shared_from_this()](const boost::system::error_code &ec,
                                                   ReadResult result) {
        boost::asio::dispatch(self->strand_, [self, ec, result = std::move(result)]() {
          self->on_pipe_data(ec, result);
        });
      });
}

void SocketPipeConnection::on_pipe_data(const boost::system::error_code &ec,
                                        ReadResult result) {
  if (ec || !open_) {
    return;
  }

  if (result.empty()) {
    if (result.is_completed) {
      // The relay finished sending: half-close, keep reading until the peer
      // closes its side too
      LOG_NET_TRACE("connection {}: send side complete", id_);
      boost::system::error_code shutdown_ec;
      socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, shutdown_ec);
      pipe_.input().complete();
      return;
    }
    // Canceled without data (e.g. a displaced read); keep going
    read_pipe();
    return;
  }

  std::vector<boost::asio::const_buffer> buffers;
  buffers.reserve(result.buffer.size());
  for (const auto &segment : result.buffer) {
    buffers.emplace_back(segment.data(), segment.size());
  }
  const size_t size = result.size();

  boost::asio::async_write(
      socket_, buffers,
      boost::asio::bind_executor(
          strand_, [self = shared_from_this(),
                    size](const boost::system::error_code &write_ec, size_t) {
            self->pipe_.input().advance(size);
            if (!self->open_) {
              return;
            }
            if (write_ec) {
              LOG_NET_TRACE("write error to {}: {}", self->remote_addr_,
                            write_ec.message());
              self->close_impl();
              return;
            }
            LOG_NET_TRACE("tcp sent {} bytes to {}", size, self->remote_addr_);
            // A completed input is observed (and half-closed) by the next read
            self->read_pipe();
          }));
}

void SocketPipeConnection::close() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->close_impl(); });
}

void SocketPipeConnection::close_impl() {
  if (!open_.exchange(false)) {
    return;
  }

  LOG_NET_DEBUG("connection {} ({}) closed", id_, remote_addr_);

  boost::system::error_code ec;
  socket_.cancel(ec);
  socket_.close(ec);

  closed_.cancel();
  pipe_.output().complete();
  pipe_.input().complete();

  DisconnectCallback callback = std::move(disconnect_callback_);
  disconnect_callback_ = nullptr;
  if (callback) {
    try {
      callback();
    } catch (const std::exception &e) {
      LOG_NET_WARN("exception in disconnect callback for {}: {}", remote_addr_,
                   e.what());
    }
  }
}

// ============================================================================
// SocketListener
// ============================================================================

SocketListener::SocketListener(boost::asio::io_context &io_context)
    : io_context_(io_context) {}

SocketListener::~SocketListener() { stop(); }

bool SocketListener::listen(const std::string &bind_address, uint16_t port,
                            AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  using tcp = boost::asio::ip::tcp;
  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    if (!bind_address.empty()) {
      tcp::endpoint endpoint(boost::asio::ip::make_address(bind_address), port);
      acceptor_->open(endpoint.protocol());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(endpoint);
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } else {
      // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
      try {
        acceptor_->open(tcp::v6());
        acceptor_->set_option(boost::asio::ip::v6_only(false));
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(tcp::endpoint(tcp::v6(), port));
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);
      } catch (const boost::system::system_error &) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        acceptor_->open(tcp::v4());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(tcp::endpoint(tcp::v4(), port));
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);
      }
    }

    // Record the actual bound port (handles ephemeral port 0)
    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listen_port_ = ec ? 0 : ep.port();

    LOG_NET_INFO("listening on {}:{}", bind_address.empty() ? "*" : bind_address,
                 listen_port_ ? listen_port_ : port);
    start_accept();
    return true;
  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void SocketListener::start_accept() {
  if (!acceptor_) {
    return;
  }
  // stop() cancels the pending accept before the listener goes away
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void SocketListener::handle_accept(const boost::system::error_code &ec,
                                   boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  // Best-effort socket options
  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  boost::system::error_code ep_ec;
  auto remote = socket.remote_endpoint(ep_ec);
  LOG_NET_DEBUG("connection from {} accepted",
                ep_ec ? std::string("unknown")
                      : remote.address().to_string() + ":" + std::to_string(remote.port()));

  if (accept_callback_) {
    try {
      accept_callback_(std::move(socket));
    } catch (const std::exception &e) {
      LOG_NET_WARN("exception in accept callback: {}", e.what());
    }
  }

  start_accept();
}

void SocketListener::stop() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listen_port_ = 0;
  accept_callback_ = {};
}

} // namespace network
} // namespace ftpctl
