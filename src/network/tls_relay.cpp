// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tls_relay.hpp"
#include "util/logging.hpp"
#include <array>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

namespace ftpctl {
namespace network {

namespace {

// TLS stream -> connection pipe
class TlsReceiveLoop : public std::enable_shared_from_this<TlsReceiveLoop> {
public:
  TlsReceiveLoop(Strand strand, std::shared_ptr<SslStream> stream,
                 std::shared_ptr<Pipe> destination, std::function<void()> on_finished)
      : strand_(std::move(strand)), stream_(std::move(stream)),
        destination_(std::move(destination)), on_finished_(std::move(on_finished)) {}

  void start() {
    boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->read_next(); });
  }

private:
  void read_next() {
    // The read itself cannot be cancelled; it ends when the raw stream's token
    // aborts the underlying pipe read.
    stream_->async_read_some(
        boost::asio::buffer(buffer_),
        boost::asio::bind_executor(
            strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                                 size_t bytes) {
              self->on_read(ec, bytes);
            }));
  }

  void on_read(const boost::system::error_code &ec, size_t bytes) {
    if (ec || bytes == 0) {
      LOG_RELAY_TRACE("tls.receive: read ended ({})",
                      ec ? ec.message() : "end of stream");
      finish();
      return;
    }

    LOG_RELAY_TRACE("tls.receive: received {} bytes", bytes);
    bytes_copied_ += bytes;
    destination_->writer().async_write(
        std::span<const uint8_t>(buffer_.data(), bytes),
        util::CancellationToken::none(),
        [self = shared_from_this()](const boost::system::error_code &flush_ec,
                                    FlushResult flushed) {
          if (flush_ec || flushed.is_completed || flushed.is_canceled) {
            boost::asio::post(self->strand_, [self]() { self->finish(); });
            return;
          }
          boost::asio::post(self->strand_, [self]() { self->read_next(); });
        });
  }

  void finish() {
    LOG_RELAY_TRACE("tls.receive: stopped after {} bytes", bytes_copied_);
    auto on_finished = std::move(on_finished_);
    on_finished_ = nullptr;
    if (on_finished) {
      on_finished();
    }
  }

  Strand strand_;
  std::shared_ptr<SslStream> stream_;
  std::shared_ptr<Pipe> destination_;
  std::function<void()> on_finished_;
  std::array<uint8_t, TlsRelay::RECEIVE_BUFFER_SIZE> buffer_{};
  uint64_t bytes_copied_{0};
};

// Connection pipe -> TLS stream
class TlsTransmitLoop : public std::enable_shared_from_this<TlsTransmitLoop> {
public:
  TlsTransmitLoop(Strand strand, std::shared_ptr<Pipe> source,
                  std::shared_ptr<SslStream> stream, util::CancellationToken token,
                  std::function<void()> on_finished)
      : strand_(std::move(strand)), source_(std::move(source)),
        stream_(std::move(stream)), token_(std::move(token)),
        on_finished_(std::move(on_finished)) {}

  void start() { read_next(); }

private:
  void read_next() {
    source_->reader().async_read(
        token_, [self = shared_from_this()](const boost::system::error_code &ec,
                                            ReadResult result) {
          boost::asio::dispatch(self->strand_,
                                [self, ec, result = std::move(result)]() {
                                  self->on_read(ec, result);
                                });
        });
  }

  void on_read(const boost::system::error_code &ec, const ReadResult &result) {
    if (ec) {
      LOG_RELAY_TRACE("tls.transmit: cancelled");
      flush_remaining();
      return;
    }

    const bool last = result.is_canceled || result.is_completed;
    if (result.empty()) {
      if (last) {
        flush_remaining();
      } else {
        read_next();
      }
      return;
    }

    std::vector<boost::asio::const_buffer> buffers;
    buffers.reserve(result.buffer.size());
    for (const auto &segment : result.buffer) {
      buffers.emplace_back(segment.data(), segment.size());
    }
    const size_t size = result.size();
    LOG_RELAY_TRACE("tls.transmit: sending {} bytes", size);

    // Immune to the relay token: these bytes are already out of the pipe's
    // pending read and must reach the peer.
    boost::asio::async_write(
        *stream_, buffers,
        boost::asio::bind_executor(
            strand_, [self = shared_from_this(), size,
                      last](const boost::system::error_code &write_ec, size_t) {
              self->source_->reader().advance(size);
              if (write_ec) {
                LOG_RELAY_TRACE("tls.transmit: write failed: {}", write_ec.message());
                self->finish();
                return;
              }
              self->bytes_copied_ += size;
              if (last) {
                self->flush_remaining();
                return;
              }
              self->read_next();
            }));
  }

  // Data that was buffered in the pipe when the loop stopped is still sent;
  // the peer may already be gone, so failures only end the attempt.
  void flush_remaining() {
    ReadResult remaining;
    if (!source_->reader().try_read(remaining) || remaining.empty()) {
      finish();
      return;
    }

    auto data = std::make_shared<std::vector<uint8_t>>(remaining.to_vector());
    source_->reader().advance(data->size());
    LOG_RELAY_TRACE("tls.transmit: flushing {} remaining bytes", data->size());
    boost::asio::async_write(
        *stream_, boost::asio::buffer(*data),
        boost::asio::bind_executor(
            strand_, [self = shared_from_this(),
                      data](const boost::system::error_code &write_ec, size_t) {
              if (write_ec) {
                LOG_RELAY_TRACE("tls.transmit: final flush failed: {}",
                                write_ec.message());
              } else {
                self->bytes_copied_ += data->size();
              }
              self->finish();
            }));
  }

  void finish() {
    LOG_RELAY_TRACE("tls.transmit: stopped after {} bytes", bytes_copied_);
    auto on_finished = std::move(on_finished_);
    on_finished_ = nullptr;
    if (on_finished) {
      on_finished();
    }
  }

  Strand strand_;
  std::shared_ptr<Pipe> source_;
  std::shared_ptr<SslStream> stream_;
  util::CancellationToken token_;
  std::function<void()> on_finished_;
  uint64_t bytes_copied_{0};
};

} // namespace

TlsRelay::TlsRelay(Strand strand, DuplexPipe socket_pipe, DuplexPipe connection_pipe,
                   std::shared_ptr<SslStreamWrapperFactory> factory,
                   ServerCertificate certificate)
    : strand_(std::move(strand)), socket_pipe_(std::move(socket_pipe)),
      connection_pipe_(std::move(connection_pipe)), factory_(std::move(factory)),
      certificate_(std::move(certificate)) {}

void TlsRelay::async_run(const util::CancellationToken &token, RelayHandler handler) {
  stop_ = util::CancellationSource::create_linked({token});
  handler_ = std::move(handler);

  // Raw reads run under the relay-local token, so a stop or pause aborts a
  // handshake or record read that is waiting on the socket.
  RawStream raw(socket_pipe_, stop_.token(), strand_);

  auto self = shared_from_this();
  try {
    factory_->async_wrap_stream(
        std::move(raw), certificate_,
        [self](const boost::system::error_code &ec, std::shared_ptr<SslStream> stream) {
          boost::asio::dispatch(self->strand_, [self, ec, stream]() {
            self->on_handshake(ec, stream);
          });
        });
  } catch (const std::exception &e) {
    LOG_TLS_WARN("cannot start TLS session: {}", e.what());
    boost::asio::post(strand_, [self, error = std::current_exception()]() {
      self->finish(error);
    });
  }
}

void TlsRelay::on_handshake(const boost::system::error_code &ec,
                            std::shared_ptr<SslStream> stream) {
  if (ec || !stream) {
    if (stop_.is_cancellation_requested()) {
      LOG_TLS_DEBUG("handshake interrupted by cancellation");
      finish(nullptr);
      return;
    }
    finish(std::make_exception_ptr(
        boost::system::system_error(ec, "TLS handshake failed")));
    return;
  }

  LOG_TLS_DEBUG("TLS session established");
  stream_ = std::move(stream);

  auto self = shared_from_this();
  auto race = CopyRace::create(
      strand_, 2, stop_.token(),
      [self]() {
        LOG_RELAY_TRACE("tls: winding down");
        self->socket_pipe_.input().cancel_pending_read();
        self->connection_pipe_.input().cancel_pending_read();
        self->stop_.cancel();
      },
      [self]() { self->on_loops_joined(); });
  race->arm();

  auto receive = std::make_shared<TlsReceiveLoop>(
      strand_, stream_, connection_pipe_.output_pipe(),
      [race]() { race->branch_finished(); });
  auto transmit = std::make_shared<TlsTransmitLoop>(
      strand_, connection_pipe_.input_pipe(), stream_, stop_.token(),
      [race]() { race->branch_finished(); });

  receive->start();
  transmit->start();
}

void TlsRelay::on_loops_joined() {
  LOG_RELAY_TRACE("tls: both directions stopped, closing session");
  auto self = shared_from_this();
  factory_->async_close_stream(stream_, [self](const boost::system::error_code &) {
    boost::asio::dispatch(self->strand_, [self]() {
      self->stream_.reset();
      self->finish(nullptr);
    });
  });
}

void TlsRelay::finish(std::exception_ptr error) {
  auto handler = std::move(handler_);
  handler_ = nullptr;
  if (handler) {
    handler(error);
  }
}

} // namespace network
} // namespace ftpctl
