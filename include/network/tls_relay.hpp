// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/pipe.hpp"
#include "network/relay.hpp"
#include "network/ssl_stream_wrapper.hpp"
#include <memory>

namespace ftpctl {
namespace network {

/**
 * TlsRelay - encrypted relay strategy
 *
 * Runs a server-side TLS handshake over the socket pipe, then bridges the TLS
 * session and the connection pipe in both directions:
 * - receive: fixed-size reads from the TLS stream, written to the connection
 *   pipe with a cancellation-immune flush. A zero-length read or a transport
 *   error ends the direction.
 * - transmit: chunks read from the connection pipe, written to the TLS stream
 *   with a cancellation-immune write, then consumed. Whatever is still
 *   buffered in the pipe when the loop stops is written best-effort.
 *
 * Once both directions are done the session is always shut down (close_notify)
 * before the run completes. A failed handshake completes the run with an
 * exception unless the token fired first.
 *
 * Single-use: create one instance per relay cycle.
 */
class TlsRelay : public Relay, public std::enable_shared_from_this<TlsRelay> {
public:
  static constexpr size_t RECEIVE_BUFFER_SIZE = 1024;

  TlsRelay(Strand strand, DuplexPipe socket_pipe, DuplexPipe connection_pipe,
           std::shared_ptr<SslStreamWrapperFactory> factory,
           ServerCertificate certificate);

  void async_run(const util::CancellationToken &token,
                 RelayHandler handler) override;
  const char *name() const override { return "tls"; }

private:
  void on_handshake(const boost::system::error_code &ec,
                    std::shared_ptr<SslStream> stream);
  void on_loops_joined();
  void finish(std::exception_ptr error);

  Strand strand_;
  DuplexPipe socket_pipe_;
  DuplexPipe connection_pipe_;
  std::shared_ptr<SslStreamWrapperFactory> factory_;
  ServerCertificate certificate_;

  util::CancellationSource stop_;
  std::shared_ptr<SslStream> stream_;
  RelayHandler handler_;
};

} // namespace network
} // namespace ftpctl
