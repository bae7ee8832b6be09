// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/communication_service.hpp"
#include "network/pipe.hpp"
#include "network/relay.hpp"
#include "network/ssl_stream_wrapper.hpp"
#include "util/cancellation.hpp"
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace ftpctl {
namespace network {

/**
 * TlsStreamService - relays one control connection between its socket pipe and
 * its connection pipe, optionally through a TLS session.
 *
 * Each start()/resume() launches one relay cycle on the service's strand. The
 * relay strategy (pass-through or TLS) is chosen at cycle start from the
 * current encryption flag, so the flag can be toggled while paused.
 *
 * A cycle runs until one of three signals fires or the relay ends on its own:
 * - connection_closed: owned by the enclosing connection, never reset
 * - stopped: service-owned, fired by stop()
 * - paused: fresh for every cycle, fired by pause()
 *
 * At cycle end:
 * - paused fired (and nothing else): status PAUSED, pipes stay open
 * - otherwise: all four pipe ends are completed once, status STOPPED
 * - relay failed unexpectedly: connection_closed is fired first, then as above
 *
 * Control calls are not synchronized against each other: callers issue one at
 * a time. The internal mutex only orders a control call against the
 * end-of-cycle status decision. The returned handles become ready when the
 * cycle they refer to has unwound.
 */
class TlsStreamService : public CommunicationService,
                         public std::enable_shared_from_this<TlsStreamService> {
private:
  struct PrivateTag {};

public:
  static std::shared_ptr<TlsStreamService>
  create(boost::asio::any_io_executor executor, DuplexPipe socket_pipe,
         DuplexPipe connection_pipe,
         std::shared_ptr<SslStreamWrapperFactory> ssl_factory,
         std::optional<ServerCertificate> certificate,
         util::CancellationSource connection_closed);

  TlsStreamService(PrivateTag, boost::asio::any_io_executor executor,
                   DuplexPipe socket_pipe, DuplexPipe connection_pipe,
                   std::shared_ptr<SslStreamWrapperFactory> ssl_factory,
                   std::optional<ServerCertificate> certificate,
                   util::CancellationSource connection_closed);

  TlsStreamService(const TlsStreamService &) = delete;
  TlsStreamService &operator=(const TlsStreamService &) = delete;

  // CommunicationService
  ServiceHandle start() override;
  ServiceHandle stop() override;
  ServiceHandle pause() override;
  ServiceHandle resume() override;
  ConnectionStatus status() const override { return status_.load(); }

  // TLS configuration
  bool has_certificate() const { return certificate_.has_value(); }
  bool encryption_enabled() const { return encryption_enabled_.load(); }
  // Throws ConfigurationError when enabling without a certificate; the flag
  // is left unchanged in that case. Takes effect at the next cycle start.
  void set_encryption_enabled(bool enabled);

  // Number of relay cycles launched so far
  uint64_t cycle_count() const { return cycle_count_.load(); }

private:
  // Per-cycle state; lives until the cycle has unwound
  struct RelayCycle {
    uint64_t id = 0;
    util::CancellationSource paused;
    util::CancellationSource active;
    std::shared_ptr<Relay> relay;
    std::promise<void> done;
    ServiceHandle handle;
  };

  // Must be called with control_mutex_ held
  std::shared_ptr<RelayCycle> launch_cycle_locked();

  void run_cycle(const std::shared_ptr<RelayCycle> &cycle);    // on strand
  void finish_cycle(const std::shared_ptr<RelayCycle> &cycle,
                    std::exception_ptr error);
  std::shared_ptr<Relay> make_relay();
  void complete_pipes();

  static ServiceHandle ready_handle();

  Strand strand_;
  DuplexPipe socket_pipe_;
  DuplexPipe connection_pipe_;
  std::shared_ptr<SslStreamWrapperFactory> ssl_factory_;
  const std::optional<ServerCertificate> certificate_;

  util::CancellationSource connection_closed_;
  util::CancellationSource stopped_;

  std::atomic<ConnectionStatus> status_{ConnectionStatus::READY_TO_RUN};
  std::atomic<bool> encryption_enabled_{false};
  std::atomic<bool> pipes_completed_{false};
  std::atomic<uint64_t> cycle_count_{0};

  // Serializes control calls against the end-of-cycle decision
  mutable std::mutex control_mutex_;
  std::shared_ptr<RelayCycle> cycle_;
};

} // namespace network
} // namespace ftpctl
