// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tls_stream_service.hpp"
#include "network/errors.hpp"
#include "network/pass_through_relay.hpp"
#include "network/tls_relay.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace ftpctl {
namespace network {

namespace {

std::string DescribeFailure(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

[[noreturn]] void ThrowTransition(const char *call, const char *expected,
                                  ConnectionStatus actual) {
  throw InvalidStateTransition(std::string(call) + ": expected status " + expected +
                               ", service is " + ConnectionStatusAsString(actual));
}

} // namespace

std::shared_ptr<TlsStreamService> TlsStreamService::create(
    boost::asio::any_io_executor executor, DuplexPipe socket_pipe,
    DuplexPipe connection_pipe, std::shared_ptr<SslStreamWrapperFactory> ssl_factory,
    std::optional<ServerCertificate> certificate,
    util::CancellationSource connection_closed) {
  return std::make_shared<TlsStreamService>(
      PrivateTag{}, std::move(executor), std::move(socket_pipe),
      std::move(connection_pipe), std::move(ssl_factory), std::move(certificate),
      std::move(connection_closed));
}

TlsStreamService::TlsStreamService(
    PrivateTag, boost::asio::any_io_executor executor, DuplexPipe socket_pipe,
    DuplexPipe connection_pipe, std::shared_ptr<SslStreamWrapperFactory> ssl_factory,
    std::optional<ServerCertificate> certificate,
    util::CancellationSource connection_closed)
    : strand_(boost::asio::make_strand(executor)), socket_pipe_(std::move(socket_pipe)),
      connection_pipe_(std::move(connection_pipe)),
      ssl_factory_(std::move(ssl_factory)), certificate_(std::move(certificate)),
      connection_closed_(std::move(connection_closed)) {
  if (!ssl_factory_) {
    ssl_factory_ = std::make_shared<DefaultSslStreamWrapperFactory>();
  }
}

void TlsStreamService::set_encryption_enabled(bool enabled) {
  if (enabled && !certificate_) {
    throw ConfigurationError("cannot enable encryption: no server certificate configured");
  }
  encryption_enabled_.store(enabled);
  LOG_RELAY_DEBUG("encryption {} for next relay cycle", enabled ? "enabled" : "disabled");
}

ServiceHandle TlsStreamService::start() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  ConnectionStatus current = status_.load();
  if (current != ConnectionStatus::READY_TO_RUN) {
    ThrowTransition("start", "ReadyToRun", current);
  }
  return launch_cycle_locked()->handle;
}

ServiceHandle TlsStreamService::resume() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  ConnectionStatus current = status_.load();
  if (current == ConnectionStatus::STOPPED) {
    LOG_RELAY_DEBUG("resume ignored: service already stopped");
    return ready_handle();
  }
  if (current != ConnectionStatus::PAUSED) {
    ThrowTransition("resume", "Paused", current);
  }
  return launch_cycle_locked()->handle;
}

ServiceHandle TlsStreamService::pause() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  ConnectionStatus current = status_.load();
  if (current != ConnectionStatus::RUNNING) {
    ThrowTransition("pause", "Running", current);
  }
  LOG_RELAY_DEBUG("pausing relay cycle {}", cycle_->id);
  socket_pipe_.input().cancel_pending_read();
  cycle_->paused.cancel();
  return cycle_->handle;
}

ServiceHandle TlsStreamService::stop() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  switch (status_.load()) {
  case ConnectionStatus::STOPPED:
    return ready_handle();
  case ConnectionStatus::PAUSED:
    // No cycle in flight: nobody else will complete the pipes
    LOG_RELAY_DEBUG("stopping paused service");
    stopped_.cancel();
    complete_pipes();
    status_.store(ConnectionStatus::STOPPED);
    return ready_handle();
  case ConnectionStatus::RUNNING:
    LOG_RELAY_DEBUG("stopping relay cycle {}", cycle_->id);
    socket_pipe_.input().cancel_pending_read();
    stopped_.cancel();
    return cycle_->handle;
  case ConnectionStatus::READY_TO_RUN:
    break;
  }
  ThrowTransition("stop", "Running, Paused or Stopped", status_.load());
}

std::shared_ptr<TlsStreamService::RelayCycle> TlsStreamService::launch_cycle_locked() {
  auto cycle = std::make_shared<RelayCycle>();
  cycle->id = ++cycle_count_;
  cycle->handle = cycle->done.get_future().share();
  cycle_ = cycle;
  status_.store(ConnectionStatus::RUNNING);

  boost::asio::post(strand_, [self = shared_from_this(), cycle]() {
    self->run_cycle(cycle);
  });
  return cycle;
}

std::shared_ptr<Relay> TlsStreamService::make_relay() {
  if (encryption_enabled_.load() && certificate_) {
    return std::make_shared<TlsRelay>(strand_, socket_pipe_, connection_pipe_,
                                      ssl_factory_, *certificate_);
  }
  return std::make_shared<PassThroughRelay>(strand_, socket_pipe_, connection_pipe_);
}

void TlsStreamService::run_cycle(const std::shared_ptr<RelayCycle> &cycle) {
  cycle->active = util::CancellationSource::create_linked(
      {connection_closed_.token(), stopped_.token(), cycle->paused.token()});

  try {
    cycle->relay = make_relay();
    LOG_RELAY_DEBUG("relay cycle {} running ({})", cycle->id, cycle->relay->name());
    cycle->relay->async_run(cycle->active.token(),
                            [self = shared_from_this(), cycle](std::exception_ptr error) {
                              self->finish_cycle(cycle, error);
                            });
  } catch (const std::exception &e) {
    LOG_RELAY_WARN("relay cycle {} failed to start: {}", cycle->id, e.what());
    finish_cycle(cycle, std::current_exception());
  }
}

void TlsStreamService::finish_cycle(const std::shared_ptr<RelayCycle> &cycle,
                                    std::exception_ptr error) {
  if (error) {
    LOG_RELAY_ERROR("relay cycle {} failed: {}; closing connection", cycle->id,
                    DescribeFailure(error));
    connection_closed_.cancel();
  }

  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    const bool paused_only = !error && cycle->paused.is_cancellation_requested() &&
                             !stopped_.is_cancellation_requested() &&
                             !connection_closed_.is_cancellation_requested();
    if (paused_only) {
      status_.store(ConnectionStatus::PAUSED);
      LOG_RELAY_DEBUG("relay cycle {} paused", cycle->id);
    } else {
      complete_pipes();
      status_.store(ConnectionStatus::STOPPED);
      LOG_RELAY_DEBUG("relay cycle {} stopped", cycle->id);
    }
  }

  cycle->relay.reset();
  cycle->done.set_value();
}

void TlsStreamService::complete_pipes() {
  if (pipes_completed_.exchange(true)) {
    return;
  }
  socket_pipe_.input().complete();
  socket_pipe_.output().complete();
  connection_pipe_.input().complete();
  connection_pipe_.output().complete();
}

ServiceHandle TlsStreamService::ready_handle() {
  std::promise<void> done;
  done.set_value();
  return done.get_future().share();
}

} // namespace network
} // namespace ftpctl
