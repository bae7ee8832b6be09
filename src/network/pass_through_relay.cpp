// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/pass_through_relay.hpp"
#include "network/pipe_copy.hpp"
#include "util/logging.hpp"

namespace ftpctl {
namespace network {

PassThroughRelay::PassThroughRelay(Strand strand, DuplexPipe socket_pipe,
                                   DuplexPipe connection_pipe)
    : strand_(std::move(strand)), socket_pipe_(std::move(socket_pipe)),
      connection_pipe_(std::move(connection_pipe)) {}

void PassThroughRelay::async_run(const util::CancellationToken &token,
                                 RelayHandler handler) {
  // Relay-local stop: fires with the cycle token, or when the first
  // direction ends so the other one does not wait forever.
  stop_ = util::CancellationSource::create_linked({token});

  auto self = shared_from_this();
  auto race = CopyRace::create(
      strand_, 2, stop_.token(),
      [self]() {
        LOG_RELAY_TRACE("pass-through: winding down");
        self->socket_pipe_.input().cancel_pending_read();
        self->connection_pipe_.input().cancel_pending_read();
        self->stop_.cancel();
      },
      [self, handler = std::move(handler)]() {
        LOG_RELAY_TRACE("pass-through: both directions stopped");
        handler(nullptr);
      });
  race->arm();

  auto transmit = PipeCopyLoop::create(
      connection_pipe_.input_pipe(), socket_pipe_.output_pipe(), stop_.token(),
      "pass-through.transmit", [race]() { race->branch_finished(); });
  auto receive = PipeCopyLoop::create(
      socket_pipe_.input_pipe(), connection_pipe_.output_pipe(), stop_.token(),
      "pass-through.receive", [race]() { race->branch_finished(); });

  transmit->start();
  receive->start();
}

} // namespace network
} // namespace ftpctl
