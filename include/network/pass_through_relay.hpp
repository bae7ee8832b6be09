// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/pipe.hpp"
#include "network/relay.hpp"
#include <memory>

namespace ftpctl {
namespace network {

/**
 * PassThroughRelay - unencrypted relay strategy
 *
 * Copies bytes unmodified in both directions (connection -> socket "transmit",
 * socket -> connection "receive") with no protocol awareness. When either
 * direction ends or the token fires, the pending reads on both physical pipes
 * are cancelled; the run completes once both directions have exited.
 *
 * Single-use: create one instance per relay cycle.
 */
class PassThroughRelay : public Relay,
                         public std::enable_shared_from_this<PassThroughRelay> {
public:
  PassThroughRelay(Strand strand, DuplexPipe socket_pipe,
                   DuplexPipe connection_pipe);

  void async_run(const util::CancellationToken &token,
                 RelayHandler handler) override;
  const char *name() const override { return "pass-through"; }

private:
  Strand strand_;
  DuplexPipe socket_pipe_;
  DuplexPipe connection_pipe_;
  util::CancellationSource stop_;
};

} // namespace network
} // namespace ftpctl
