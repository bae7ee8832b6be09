// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/cancellation.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>

namespace ftpctl {
namespace network {

using Strand = boost::asio::strand<boost::asio::any_io_executor>;

// Completion of one relay run. A non-null exception is an unexpected failure
// that the owner must escalate; orderly ends (cancellation, peer closure)
// complete with nullptr.
using RelayHandler = std::function<void(std::exception_ptr error)>;

// Relay strategy: moves bytes between the socket-side and connection-side
// pipes until cancelled or one direction ends.
class Relay {
public:
  virtual ~Relay() = default;

  virtual void async_run(const util::CancellationToken &token,
                         RelayHandler handler) = 0;
  virtual const char *name() const = 0;
};

/**
 * CopyRace - races N directional copy loops against a cancellation token and
 * joins them.
 *
 * on_first runs once, as soon as the token fires or the first branch
 * finishes; owners use it to wake the remaining branches. on_joined runs once
 * every branch has reported completion, and never before on_first. Both run on
 * the strand. branch_finished() may be called from any thread.
 */
class CopyRace : public std::enable_shared_from_this<CopyRace> {
private:
  struct PrivateTag {};

public:
  using Callback = std::function<void()>;

  static std::shared_ptr<CopyRace> create(Strand strand, size_t branches,
                                          util::CancellationToken token,
                                          Callback on_first, Callback on_joined);

  CopyRace(PrivateTag, Strand strand, size_t branches,
           util::CancellationToken token, Callback on_first, Callback on_joined);

  // Start watching the token. Call once, after construction.
  void arm();

  void branch_finished();

private:
  void fire_first();  // on strand
  void join_one();    // on strand

  Strand strand_;
  size_t remaining_;
  util::CancellationToken token_;
  util::CancellationRegistration registration_;
  bool first_fired_{false};
  bool joined_{false};
  Callback on_first_;
  Callback on_joined_;
};

} // namespace network
} // namespace ftpctl
