// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/pipe.hpp"
#include "util/cancellation.hpp"
#include <functional>
#include <memory>
#include <string>

namespace ftpctl {
namespace network {

/**
 * PipeCopyLoop - one direction of a pass-through relay.
 *
 * Reads the next chunk from the source pipe under the given token, writes
 * every segment to the destination and flushes it with a cancellation-immune
 * flush, then consumes the chunk. Bytes that were read are therefore always
 * delivered, even if the token fires while they are in flight.
 *
 * Ends when the source reports cancellation or completion, when the read is
 * aborted by the token, or when the destination's reader is gone.
 * on_finished is invoked exactly once.
 */
class PipeCopyLoop : public std::enable_shared_from_this<PipeCopyLoop> {
private:
  struct PrivateTag {};

public:
  static std::shared_ptr<PipeCopyLoop>
  create(std::shared_ptr<Pipe> source, std::shared_ptr<Pipe> destination,
         util::CancellationToken token, std::string name,
         std::function<void()> on_finished);

  PipeCopyLoop(PrivateTag, std::shared_ptr<Pipe> source,
               std::shared_ptr<Pipe> destination, util::CancellationToken token,
               std::string name, std::function<void()> on_finished);

  void start();

  uint64_t bytes_copied() const { return bytes_copied_; }

private:
  void read_next();
  void on_read(const boost::system::error_code &ec, ReadResult result);
  void finish();

  std::shared_ptr<Pipe> source_;
  std::shared_ptr<Pipe> destination_;
  util::CancellationToken token_;
  std::string name_;
  std::function<void()> on_finished_;
  uint64_t bytes_copied_{0};
};

} // namespace network
} // namespace ftpctl
