// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/pipe_copy.hpp"
#include "util/logging.hpp"

namespace ftpctl {
namespace network {

std::shared_ptr<PipeCopyLoop>
PipeCopyLoop::create(std::shared_ptr<Pipe> source, std::shared_ptr<Pipe> destination,
                     util::CancellationToken token, std::string name,
                     std::function<void()> on_finished) {
  return std::make_shared<PipeCopyLoop>(PrivateTag{}, std::move(source),
                                        std::move(destination), std::move(token),
                                        std::move(name), std::move(on_finished));
}

PipeCopyLoop::PipeCopyLoop(PrivateTag, std::shared_ptr<Pipe> source,
                           std::shared_ptr<Pipe> destination,
                           util::CancellationToken token, std::string name,
                           std::function<void()> on_finished)
    : source_(std::move(source)), destination_(std::move(destination)),
      token_(std::move(token)), name_(std::move(name)),
      on_finished_(std::move(on_finished)) {}

void PipeCopyLoop::start() {
  LOG_RELAY_TRACE("{}: starting", name_);
  read_next();
}

void PipeCopyLoop::read_next() {
  LOG_RELAY_TRACE("{}: reading", name_);
  source_->reader().async_read(
      token_, [self = shared_from_this()](const boost::system::error_code &ec,
                                          ReadResult result) {
        self->on_read(ec, std::move(result));
      });
}

void PipeCopyLoop::on_read(const boost::system::error_code &ec, ReadResult result) {
  if (ec) {
    // Aborted by the relay token; unread bytes stay in the source pipe
    LOG_RELAY_TRACE("{}: cancelled", name_);
    finish();
    return;
  }

  LOG_RELAY_TRACE("{}: read result: is_canceled={}, is_completed={}", name_,
                  result.is_canceled, result.is_completed);

  size_t total = 0;
  for (const auto &segment : result.buffer) {
    LOG_RELAY_TRACE("{}: received {} bytes", name_, segment.size());
    destination_->writer().write(segment);
    total += segment.size();
  }
  // write() copied the bytes, so the chunk can be released before the flush
  source_->reader().advance(total);
  bytes_copied_ += total;

  const bool last = result.is_canceled || result.is_completed;
  if (total == 0) {
    if (last) {
      finish();
    } else {
      read_next();
    }
    return;
  }

  // Flush outside the relay token; otherwise data already taken out of the
  // source could be dropped at a pause boundary.
  destination_->writer().async_flush(
      util::CancellationToken::none(),
      [self = shared_from_this(), last](const boost::system::error_code &flush_ec,
                                        FlushResult flushed) {
        if (flush_ec || flushed.is_completed || flushed.is_canceled || last) {
          self->finish();
          return;
        }
        self->read_next();
      });
}

void PipeCopyLoop::finish() {
  LOG_RELAY_TRACE("{}: stopped after {} bytes", name_, bytes_copied_);
  auto on_finished = std::move(on_finished_);
  on_finished_ = nullptr;
  if (on_finished) {
    on_finished();
  }
}

} // namespace network
} // namespace ftpctl
