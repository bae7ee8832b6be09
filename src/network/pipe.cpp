// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/pipe.hpp"
#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace ftpctl {
namespace network {

// ============================================================================
// ReadResult
// ============================================================================

size_t ReadResult::size() const {
  size_t total = 0;
  for (const auto &segment : buffer) {
    total += segment.size();
  }
  return total;
}

std::vector<uint8_t> ReadResult::to_vector() const {
  std::vector<uint8_t> out;
  out.reserve(size());
  for (const auto &segment : buffer) {
    out.insert(out.end(), segment.begin(), segment.end());
  }
  return out;
}

// ============================================================================
// PipeReader / PipeWriter
// ============================================================================

void PipeReader::async_read(const util::CancellationToken &token,
                            ReadHandler handler) {
  pipe_.async_read(token, std::move(handler));
}

bool PipeReader::try_read(ReadResult &result) { return pipe_.try_read(result); }

void PipeReader::advance(size_t consumed) { pipe_.advance(consumed); }

void PipeReader::cancel_pending_read() { pipe_.cancel_pending_read(); }

void PipeReader::complete() { pipe_.complete_reader(); }

bool PipeReader::is_completed() const {
  std::lock_guard<std::mutex> lock(pipe_.mutex_);
  return pipe_.reader_completed_;
}

void PipeWriter::write(std::span<const uint8_t> data) { pipe_.write(data); }

void PipeWriter::async_flush(const util::CancellationToken &token,
                             FlushHandler handler) {
  pipe_.async_flush(token, std::move(handler));
}

void PipeWriter::async_write(std::span<const uint8_t> data,
                             const util::CancellationToken &token,
                             FlushHandler handler) {
  pipe_.write(data);
  pipe_.async_flush(token, std::move(handler));
}

void PipeWriter::complete() { pipe_.complete_writer(); }

bool PipeWriter::is_completed() const {
  std::lock_guard<std::mutex> lock(pipe_.mutex_);
  return pipe_.writer_completed_;
}

// ============================================================================
// Pipe
// ============================================================================

std::shared_ptr<Pipe> Pipe::create(boost::asio::any_io_executor executor,
                                   PipeOptions options) {
  return std::make_shared<Pipe>(PrivateTag{}, std::move(executor), options);
}

Pipe::Pipe(PrivateTag, boost::asio::any_io_executor executor, PipeOptions options)
    : executor_(std::move(executor)), options_(options), reader_(*this),
      writer_(*this) {
  if (options_.resume_writer_threshold > options_.pause_writer_threshold) {
    options_.resume_writer_threshold = options_.pause_writer_threshold;
  }
}

size_t Pipe::unread_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return unread_bytes_;
}

ReadResult Pipe::snapshot_locked() const {
  ReadResult result;
  bool first = true;
  for (const auto &segment : segments_) {
    size_t offset = first ? head_offset_ : 0;
    first = false;
    if (segment.size() > offset) {
      result.buffer.emplace_back(segment.data() + offset, segment.size() - offset);
    }
  }
  result.is_completed = writer_completed_ || reader_completed_;
  return result;
}

bool Pipe::readable_locked() const {
  return unread_bytes_ > 0 || writer_completed_ || reader_completed_;
}

void Pipe::commit_locked() {
  if (staging_.empty()) {
    return;
  }
  unread_bytes_ += staging_.size();
  segments_.push_back(std::move(staging_));
  staging_ = {};
}

bool Pipe::flush_may_complete_locked() const {
  return reader_completed_ || unread_bytes_ <= options_.resume_writer_threshold;
}

void Pipe::post_read(ReadHandler handler, boost::system::error_code ec,
                     ReadResult result) {
  boost::asio::post(executor_, [handler = std::move(handler), ec,
                                result = std::move(result)]() mutable {
    handler(ec, std::move(result));
  });
}

void Pipe::post_flush(FlushHandler handler, boost::system::error_code ec,
                      FlushResult result) {
  boost::asio::post(executor_, [handler = std::move(handler), ec, result]() {
    handler(ec, result);
  });
}

void Pipe::async_read(const util::CancellationToken &token, ReadHandler handler) {
  if (token.is_cancellation_requested()) {
    post_read(std::move(handler), boost::asio::error::operation_aborted, {});
    return;
  }

  uint64_t seq = 0;
  ReadHandler displaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (readable_locked()) {
      ReadResult result = snapshot_locked();
      post_read(std::move(handler), {}, std::move(result));
      return;
    }
    // A second concurrent read replaces the first; the first one reports
    // cancellation so its owner is not left hanging.
    displaced = std::move(pending_read_);
    pending_read_ = std::move(handler);
    seq = ++read_seq_;
  }
  if (displaced) {
    ReadResult canceled;
    canceled.is_canceled = true;
    post_read(std::move(displaced), {}, std::move(canceled));
  }

  // Registration happens outside the lock: an already-fired token runs the
  // callback inline and the callback takes the lock itself.
  std::weak_ptr<Pipe> weak = weak_from_this();
  auto registration = token.register_callback([weak, seq]() {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    ReadHandler aborted;
    util::CancellationRegistration stale;
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      if (!self->pending_read_ || self->read_seq_ != seq) {
        return;
      }
      aborted = std::move(self->pending_read_);
      self->pending_read_ = nullptr;
      stale = std::move(self->read_registration_);
    }
    self->post_read(std::move(aborted), boost::asio::error::operation_aborted, {});
  });

  util::CancellationRegistration stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_read_ && read_seq_ == seq) {
      stale = std::move(read_registration_);
      read_registration_ = std::move(registration);
    } else {
      stale = std::move(registration);
    }
  }
}

bool Pipe::try_read(ReadResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unread_bytes_ == 0) {
    return false;
  }
  result = snapshot_locked();
  return true;
}

void Pipe::advance(size_t consumed) {
  FlushHandler released;
  util::CancellationRegistration stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    consumed = std::min(consumed, unread_bytes_);
    unread_bytes_ -= consumed;
    while (consumed > 0 && !segments_.empty()) {
      size_t available = segments_.front().size() - head_offset_;
      if (consumed >= available) {
        consumed -= available;
        segments_.pop_front();
        head_offset_ = 0;
      } else {
        head_offset_ += consumed;
        consumed = 0;
      }
    }
    if (pending_flush_ && flush_may_complete_locked()) {
      released = std::move(pending_flush_);
      pending_flush_ = nullptr;
      stale = std::move(flush_registration_);
    }
  }
  if (released) {
    post_flush(std::move(released), {}, {});
  }
}

void Pipe::cancel_pending_read() {
  ReadHandler canceled;
  util::CancellationRegistration stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_read_) {
      return;
    }
    canceled = std::move(pending_read_);
    pending_read_ = nullptr;
    stale = std::move(read_registration_);
  }
  ReadResult result;
  result.is_canceled = true;
  post_read(std::move(canceled), {}, std::move(result));
}

void Pipe::complete_reader() {
  ReadHandler reader_waiting;
  FlushHandler writer_waiting;
  util::CancellationRegistration stale_read;
  util::CancellationRegistration stale_flush;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reader_completed_) {
      return;
    }
    reader_completed_ = true;
    segments_.clear();
    staging_.clear();
    head_offset_ = 0;
    unread_bytes_ = 0;
    reader_waiting = std::move(pending_read_);
    pending_read_ = nullptr;
    stale_read = std::move(read_registration_);
    writer_waiting = std::move(pending_flush_);
    pending_flush_ = nullptr;
    stale_flush = std::move(flush_registration_);
  }
  if (reader_waiting) {
    ReadResult result;
    result.is_completed = true;
    post_read(std::move(reader_waiting), {}, std::move(result));
  }
  if (writer_waiting) {
    FlushResult result;
    result.is_completed = true;
    post_flush(std::move(writer_waiting), {}, result);
  }
}

void Pipe::write(std::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (reader_completed_ || writer_completed_) {
    return;
  }
  staging_.insert(staging_.end(), data.begin(), data.end());
}

void Pipe::async_flush(const util::CancellationToken &token, FlushHandler handler) {
  if (token.is_cancellation_requested()) {
    post_flush(std::move(handler), boost::asio::error::operation_aborted, {});
    return;
  }

  ReadHandler reader_waiting;
  ReadResult wake;
  util::CancellationRegistration stale_read;
  FlushHandler displaced;
  uint64_t seq = 0;
  bool wait_for_reader = false;
  FlushResult immediate;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reader_completed_ && !writer_completed_) {
      commit_locked();
    }
    if (pending_read_ && readable_locked()) {
      reader_waiting = std::move(pending_read_);
      pending_read_ = nullptr;
      stale_read = std::move(read_registration_);
      wake = snapshot_locked();
    }
    if (reader_completed_) {
      immediate.is_completed = true;
    } else if (unread_bytes_ > options_.pause_writer_threshold) {
      wait_for_reader = true;
      displaced = std::move(pending_flush_);
      pending_flush_ = std::move(handler);
      seq = ++flush_seq_;
    }
  }

  if (reader_waiting) {
    post_read(std::move(reader_waiting), {}, std::move(wake));
  }
  if (displaced) {
    FlushResult canceled;
    canceled.is_canceled = true;
    post_flush(std::move(displaced), {}, canceled);
  }
  if (!wait_for_reader) {
    post_flush(std::move(handler), {}, immediate);
    return;
  }

  std::weak_ptr<Pipe> weak = weak_from_this();
  auto registration = token.register_callback([weak, seq]() {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    FlushHandler aborted;
    util::CancellationRegistration stale;
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      if (!self->pending_flush_ || self->flush_seq_ != seq) {
        return;
      }
      aborted = std::move(self->pending_flush_);
      self->pending_flush_ = nullptr;
      stale = std::move(self->flush_registration_);
    }
    self->post_flush(std::move(aborted), boost::asio::error::operation_aborted, {});
  });

  util::CancellationRegistration stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_flush_ && flush_seq_ == seq) {
      stale = std::move(flush_registration_);
      flush_registration_ = std::move(registration);
    } else {
      stale = std::move(registration);
    }
  }
}

void Pipe::complete_writer() {
  ReadHandler reader_waiting;
  ReadResult wake;
  util::CancellationRegistration stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_completed_) {
      return;
    }
    if (!reader_completed_) {
      commit_locked();
    }
    writer_completed_ = true;
    if (pending_read_) {
      reader_waiting = std::move(pending_read_);
      pending_read_ = nullptr;
      stale = std::move(read_registration_);
      wake = snapshot_locked();
    }
  }
  if (reader_waiting) {
    post_read(std::move(reader_waiting), {}, std::move(wake));
  }
}

// ============================================================================
// DuplexPipe
// ============================================================================

std::pair<DuplexPipe, DuplexPipe>
DuplexPipe::create_pair(boost::asio::any_io_executor executor, PipeOptions options) {
  // application -> transport
  auto outbound = Pipe::create(executor, options);
  // transport -> application
  auto inbound = Pipe::create(executor, options);
  DuplexPipe transport(outbound, inbound);
  DuplexPipe application(inbound, outbound);
  return {transport, application};
}

} // namespace network
} // namespace ftpctl
