// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/cancellation.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace ftpctl {
namespace network {

/**
 * Pipe - buffered, backpressure-aware byte channel with one reader and one
 * writer end.
 *
 * Writer side: write() buffers bytes, async_flush() makes them visible to the
 * reader and completes once the reader has caught up far enough (pause/resume
 * thresholds). Reader side: async_read() completes when unread data exists,
 * the writer completed, the token fires (operation_aborted) or
 * cancel_pending_read() is called (is_canceled). Consumed bytes are released
 * with advance(); anything not consumed is returned again by the next read.
 *
 * Completion handlers are always posted to the pipe's executor, never invoked
 * from inside the initiating call. All methods are thread-safe, but each end
 * supports a single outstanding operation at a time.
 */

struct PipeOptions {
  // Flushes wait while more than this many bytes are unread
  size_t pause_writer_threshold = 64 * 1024;
  // ...until the unread size drops to this value
  size_t resume_writer_threshold = 32 * 1024;
};

struct ReadResult {
  // Unread bytes as contiguous segments. Valid until the next advance()
  std::vector<std::span<const uint8_t>> buffer;
  bool is_canceled = false;
  bool is_completed = false;

  size_t size() const;
  bool empty() const { return size() == 0; }
  std::vector<uint8_t> to_vector() const;
};

struct FlushResult {
  bool is_canceled = false;
  // The reader end completed; further writes are discarded
  bool is_completed = false;
};

using ReadHandler =
    std::function<void(const boost::system::error_code &ec, ReadResult result)>;
using FlushHandler =
    std::function<void(const boost::system::error_code &ec, FlushResult result)>;

class Pipe;

class PipeReader {
public:
  explicit PipeReader(Pipe &pipe) : pipe_(pipe) {}
  PipeReader(const PipeReader &) = delete;
  PipeReader &operator=(const PipeReader &) = delete;

  void async_read(const util::CancellationToken &token, ReadHandler handler);
  // Non-blocking read: true if data is available or the writer completed
  bool try_read(ReadResult &result);
  void advance(size_t consumed);
  void cancel_pending_read();
  void complete();
  bool is_completed() const;

private:
  Pipe &pipe_;
};

class PipeWriter {
public:
  explicit PipeWriter(Pipe &pipe) : pipe_(pipe) {}
  PipeWriter(const PipeWriter &) = delete;
  PipeWriter &operator=(const PipeWriter &) = delete;

  void write(std::span<const uint8_t> data);
  void async_flush(const util::CancellationToken &token, FlushHandler handler);
  void async_write(std::span<const uint8_t> data,
                   const util::CancellationToken &token, FlushHandler handler);
  void complete();
  bool is_completed() const;

private:
  Pipe &pipe_;
};

class Pipe : public std::enable_shared_from_this<Pipe> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  static std::shared_ptr<Pipe> create(boost::asio::any_io_executor executor,
                                      PipeOptions options = {});

  Pipe(PrivateTag, boost::asio::any_io_executor executor, PipeOptions options);
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  PipeReader &reader() { return reader_; }
  PipeWriter &writer() { return writer_; }

  const boost::asio::any_io_executor &get_executor() const { return executor_; }

  // Diagnostics
  size_t unread_bytes() const;

private:
  friend class PipeReader;
  friend class PipeWriter;

  // Reader side
  void async_read(const util::CancellationToken &token, ReadHandler handler);
  bool try_read(ReadResult &result);
  void advance(size_t consumed);
  void cancel_pending_read();
  void complete_reader();

  // Writer side
  void write(std::span<const uint8_t> data);
  void async_flush(const util::CancellationToken &token, FlushHandler handler);
  void complete_writer();

  // Must be called with mutex_ held
  ReadResult snapshot_locked() const;
  bool readable_locked() const;
  void commit_locked();
  bool flush_may_complete_locked() const;

  void post_read(ReadHandler handler, boost::system::error_code ec,
                 ReadResult result);
  void post_flush(FlushHandler handler, boost::system::error_code ec,
                  FlushResult result);

  boost::asio::any_io_executor executor_;
  PipeOptions options_;
  PipeReader reader_;
  PipeWriter writer_;

  mutable std::mutex mutex_;
  std::deque<std::vector<uint8_t>> segments_;  // flushed, visible to reader
  size_t head_offset_{0};                     // consumed bytes of segments_.front()
  size_t unread_bytes_{0};
  std::vector<uint8_t> staging_;               // written, not yet flushed
  bool reader_completed_{false};
  bool writer_completed_{false};

  // At most one pending operation per end; the sequence number lets a late
  // token callback recognize that its operation already finished.
  ReadHandler pending_read_;
  util::CancellationRegistration read_registration_;
  uint64_t read_seq_{0};

  FlushHandler pending_flush_;
  util::CancellationRegistration flush_registration_;
  uint64_t flush_seq_{0};
};

/**
 * DuplexPipe - the reader of one pipe paired with the writer of another.
 *
 * The transport side of a connection reads what the application writes and
 * vice versa. Copies share the underlying pipes.
 */
class DuplexPipe {
public:
  DuplexPipe(std::shared_ptr<Pipe> input_pipe, std::shared_ptr<Pipe> output_pipe)
      : input_pipe_(std::move(input_pipe)), output_pipe_(std::move(output_pipe)) {}

  // {transport side, application side}
  static std::pair<DuplexPipe, DuplexPipe>
  create_pair(boost::asio::any_io_executor executor, PipeOptions options = {});

  PipeReader &input() const { return input_pipe_->reader(); }
  PipeWriter &output() const { return output_pipe_->writer(); }

  const std::shared_ptr<Pipe> &input_pipe() const { return input_pipe_; }
  const std::shared_ptr<Pipe> &output_pipe() const { return output_pipe_; }

private:
  std::shared_ptr<Pipe> input_pipe_;
  std::shared_ptr<Pipe> output_pipe_;
};

} // namespace network
} // namespace ftpctl
