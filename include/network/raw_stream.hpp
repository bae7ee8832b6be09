// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/pipe.hpp"
#include "util/cancellation.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace ftpctl {
namespace network {

/**
 * RawStream - presents the socket side of a connection (a DuplexPipe) as a
 * Boost.Asio AsyncReadStream / AsyncWriteStream.
 *
 * This is the layer boost::asio::ssl::stream runs on in TLS mode:
 * - async_read_some() reads from the pipe's input under the read token. A
 *   fired token completes the read with operation_aborted; a cancelled or
 *   completed input with no data left reads as eof. Unconsumed bytes stay in
 *   the pipe for the next cycle.
 * - async_write_some() writes all bytes to the pipe's output and flushes
 *   without a token, so encrypted records are never cut off mid-way.
 *
 * Completion handlers run on their associated executor (defaulting to the
 * stream's executor) and are never invoked from inside the initiating call.
 */
class RawStream {
public:
  using executor_type = boost::asio::any_io_executor;
  using lowest_layer_type = RawStream;

  RawStream(DuplexPipe pipe, util::CancellationToken read_token,
            executor_type executor)
      : pipe_(std::move(pipe)), read_token_(std::move(read_token)),
        executor_(std::move(executor)) {}

  executor_type get_executor() noexcept { return executor_; }

  lowest_layer_type &lowest_layer() { return *this; }
  const lowest_layer_type &lowest_layer() const { return *this; }

  const DuplexPipe &pipe() const { return pipe_; }

  template <typename MutableBufferSequence, typename ReadHandler>
  void async_read_some(const MutableBufferSequence &buffers, ReadHandler &&handler) {
    if (boost::asio::buffer_size(buffers) == 0) {
      post_completion(executor_, std::forward<ReadHandler>(handler),
                      boost::system::error_code(), 0);
      return;
    }

    // Pipe handlers are copyable std::functions; asio handlers may be
    // move-only, so park the handler behind a shared_ptr until completion.
    auto shared = std::make_shared<std::decay_t<ReadHandler>>(
        std::forward<ReadHandler>(handler));
    auto input_pipe = pipe_.input_pipe();
    executor_type executor = executor_;
    input_pipe->reader().async_read(
        read_token_, [input_pipe, buffers, shared,
                      executor](const boost::system::error_code &ec,
                                ReadResult result) {
          if (ec) {
            post_completion(executor, std::move(*shared), ec, 0);
            return;
          }
          std::vector<boost::asio::const_buffer> source;
          source.reserve(result.buffer.size());
          for (const auto &segment : result.buffer) {
            source.emplace_back(segment.data(), segment.size());
          }
          size_t copied = boost::asio::buffer_copy(buffers, source);
          input_pipe->reader().advance(copied);
          if (copied == 0) {
            post_completion(executor, std::move(*shared),
                            boost::asio::error::eof, 0);
            return;
          }
          post_completion(executor, std::move(*shared),
                          boost::system::error_code(), copied);
        });
  }

  template <typename ConstBufferSequence, typename WriteHandler>
  void async_write_some(const ConstBufferSequence &buffers, WriteHandler &&handler) {
    size_t size = boost::asio::buffer_size(buffers);
    if (size == 0) {
      post_completion(executor_, std::forward<WriteHandler>(handler),
                      boost::system::error_code(), 0);
      return;
    }

    std::vector<uint8_t> data(size);
    boost::asio::buffer_copy(boost::asio::buffer(data), buffers);

    auto shared = std::make_shared<std::decay_t<WriteHandler>>(
        std::forward<WriteHandler>(handler));
    auto output_pipe = pipe_.output_pipe();
    executor_type executor = executor_;
    output_pipe->writer().async_write(
        data, util::CancellationToken::none(),
        [shared, executor, size](const boost::system::error_code &ec,
                                 FlushResult flushed) {
          if (ec) {
            post_completion(executor, std::move(*shared), ec, 0);
            return;
          }
          if (flushed.is_completed) {
            post_completion(executor, std::move(*shared),
                            boost::asio::error::broken_pipe, 0);
            return;
          }
          post_completion(executor, std::move(*shared),
                          boost::system::error_code(), size);
        });
  }

private:
  template <typename Handler>
  static void post_completion(const executor_type &fallback, Handler &&handler,
                              boost::system::error_code ec, size_t bytes) {
    auto executor = boost::asio::get_associated_executor(handler, fallback);
    boost::asio::post(executor, [h = std::forward<Handler>(handler), ec,
                                 bytes]() mutable { h(ec, bytes); });
  }

  DuplexPipe pipe_;
  util::CancellationToken read_token_;
  executor_type executor_;
};

} // namespace network
} // namespace ftpctl
