// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

namespace ftpctl {
namespace util {

namespace detail {
class CancellationState;
}

/**
 * Cooperative cancellation
 *
 * A CancellationSource owns a one-shot signal; CancellationTokens observe it.
 * Sources are cheap shared handles: copying a source copies the handle, not
 * the signal, so the enclosing connection can hand its "connection closed"
 * source to a service and still fire it from the outside.
 *
 * - cancel() fires at most once; callbacks run synchronously on the thread
 *   that fired the signal, outside any internal lock.
 * - Callbacks registered after the signal fired run immediately.
 * - create_linked() composes several tokens into a new source that fires as
 *   soon as any of them fires.
 */

/**
 * Registration handle - RAII wrapper
 * Automatically unregisters the callback when destroyed
 */
class CancellationRegistration {
public:
  CancellationRegistration() = default;
  ~CancellationRegistration();

  // Movable but not copyable
  CancellationRegistration(CancellationRegistration &&other) noexcept;
  CancellationRegistration &operator=(CancellationRegistration &&other) noexcept;
  CancellationRegistration(const CancellationRegistration &) = delete;
  CancellationRegistration &operator=(const CancellationRegistration &) = delete;

  void Unregister();

private:
  friend class CancellationToken;
  CancellationRegistration(std::weak_ptr<detail::CancellationState> state,
                           size_t id);

  std::weak_ptr<detail::CancellationState> state_;
  size_t id_{0};
  bool active_{false};
};

class CancellationToken {
public:
  // Default-constructed tokens never fire (same as none())
  CancellationToken() = default;

  // A token that can never be cancelled. Used for cancellation-immune I/O.
  static CancellationToken none() { return CancellationToken(); }

  bool is_cancellation_requested() const;
  bool can_be_canceled() const { return static_cast<bool>(state_); }

  [[nodiscard]] CancellationRegistration
  register_callback(std::function<void()> callback) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
  CancellationSource();

  // Source that fires when any of the given tokens fires (or when cancelled
  // directly). Parent registrations live as long as the returned source's
  // signal does.
  static CancellationSource
  create_linked(std::initializer_list<CancellationToken> tokens);
  static CancellationSource
  create_linked(const std::vector<CancellationToken> &tokens);

  CancellationToken token() const { return CancellationToken(state_); }

  // Returns true if this call fired the signal, false if it had already fired
  bool cancel();

  bool is_cancellation_requested() const;

private:
  std::shared_ptr<detail::CancellationState> state_;
};

namespace detail {

class CancellationState {
public:
  bool cancel();
  bool is_canceled() const { return canceled_.load(std::memory_order_acquire); }

  // Returns 0 if the state was already cancelled (callback ran inline)
  size_t add_callback(std::function<void()> callback);
  void remove_callback(size_t id);

  // Registrations held on parent signals (linked sources only)
  void adopt_parent(CancellationRegistration registration);

private:
  struct CallbackEntry {
    size_t id;
    std::function<void()> callback;
  };

  mutable std::mutex mutex_;
  std::atomic<bool> canceled_{false};
  size_t next_id_{1};
  std::vector<CallbackEntry> callbacks_;
  std::vector<CancellationRegistration> parents_;
};

} // namespace detail

} // namespace util
} // namespace ftpctl
