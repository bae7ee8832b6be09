// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/cancellation.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>

namespace ftpctl {
namespace util {

// ============================================================================
// CancellationRegistration
// ============================================================================

CancellationRegistration::CancellationRegistration(
    std::weak_ptr<detail::CancellationState> state, size_t id)
    : state_(std::move(state)), id_(id), active_(true) {}

CancellationRegistration::~CancellationRegistration() { Unregister(); }

CancellationRegistration::CancellationRegistration(
    CancellationRegistration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_), active_(other.active_) {
  other.active_ = false;
}

CancellationRegistration &
CancellationRegistration::operator=(CancellationRegistration &&other) noexcept {
  if (this != &other) {
    Unregister();
    state_ = std::move(other.state_);
    id_ = other.id_;
    active_ = other.active_;
    other.active_ = false;
  }
  return *this;
}

void CancellationRegistration::Unregister() {
  if (!active_) {
    return;
  }
  active_ = false;
  if (auto state = state_.lock()) {
    state->remove_callback(id_);
  }
  state_.reset();
}

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::is_cancellation_requested() const {
  return state_ && state_->is_canceled();
}

CancellationRegistration
CancellationToken::register_callback(std::function<void()> callback) const {
  if (!state_) {
    return {};
  }
  size_t id = state_->add_callback(std::move(callback));
  if (id == 0) {
    return {};
  }
  return CancellationRegistration(state_, id);
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource
CancellationSource::create_linked(std::initializer_list<CancellationToken> tokens) {
  return create_linked(std::vector<CancellationToken>(tokens));
}

CancellationSource
CancellationSource::create_linked(const std::vector<CancellationToken> &tokens) {
  CancellationSource linked;
  // Parents only keep a weak reference: a discarded linked source must not be
  // kept alive (or fired) by a long-lived parent.
  std::weak_ptr<detail::CancellationState> weak = linked.state_;
  for (const auto &parent : tokens) {
    auto registration = parent.register_callback([weak]() {
      if (auto state = weak.lock()) {
        state->cancel();
      }
    });
    linked.state_->adopt_parent(std::move(registration));
  }
  return linked;
}

bool CancellationSource::cancel() { return state_->cancel(); }

bool CancellationSource::is_cancellation_requested() const {
  return state_->is_canceled();
}

// ============================================================================
// detail::CancellationState
// ============================================================================

namespace detail {

bool CancellationState::cancel() {
  std::vector<CallbackEntry> to_run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canceled_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    to_run.swap(callbacks_);
  }

  // Run outside the lock: callbacks may register/unregister on other signals
  // (or on this one) without deadlocking.
  for (auto &entry : to_run) {
    try {
      entry.callback();
    } catch (const std::exception &e) {
      LOG_WARN("exception in cancellation callback: {}", e.what());
    }
  }
  return true;
}

size_t CancellationState::add_callback(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!canceled_.load(std::memory_order_acquire)) {
      size_t id = next_id_++;
      callbacks_.push_back(CallbackEntry{id, std::move(callback)});
      return id;
    }
  }
  callback();
  return 0;
}

void CancellationState::remove_callback(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &e) { return e.id == id; }),
                   callbacks_.end());
}

void CancellationState::adopt_parent(CancellationRegistration registration) {
  std::lock_guard<std::mutex> lock(mutex_);
  parents_.push_back(std::move(registration));
}

} // namespace detail

} // namespace util
} // namespace ftpctl
