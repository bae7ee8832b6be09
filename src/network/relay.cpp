// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/relay.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace ftpctl {
namespace network {

std::shared_ptr<CopyRace> CopyRace::create(Strand strand, size_t branches,
                                           util::CancellationToken token,
                                           Callback on_first, Callback on_joined) {
  return std::make_shared<CopyRace>(PrivateTag{}, std::move(strand), branches,
                                    std::move(token), std::move(on_first),
                                    std::move(on_joined));
}

CopyRace::CopyRace(PrivateTag, Strand strand, size_t branches,
                   util::CancellationToken token, Callback on_first,
                   Callback on_joined)
    : strand_(std::move(strand)), remaining_(branches), token_(std::move(token)),
      on_first_(std::move(on_first)), on_joined_(std::move(on_joined)) {}

void CopyRace::arm() {
  std::weak_ptr<CopyRace> weak = weak_from_this();
  auto registration = token_.register_callback([weak]() {
    if (auto self = weak.lock()) {
      boost::asio::post(self->strand_, [self]() { self->fire_first(); });
    }
  });
  boost::asio::dispatch(strand_, [self = shared_from_this(),
                                  reg = std::make_shared<util::CancellationRegistration>(
                                      std::move(registration))]() mutable {
    if (!self->joined_) {
      self->registration_ = std::move(*reg);
    }
  });
}

void CopyRace::branch_finished() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->fire_first();
    self->join_one();
  });
}

void CopyRace::fire_first() {
  if (first_fired_) {
    return;
  }
  first_fired_ = true;
  if (on_first_) {
    on_first_();
  }
  on_first_ = nullptr;
}

void CopyRace::join_one() {
  if (remaining_ > 0) {
    --remaining_;
  }
  if (remaining_ > 0 || joined_) {
    return;
  }
  joined_ = true;
  registration_.Unregister();
  Callback on_joined = std::move(on_joined_);
  on_joined_ = nullptr;
  if (on_joined) {
    on_joined();
  }
}

} // namespace network
} // namespace ftpctl
