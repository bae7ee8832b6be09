// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <typeindex>

namespace ftpctl {
namespace auth {

/**
 * Per-connection feature registry, keyed by feature type.
 *
 * Connection-level components publish optional capabilities here (e.g. a
 * session feature) so that others can look them up without a direct
 * dependency. Thread-safe.
 */
class FeatureCollection {
public:
  template <typename T> void set(std::shared_ptr<T> feature) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (feature) {
      features_[std::type_index(typeid(T))] = std::move(feature);
    } else {
      features_.erase(std::type_index(typeid(T)));
    }
  }

  // nullptr if no feature of that type is registered
  template <typename T> std::shared_ptr<T> get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = features_.find(std::type_index(typeid(T)));
    if (it == features_.end()) {
      return nullptr;
    }
    return std::static_pointer_cast<T>(it->second);
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return features_.size();
  }

private:
  mutable std::mutex mutex_;
  std::map<std::type_index, std::shared_ptr<void>> features_;
};

} // namespace auth
} // namespace ftpctl
