#pragma once

#include "txsession/base/result.hpp"
#include "txsession/tx/resource_holder.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace txsession {

/// Resources bound to one execution context, keyed by the identity of their
/// owner. At most one holder is bound per key.
///
/// An execution context is logically single threaded, the mutex only keeps
/// the map consistent when completion callbacks arrive from another thread.
class AmbientRegistry {
public:
  AmbientRegistry() = default;
  ~AmbientRegistry() = default;

  AmbientRegistry(const AmbientRegistry&) = delete;
  AmbientRegistry& operator=(const AmbientRegistry&) = delete;

  /// Returns the holder bound to the key, nullptr if absent. A void holder is
  /// dropped from the registry and reported as absent.
  std::shared_ptr<ResourceHolder> Get(ResourceKey key);

  /// Binds the holder to the key, fails with AlreadyBound if the key is taken.
  Result<void> Bind(ResourceKey key, std::shared_ptr<ResourceHolder> holder);

  /// Unbinds and returns the holder bound to the key, fails with NotBound if
  /// absent.
  Result<std::shared_ptr<ResourceHolder>> Unbind(ResourceKey key);

  /// Unbinds and returns the holder bound to the key, nullptr if absent.
  std::shared_ptr<ResourceHolder> UnbindIfPossible(ResourceKey key);

  /// Removes the binding without touching the holder, so that a nested
  /// transaction doesn't observe it. Returns nullptr if nothing was bound.
  std::shared_ptr<ResourceHolder> Suspend(ResourceKey key);

  /// Rebinds a holder previously returned by Suspend().
  Result<void> Resume(ResourceKey key, std::shared_ptr<ResourceHolder> holder);

  bool Contains(ResourceKey key);

  size_t Size();

  /// Removes and returns all the bindings.
  std::unordered_map<ResourceKey, std::shared_ptr<ResourceHolder>> TakeAll();

  /// Dumps the bindings for diagnostics.
  std::string ToJson();

private:
  std::mutex mutex_;
  std::unordered_map<ResourceKey, std::shared_ptr<ResourceHolder>> resources_;
};

} // namespace txsession
