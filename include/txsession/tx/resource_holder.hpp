#pragma once

#include <atomic>
#include <cstdint>
#include <format>
#include <string>

namespace txsession {

/// Identity of a resource bound to an execution context. It's the address of
/// the object owning the resource, e.g. a SessionFactory or a data source.
using ResourceKey = const void*;

inline std::string ResourceKeyToString(ResourceKey key) {
  return std::format("{}", key);
}

/// Base of every holder bound in an AmbientRegistry. Tracks how many callers
/// currently use the resource and whether it's synchronized with the ambient
/// transaction.
///
/// The reference count and flags are atomics: after-completion callbacks may
/// arrive on a thread other than the one owning the binding.
class ResourceHolder {
public:
  ResourceHolder() = default;
  virtual ~ResourceHolder() = default;

  ResourceHolder(const ResourceHolder&) = delete;
  ResourceHolder& operator=(const ResourceHolder&) = delete;

  void SetSynchronizedWithTx(bool synchronized) {
    synchronized_with_tx_.store(synchronized, std::memory_order_release);
  }

  bool IsSynchronizedWithTx() const {
    return synchronized_with_tx_.load(std::memory_order_acquire);
  }

  /// Increases the reference count by one because the holder has been
  /// requested.
  void Requested() {
    ref_count_.fetch_add(1, std::memory_order_acq_rel);
  }

  /// Decreases the reference count by one because the holder has been
  /// released. Never goes below zero.
  void Released() {
    auto cur = ref_count_.load(std::memory_order_acquire);
    while (cur > 0 &&
           !ref_count_.compare_exchange_weak(cur, cur - 1, std::memory_order_acq_rel)) {
    }
  }

  /// Whether there are still open references to this holder.
  bool IsOpen() const {
    return ref_count_.load(std::memory_order_acquire) > 0;
  }

  int64_t RefCount() const {
    return ref_count_.load(std::memory_order_acquire);
  }

  /// Clears the transactional state of this holder.
  void Clear() {
    synchronized_with_tx_.store(false, std::memory_order_release);
  }

  /// Resets this holder: transactional state as well as the reference count.
  void Reset() {
    Clear();
    ref_count_.store(0, std::memory_order_release);
  }

  /// Notifies this holder that it has been unbound from the execution context
  /// it was bound to. A void holder is never handed out by a registry again.
  void Unbound() {
    is_void_.store(true, std::memory_order_release);
  }

  bool IsVoid() const {
    return is_void_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> synchronized_with_tx_ = false;
  std::atomic<int64_t> ref_count_ = 0;
  std::atomic<bool> is_void_ = false;
};

} // namespace txsession
