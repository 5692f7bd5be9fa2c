#pragma once

#include <utility>

namespace txsession {

/// Runs the given function when it goes out of scope, unless cancelled.
template <class F>
class ScopedDeferrer {
public:
  explicit ScopedDeferrer(F f) : func_(std::move(f)) {
  }

  ~ScopedDeferrer() {
    if (armed_) {
      func_();
    }
  }

  ScopedDeferrer(const ScopedDeferrer&) = delete;
  ScopedDeferrer& operator=(const ScopedDeferrer&) = delete;
  ScopedDeferrer& operator=(ScopedDeferrer&&) = delete;

  ScopedDeferrer(ScopedDeferrer&& other) noexcept
      : func_(std::move(other.func_)),
        armed_(other.armed_) {
    other.armed_ = false;
  }

  /// Skips the deferred function, e.g. when the resource it cleans up has been
  /// handed over on an early path.
  void Cancel() {
    armed_ = false;
  }

private:
  F func_;
  bool armed_ = true;
};

template <typename F>
ScopedDeferrer<F> MakeScopedDeferrer(F f) {
  return ScopedDeferrer<F>(std::move(f));
}

} // namespace txsession
