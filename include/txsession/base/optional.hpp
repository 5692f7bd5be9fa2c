#pragma once

#include "txsession/base/error.hpp"

#include <cassert>
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

namespace txsession {

#ifdef DEBUG
#define TXSESSION_DCHECK_HAS_VALUE assert(has_value() && "No value present in Optional");
#else
#define TXSESSION_DCHECK_HAS_VALUE
#endif

/// Optional<void> has no value semantics, and Optional<Error> is ruled out
/// because a missing error is expressed by Result<void>.
template <typename T>
concept OptionalValue = !std::is_void_v<T> && !std::same_as<std::remove_cvref_t<T>, Error>;

/// A move-only optional value, used for lookups that may legitimately find
/// nothing, e.g. a select that matches no row.
template <OptionalValue T>
class [[nodiscard]] Optional {
public:
  using optional_t = std::optional<T>;

  Optional(const Optional&) = delete;
  Optional& operator=(const Optional&) = delete;

  Optional(Optional&& other) noexcept {
    *this = std::move(other);
  }

  Optional& operator=(Optional&& other) noexcept {
    if (this != &other) {
      opt_ = std::move(other.opt_);
      other.opt_ = std::nullopt;
    }
    return *this;
  }

  Optional() : opt_(std::nullopt) {
  }

  Optional(std::nullopt_t) : opt_(std::nullopt) { // NOLINT (google-explicit-constructor)
  }

  Optional(T&& v) : opt_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  Optional(const T& v) : opt_(v) { // NOLINT (google-explicit-constructor)
  }

  Optional& operator=(std::nullopt_t) {
    opt_ = std::nullopt;
    return *this;
  }

  Optional& operator=(T&& v) {
    opt_ = std::move(v);
    return *this;
  }

  constexpr bool has_value() const noexcept { // NOLINT: mimicking std::optional
    return opt_.has_value();
  }

  explicit operator bool() const noexcept {
    return has_value();
  }

  constexpr T& value() & { // NOLINT: mimicking std::optional
    TXSESSION_DCHECK_HAS_VALUE;
    return opt_.value();
  }

  constexpr const T& value() const& { // NOLINT: mimicking std::optional
    TXSESSION_DCHECK_HAS_VALUE;
    return opt_.value();
  }

  template <typename U>
  constexpr T value_or(U&& default_value) const& { // NOLINT: mimicking std::optional
    return opt_.value_or(std::forward<U>(default_value));
  }

  void reset() noexcept { // NOLINT: mimicking std::optional
    opt_.reset();
  }

  constexpr const T* operator->() const& {
    TXSESSION_DCHECK_HAS_VALUE;
    return &opt_.value();
  }

  constexpr T* operator->() & {
    TXSESSION_DCHECK_HAS_VALUE;
    return &opt_.value();
  }

  constexpr const T& operator*() const& {
    TXSESSION_DCHECK_HAS_VALUE;
    return opt_.value();
  }

  constexpr bool operator==(const Optional& rhs) const {
    return opt_ == rhs.opt_;
  }

  constexpr bool operator!=(const Optional& rhs) const {
    return !(*this == rhs);
  }

private:
  optional_t opt_;
};

#undef TXSESSION_DCHECK_HAS_VALUE

} // namespace txsession
