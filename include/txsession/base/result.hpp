#pragma once

#include "txsession/base/error.hpp"

#include <cassert>
#include <expected>
#include <type_traits>
#include <utility>
#include <variant>

namespace txsession {

#ifdef DEBUG
#define TXSESSION_DCHECK_HAS_VALUE assert(has_value() && "No value present in Result");
#define TXSESSION_DCHECK_HAS_ERROR assert(!has_value() && "No error present in Result");
#else
#define TXSESSION_DCHECK_HAS_VALUE
#define TXSESSION_DCHECK_HAS_ERROR
#endif

template <typename T>
struct ResultStorageType {
  using type = T;
};

template <>
struct ResultStorageType<void> {
  using type = std::monostate;
};

/// A Result type that encapsulates either a value of type T or an Error. All
/// APIs are mimicked after std::expected.
///
/// Every fallible operation in txsession returns a Result, failures are never
/// reported by exceptions.
template <typename T, typename E = Error>
class [[nodiscard]] Result {
public:
  using storage_t = typename ResultStorageType<T>::type;
  using result_t = std::expected<storage_t, E>;

  Result(result_t&& result) : result_(std::move(result)) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an empty Result for void type.
  Result()
    requires std::is_void_v<T>
      : result_(result_t{}) {
  }

  /// Construct a value Result. Moves the value.
  Result(storage_t&& v) : result_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  /// Construct a value Result. Copies the value.
  Result(const storage_t& v) : result_(v) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an error Result. Moves the error.
  Result(E&& e) : result_(std::unexpected(std::move(e))) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an error Result. Copies the error, used when the same error is
  /// both logged and returned.
  Result(const E& e) : result_(std::unexpected(e)) { // NOLINT (google-explicit-constructor)
  }

  constexpr bool has_value() const noexcept { // NOLINT: mimicking std::expected
    return result_.has_value();
  }

  explicit operator bool() const noexcept {
    return has_value();
  }

  friend bool operator==(const Result& lhs, const Result& rhs) noexcept {
    return lhs.result_ == rhs.result_;
  }

  friend bool operator!=(const Result& lhs, const Result& rhs) noexcept {
    return !(lhs == rhs);
  }

  constexpr storage_t& value() & { // NOLINT: mimicking std::expected
    TXSESSION_DCHECK_HAS_VALUE;
    return result_.value();
  }

  constexpr const storage_t& value() const& { // NOLINT: mimicking std::expected
    TXSESSION_DCHECK_HAS_VALUE;
    return result_.value();
  }

  constexpr storage_t&& value() && { // NOLINT: mimicking std::expected
    TXSESSION_DCHECK_HAS_VALUE;
    return std::move(result_).value();
  }

  /// Gets the value, or the given default when an error is held.
  template <typename U>
  constexpr storage_t value_or(U&& default_value) const& { // NOLINT: mimicking std::expected
    return result_.value_or(std::forward<U>(default_value));
  }

  constexpr E& error() & { // NOLINT: mimicking std::expected
    TXSESSION_DCHECK_HAS_ERROR;
    return result_.error();
  }

  constexpr const E& error() const& { // NOLINT: mimicking std::expected
    TXSESSION_DCHECK_HAS_ERROR;
    return result_.error();
  }

  constexpr E&& error() && { // NOLINT: mimicking std::expected
    TXSESSION_DCHECK_HAS_ERROR;
    return std::move(result_).error();
  }

private:
  result_t result_;
};

#undef TXSESSION_DCHECK_HAS_VALUE
#undef TXSESSION_DCHECK_HAS_ERROR

} // namespace txsession
