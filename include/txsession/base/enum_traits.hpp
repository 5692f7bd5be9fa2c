#pragma once

#include "txsession/base/optional.hpp"

#include <concepts>
#include <optional>
#include <string_view>

namespace txsession {

/// Trait struct for enum types to provide string conversion. Each enum type
/// printed in logs or read from configuration specializes this struct.
template <typename E>
struct EnumTraits {
  static std::string_view ToString(E) {
    static_assert(sizeof(E) == 0, "EnumTraits not specialized for this enum type");
    return {};
  }

  static Optional<E> FromString(std::string_view) {
    static_assert(sizeof(E) == 0, "EnumTraits not specialized for this enum type");
    return std::nullopt;
  }
};

template <typename E>
concept EnumTraitsRequired = requires(E e) {
  { EnumTraits<E>::ToString(e) } -> std::same_as<std::string_view>;
  { EnumTraits<E>::FromString(std::string_view{}) } -> std::same_as<Optional<E>>;
};

template <EnumTraitsRequired E>
std::string_view ToString(E e) {
  return EnumTraits<E>::ToString(e);
}

} // namespace txsession
