#pragma once

#include "txsession/base/enum_traits.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace txsession {

/// How a new transaction boundary relates to the one already running in the
/// execution context.
enum class Propagation : uint8_t {
  /// Join the running transaction, create a new one if none exists.
  kRequired = 0,
  /// Suspend the running transaction if any, always create a new one.
  kRequiresNew,
  /// Join the running transaction, run non-transactionally if none exists.
  kSupports,
  /// Suspend the running transaction if any, run non-transactionally.
  kNotSupported,
  /// Join the running transaction, fail if none exists.
  kMandatory,
};

template <>
struct EnumTraits<Propagation> {
  static std::string_view ToString(Propagation propagation) {
    switch (propagation) {
    case Propagation::kRequired:
      return "REQUIRED";
    case Propagation::kRequiresNew:
      return "REQUIRES_NEW";
    case Propagation::kSupports:
      return "SUPPORTS";
    case Propagation::kNotSupported:
      return "NOT_SUPPORTED";
    case Propagation::kMandatory:
      return "MANDATORY";
    default:
      return "UNKNOWN";
    }
  }

  static Optional<Propagation> FromString(std::string_view str) {
    if (str == "REQUIRED") {
      return Propagation::kRequired;
    }
    if (str == "REQUIRES_NEW") {
      return Propagation::kRequiresNew;
    }
    if (str == "SUPPORTS") {
      return Propagation::kSupports;
    }
    if (str == "NOT_SUPPORTED") {
      return Propagation::kNotSupported;
    }
    if (str == "MANDATORY") {
      return Propagation::kMandatory;
    }
    return std::nullopt;
  }
};

/// Outcome reported to synchronizations after a transaction completes.
enum class TxCompletionStatus : uint8_t { kCommitted = 0, kRolledBack, kUnknown };

template <>
struct EnumTraits<TxCompletionStatus> {
  static std::string_view ToString(TxCompletionStatus status) {
    switch (status) {
    case TxCompletionStatus::kCommitted:
      return "COMMITTED";
    case TxCompletionStatus::kRolledBack:
      return "ROLLED_BACK";
    default:
      return "UNKNOWN";
    }
  }

  static Optional<TxCompletionStatus> FromString(std::string_view str) {
    if (str == "COMMITTED") {
      return TxCompletionStatus::kCommitted;
    }
    if (str == "ROLLED_BACK") {
      return TxCompletionStatus::kRolledBack;
    }
    if (str == "UNKNOWN") {
      return TxCompletionStatus::kUnknown;
    }
    return std::nullopt;
  }
};

/// Attributes of a transaction boundary requested from the TxManager.
struct TxDefinition {
  Propagation propagation_ = Propagation::kRequired;

  /// Passed to OnBeforeCommit() of every synchronization.
  bool read_only_ = false;

  /// Name used in logs and errors.
  std::string name_;
};

} // namespace txsession
