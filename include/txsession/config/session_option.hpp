#pragma once

#include "txsession/base/enum_traits.hpp"
#include "txsession/base/result.hpp"
#include "txsession/tx/tx_definition.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace txsession {

/// Log level.
enum class LogLevel : uint8_t { kDebug = 0, kInfo, kWarn, kError };

template <>
struct EnumTraits<LogLevel> {
  static std::string_view ToString(LogLevel level) {
    switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    default:
      return "UNKNOWN";
    }
  }

  static Optional<LogLevel> FromString(std::string_view str) {
    if (str == "DEBUG") {
      return LogLevel::kDebug;
    }
    if (str == "INFO") {
      return LogLevel::kInfo;
    }
    if (str == "WARN") {
      return LogLevel::kWarn;
    }
    if (str == "ERROR") {
      return LogLevel::kError;
    }
    return std::nullopt;
  }
};

/// The options shared by the logger and the transaction manager.
struct SessionOption {
  // ---------------------------------------------------------------------------
  // log related options
  // ---------------------------------------------------------------------------

  /// The log level.
  LogLevel log_level_ = LogLevel::kInfo;

  /// The log file, logs go to stderr when empty.
  std::string log_file_;

  /// Interval in seconds between two background flushes of the log sink.
  uint64_t log_flush_interval_secs_ = 3;

  // ---------------------------------------------------------------------------
  // Transaction related options
  // ---------------------------------------------------------------------------

  /// Propagation used by TxManager::Begin() when no definition is given.
  Propagation default_propagation_ = Propagation::kRequired;

  /// Returns the option with all the default values.
  static SessionOption Default() {
    return SessionOption{};
  }

  /// Parses a JSON object, keys absent from it keep their default values.
  ///
  /// Example:
  ///   {"log_level": "DEBUG", "log_file": "/tmp/txsession.log",
  ///    "log_flush_interval_secs": 1, "default_propagation": "REQUIRES_NEW"}
  static Result<SessionOption> FromJson(std::string_view json);

  /// Serializes all the options into a JSON object.
  std::string ToJson() const;
};

} // namespace txsession
