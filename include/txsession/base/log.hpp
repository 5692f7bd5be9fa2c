#pragma once

#include <format>
#include <string>
#include <utility>

#ifdef DEBUG
#define TXSESSION_DLOG(...) txsession::Log::Debug(__VA_ARGS__);
#else
#define TXSESSION_DLOG(...) (void)0;
#endif

namespace txsession {

struct SessionOption;

/// Process wide logging facade backed by spdlog. Messages are formatted with
/// std::format before reaching the sink.
class Log {
public:
  /// Installs the txsession logger described by the option. Calling it again
  /// before Deinit() is a no-op.
  static void Init(const SessionOption* option);

  /// Drops the txsession logger and restores the previous default logger.
  static void Deinit();

  static void Debug(const std::string& msg);

  static void Info(const std::string& msg);

  static void Warn(const std::string& msg);

  static void Error(const std::string& msg);

  template <typename... Args>
  static void Debug(std::format_string<Args...> fmt, Args&&... args) {
    Debug(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Info(std::format_string<Args...> fmt, Args&&... args) {
    Info(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Warn(std::format_string<Args...> fmt, Args&&... args) {
    Warn(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Error(std::format_string<Args...> fmt, Args&&... args) {
    Error(std::format(fmt, std::forward<Args>(args)...));
  }
};

} // namespace txsession
