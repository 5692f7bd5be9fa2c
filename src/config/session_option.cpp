#include "txsession/config/session_option.hpp"

#include "txsession/base/error.hpp"
#include "utils/json.hpp"

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace txsession {

namespace {

constexpr auto kLogLevel = "log_level";
constexpr auto kLogFile = "log_file";
constexpr auto kLogFlushIntervalSecs = "log_flush_interval_secs";
constexpr auto kDefaultPropagation = "default_propagation";

/// Reads an enum encoded by its EnumTraits name, keeps the target untouched
/// when the key is absent.
template <EnumTraitsRequired E>
Result<void> ReadEnum(const utils::JsonObj& obj, std::string_view key, E& target) {
  if (!obj.HasMember(key)) {
    return {};
  }
  auto str = obj.GetString(key);
  if (!str.has_value()) {
    return Error::InvalidArgument(std::format("Option {} must be a string", key));
  }
  auto value = EnumTraits<E>::FromString(str.value());
  if (!value.has_value()) {
    return Error::InvalidArgument(std::format("Unknown value for option {}: {}", key, str.value()));
  }
  target = value.value();
  return {};
}

} // namespace

Result<SessionOption> SessionOption::FromJson(std::string_view json) {
  utils::JsonObj obj;
  if (auto res = obj.Deserialize(json); !res) {
    return std::move(res.error());
  }

  auto option = SessionOption::Default();
  if (auto res = ReadEnum(obj, kLogLevel, option.log_level_); !res) {
    return std::move(res.error());
  }

  if (obj.HasMember(kLogFile)) {
    auto log_file = obj.GetString(kLogFile);
    if (!log_file.has_value()) {
      return Error::InvalidArgument(std::format("Option {} must be a string", kLogFile));
    }
    option.log_file_ = std::string(log_file.value());
  }

  if (obj.HasMember(kLogFlushIntervalSecs)) {
    auto interval = obj.GetUint64(kLogFlushIntervalSecs);
    if (!interval.has_value() || interval.value() == 0) {
      return Error::InvalidArgument(
          std::format("Option {} must be a positive integer", kLogFlushIntervalSecs));
    }
    option.log_flush_interval_secs_ = interval.value();
  }

  if (auto res = ReadEnum(obj, kDefaultPropagation, option.default_propagation_); !res) {
    return std::move(res.error());
  }
  return option;
}

std::string SessionOption::ToJson() const {
  utils::JsonObj obj;
  obj.AddString(kLogLevel, ToString(log_level_));
  obj.AddString(kLogFile, log_file_);
  obj.AddUint64(kLogFlushIntervalSecs, log_flush_interval_secs_);
  obj.AddString(kDefaultPropagation, ToString(default_propagation_));
  return obj.Serialize();
}

} // namespace txsession
