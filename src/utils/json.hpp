#pragma once

#include "txsession/base/result.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace txsession::utils {

using JsonValue = rapidjson::Value;

class JsonArray;

/// A JSON object owning its own rapidjson document.
class JsonObj {
public:
  JsonObj() {
    doc_.SetObject();
  }

  ~JsonObj() = default;

  JsonObj(const JsonObj&) = delete;
  JsonObj& operator=(const JsonObj&) = delete;

  JsonObj(JsonObj&& other) noexcept {
    *this = std::move(other);
  }

  JsonObj& operator=(JsonObj&& other) noexcept;

  std::string Serialize() const;
  Result<void> Deserialize(std::string_view json);

  //----------------------------------------------------------------------------
  // Utils to add element to a JSON object
  //----------------------------------------------------------------------------

  void AddBool(std::string_view key, bool value);
  void AddInt64(std::string_view key, int64_t value);
  void AddUint64(std::string_view key, uint64_t value);
  void AddString(std::string_view key, std::string_view value);
  void AddJsonObj(std::string_view key, const JsonObj& value);
  void AddJsonArray(std::string_view key, const JsonArray& value);

  //----------------------------------------------------------------------------
  // Utils to access element in a JSON object
  //----------------------------------------------------------------------------

  std::optional<uint64_t> GetUint64(std::string_view key) const;
  std::optional<std::string_view> GetString(std::string_view key) const;
  bool HasMember(std::string_view key) const;

private:
  const JsonValue* GetJsonValue(std::string_view key) const;

  rapidjson::Document doc_;

  friend class JsonArray;
};

class JsonArray {
public:
  JsonArray() {
    doc_.SetArray();
  }

  ~JsonArray() = default;

  JsonArray(const JsonArray&) = delete;
  JsonArray& operator=(const JsonArray&) = delete;

  JsonArray(JsonArray&& other) noexcept {
    *this = std::move(other);
  }

  JsonArray& operator=(JsonArray&& other) noexcept {
    if (this != &other) {
      doc_.SetArray();
      doc_.Swap(other.doc_);
    }
    return *this;
  }

  void AppendJsonObj(const JsonObj& value) {
    auto value_copy = JsonValue(value.doc_, doc_.GetAllocator());
    doc_.PushBack(value_copy, doc_.GetAllocator());
  }

private:
  rapidjson::Document doc_;

  friend class JsonObj;
};

} // namespace txsession::utils
