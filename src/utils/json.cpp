#include "utils/json.hpp"

#include "txsession/base/error.hpp"
#include "txsession/base/result.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace txsession::utils {

JsonObj& JsonObj::operator=(JsonObj&& other) noexcept {
  if (this != &other) {
    doc_.SetObject();
    doc_.Swap(other.doc_);
  }
  return *this;
}

std::string JsonObj::Serialize() const {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
  doc_.Accept(writer);
  return std::string(buffer.GetString(), buffer.GetSize());
}

Result<void> JsonObj::Deserialize(std::string_view json) {
  doc_.Parse(json.data(), json.size());
  if (doc_.HasParseError()) {
    return Error::InvalidArgument(
        std::format("Failed to parse JSON at offset {}: {}", doc_.GetErrorOffset(), json));
  }
  if (!doc_.IsObject()) {
    return Error::InvalidArgument(std::format("JSON is not an object: {}", json));
  }
  return {};
}

void JsonObj::AddBool(std::string_view key, bool value) {
  auto key_copy = JsonValue(key.data(), key.size(), doc_.GetAllocator());
  auto value_copy = JsonValue(value);
  doc_.AddMember(key_copy, value_copy, doc_.GetAllocator());
}

void JsonObj::AddInt64(std::string_view key, int64_t value) {
  auto key_copy = JsonValue(key.data(), key.size(), doc_.GetAllocator());
  auto value_copy = JsonValue(value);
  doc_.AddMember(key_copy, value_copy, doc_.GetAllocator());
}

void JsonObj::AddUint64(std::string_view key, uint64_t value) {
  auto key_copy = JsonValue(key.data(), key.size(), doc_.GetAllocator());
  auto value_copy = JsonValue(value);
  doc_.AddMember(key_copy, value_copy, doc_.GetAllocator());
}

void JsonObj::AddString(std::string_view key, std::string_view value) {
  auto key_copy = JsonValue(key.data(), key.size(), doc_.GetAllocator());
  auto value_copy = JsonValue(value.data(), value.size(), doc_.GetAllocator());
  doc_.AddMember(key_copy, value_copy, doc_.GetAllocator());
}

void JsonObj::AddJsonObj(std::string_view key, const JsonObj& value) {
  auto key_copy = JsonValue(key.data(), key.size(), doc_.GetAllocator());
  auto value_copy = JsonValue(value.doc_, doc_.GetAllocator());
  doc_.AddMember(key_copy, value_copy, doc_.GetAllocator());
}

void JsonObj::AddJsonArray(std::string_view key, const JsonArray& value) {
  auto key_copy = JsonValue(key.data(), key.size(), doc_.GetAllocator());
  auto value_copy = JsonValue(value.doc_, doc_.GetAllocator());
  doc_.AddMember(key_copy, value_copy, doc_.GetAllocator());
}

const JsonValue* JsonObj::GetJsonValue(std::string_view key) const {
  if (!doc_.IsObject()) {
    return nullptr;
  }
  auto it = doc_.FindMember(JsonValue(rapidjson::StringRef(key.data(), key.size())));
  if (it == doc_.MemberEnd()) {
    return nullptr;
  }
  return &it->value;
}

std::optional<uint64_t> JsonObj::GetUint64(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsUint64()) {
    return {};
  }
  return value->GetUint64();
}

std::optional<std::string_view> JsonObj::GetString(std::string_view key) const {
  const auto* value = GetJsonValue(key);
  if (value == nullptr || !value->IsString()) {
    return {};
  }
  return std::string_view(value->GetString(), value->GetStringLength());
}

bool JsonObj::HasMember(std::string_view key) const {
  return GetJsonValue(key) != nullptr;
}

} // namespace txsession::utils
