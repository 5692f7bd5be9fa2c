#include "common/txsession_test_suite.hpp"
#include "txsession/base/error.hpp"
#include "utils/json.hpp"

#include <gtest/gtest.h>

#include <utility>

namespace txsession::test {

class JsonTest : public TxSessionTestSuite {};

TEST_F(JsonTest, AddAndGet) {
  utils::JsonObj obj;
  obj.AddUint64("size", 42);
  obj.AddString("name", "ctx");

  ASSERT_EQ(obj.GetUint64("size"), 42u);
  ASSERT_EQ(obj.GetString("name"), "ctx");
  ASSERT_TRUE(obj.HasMember("name"));
  ASSERT_FALSE(obj.HasMember("absent"));

  // wrong types are reported as absent
  ASSERT_FALSE(obj.GetString("size").has_value());
  ASSERT_FALSE(obj.GetUint64("name").has_value());
}

TEST_F(JsonTest, SerializeAndDeserialize) {
  utils::JsonArray bindings;
  utils::JsonObj binding;
  binding.AddString("key", "0x1");
  binding.AddInt64("ref_count", -1);
  binding.AddBool("void", false);
  bindings.AppendJsonObj(binding);

  utils::JsonObj nested;
  nested.AddBool("active", true);

  utils::JsonObj obj;
  obj.AddUint64("size", 1);
  obj.AddJsonArray("bindings", bindings);
  obj.AddJsonObj("nested", nested);
  auto json = obj.Serialize();
  ASSERT_EQ(json,
            R"({"size":1,"bindings":[{"key":"0x1","ref_count":-1,"void":false}],)"
            R"("nested":{"active":true}})");

  utils::JsonObj parsed;
  ASSERT_TRUE(parsed.Deserialize(json));
  ASSERT_EQ(parsed.GetUint64("size"), 1u);
  ASSERT_TRUE(parsed.HasMember("bindings"));

  auto moved = std::move(parsed);
  ASSERT_EQ(moved.Serialize(), json);
}

TEST_F(JsonTest, DeserializeInvalid) {
  utils::JsonObj obj;
  auto res = obj.Deserialize("{\"size\":");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);

  auto not_object = obj.Deserialize("[1, 2]");
  ASSERT_FALSE(not_object);
  ASSERT_EQ(not_object.error().GetCode(), Error::Code::kInvalidArgument);
}

} // namespace txsession::test
