#include "common/txsession_test_suite.hpp"
#include "txsession/base/error.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/tx_synchronization.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

namespace txsession::test {

namespace {

class OrderedSynchronization : public TxSynchronization {
public:
  explicit OrderedSynchronization(int32_t order) : order_(order) {
  }

  int32_t Order() const override {
    return order_;
  }

private:
  const int32_t order_;
};

} // namespace

class ExecContextTest : public TxSessionTestSuite {};

TEST_F(ExecContextTest, SynchronizationLifecycle) {
  ExecContext ctx(ContextName());
  ASSERT_FALSE(ctx.IsSynchronizationActive());

  auto sync = std::make_shared<OrderedSynchronization>(0);
  auto res = ctx.RegisterSynchronization(sync);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kNoSynchronization);

  ASSERT_TRUE(ctx.InitSynchronization());
  ASSERT_TRUE(ctx.IsSynchronizationActive());
  ASSERT_FALSE(ctx.InitSynchronization());

  ASSERT_TRUE(ctx.RegisterSynchronization(sync));
  ASSERT_EQ(ctx.Synchronizations().size(), 1);

  auto null_res = ctx.RegisterSynchronization(nullptr);
  ASSERT_FALSE(null_res);
  ASSERT_EQ(null_res.error().GetCode(), Error::Code::kInvalidArgument);

  ctx.ClearSynchronization();
  ASSERT_FALSE(ctx.IsSynchronizationActive());
  ASSERT_TRUE(ctx.Synchronizations().empty());
}

TEST_F(ExecContextTest, SynchronizationsSortedByOrder) {
  ExecContext ctx(ContextName());
  ASSERT_TRUE(ctx.InitSynchronization());

  auto late = std::make_shared<OrderedSynchronization>(TxSynchronization::kConnectionSyncOrder);
  auto early = std::make_shared<OrderedSynchronization>(-5);
  auto middle1 = std::make_shared<OrderedSynchronization>(10);
  auto middle2 = std::make_shared<OrderedSynchronization>(10);
  ASSERT_TRUE(ctx.RegisterSynchronization(late));
  ASSERT_TRUE(ctx.RegisterSynchronization(middle1));
  ASSERT_TRUE(ctx.RegisterSynchronization(early));
  ASSERT_TRUE(ctx.RegisterSynchronization(middle2));

  auto syncs = ctx.Synchronizations();
  ASSERT_EQ(syncs.size(), 4);
  ASSERT_EQ(syncs[0], early);
  ASSERT_EQ(syncs[1], middle1);
  ASSERT_EQ(syncs[2], middle2);
  ASSERT_EQ(syncs[3], late);
  ctx.Clear();
}

TEST_F(ExecContextTest, TxAttributes) {
  ExecContext ctx(ContextName());
  ASSERT_TRUE(ctx.InitSynchronization());
  ctx.SetActualTxActive(true);
  ctx.SetTxReadOnly(true);
  ctx.SetTxName("transfer");

  ASSERT_TRUE(ctx.IsActualTxActive());
  ASSERT_TRUE(ctx.IsTxReadOnly());
  ASSERT_EQ(ctx.TxName(), "transfer");

  auto json = ctx.ToJson();
  ASSERT_TRUE(json.contains("\"synchronization_active\":true"));
  ASSERT_TRUE(json.contains("\"tx_name\":\"transfer\""));
  ASSERT_TRUE(json.contains("\"registry\""));

  ctx.Clear();
  ASSERT_FALSE(ctx.IsSynchronizationActive());
  ASSERT_FALSE(ctx.IsActualTxActive());
  ASSERT_FALSE(ctx.IsTxReadOnly());
  ASSERT_TRUE(ctx.TxName().empty());
}

} // namespace txsession::test
