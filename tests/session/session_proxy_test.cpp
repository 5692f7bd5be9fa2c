#include "common/fake_session.hpp"
#include "common/txsession_test_suite.hpp"
#include "txsession/base/error.hpp"
#include "txsession/session/error_translator.hpp"
#include "txsession/session/session.hpp"
#include "txsession/session/session_coordinator.hpp"
#include "txsession/session/session_handle.hpp"
#include "txsession/session/session_proxy.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/tx_definition.hpp"
#include "txsession/tx/tx_manager.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace txsession::test {

class SessionProxyTest : public TxSessionTestSuite {
protected:
  SessionProxyTest() : ctx_(ContextName()), proxy_(ctx_, factory_) {
  }

  ~SessionProxyTest() override {
    ctx_.Clear();
    ctx_.Registry().TakeAll();
  }

  TxStatus MustBegin() {
    auto begun = tx_mgr_.Begin(ctx_, TxDefinition{.name_ = CaseName()});
    EXPECT_TRUE(begun) << begun.error().ToString();
    if (!begun) {
      return TxStatus{};
    }
    return std::move(begun.value());
  }

  std::shared_ptr<SessionHandle> BoundHandle() {
    return std::dynamic_pointer_cast<SessionHandle>(ctx_.Registry().Get(KeyOf(factory_)));
  }

  const FakeJournal& Journal() const {
    return factory_.Journal();
  }

  TxManager tx_mgr_;
  FakeSessionFactory factory_;
  ExecContext ctx_;
  SessionProxy proxy_;
};

TEST_F(SessionProxyTest, WithoutTxCommitsAndCloses) {
  auto row = proxy_.SelectOne("select.user", {{"id", Value(int64_t{1})}});
  ASSERT_TRUE(row);
  ASSERT_TRUE(row.value().has_value());
  ASSERT_EQ(std::get<int64_t>(row.value()->at("id")), 1);

  ASSERT_EQ(Journal().opens_.load(), 1);
  ASSERT_EQ(Journal().commits_.load(), 1);
  ASSERT_EQ(Journal().forced_commits_.load(), 1);
  ASSERT_EQ(Journal().closes_.load(), 1);
  ASSERT_EQ(ctx_.Registry().Size(), 0);

  // every call runs on its own session
  ASSERT_TRUE(proxy_.Insert("insert.user"));
  ASSERT_EQ(Journal().opens_.load(), 2);
  ASSERT_EQ(Journal().forced_commits_.load(), 2);
  ASSERT_EQ(Journal().closes_.load(), 2);
}

TEST_F(SessionProxyTest, WithinTxSharesOneSession) {
  auto status = MustBegin();

  // the caller holds a reference of its own across the proxy calls
  auto acquired = SessionCoordinator::Acquire(ctx_, factory_);
  ASSERT_TRUE(acquired);
  auto handle = BoundHandle();
  ASSERT_EQ(handle->RefCount(), 1);

  ASSERT_TRUE(proxy_.Insert("insert.user", {{"name", Value(std::string("a"))}}));
  ASSERT_EQ(handle->RefCount(), 1);

  std::vector<int64_t> ref_counts;
  auto res = proxy_.Select("select.user", {}, RowBounds{},
                           [&](const Row& row [[maybe_unused]]) {
                             ref_counts.push_back(handle->RefCount());
                           });
  ASSERT_TRUE(res);
  ASSERT_EQ(ref_counts, std::vector<int64_t>({2, 2, 2}));
  ASSERT_EQ(handle->RefCount(), 1);

  ASSERT_TRUE(SessionCoordinator::Release(ctx_, acquired.value(), factory_));
  ASSERT_EQ(handle->RefCount(), 0);

  auto session = factory_.LastSession();
  ASSERT_EQ(session->Statements(), std::vector<std::string>({"insert.user", "select.user"}));
  ASSERT_EQ(Journal().commits_.load(), 0);
  ASSERT_EQ(Journal().closes_.load(), 0);

  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(Journal().opens_.load(), 1);
  ASSERT_EQ(Journal().commits_.load(), 1);
  ASSERT_EQ(Journal().forced_commits_.load(), 0);
  ASSERT_EQ(Journal().closes_.load(), 1);
  ASSERT_EQ(handle->RefCount(), 0);
  ASSERT_EQ(ctx_.Registry().Size(), 0);
}

TEST_F(SessionProxyTest, WithinTxFailureTranslated) {
  auto status = MustBegin();
  ASSERT_TRUE(proxy_.Insert("insert.user"));

  factory_.FailStatements(Error::PersistenceConstraint("insert.user", "duplicate key"));
  auto res = proxy_.Insert("insert.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kDataIntegrityViolation);
  ASSERT_TRUE(IsDataAccessError(res.error()));
  ASSERT_EQ(BoundHandle()->RefCount(), 0);
  ASSERT_EQ(Journal().closes_.load(), 0);

  ASSERT_TRUE(tx_mgr_.Rollback(ctx_, status));
  ASSERT_EQ(Journal().opens_.load(), 1);
  ASSERT_EQ(Journal().commits_.load(), 0);
  ASSERT_EQ(Journal().closes_.load(), 1);
  ASSERT_EQ(BoundHandle(), nullptr);
  ASSERT_EQ(ctx_.Registry().Size(), 0);
}

TEST_F(SessionProxyTest, WithoutTxFailureTranslatedAndClosed) {
  factory_.FailStatements(Error::PersistenceGrammar("select.user", "syntax error"));
  auto res = proxy_.SelectList("select.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kBadStatementGrammar);
  ASSERT_EQ(Journal().commits_.load(), 0);
  ASSERT_EQ(Journal().closes_.load(), 1);
}

TEST_F(SessionProxyTest, ForcedCommitFailureTranslated) {
  factory_.FailCommits(Error::PersistenceTransient("commit", "connection reset"));
  auto res = proxy_.Update("update.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kTransientDataAccess);
  ASSERT_EQ(Journal().closes_.load(), 1);
}

TEST_F(SessionProxyTest, OtherErrorsPropagatedAsIs) {
  factory_.FailStatements(Error::General("engine crashed"));
  auto res = proxy_.Delete("delete.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), Error::General("engine crashed"));
  ASSERT_EQ(Journal().closes_.load(), 1);
}

TEST_F(SessionProxyTest, WithoutTranslator) {
  SessionProxy proxy(ctx_, factory_, ExecutorMode::kSimple, nullptr);
  ASSERT_EQ(proxy.GetErrorTranslator(), nullptr);

  factory_.FailStatements(Error::PersistenceConstraint("insert.user", "duplicate key"));
  auto res = proxy.Insert("insert.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kPersistenceConstraint);
}

TEST_F(SessionProxyTest, AcquireFailurePropagated) {
  factory_.FailOpens(Error::PersistenceTransient("open", "pool exhausted"));
  auto res = proxy_.SelectOne("select.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kPersistenceTransient);
  ASSERT_EQ(Journal().closes_.load(), 0);
}

TEST_F(SessionProxyTest, ManualTxControlRejected) {
  auto commit = proxy_.Commit();
  ASSERT_FALSE(commit);
  ASSERT_EQ(commit.error(), Error::UnsupportedOperation("commit"));

  auto rollback = proxy_.Rollback(true);
  ASSERT_FALSE(rollback);
  ASSERT_EQ(rollback.error(), Error::UnsupportedOperation("rollback"));

  auto close = proxy_.Close();
  ASSERT_FALSE(close);
  ASSERT_EQ(close.error(), Error::UnsupportedOperation("close"));
  ASSERT_EQ(Journal().opens_.load(), 0);
}

TEST_F(SessionProxyTest, ExecutorModeMismatchWithinTx) {
  auto status = MustBegin();
  ASSERT_TRUE(proxy_.Insert("insert.user"));

  SessionProxy batch_proxy(ctx_, factory_, ExecutorMode::kBatch);
  auto res = batch_proxy.Insert("insert.user");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kExecutorMismatch);
  ASSERT_EQ(Journal().opens_.load(), 1);
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
}

TEST_F(SessionProxyTest, Accessors) {
  ASSERT_EQ(&proxy_.GetSessionFactory(), &factory_);
  ASSERT_EQ(proxy_.GetExecutorMode(), factory_.DefaultExecutorMode());
  ASSERT_NE(proxy_.GetErrorTranslator(), nullptr);

  SessionProxy batch_proxy(ctx_, factory_, ExecutorMode::kBatch);
  ASSERT_EQ(batch_proxy.GetExecutorMode(), ExecutorMode::kBatch);
}

TEST_F(SessionProxyTest, DataOperations) {
  auto rows = proxy_.SelectList("select.user", {}, RowBounds{.offset_ = 1, .limit_ = 1});
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows.value().size(), 1);
  ASSERT_EQ(std::get<int64_t>(rows.value()[0].at("id")), 2);

  auto map = proxy_.SelectMap("select.user", {}, "id");
  ASSERT_TRUE(map);
  ASSERT_EQ(map.value().size(), 3);
  ASSERT_TRUE(map.value().contains(Value(int64_t{3})));

  auto bad_map = proxy_.SelectMap("select.user", {}, "missing");
  ASSERT_FALSE(bad_map);
  ASSERT_EQ(bad_map.error().GetCode(), Error::Code::kBadStatementGrammar);

  auto updated = proxy_.Update("update.user");
  ASSERT_TRUE(updated);
  ASSERT_EQ(updated.value(), 1);

  auto connection = proxy_.GetConnection();
  ASSERT_TRUE(connection);
  ASSERT_TRUE(connection.value()->Describe().starts_with("fake-connection-"));

  ASSERT_TRUE(proxy_.ClearCache());
  ASSERT_EQ(Journal().opens_.load(), Journal().closes_.load());
}

TEST_F(SessionProxyTest, FlushStatementsWithinBatchTx) {
  SessionProxy batch_proxy(ctx_, factory_, ExecutorMode::kBatch);
  auto status = MustBegin();
  ASSERT_TRUE(batch_proxy.Insert("insert.user"));
  ASSERT_TRUE(batch_proxy.Update("update.user"));

  auto flushed = batch_proxy.FlushStatements();
  ASSERT_TRUE(flushed);
  ASSERT_EQ(flushed.value().size(), 2);
  ASSERT_EQ(flushed.value()[0].statement_, "insert.user");
  ASSERT_EQ(flushed.value()[1].update_counts_, std::vector<int64_t>({1}));

  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(Journal().opens_.load(), 1);
  ASSERT_EQ(Journal().commits_.load(), 1);
}

} // namespace txsession::test
