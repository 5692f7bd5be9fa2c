#include "common/fake_session.hpp"
#include "common/fake_tx_resource.hpp"
#include "common/txsession_test_suite.hpp"
#include "txsession/base/error.hpp"
#include "txsession/config/session_option.hpp"
#include "txsession/session/session.hpp"
#include "txsession/session/session_coordinator.hpp"
#include "txsession/session/session_handle.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/tx_definition.hpp"
#include "txsession/tx/tx_manager.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>

namespace txsession::test {

class SessionCoordinatorTest : public TxSessionTestSuite {
protected:
  SessionCoordinatorTest()
      : tx_mgr_(SessionOption::Default(), &resource_),
        ctx_(ContextName()) {
  }

  ~SessionCoordinatorTest() override {
    ctx_.Clear();
    ctx_.Registry().TakeAll();
  }

  TxStatus MustBegin(Propagation propagation = Propagation::kRequired) {
    auto begun =
        tx_mgr_.Begin(ctx_, TxDefinition{.propagation_ = propagation, .name_ = CaseName()});
    EXPECT_TRUE(begun) << begun.error().ToString();
    if (!begun) {
      return TxStatus{};
    }
    return std::move(begun.value());
  }

  std::shared_ptr<Session> MustAcquire(SessionFactory& factory,
                                       ExecutorMode mode = ExecutorMode::kSimple) {
    auto acquired = SessionCoordinator::Acquire(ctx_, factory, mode);
    EXPECT_TRUE(acquired) << acquired.error().ToString();
    if (!acquired) {
      return nullptr;
    }
    return acquired.value();
  }

  std::shared_ptr<SessionHandle> BoundHandle(const SessionFactory& factory) {
    return std::dynamic_pointer_cast<SessionHandle>(ctx_.Registry().Get(KeyOf(factory)));
  }

  FakeTxResourceManager resource_;
  TxManager tx_mgr_;
  ExecContext ctx_;
  FakeSessionFactory factory_;
};

TEST_F(SessionCoordinatorTest, WithoutTxEveryAcquireOpensSession) {
  auto session1 = MustAcquire(factory_);
  auto session2 = MustAcquire(factory_);
  ASSERT_NE(session1, session2);
  ASSERT_EQ(factory_.Journal().opens_.load(), 2);
  ASSERT_EQ(ctx_.Registry().Size(), 0);
  ASSERT_FALSE(SessionCoordinator::IsTransactional(ctx_, session1, factory_));

  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session1, factory_));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session2, factory_));
  auto sessions = factory_.Sessions();
  ASSERT_EQ(sessions[0]->Closes(), 1);
  ASSERT_EQ(sessions[1]->Closes(), 1);
}

TEST_F(SessionCoordinatorTest, WithinTxAcquireReturnsSameSession) {
  auto status = MustBegin();

  auto session1 = MustAcquire(factory_);
  ASSERT_TRUE(SessionCoordinator::IsTransactional(ctx_, session1, factory_));
  auto handle = BoundHandle(factory_);
  ASSERT_NE(handle, nullptr);
  ASSERT_TRUE(handle->IsSynchronizedWithTx());
  ASSERT_EQ(handle->RefCount(), 1);

  auto session2 = MustAcquire(factory_);
  auto session3 = MustAcquire(factory_);
  ASSERT_EQ(session1, session2);
  ASSERT_EQ(session1, session3);
  ASSERT_EQ(handle->RefCount(), 3);
  ASSERT_EQ(factory_.Journal().opens_.load(), 1);
  ASSERT_EQ(ctx_.Synchronizations().size(), 1);

  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session3, factory_));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session2, factory_));
  ASSERT_EQ(handle->RefCount(), 1);
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session1, factory_));
  ASSERT_EQ(handle->RefCount(), 0);

  // never closed on release, even at zero references
  auto session = factory_.LastSession();
  ASSERT_EQ(session->Closes(), 0);
  ASSERT_EQ(BoundHandle(factory_), handle);

  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(session->Commits(), 1);
  ASSERT_EQ(session->Closes(), 1);
  ASSERT_EQ(factory_.Journal().forced_commits_.load(), 0);
  ASSERT_EQ(BoundHandle(factory_), nullptr);
}

TEST_F(SessionCoordinatorTest, ZeroReferenceSessionReacquired) {
  auto status = MustBegin();
  auto session1 = MustAcquire(factory_);
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session1, factory_));
  ASSERT_EQ(BoundHandle(factory_)->RefCount(), 0);

  auto session2 = MustAcquire(factory_);
  ASSERT_EQ(session1, session2);
  ASSERT_EQ(BoundHandle(factory_)->RefCount(), 1);
  ASSERT_EQ(factory_.Journal().opens_.load(), 1);

  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session2, factory_));
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(factory_.LastSession()->Closes(), 1);
}

TEST_F(SessionCoordinatorTest, SessionStillReferencedClosedAfterCompletion) {
  auto status = MustBegin();
  auto session = MustAcquire(factory_);
  auto handle = BoundHandle(factory_);

  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(factory_.LastSession()->Closes(), 1);
  ASSERT_EQ(handle->RefCount(), 0);
  ASSERT_TRUE(handle->IsVoid());

  // once the transaction completed the session is no longer transactional
  ASSERT_FALSE(SessionCoordinator::IsTransactional(ctx_, session, factory_));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session, factory_));
  ASSERT_EQ(factory_.LastSession()->Closes(), 2);
}

TEST_F(SessionCoordinatorTest, RollbackClosesSessionWithoutCommit) {
  auto status = MustBegin();
  auto session = MustAcquire(factory_);
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session, factory_));

  ASSERT_TRUE(tx_mgr_.Rollback(ctx_, status));
  ASSERT_EQ(factory_.LastSession()->Commits(), 0);
  ASSERT_EQ(factory_.LastSession()->Closes(), 1);
  ASSERT_EQ(ctx_.Registry().Size(), 0);
}

TEST_F(SessionCoordinatorTest, ExecutorMismatchLeavesRegistryUntouched) {
  auto status = MustBegin();
  auto session = MustAcquire(factory_, ExecutorMode::kSimple);
  auto handle = BoundHandle(factory_);

  auto mismatch = SessionCoordinator::Acquire(ctx_, factory_, ExecutorMode::kBatch);
  ASSERT_FALSE(mismatch);
  ASSERT_EQ(mismatch.error().GetCode(), Error::Code::kExecutorMismatch);
  ASSERT_EQ(mismatch.error(), Error::ExecutorMismatch("SIMPLE", "BATCH"));
  ASSERT_EQ(BoundHandle(factory_), handle);
  ASSERT_EQ(handle->RefCount(), 1);
  ASSERT_EQ(handle->GetExecutorMode(), ExecutorMode::kSimple);
  ASSERT_EQ(factory_.Journal().opens_.load(), 1);

  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session, factory_));
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
}

TEST_F(SessionCoordinatorTest, SuspendedSessionNotLeakedIntoNewTx) {
  auto outer = MustBegin();
  auto outer_session = MustAcquire(factory_);
  auto outer_handle = BoundHandle(factory_);

  auto inner = MustBegin(Propagation::kRequiresNew);
  ASSERT_EQ(BoundHandle(factory_), nullptr);
  auto inner_session = MustAcquire(factory_);
  ASSERT_NE(inner_session, outer_session);
  ASSERT_EQ(factory_.Journal().opens_.load(), 2);
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, inner_session, factory_));
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, inner));

  auto sessions = factory_.Sessions();
  ASSERT_EQ(sessions[1]->Closes(), 1);
  ASSERT_EQ(sessions[0]->Closes(), 0);

  // the outer handle comes back with its reference count
  ASSERT_EQ(BoundHandle(factory_), outer_handle);
  ASSERT_EQ(outer_handle->RefCount(), 1);
  ASSERT_TRUE(SessionCoordinator::IsTransactional(ctx_, outer_session, factory_));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, outer_session, factory_));
  ASSERT_EQ(outer_handle->RefCount(), 0);

  ASSERT_TRUE(tx_mgr_.Commit(ctx_, outer));
  ASSERT_EQ(sessions[0]->Closes(), 1);
  ASSERT_EQ(sessions[0]->Commits(), 1);
  ASSERT_EQ(sessions[1]->Commits(), 1);
}

TEST_F(SessionCoordinatorTest, EmptyTxBindsSessionWithoutCommit) {
  auto status = MustBegin(Propagation::kSupports);
  auto session1 = MustAcquire(factory_);
  auto session2 = MustAcquire(factory_);
  ASSERT_EQ(session1, session2);
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session1, factory_));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session2, factory_));

  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(factory_.LastSession()->Commits(), 0);
  ASSERT_EQ(factory_.LastSession()->Closes(), 1);
}

TEST_F(SessionCoordinatorTest, NonTxAwareFactoryWithoutTxDataSource) {
  int data_source = 0;
  FakeSessionFactory factory(ExecutorMode::kSimple, false, &data_source);
  auto status = MustBegin();

  auto session = MustAcquire(factory);
  ASSERT_EQ(BoundHandle(factory), nullptr);
  ASSERT_FALSE(SessionCoordinator::IsTransactional(ctx_, session, factory));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session, factory));
  ASSERT_EQ(factory.LastSession()->Closes(), 1);
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
}

TEST_F(SessionCoordinatorTest, NonTxAwareFactoryWithTxDataSourceFails) {
  FakeSessionFactory factory(ExecutorMode::kSimple, false, resource_.GetResourceKey());
  auto status = MustBegin();

  auto acquired = SessionCoordinator::Acquire(ctx_, factory, ExecutorMode::kSimple);
  ASSERT_FALSE(acquired);
  ASSERT_EQ(acquired.error().GetCode(), Error::Code::kUnsupportedTxBinding);
  ASSERT_EQ(BoundHandle(factory), nullptr);
  // the session opened for the attempt doesn't leak
  ASSERT_EQ(factory.Journal().opens_.load(), 1);
  ASSERT_EQ(factory.LastSession()->Closes(), 1);
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
}

TEST_F(SessionCoordinatorTest, DefaultExecutorModeOfFactory) {
  FakeSessionFactory factory(ExecutorMode::kBatch);
  auto status = MustBegin();

  auto acquired = SessionCoordinator::Acquire(ctx_, factory);
  ASSERT_TRUE(acquired);
  ASSERT_EQ(factory.LastSession()->Mode(), ExecutorMode::kBatch);
  ASSERT_EQ(BoundHandle(factory)->GetExecutorMode(), ExecutorMode::kBatch);
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, acquired.value(), factory));
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
}

TEST_F(SessionCoordinatorTest, FactoriesAreIsolated) {
  FakeSessionFactory other;
  auto status = MustBegin();

  auto session1 = MustAcquire(factory_);
  auto session2 = MustAcquire(other);
  ASSERT_NE(session1, session2);
  ASSERT_NE(BoundHandle(factory_), BoundHandle(other));
  ASSERT_EQ(ctx_.Synchronizations().size(), 2);
  ASSERT_FALSE(SessionCoordinator::IsTransactional(ctx_, session1, other));

  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session1, factory_));
  ASSERT_TRUE(SessionCoordinator::Release(ctx_, session2, other));
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
  ASSERT_EQ(factory_.LastSession()->Closes(), 1);
  ASSERT_EQ(other.LastSession()->Closes(), 1);
}

TEST_F(SessionCoordinatorTest, OpenFailurePropagated) {
  factory_.FailOpens(Error::PersistenceTransient("open", "pool exhausted"));
  auto status = MustBegin();

  auto acquired = SessionCoordinator::Acquire(ctx_, factory_, ExecutorMode::kSimple);
  ASSERT_FALSE(acquired);
  ASSERT_EQ(acquired.error().GetCode(), Error::Code::kPersistenceTransient);
  ASSERT_EQ(BoundHandle(factory_), nullptr);
  ASSERT_TRUE(ctx_.Synchronizations().empty());
  ASSERT_TRUE(tx_mgr_.Commit(ctx_, status));
}

TEST_F(SessionCoordinatorTest, ReleaseNullSessionFails) {
  auto res = SessionCoordinator::Release(ctx_, nullptr, factory_);
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error().GetCode(), Error::Code::kInvalidArgument);
  ASSERT_FALSE(SessionCoordinator::IsTransactional(ctx_, nullptr, factory_));
}

} // namespace txsession::test
