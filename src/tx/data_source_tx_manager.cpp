#include "txsession/tx/data_source_tx_manager.hpp"

#include "txsession/base/defer.hpp"
#include "txsession/base/error.hpp"
#include "txsession/base/log.hpp"

#include <memory>
#include <utility>

namespace txsession {

namespace {

void CloseQuietly(ExecContext& ctx, Connection& connection) {
  if (auto res = connection.Close(); !res) {
    Log::Error("Close connection failed, context={}, connection={}, error={}", ctx.Name(),
               connection.Describe(), res.error().ToString());
  }
}

} // namespace

Result<void> DataSourceTxManager::DoBegin(ExecContext& ctx, const TxDefinition& definition) {
  auto opened = data_source_.OpenConnection();
  if (!opened) {
    return std::move(opened.error());
  }
  auto connection = std::move(opened.value());
  if (connection == nullptr) {
    return Error::General("Data source returned a null connection");
  }
  auto close_on_failure = MakeScopedDeferrer([&]() { CloseQuietly(ctx, *connection); });

  auto holder = std::make_shared<ConnectionHolder>(connection);
  auto auto_commit = connection->IsAutoCommit();
  if (!auto_commit) {
    return std::move(auto_commit.error());
  }
  if (auto_commit.value()) {
    Log::Debug("Switching connection to manual commit, context={}, connection={}", ctx.Name(),
               connection->Describe());
    if (auto res = connection->SetAutoCommit(false); !res) {
      return res;
    }
    holder->SetMustRestoreAutoCommit(true);
  }

  holder->SetSynchronizedWithTx(true);
  if (auto res = ctx.Registry().Bind(GetResourceKey(), holder); !res) {
    if (holder->MustRestoreAutoCommit()) {
      if (auto restored = connection->SetAutoCommit(true); !restored) {
        Log::Error("Restore auto-commit failed, context={}, connection={}, error={}", ctx.Name(),
                   connection->Describe(), restored.error().ToString());
      }
    }
    return res;
  }

  close_on_failure.Cancel();
  Log::Debug("Acquired connection for transaction, context={}, tx={}, connection={}", ctx.Name(),
             definition.name_, connection->Describe());
  return {};
}

Result<void> DataSourceTxManager::DoCommit(ExecContext& ctx) {
  auto holder = BoundHolder(ctx);
  if (!holder) {
    return std::move(holder.error());
  }
  const auto& connection = holder.value()->GetConnection();
  Log::Debug("Committing connection, context={}, connection={}", ctx.Name(),
             connection->Describe());
  return connection->Commit();
}

Result<void> DataSourceTxManager::DoRollback(ExecContext& ctx) {
  auto holder = BoundHolder(ctx);
  if (!holder) {
    return std::move(holder.error());
  }
  const auto& connection = holder.value()->GetConnection();
  Log::Debug("Rolling back connection, context={}, connection={}", ctx.Name(),
             connection->Describe());
  return connection->Rollback();
}

void DataSourceTxManager::DoCleanup(ExecContext& ctx) {
  auto unbound = ctx.Registry().UnbindIfPossible(GetResourceKey());
  auto holder = std::dynamic_pointer_cast<ConnectionHolder>(std::move(unbound));
  if (holder == nullptr) {
    Log::Warn("No connection bound after transaction, context={}, key={}", ctx.Name(),
              ResourceKeyToString(GetResourceKey()));
    return;
  }

  const auto& connection = holder->GetConnection();
  if (holder->MustRestoreAutoCommit()) {
    if (auto res = connection->SetAutoCommit(true); !res) {
      Log::Error("Restore auto-commit failed, context={}, connection={}, error={}", ctx.Name(),
                 connection->Describe(), res.error().ToString());
    }
  }
  holder->Reset();
  holder->Unbound();

  Log::Debug("Releasing connection after transaction, context={}, connection={}", ctx.Name(),
             connection->Describe());
  CloseQuietly(ctx, *connection);
}

Result<std::shared_ptr<ConnectionHolder>> DataSourceTxManager::BoundHolder(
    ExecContext& ctx) const {
  auto holder =
      std::dynamic_pointer_cast<ConnectionHolder>(ctx.Registry().Get(GetResourceKey()));
  if (holder == nullptr) {
    return Error::NotBound(ResourceKeyToString(GetResourceKey()));
  }
  return holder;
}

} // namespace txsession
