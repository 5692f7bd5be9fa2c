#include "txsession/tx/managed_transaction.hpp"

#include "txsession/base/log.hpp"

#include <memory>
#include <utility>

namespace txsession {

Result<std::shared_ptr<Connection>> ManagedTransaction::GetConnection() {
  if (connection_ == nullptr) {
    if (auto res = OpenConnection(); !res) {
      return std::move(res.error());
    }
  }
  return connection_;
}

Result<void> ManagedTransaction::OpenConnection() {
  auto connection = ConnectionUtils::GetConnection(ctx_, data_source_);
  if (!connection) {
    return std::move(connection.error());
  }

  auto auto_commit = connection.value()->IsAutoCommit();
  if (!auto_commit) {
    if (auto res = ConnectionUtils::ReleaseConnection(ctx_, connection.value(), data_source_);
        !res) {
      Log::Error("Release connection failed, context={}, connection={}, error={}", ctx_.Name(),
                 connection.value()->Describe(), res.error().ToString());
    }
    return std::move(auto_commit.error());
  }

  connection_ = std::move(connection.value());
  auto_commit_ = auto_commit.value();
  connection_transactional_ =
      ConnectionUtils::IsConnectionTransactional(ctx_, connection_, data_source_);
  Log::Debug("Connection {} will{} be managed by the transaction manager, context={}, "
             "auto_commit={}",
             connection_->Describe(), connection_transactional_ ? "" : " not", ctx_.Name(),
             auto_commit_);
  return {};
}

Result<void> ManagedTransaction::Commit() {
  if (!OwnsCompletion()) {
    return {};
  }
  Log::Debug("Committing connection, context={}, connection={}", ctx_.Name(),
             connection_->Describe());
  return connection_->Commit();
}

Result<void> ManagedTransaction::Rollback() {
  if (!OwnsCompletion()) {
    return {};
  }
  Log::Debug("Rolling back connection, context={}, connection={}", ctx_.Name(),
             connection_->Describe());
  return connection_->Rollback();
}

Result<void> ManagedTransaction::Close() {
  auto connection = std::move(connection_);
  connection_ = nullptr;
  connection_transactional_ = false;
  auto_commit_ = false;
  return ConnectionUtils::ReleaseConnection(ctx_, connection, data_source_);
}

} // namespace txsession
