#pragma once

#include "txsession/base/result.hpp"
#include "txsession/tx/connection.hpp"
#include "txsession/tx/exec_context.hpp"

#include <memory>

namespace txsession {

/// The transaction a session runs on when its connection is managed by a
/// DataSourceTxManager.
///
/// The connection is fetched lazily through ConnectionUtils on the first
/// GetConnection(). If it's the connection of the running transaction, commit
/// and rollback are left to the transaction manager and Close() only
/// dereferences it. Otherwise this object commits, rolls back and closes the
/// connection itself, except that nothing is committed or rolled back on an
/// auto-commit connection.
///
/// Not thread safe, it's owned by exactly one session.
class ManagedTransaction {
public:
  ManagedTransaction(ExecContext& ctx, DataSource& data_source)
      : ctx_(ctx),
        data_source_(data_source) {
  }

  ~ManagedTransaction() = default;

  ManagedTransaction(const ManagedTransaction&) = delete;
  ManagedTransaction& operator=(const ManagedTransaction&) = delete;

  Result<std::shared_ptr<Connection>> GetConnection();

  Result<void> Commit();

  Result<void> Rollback();

  /// Releases the connection. A later GetConnection() fetches a new one.
  Result<void> Close();

  /// Whether the connection in use is the one of the running transaction.
  /// False before the first GetConnection().
  bool IsConnectionTransactional() const {
    return connection_transactional_;
  }

  bool IsAutoCommit() const {
    return auto_commit_;
  }

private:
  Result<void> OpenConnection();

  /// Whether commit and rollback must be issued on the connection.
  bool OwnsCompletion() const {
    return connection_ != nullptr && !connection_transactional_ && !auto_commit_;
  }

  ExecContext& ctx_;
  DataSource& data_source_;

  std::shared_ptr<Connection> connection_;
  bool connection_transactional_ = false;
  bool auto_commit_ = false;
};

} // namespace txsession
