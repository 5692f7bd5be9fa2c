#pragma once

#include "txsession/base/result.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/resource_holder.hpp"

#include <memory>
#include <string>
#include <utility>

namespace txsession {

/// A physical connection to a data source. Implemented by the persistence
/// engine.
class Connection {
public:
  virtual ~Connection() = default;

  /// A printable identity used in logs.
  virtual std::string Describe() const = 0;

  virtual Result<bool> IsAutoCommit() const = 0;

  virtual Result<void> SetAutoCommit(bool auto_commit) = 0;

  virtual Result<void> Commit() = 0;

  virtual Result<void> Rollback() = 0;

  /// Returns the connection to its data source.
  virtual Result<void> Close() = 0;
};

/// Hands out connections. Implemented by the persistence engine.
class DataSource {
public:
  virtual ~DataSource() = default;

  virtual Result<std::shared_ptr<Connection>> OpenConnection() = 0;
};

/// Identity of a data source in an AmbientRegistry.
inline ResourceKey KeyOf(const DataSource& data_source) {
  return static_cast<ResourceKey>(&data_source);
}

/// Holder of the connection a transaction runs on, bound under the key of its
/// data source while the transaction runs.
class ConnectionHolder : public ResourceHolder {
public:
  explicit ConnectionHolder(std::shared_ptr<Connection> connection)
      : connection_(std::move(connection)) {
  }

  const std::shared_ptr<Connection>& GetConnection() const {
    return connection_;
  }

  /// Whether auto-commit was switched off when the transaction began and must
  /// be switched on again once it completes.
  bool MustRestoreAutoCommit() const {
    return must_restore_auto_commit_;
  }

  void SetMustRestoreAutoCommit(bool must_restore) {
    must_restore_auto_commit_ = must_restore;
  }

private:
  const std::shared_ptr<Connection> connection_;
  bool must_restore_auto_commit_ = false;
};

/// Connection lookup on top of the ambient state of an execution context.
///
/// Every GetConnection() must be matched by exactly one ReleaseConnection()
/// with the same context, connection and data source.
class ConnectionUtils {
public:
  /// Returns the connection of the transaction running on the context for the
  /// data source, or a new connection of the data source when there is none.
  static Result<std::shared_ptr<Connection>> GetConnection(ExecContext& ctx,
                                                           DataSource& data_source);

  /// Releases a connection returned by GetConnection(). The connection of the
  /// running transaction is only dereferenced, any other connection is closed.
  static Result<void> ReleaseConnection(ExecContext& ctx,
                                        const std::shared_ptr<Connection>& connection,
                                        const DataSource& data_source);

  /// Whether the connection is the one of the transaction running on the
  /// context for the data source.
  static bool IsConnectionTransactional(ExecContext& ctx,
                                        const std::shared_ptr<Connection>& connection,
                                        const DataSource& data_source);
};

} // namespace txsession
