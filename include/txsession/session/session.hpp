#pragma once

#include "txsession/base/enum_traits.hpp"
#include "txsession/base/optional.hpp"
#include "txsession/base/result.hpp"
#include "txsession/tx/connection.hpp"
#include "txsession/tx/resource_holder.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace txsession {

/// Strategy a session uses to run statements.
enum class ExecutorMode : uint8_t {
  /// Prepares a new statement for every execution.
  kSimple = 0,
  /// Reuses prepared statements.
  kReuse,
  /// Queues updates until FlushStatements() or Commit().
  kBatch,
};

template <>
struct EnumTraits<ExecutorMode> {
  static std::string_view ToString(ExecutorMode mode) {
    switch (mode) {
    case ExecutorMode::kSimple:
      return "SIMPLE";
    case ExecutorMode::kReuse:
      return "REUSE";
    case ExecutorMode::kBatch:
      return "BATCH";
    default:
      return "UNKNOWN";
    }
  }

  static Optional<ExecutorMode> FromString(std::string_view str) {
    if (str == "SIMPLE") {
      return ExecutorMode::kSimple;
    }
    if (str == "REUSE") {
      return ExecutorMode::kReuse;
    }
    if (str == "BATCH") {
      return ExecutorMode::kBatch;
    }
    return std::nullopt;
  }
};

/// A column or parameter value.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/// Named statement parameters.
using Params = std::map<std::string, Value>;

/// One result row, keyed by column name.
using Row = std::map<std::string, Value>;

/// Rows keyed by the value of one of their columns.
using RowMap = std::map<Value, Row>;

/// Called once per row by Session::Select().
using RowHandler = std::function<void(const Row& row)>;

/// Slice of a result set to return.
struct RowBounds {
  static constexpr uint64_t kNoLimit = std::numeric_limits<uint64_t>::max();

  uint64_t offset_ = 0;
  uint64_t limit_ = kNoLimit;
};

/// Update counts of one statement flushed from a batch.
struct BatchResult {
  std::string statement_;
  std::vector<int64_t> update_counts_;
};

/// A stateful unit of work against a persistence engine. Implemented by the
/// engine, consumed by SessionCoordinator and wrapped by SessionProxy.
///
/// Failures of the engine are reported as persistence errors, see
/// IsPersistenceError().
class Session {
public:
  virtual ~Session() = default;

  virtual Result<Optional<Row>> SelectOne(std::string_view statement,
                                          const Params& params = {}) = 0;

  virtual Result<std::vector<Row>> SelectList(std::string_view statement,
                                              const Params& params = {},
                                              RowBounds bounds = {}) = 0;

  virtual Result<RowMap> SelectMap(std::string_view statement, const Params& params,
                                   std::string_view map_key, RowBounds bounds = {}) = 0;

  virtual Result<void> Select(std::string_view statement, const Params& params,
                              RowBounds bounds, const RowHandler& handler) = 0;

  /// Returns the number of affected rows.
  virtual Result<int64_t> Insert(std::string_view statement, const Params& params = {}) = 0;

  /// Returns the number of affected rows.
  virtual Result<int64_t> Update(std::string_view statement, const Params& params = {}) = 0;

  /// Returns the number of affected rows.
  virtual Result<int64_t> Delete(std::string_view statement, const Params& params = {}) = 0;

  virtual Result<std::vector<BatchResult>> FlushStatements() = 0;

  virtual Result<void> ClearCache() = 0;

  virtual Result<Connection*> GetConnection() = 0;

  /// Commits the unit of work. Without force, a session with no pending
  /// changes may skip the commit.
  virtual Result<void> Commit(bool force = false) = 0;

  /// Rolls back the unit of work. Without force, a session with no pending
  /// changes may skip the rollback.
  virtual Result<void> Rollback(bool force = false) = 0;

  /// Releases the session and everything it holds.
  virtual Result<void> Close() = 0;
};

/// Opens sessions. Implemented by the persistence engine.
class SessionFactory {
public:
  virtual ~SessionFactory() = default;

  virtual Result<std::shared_ptr<Session>> OpenSession(ExecutorMode mode) = 0;

  virtual ExecutorMode DefaultExecutorMode() const = 0;

  /// Whether sessions of this factory run on a ManagedTransaction over the
  /// data source behind DataSourceKey(), i.e. whether they take their
  /// connection from the ambient transaction and can be synchronized with it.
  virtual bool IsTxAware() const = 0;

  /// Identity of the data source behind the sessions. Something bound under
  /// this key means the data source takes part in the ambient transaction.
  virtual ResourceKey DataSourceKey() const = 0;
};

/// Identity of a session factory in an AmbientRegistry.
inline ResourceKey KeyOf(const SessionFactory& factory) {
  return static_cast<ResourceKey>(&factory);
}

} // namespace txsession
