#pragma once

#include "txsession/base/result.hpp"
#include "txsession/tx/connection.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/resource_holder.hpp"
#include "txsession/tx/tx_definition.hpp"
#include "txsession/tx/tx_manager.hpp"

#include <memory>

namespace txsession {

/// Runs the actual transactions of a TxManager on connections of one data
/// source. Each transaction takes a connection from the data source, switches
/// it to manual commit and binds it to the context as a ConnectionHolder under
/// the key of the data source. ConnectionUtils and ManagedTransaction pick it
/// up from there.
class DataSourceTxManager : public TxResourceManager {
public:
  explicit DataSourceTxManager(DataSource& data_source) : data_source_(data_source) {
  }

  ResourceKey GetResourceKey() const override {
    return KeyOf(data_source_);
  }

  Result<void> DoBegin(ExecContext& ctx, const TxDefinition& definition) override;

  Result<void> DoCommit(ExecContext& ctx) override;

  Result<void> DoRollback(ExecContext& ctx) override;

  /// Unbinds the connection, restores its auto-commit mode and closes it.
  void DoCleanup(ExecContext& ctx) override;

  DataSource& GetDataSource() const {
    return data_source_;
  }

private:
  Result<std::shared_ptr<ConnectionHolder>> BoundHolder(ExecContext& ctx) const;

  DataSource& data_source_;
};

} // namespace txsession
