#include "txsession/tx/connection.hpp"

#include "txsession/base/error.hpp"
#include "txsession/base/log.hpp"

#include <memory>
#include <utility>

namespace txsession {

namespace {

std::shared_ptr<ConnectionHolder> BoundHolder(ExecContext& ctx, const DataSource& data_source) {
  return std::dynamic_pointer_cast<ConnectionHolder>(ctx.Registry().Get(KeyOf(data_source)));
}

} // namespace

Result<std::shared_ptr<Connection>> ConnectionUtils::GetConnection(ExecContext& ctx,
                                                                   DataSource& data_source) {
  if (auto holder = BoundHolder(ctx, data_source); holder != nullptr) {
    holder->Requested();
    Log::Debug("Fetched connection from current transaction, context={}, connection={}, "
               "ref_count={}",
               ctx.Name(), holder->GetConnection()->Describe(), holder->RefCount());
    return holder->GetConnection();
  }

  auto opened = data_source.OpenConnection();
  if (!opened) {
    return std::move(opened.error());
  }
  if (opened.value() == nullptr) {
    return Error::General("Data source returned a null connection");
  }
  Log::Debug("Fetched connection from data source, context={}, connection={}", ctx.Name(),
             opened.value()->Describe());
  return std::move(opened.value());
}

Result<void> ConnectionUtils::ReleaseConnection(ExecContext& ctx,
                                                const std::shared_ptr<Connection>& connection,
                                                const DataSource& data_source) {
  if (connection == nullptr) {
    return {};
  }

  auto holder = BoundHolder(ctx, data_source);
  if (holder != nullptr && holder->GetConnection() == connection) {
    holder->Released();
    return {};
  }

  Log::Debug("Closing non transactional connection, context={}, connection={}", ctx.Name(),
             connection->Describe());
  return connection->Close();
}

bool ConnectionUtils::IsConnectionTransactional(ExecContext& ctx,
                                                const std::shared_ptr<Connection>& connection,
                                                const DataSource& data_source) {
  if (connection == nullptr) {
    return false;
  }
  auto holder = BoundHolder(ctx, data_source);
  return holder != nullptr && holder->GetConnection() == connection;
}

} // namespace txsession
