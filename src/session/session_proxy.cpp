#include "txsession/session/session_proxy.hpp"

#include "txsession/base/error.hpp"

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace txsession {

SessionProxy::SessionProxy(ExecContext& ctx, SessionFactory& factory)
    : SessionProxy(ctx, factory, factory.DefaultExecutorMode()) {
}

SessionProxy::SessionProxy(ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode)
    : SessionProxy(ctx, factory, executor_mode, std::make_shared<PersistenceErrorTranslator>()) {
}

SessionProxy::SessionProxy(ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode,
                           std::shared_ptr<const ErrorTranslator> translator)
    : ctx_(ctx),
      factory_(factory),
      executor_mode_(executor_mode),
      translator_(std::move(translator)) {
}

Error SessionProxy::Translate(Error&& error) const {
  if (translator_ == nullptr || !IsPersistenceError(error)) {
    return std::move(error);
  }
  auto translated = translator_->TranslateIfPossible(error);
  if (!translated.has_value()) {
    return std::move(error);
  }
  return std::move(translated.value());
}

Result<Optional<Row>> SessionProxy::SelectOne(std::string_view statement, const Params& params) {
  return Invoke([&](Session& session) { return session.SelectOne(statement, params); });
}

Result<std::vector<Row>> SessionProxy::SelectList(std::string_view statement,
                                                  const Params& params, RowBounds bounds) {
  return Invoke([&](Session& session) { return session.SelectList(statement, params, bounds); });
}

Result<RowMap> SessionProxy::SelectMap(std::string_view statement, const Params& params,
                                       std::string_view map_key, RowBounds bounds) {
  return Invoke(
      [&](Session& session) { return session.SelectMap(statement, params, map_key, bounds); });
}

Result<void> SessionProxy::Select(std::string_view statement, const Params& params,
                                  RowBounds bounds, const RowHandler& handler) {
  return Invoke(
      [&](Session& session) { return session.Select(statement, params, bounds, handler); });
}

Result<int64_t> SessionProxy::Insert(std::string_view statement, const Params& params) {
  return Invoke([&](Session& session) { return session.Insert(statement, params); });
}

Result<int64_t> SessionProxy::Update(std::string_view statement, const Params& params) {
  return Invoke([&](Session& session) { return session.Update(statement, params); });
}

Result<int64_t> SessionProxy::Delete(std::string_view statement, const Params& params) {
  return Invoke([&](Session& session) { return session.Delete(statement, params); });
}

Result<std::vector<BatchResult>> SessionProxy::FlushStatements() {
  return Invoke([](Session& session) { return session.FlushStatements(); });
}

Result<void> SessionProxy::ClearCache() {
  return Invoke([](Session& session) { return session.ClearCache(); });
}

Result<Connection*> SessionProxy::GetConnection() {
  return Invoke([](Session& session) { return session.GetConnection(); });
}

Result<void> SessionProxy::Commit(bool force [[maybe_unused]]) {
  return Error::UnsupportedOperation("commit");
}

Result<void> SessionProxy::Rollback(bool force [[maybe_unused]]) {
  return Error::UnsupportedOperation("rollback");
}

Result<void> SessionProxy::Close() {
  return Error::UnsupportedOperation("close");
}

} // namespace txsession
