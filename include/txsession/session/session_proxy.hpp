#pragma once

#include "txsession/base/log.hpp"
#include "txsession/base/result.hpp"
#include "txsession/session/error_translator.hpp"
#include "txsession/session/session.hpp"
#include "txsession/session/session_coordinator.hpp"
#include "txsession/tx/exec_context.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace txsession {

/// A Session that never holds a session itself: every operation acquires the
/// session of the ambient transaction (or a fresh one) from the
/// SessionCoordinator, runs on it, commits it when no transaction owns it, and
/// releases it.
///
/// Transaction boundaries belong to the ambient transaction or to the proxy
/// itself, so Commit(), Rollback() and Close() fail with UnsupportedOperation.
///
/// A proxy is bound to one execution context, it's cheap to construct one per
/// context for the same factory.
class SessionProxy : public Session {
public:
  /// Uses the default executor mode of the factory and a
  /// PersistenceErrorTranslator.
  SessionProxy(ExecContext& ctx, SessionFactory& factory);

  /// Uses a PersistenceErrorTranslator.
  SessionProxy(ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode);

  /// The translator may be nullptr, in which case engine failures are
  /// propagated as is.
  SessionProxy(ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode,
               std::shared_ptr<const ErrorTranslator> translator);

  ~SessionProxy() override = default;

  SessionFactory& GetSessionFactory() const {
    return factory_;
  }

  ExecutorMode GetExecutorMode() const {
    return executor_mode_;
  }

  const std::shared_ptr<const ErrorTranslator>& GetErrorTranslator() const {
    return translator_;
  }

  Result<Optional<Row>> SelectOne(std::string_view statement, const Params& params = {}) override;

  Result<std::vector<Row>> SelectList(std::string_view statement, const Params& params = {},
                                      RowBounds bounds = {}) override;

  Result<RowMap> SelectMap(std::string_view statement, const Params& params,
                           std::string_view map_key, RowBounds bounds = {}) override;

  Result<void> Select(std::string_view statement, const Params& params, RowBounds bounds,
                      const RowHandler& handler) override;

  Result<int64_t> Insert(std::string_view statement, const Params& params = {}) override;

  Result<int64_t> Update(std::string_view statement, const Params& params = {}) override;

  Result<int64_t> Delete(std::string_view statement, const Params& params = {}) override;

  Result<std::vector<BatchResult>> FlushStatements() override;

  Result<void> ClearCache() override;

  Result<Connection*> GetConnection() override;

  Result<void> Commit(bool force = false) override;

  Result<void> Rollback(bool force = false) override;

  Result<void> Close() override;

private:
  /// Runs fn on the acquired session: acquire, invoke, commit when not
  /// transactional, translate, release.
  template <typename F>
  auto Invoke(F&& fn) -> std::invoke_result_t<F, Session&>;

  /// Translates an engine failure through the translator, returns the error
  /// itself when it's not a persistence error or not translated.
  Error Translate(Error&& error) const;

  ExecContext& ctx_;
  SessionFactory& factory_;
  const ExecutorMode executor_mode_;
  const std::shared_ptr<const ErrorTranslator> translator_;
};

template <typename F>
auto SessionProxy::Invoke(F&& fn) -> std::invoke_result_t<F, Session&> {
  using ResultType = std::invoke_result_t<F, Session&>;

  auto acquired = SessionCoordinator::Acquire(ctx_, factory_, executor_mode_, translator_);
  if (!acquired) {
    return ResultType(std::move(acquired.error()));
  }
  auto session = std::move(acquired.value());

  auto result = fn(*session);
  std::optional<Error> failure;
  if (result) {
    if (!SessionCoordinator::IsTransactional(ctx_, session, factory_)) {
      // Force the commit even without pending changes, some engines require an
      // explicit transaction end before the connection can be reused.
      if (auto committed = session->Commit(true); !committed) {
        failure = std::move(committed.error());
      }
    }
  } else {
    failure = std::move(result.error());
  }

  auto released = SessionCoordinator::Release(ctx_, session, factory_);
  if (failure.has_value()) {
    if (!released) {
      Log::Error("Release session failed, context={}, error={}", ctx_.Name(),
                 released.error().ToString());
    }
    return ResultType(Translate(std::move(failure.value())));
  }
  if (!released) {
    return ResultType(std::move(released.error()));
  }
  return result;
}

} // namespace txsession
