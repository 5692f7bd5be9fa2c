#include "txsession/session/session_coordinator.hpp"

#include "txsession/base/defer.hpp"
#include "txsession/base/log.hpp"
#include "txsession/session/session_handle.hpp"
#include "txsession/session/session_synchronization.hpp"

#include <memory>
#include <utility>

namespace txsession {

namespace {

/// Returns the handle bound for the factory, nullptr if absent.
std::shared_ptr<SessionHandle> BoundHandle(ExecContext& ctx, const SessionFactory& factory) {
  return std::dynamic_pointer_cast<SessionHandle>(ctx.Registry().Get(KeyOf(factory)));
}

void CloseQuietly(ExecContext& ctx, const std::shared_ptr<Session>& session) {
  if (auto res = session->Close(); !res) {
    Log::Error("Close session failed, context={}, error={}", ctx.Name(), res.error().ToString());
  }
}

} // namespace

Result<std::shared_ptr<Session>> SessionCoordinator::Acquire(
    ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode,
    std::shared_ptr<const ErrorTranslator> translator) {
  auto handle = BoundHandle(ctx, factory);
  if (handle != nullptr && handle->IsSynchronizedWithTx()) {
    if (handle->GetExecutorMode() != executor_mode) {
      return Error::ExecutorMismatch(ToString(handle->GetExecutorMode()),
                                     ToString(executor_mode));
    }
    handle->Requested();
    Log::Debug("Fetched session from current transaction, context={}, ref_count={}", ctx.Name(),
               handle->RefCount());
    return handle->GetSession();
  }

  Log::Debug("Creating a new session, context={}, executor_mode={}", ctx.Name(),
             ToString(executor_mode));
  auto opened = factory.OpenSession(executor_mode);
  if (!opened) {
    return std::move(opened.error());
  }
  auto session = std::move(opened.value());
  if (session == nullptr) {
    return Error::General("Session factory returned a null session");
  }

  auto close_on_failure = MakeScopedDeferrer([&]() { CloseQuietly(ctx, session); });
  if (auto res = RegisterSessionHandle(ctx, factory, executor_mode, std::move(translator), session);
      !res) {
    return std::move(res.error());
  }
  close_on_failure.Cancel();
  return session;
}

Result<std::shared_ptr<Session>> SessionCoordinator::Acquire(ExecContext& ctx,
                                                             SessionFactory& factory) {
  return Acquire(ctx, factory, factory.DefaultExecutorMode());
}

Result<void> SessionCoordinator::RegisterSessionHandle(
    ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode,
    std::shared_ptr<const ErrorTranslator> translator, const std::shared_ptr<Session>& session) {
  if (!ctx.IsSynchronizationActive()) {
    Log::Debug("Session was not registered for synchronization because synchronization is not "
               "active, context={}",
               ctx.Name());
    return {};
  }

  if (!factory.IsTxAware()) {
    if (ctx.Registry().Get(factory.DataSourceKey()) == nullptr) {
      Log::Debug("Session was not registered for synchronization because the data source is not "
                 "transactional, context={}",
                 ctx.Name());
      return {};
    }
    return Error::UnsupportedTxBinding(ResourceKeyToString(KeyOf(factory)));
  }

  Log::Debug("Registering transaction synchronization for session, context={}", ctx.Name());
  auto key = KeyOf(factory);
  auto handle = std::make_shared<SessionHandle>(session, executor_mode, std::move(translator));
  if (auto res = ctx.Registry().Bind(key, handle); !res) {
    return std::move(res.error());
  }

  auto sync = std::make_shared<SessionSynchronization>(ctx, handle, key);
  if (auto res = ctx.RegisterSynchronization(std::move(sync)); !res) {
    ctx.Registry().UnbindIfPossible(key);
    return std::move(res.error());
  }

  handle->SetSynchronizedWithTx(true);
  handle->Requested();
  return {};
}

Result<void> SessionCoordinator::Release(ExecContext& ctx, const std::shared_ptr<Session>& session,
                                         SessionFactory& factory) {
  if (session == nullptr) {
    return Error::InvalidArgument("No session specified");
  }

  auto handle = BoundHandle(ctx, factory);
  if (handle != nullptr && handle->GetSession() == session) {
    handle->Released();
    Log::Debug("Releasing transactional session, context={}, ref_count={}", ctx.Name(),
               handle->RefCount());
    return {};
  }

  Log::Debug("Closing non transactional session, context={}", ctx.Name());
  return session->Close();
}

bool SessionCoordinator::IsTransactional(ExecContext& ctx, const std::shared_ptr<Session>& session,
                                         SessionFactory& factory) {
  if (session == nullptr) {
    return false;
  }
  auto handle = BoundHandle(ctx, factory);
  return handle != nullptr && handle->GetSession() == session;
}

} // namespace txsession
