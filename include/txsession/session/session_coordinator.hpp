#pragma once

#include "txsession/base/result.hpp"
#include "txsession/session/error_translator.hpp"
#include "txsession/session/session.hpp"
#include "txsession/tx/exec_context.hpp"

#include <memory>

namespace txsession {

/// Implements "one session per ambient transaction, otherwise one session per
/// call" on top of the ambient state of an execution context.
///
/// Every Acquire() must be matched by exactly one Release() with the same
/// context, session and factory.
class SessionCoordinator {
public:
  /// Returns the session bound to the ambient transaction for the factory, or
  /// opens a new one. A new session is bound to the context when a transaction
  /// synchronization is active, it's closed when the transaction completes.
  ///
  /// Fails with ExecutorMismatch if the bound session runs with another
  /// executor mode, and with UnsupportedTxBinding if the factory is not
  /// transaction aware while its data source takes part in the transaction.
  static Result<std::shared_ptr<Session>> Acquire(
      ExecContext& ctx, SessionFactory& factory, ExecutorMode executor_mode,
      std::shared_ptr<const ErrorTranslator> translator = nullptr);

  /// Same as above, with the default executor mode of the factory.
  static Result<std::shared_ptr<Session>> Acquire(ExecContext& ctx, SessionFactory& factory);

  /// Releases a session returned by Acquire(). A session bound to the ambient
  /// transaction is only dereferenced, even when its reference count drops to
  /// zero it stays open until the transaction completes. Any other session is
  /// closed.
  static Result<void> Release(ExecContext& ctx, const std::shared_ptr<Session>& session,
                              SessionFactory& factory);

  /// Whether the session is the one bound to the ambient transaction for the
  /// factory, i.e. whether committing it is up to the transaction.
  static bool IsTransactional(ExecContext& ctx, const std::shared_ptr<Session>& session,
                              SessionFactory& factory);

private:
  /// Binds a newly opened session to the ambient transaction if there is one.
  static Result<void> RegisterSessionHandle(ExecContext& ctx, SessionFactory& factory,
                                            ExecutorMode executor_mode,
                                            std::shared_ptr<const ErrorTranslator> translator,
                                            const std::shared_ptr<Session>& session);
};

} // namespace txsession
