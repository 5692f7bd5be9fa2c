#pragma once

#include "txsession/base/log.hpp"
#include "txsession/base/result.hpp"
#include "txsession/config/session_option.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/resource_holder.hpp"
#include "txsession/tx/tx_definition.hpp"
#include "txsession/tx/tx_synchronization.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace txsession {

/// The physical side of a transaction: a data source able to begin, commit and
/// roll back a transaction on behalf of an execution context.
///
/// DoBegin() is expected to bind a holder under GetResourceKey() to the
/// context, DoCleanup() to unbind it.
class TxResourceManager {
public:
  virtual ~TxResourceManager() = default;

  virtual ResourceKey GetResourceKey() const = 0;

  virtual Result<void> DoBegin(ExecContext& ctx, const TxDefinition& definition) = 0;

  virtual Result<void> DoCommit(ExecContext& ctx) = 0;

  virtual Result<void> DoRollback(ExecContext& ctx) = 0;

  virtual void DoCleanup(ExecContext& ctx) = 0;
};

/// Holder of a running actual transaction, bound under
/// TxManager::GetResourceKey() and shared by every boundary taking part in it.
class TxScopeHolder : public ResourceHolder {
public:
  /// Marks the whole transaction so that only a rollback can complete it. Set
  /// by a participating boundary that rolls back.
  void SetRollbackOnly() {
    rollback_only_.store(true, std::memory_order_release);
  }

  bool IsRollbackOnly() const {
    return rollback_only_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> rollback_only_ = false;
};

/// Ambient state of an outer transaction suspended by an inner one.
struct SuspendedResources {
  std::vector<std::pair<ResourceKey, std::shared_ptr<ResourceHolder>>> resources_;
  std::vector<std::shared_ptr<TxSynchronization>> synchronizations_;
  bool synchronization_active_ = false;
  std::string tx_name_;
  bool read_only_ = false;
  bool actual_tx_active_ = false;
};

/// Handle of a transaction boundary opened by TxManager::Begin(). It must be
/// completed exactly once, by TxManager::Commit() or TxManager::Rollback().
class TxStatus {
public:
  TxStatus() = default;
  ~TxStatus() = default;

  TxStatus(const TxStatus&) = delete;
  TxStatus& operator=(const TxStatus&) = delete;

  TxStatus(TxStatus&&) noexcept = default;
  TxStatus& operator=(TxStatus&&) noexcept = default;

  const std::string& Name() const {
    return name_;
  }

  /// Whether an actual transaction runs under the boundary, either started by
  /// it or joined.
  bool HasTx() const {
    return scope_ != nullptr;
  }

  /// Whether the boundary started the actual transaction.
  bool IsNewTx() const {
    return new_tx_;
  }

  /// Whether the boundary activated the synchronization of the context.
  bool IsNewSynchronization() const {
    return new_synchronization_;
  }

  bool IsReadOnly() const {
    return read_only_;
  }

  /// Marks the boundary so that committing it rolls it back.
  void SetRollbackOnly() {
    local_rollback_only_ = true;
  }

  /// Whether the boundary itself or the transaction it joined is marked
  /// rollback-only.
  bool IsRollbackOnly() const {
    return local_rollback_only_ || IsGlobalRollbackOnly();
  }

  bool IsCompleted() const {
    return completed_;
  }

  bool HasSuspendedResources() const {
    return suspended_ != nullptr;
  }

private:
  bool IsGlobalRollbackOnly() const {
    return scope_ != nullptr && scope_->IsRollbackOnly();
  }

  std::string name_;

  /// nullptr when the boundary runs without an actual transaction.
  std::shared_ptr<TxScopeHolder> scope_;

  bool new_tx_ = false;
  bool new_synchronization_ = false;
  bool read_only_ = false;
  bool local_rollback_only_ = false;
  bool completed_ = false;

  std::unique_ptr<SuspendedResources> suspended_;

  friend class TxManager;
};

/// Drives transaction boundaries on execution contexts: activates the
/// transaction synchronization, fires the TxSynchronization callbacks in order
/// and suspends or resumes outer transactions according to the propagation.
///
/// Physical work is delegated to an optional TxResourceManager, without one
/// the actual transactions are purely logical.
class TxManager {
public:
  TxManager() = default;

  explicit TxManager(const SessionOption& option, TxResourceManager* resource_manager = nullptr)
      : default_propagation_(option.default_propagation_),
        resource_manager_(resource_manager) {
  }

  ~TxManager() = default;

  TxManager(const TxManager&) = delete;
  TxManager& operator=(const TxManager&) = delete;

  /// Opens a transaction boundary with the default propagation.
  Result<TxStatus> Begin(ExecContext& ctx);

  /// Opens a transaction boundary. Fails with NoTransaction for kMandatory
  /// without an existing transaction.
  Result<TxStatus> Begin(ExecContext& ctx, const TxDefinition& definition);

  /// Commits the boundary. A boundary marked rollback-only is rolled back
  /// instead, UnexpectedRollback is returned when the rollback-only mark was set
  /// by a participant of a transaction started by this boundary.
  Result<void> Commit(ExecContext& ctx, TxStatus& status);

  /// Rolls back the boundary, or marks the joined transaction rollback-only
  /// when the boundary only participates in it.
  Result<void> Rollback(ExecContext& ctx, TxStatus& status);

  /// Runs fn inside a transaction boundary, commits when it succeeds and rolls
  /// back when it fails. The error of fn takes precedence over the error of
  /// the rollback.
  template <typename F>
    requires std::is_same_v<std::invoke_result_t<F>, Result<void>>
  Result<void> Execute(ExecContext& ctx, const TxDefinition& definition, F&& fn);

  /// Key under which the holder of the running actual transaction is bound.
  ResourceKey GetResourceKey() const {
    return static_cast<ResourceKey>(this);
  }

  Propagation GetDefaultPropagation() const {
    return default_propagation_;
  }

private:
  Result<TxStatus> HandleExistingTx(ExecContext& ctx, const TxDefinition& definition,
                                    std::shared_ptr<TxScopeHolder> scope);

  Result<TxStatus> StartTx(ExecContext& ctx, const TxDefinition& definition,
                           std::unique_ptr<SuspendedResources> suspended);

  TxStatus PrepareEmptyTx(ExecContext& ctx, const TxDefinition& definition,
                          std::unique_ptr<SuspendedResources> suspended);

  Result<void> ProcessCommit(ExecContext& ctx, TxStatus& status);

  Result<void> ProcessRollback(ExecContext& ctx, TxStatus& status, bool unexpected);

  /// Suspends the synchronizations of the context, and the resources of the
  /// running actual transaction when with_resources is set. Returns nullptr
  /// when there is nothing to suspend.
  std::unique_ptr<SuspendedResources> Suspend(ExecContext& ctx, bool with_resources);

  void Resume(ExecContext& ctx, std::unique_ptr<SuspendedResources> suspended);

  Result<void> TriggerBeforeCommit(ExecContext& ctx, const TxStatus& status);

  void TriggerBeforeCompletion(ExecContext& ctx, const TxStatus& status);

  void TriggerAfterCompletion(ExecContext& ctx, const TxStatus& status,
                              TxCompletionStatus completion);

  void CleanupAfterCompletion(ExecContext& ctx, TxStatus& status);

  const Propagation default_propagation_ = Propagation::kRequired;

  TxResourceManager* const resource_manager_ = nullptr;
};

template <typename F>
  requires std::is_same_v<std::invoke_result_t<F>, Result<void>>
Result<void> TxManager::Execute(ExecContext& ctx, const TxDefinition& definition, F&& fn) {
  auto begun = Begin(ctx, definition);
  if (!begun) {
    return std::move(begun.error());
  }
  auto status = std::move(begun.value());

  if (auto res = fn(); !res) {
    if (auto rolled_back = Rollback(ctx, status); !rolled_back) {
      Log::Error("Rollback after failure failed, context={}, tx={}, error={}", ctx.Name(),
                 status.Name(), rolled_back.error().ToString());
    }
    return std::move(res.error());
  }
  return Commit(ctx, status);
}

} // namespace txsession
