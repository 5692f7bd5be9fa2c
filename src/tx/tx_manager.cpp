#include "txsession/tx/tx_manager.hpp"

#include "txsession/base/error.hpp"
#include "txsession/base/log.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace txsession {

Result<TxStatus> TxManager::Begin(ExecContext& ctx) {
  return Begin(ctx, TxDefinition{.propagation_ = default_propagation_});
}

Result<TxStatus> TxManager::Begin(ExecContext& ctx, const TxDefinition& definition) {
  if (auto scope = std::dynamic_pointer_cast<TxScopeHolder>(ctx.Registry().Get(GetResourceKey()));
      scope != nullptr) {
    return HandleExistingTx(ctx, definition, std::move(scope));
  }

  switch (definition.propagation_) {
  case Propagation::kMandatory: {
    return Error::NoTransaction(ToString(definition.propagation_));
  }
  case Propagation::kRequired:
  case Propagation::kRequiresNew: {
    // an empty boundary may run around, its synchronizations must not observe
    // the new transaction
    return StartTx(ctx, definition, Suspend(ctx, false));
  }
  case Propagation::kSupports:
  case Propagation::kNotSupported: {
    return PrepareEmptyTx(ctx, definition, nullptr);
  }
  default: {
    return Error::InvalidArgument("Unknown propagation");
  }
  }
}

Result<TxStatus> TxManager::HandleExistingTx(ExecContext& ctx, const TxDefinition& definition,
                                             std::shared_ptr<TxScopeHolder> scope) {
  switch (definition.propagation_) {
  case Propagation::kNotSupported: {
    Log::Debug("Suspending current transaction, context={}, tx={}", ctx.Name(), ctx.TxName());
    return PrepareEmptyTx(ctx, definition, Suspend(ctx, true));
  }
  case Propagation::kRequiresNew: {
    Log::Debug("Suspending current transaction, creating new transaction, context={}, tx={}",
               ctx.Name(), ctx.TxName());
    return StartTx(ctx, definition, Suspend(ctx, true));
  }
  case Propagation::kRequired:
  case Propagation::kSupports:
  case Propagation::kMandatory: {
    Log::Debug("Participating in existing transaction, context={}, tx={}", ctx.Name(),
               ctx.TxName());
    TxStatus status;
    status.name_ = definition.name_.empty() ? ctx.TxName() : definition.name_;
    status.scope_ = std::move(scope);
    status.read_only_ = ctx.IsTxReadOnly();
    return status;
  }
  default: {
    return Error::InvalidArgument("Unknown propagation");
  }
  }
}

Result<TxStatus> TxManager::StartTx(ExecContext& ctx, const TxDefinition& definition,
                                    std::unique_ptr<SuspendedResources> suspended) {
  Log::Debug("Creating new transaction, context={}, tx={}, propagation={}", ctx.Name(),
             definition.name_, ToString(definition.propagation_));
  auto scope = std::make_shared<TxScopeHolder>();
  scope->SetSynchronizedWithTx(true);
  if (auto res = ctx.Registry().Bind(GetResourceKey(), scope); !res) {
    Resume(ctx, std::move(suspended));
    return std::move(res.error());
  }

  if (resource_manager_ != nullptr) {
    if (auto res = resource_manager_->DoBegin(ctx, definition); !res) {
      Log::Error("Begin transaction failed, context={}, tx={}, error={}", ctx.Name(),
                 definition.name_, res.error().ToString());
      ctx.Registry().UnbindIfPossible(GetResourceKey());
      Resume(ctx, std::move(suspended));
      return std::move(res.error());
    }
  }

  if (auto res = ctx.InitSynchronization(); !res) {
    if (resource_manager_ != nullptr) {
      resource_manager_->DoCleanup(ctx);
    }
    ctx.Registry().UnbindIfPossible(GetResourceKey());
    Resume(ctx, std::move(suspended));
    return std::move(res.error());
  }
  ctx.SetActualTxActive(true);
  ctx.SetTxReadOnly(definition.read_only_);
  ctx.SetTxName(definition.name_);

  TxStatus status;
  status.name_ = definition.name_;
  status.scope_ = std::move(scope);
  status.new_tx_ = true;
  status.new_synchronization_ = true;
  status.read_only_ = definition.read_only_;
  status.suspended_ = std::move(suspended);
  return status;
}

TxStatus TxManager::PrepareEmptyTx(ExecContext& ctx, const TxDefinition& definition,
                                   std::unique_ptr<SuspendedResources> suspended) {
  TxStatus status;
  status.name_ = definition.name_;
  status.read_only_ = definition.read_only_;
  status.suspended_ = std::move(suspended);

  // an enclosing empty boundary keeps owning the synchronization
  if (!ctx.IsSynchronizationActive()) {
    if (auto res = ctx.InitSynchronization(); !res) {
      Log::Error("Activate transaction synchronization failed, context={}, error={}", ctx.Name(),
                 res.error().ToString());
      return status;
    }
    status.new_synchronization_ = true;
    ctx.SetActualTxActive(false);
    ctx.SetTxReadOnly(definition.read_only_);
    ctx.SetTxName(definition.name_);
  }
  return status;
}

Result<void> TxManager::Commit(ExecContext& ctx, TxStatus& status) {
  if (status.completed_) {
    return Error::TxAlreadyCompleted(status.name_);
  }

  if (status.local_rollback_only_) {
    Log::Debug("Transaction marked as rollback-only locally, rolling back, context={}, tx={}",
               ctx.Name(), status.name_);
    return ProcessRollback(ctx, status, false);
  }

  if (status.IsGlobalRollbackOnly()) {
    Log::Debug("Transaction marked as rollback-only globally, rolling back, context={}, tx={}",
               ctx.Name(), status.name_);
    return ProcessRollback(ctx, status, true);
  }

  return ProcessCommit(ctx, status);
}

Result<void> TxManager::Rollback(ExecContext& ctx, TxStatus& status) {
  if (status.completed_) {
    return Error::TxAlreadyCompleted(status.name_);
  }
  return ProcessRollback(ctx, status, false);
}

Result<void> TxManager::ProcessCommit(ExecContext& ctx, TxStatus& status) {
  if (auto res = TriggerBeforeCommit(ctx, status); !res) {
    Log::Info("Before-commit callback failed, rolling back, context={}, tx={}, error={}",
              ctx.Name(), status.name_, res.error().ToString());
    TriggerBeforeCompletion(ctx, status);
    if (status.new_tx_ && resource_manager_ != nullptr) {
      if (auto rolled_back = resource_manager_->DoRollback(ctx); !rolled_back) {
        Log::Error("Rollback after before-commit failure failed, context={}, tx={}, error={}",
                   ctx.Name(), status.name_, rolled_back.error().ToString());
      }
    } else if (status.HasTx()) {
      status.scope_->SetRollbackOnly();
    }
    TriggerAfterCompletion(ctx, status, TxCompletionStatus::kRolledBack);
    CleanupAfterCompletion(ctx, status);
    return std::move(res.error());
  }

  TriggerBeforeCompletion(ctx, status);

  if (status.new_tx_ && resource_manager_ != nullptr) {
    Log::Debug("Initiating transaction commit, context={}, tx={}", ctx.Name(), status.name_);
    if (auto res = resource_manager_->DoCommit(ctx); !res) {
      Log::Error("Commit transaction failed, rolling back, context={}, tx={}, error={}",
                 ctx.Name(), status.name_, res.error().ToString());
      if (auto rolled_back = resource_manager_->DoRollback(ctx); !rolled_back) {
        Log::Error("Rollback after commit failure failed, context={}, tx={}, error={}",
                   ctx.Name(), status.name_, rolled_back.error().ToString());
      }
      TriggerAfterCompletion(ctx, status, TxCompletionStatus::kRolledBack);
      CleanupAfterCompletion(ctx, status);
      return std::move(res.error());
    }
  }

  TriggerAfterCompletion(ctx, status, TxCompletionStatus::kCommitted);
  CleanupAfterCompletion(ctx, status);
  return {};
}

Result<void> TxManager::ProcessRollback(ExecContext& ctx, TxStatus& status, bool unexpected) {
  TriggerBeforeCompletion(ctx, status);

  std::optional<Error> failure;
  if (status.new_tx_) {
    Log::Debug("Initiating transaction rollback, context={}, tx={}", ctx.Name(), status.name_);
    if (resource_manager_ != nullptr) {
      if (auto res = resource_manager_->DoRollback(ctx); !res) {
        Log::Error("Rollback transaction failed, context={}, tx={}, error={}", ctx.Name(),
                   status.name_, res.error().ToString());
        failure = std::move(res.error());
      }
    }
  } else if (status.HasTx()) {
    Log::Debug("Participating transaction failed, marking existing transaction as rollback-only, "
               "context={}, tx={}",
               ctx.Name(), status.name_);
    status.scope_->SetRollbackOnly();
  }

  TriggerAfterCompletion(ctx, status, TxCompletionStatus::kRolledBack);
  CleanupAfterCompletion(ctx, status);

  if (failure.has_value()) {
    return std::move(failure.value());
  }
  if (unexpected && status.new_tx_) {
    return Error::UnexpectedRollback(status.name_);
  }
  return {};
}

std::unique_ptr<SuspendedResources> TxManager::Suspend(ExecContext& ctx, bool with_resources) {
  auto sync_active = ctx.IsSynchronizationActive();
  if (!sync_active && !with_resources) {
    return nullptr;
  }

  auto suspended = std::make_unique<SuspendedResources>();
  if (sync_active) {
    suspended->synchronizations_ = ctx.Synchronizations();
    for (const auto& sync : suspended->synchronizations_) {
      sync->OnSuspend();
    }
    suspended->synchronization_active_ = true;
    suspended->tx_name_ = ctx.TxName();
    suspended->read_only_ = ctx.IsTxReadOnly();
    suspended->actual_tx_active_ = ctx.IsActualTxActive();
    ctx.Clear();
  }

  if (with_resources) {
    if (auto scope = ctx.Registry().Suspend(GetResourceKey()); scope != nullptr) {
      suspended->resources_.emplace_back(GetResourceKey(), std::move(scope));
    }
    if (resource_manager_ != nullptr) {
      auto key = resource_manager_->GetResourceKey();
      if (auto holder = ctx.Registry().Suspend(key); holder != nullptr) {
        suspended->resources_.emplace_back(key, std::move(holder));
      }
    }
  }
  return suspended;
}

void TxManager::Resume(ExecContext& ctx, std::unique_ptr<SuspendedResources> suspended) {
  if (suspended == nullptr) {
    return;
  }

  for (auto& [key, holder] : suspended->resources_) {
    if (auto res = ctx.Registry().Resume(key, std::move(holder)); !res) {
      Log::Error("Resume resource failed, context={}, error={}", ctx.Name(),
                 res.error().ToString());
    }
  }

  if (!suspended->synchronization_active_) {
    return;
  }
  for (const auto& sync : suspended->synchronizations_) {
    sync->OnResume();
  }
  if (auto res = ctx.InitSynchronization(); !res) {
    Log::Error("Resume transaction synchronization failed, context={}, error={}", ctx.Name(),
               res.error().ToString());
    return;
  }
  for (auto& sync : suspended->synchronizations_) {
    if (auto res = ctx.RegisterSynchronization(std::move(sync)); !res) {
      Log::Error("Resume transaction synchronization failed, context={}, error={}", ctx.Name(),
                 res.error().ToString());
    }
  }
  ctx.SetTxName(std::move(suspended->tx_name_));
  ctx.SetTxReadOnly(suspended->read_only_);
  ctx.SetActualTxActive(suspended->actual_tx_active_);
}

Result<void> TxManager::TriggerBeforeCommit(ExecContext& ctx, const TxStatus& status) {
  if (!status.new_synchronization_) {
    return {};
  }
  for (const auto& sync : ctx.Synchronizations()) {
    if (auto res = sync->OnBeforeCommit(status.read_only_); !res) {
      return res;
    }
  }
  return {};
}

void TxManager::TriggerBeforeCompletion(ExecContext& ctx, const TxStatus& status) {
  if (!status.new_synchronization_) {
    return;
  }
  for (const auto& sync : ctx.Synchronizations()) {
    sync->OnBeforeCompletion();
  }
}

void TxManager::TriggerAfterCompletion(ExecContext& ctx, const TxStatus& status,
                                       TxCompletionStatus completion) {
  if (!status.new_synchronization_) {
    return;
  }
  // the synchronization is cleared first, callbacks must not register new
  // synchronizations for a completed transaction
  auto synchronizations = ctx.Synchronizations();
  ctx.ClearSynchronization();
  for (const auto& sync : synchronizations) {
    sync->OnAfterCompletion(completion);
  }
}

void TxManager::CleanupAfterCompletion(ExecContext& ctx, TxStatus& status) {
  status.completed_ = true;
  if (status.new_synchronization_) {
    ctx.Clear();
  }
  if (status.new_tx_) {
    ctx.Registry().UnbindIfPossible(GetResourceKey());
    status.scope_->Unbound();
    if (resource_manager_ != nullptr) {
      resource_manager_->DoCleanup(ctx);
    }
  }
  if (status.suspended_ != nullptr) {
    Log::Debug("Resuming suspended transaction after completion, context={}, tx={}", ctx.Name(),
               status.name_);
    Resume(ctx, std::move(status.suspended_));
  }
}

} // namespace txsession
