#include "txsession/session/session_synchronization.hpp"

#include "txsession/base/log.hpp"

#include <memory>
#include <string_view>
#include <utility>

namespace txsession {

SessionSynchronization::SessionSynchronization(ExecContext& ctx,
                                               std::shared_ptr<SessionHandle> handle,
                                               ResourceKey key)
    : ctx_(ctx),
      handle_(std::move(handle)),
      key_(key) {
}

void SessionSynchronization::OnSuspend() {
  auto expected = State::kActive;
  if (!state_.compare_exchange_strong(expected, State::kSuspended, std::memory_order_acq_rel)) {
    return;
  }

  Log::Debug("Transaction synchronization suspending session, context={}, key={}", ctx_.Name(),
             ResourceKeyToString(key_));
  if (ctx_.Registry().Suspend(key_) == nullptr) {
    Log::Warn("Suspended session was not bound, context={}, key={}", ctx_.Name(),
              ResourceKeyToString(key_));
  }
}

void SessionSynchronization::OnResume() {
  auto expected = State::kSuspended;
  if (!state_.compare_exchange_strong(expected, State::kActive, std::memory_order_acq_rel)) {
    return;
  }

  Log::Debug("Transaction synchronization resuming session, context={}, key={}", ctx_.Name(),
             ResourceKeyToString(key_));
  if (auto res = ctx_.Registry().Resume(key_, handle_); !res) {
    Log::Error("Resume session failed, context={}, error={}", ctx_.Name(),
               res.error().ToString());
  }
}

Result<void> SessionSynchronization::OnBeforeCommit(bool read_only) {
  // Connection commit or rollback is up to the transaction manager. Commit the
  // session only to flush its pending batched statements.
  if (!ctx_.IsActualTxActive()) {
    return {};
  }

  Log::Debug("Transaction synchronization committing session, context={}, key={}, read_only={}",
             ctx_.Name(), ResourceKeyToString(key_), read_only);
  auto res = handle_->GetSession()->Commit(false);
  if (res) {
    return {};
  }

  auto& error = res.error();
  const auto& translator = handle_->GetErrorTranslator();
  if (translator != nullptr && IsPersistenceError(error)) {
    if (auto translated = translator->TranslateIfPossible(error); translated.has_value()) {
      return std::move(translated.value());
    }
  }
  return std::move(error);
}

void SessionSynchronization::OnBeforeCompletion() {
  auto expected = State::kActive;
  if (!state_.compare_exchange_strong(expected, State::kCompleting, std::memory_order_acq_rel)) {
    Log::Debug("Transaction synchronization completing from state {}, context={}, key={}",
               ToString(expected), ctx_.Name(), ResourceKeyToString(key_));
  }

  // Close and unbind the session now if nobody references it anymore, the
  // after-completion callback may arrive on another thread.
  if (handle_->IsOpen()) {
    return;
  }

  Log::Debug("Transaction synchronization deregistering session, context={}, key={}",
             ctx_.Name(), ResourceKeyToString(key_));
  if (auto res = ctx_.Registry().Unbind(key_); !res) {
    Log::Error("Deregister session failed, context={}, error={}", ctx_.Name(),
               res.error().ToString());
  }
  CloseSession("before completion");
}

void SessionSynchronization::OnAfterCompletion(TxCompletionStatus status) {
  if (GetState() != State::kDone) {
    Log::Debug("Transaction synchronization deregistering session, context={}, key={}, status={}",
               ctx_.Name(), ResourceKeyToString(key_), ToString(status));
    // another holder may have been bound under the key since
    if (ctx_.Registry().Get(key_) == handle_) {
      ctx_.Registry().UnbindIfPossible(key_);
    }
    CloseSession("after completion");
  }
  handle_->Reset();
}

void SessionSynchronization::CloseSession(std::string_view reason) {
  auto prev = state_.exchange(State::kDone, std::memory_order_acq_rel);
  if (prev == State::kDone) {
    return;
  }

  handle_->Unbound();
  Log::Debug("Transaction synchronization closing session, context={}, key={}, state={}, "
             "reason={}",
             ctx_.Name(), ResourceKeyToString(key_), ToString(prev), reason);
  if (auto res = handle_->GetSession()->Close(); !res) {
    Log::Error("Close session failed, context={}, error={}", ctx_.Name(), res.error().ToString());
  }
}

} // namespace txsession
