#pragma once

#include "txsession/base/enum_traits.hpp"
#include "txsession/base/result.hpp"
#include "txsession/session/session_handle.hpp"
#include "txsession/tx/exec_context.hpp"
#include "txsession/tx/tx_synchronization.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace txsession {

/// Ties a SessionHandle to the lifecycle of the transaction it's bound to:
/// unbinds it on suspend, rebinds it on resume, flushes the session before
/// commit, and closes it once the transaction completes.
///
/// State transitions:
///
///   kActive --OnSuspend--> kSuspended --OnResume--> kActive
///   kActive --OnBeforeCompletion--> kCompleting (handle still referenced)
///   kActive|kCompleting --OnBeforeCompletion|OnAfterCompletion--> kDone
///
/// The session is closed exactly once, on the transition to kDone.
class SessionSynchronization : public TxSynchronization {
public:
  enum class State : uint8_t { kActive = 0, kSuspended, kCompleting, kDone };

  /// Constructs a synchronization for the handle bound to ctx under key. The
  /// context must outlive the transaction.
  SessionSynchronization(ExecContext& ctx, std::shared_ptr<SessionHandle> handle, ResourceKey key);

  int32_t Order() const override {
    return kConnectionSyncOrder - 1;
  }

  void OnSuspend() override;

  void OnResume() override;

  Result<void> OnBeforeCommit(bool read_only) override;

  void OnBeforeCompletion() override;

  void OnAfterCompletion(TxCompletionStatus status) override;

  State GetState() const {
    return state_.load(std::memory_order_acquire);
  }

private:
  /// Moves to kDone and closes the session, unless another callback already
  /// did it.
  void CloseSession(std::string_view reason);

  ExecContext& ctx_;
  const std::shared_ptr<SessionHandle> handle_;
  const ResourceKey key_;
  std::atomic<State> state_ = State::kActive;
};

template <>
struct EnumTraits<SessionSynchronization::State> {
  static std::string_view ToString(SessionSynchronization::State state) {
    switch (state) {
    case SessionSynchronization::State::kActive:
      return "ACTIVE";
    case SessionSynchronization::State::kSuspended:
      return "SUSPENDED";
    case SessionSynchronization::State::kCompleting:
      return "COMPLETING";
    case SessionSynchronization::State::kDone:
      return "DONE";
    default:
      return "UNKNOWN";
    }
  }

  static Optional<SessionSynchronization::State> FromString(std::string_view str) {
    if (str == "ACTIVE") {
      return SessionSynchronization::State::kActive;
    }
    if (str == "SUSPENDED") {
      return SessionSynchronization::State::kSuspended;
    }
    if (str == "COMPLETING") {
      return SessionSynchronization::State::kCompleting;
    }
    if (str == "DONE") {
      return SessionSynchronization::State::kDone;
    }
    return std::nullopt;
  }
};

} // namespace txsession
