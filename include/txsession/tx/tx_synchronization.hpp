#pragma once

#include "txsession/base/result.hpp"
#include "txsession/tx/tx_definition.hpp"

#include <cstdint>

namespace txsession {

/// Callbacks fired by the TxManager around the boundaries of the transaction a
/// synchronization is registered with.
///
/// For one transaction, OnBeforeCommit() precedes OnBeforeCompletion(), which
/// precedes OnAfterCompletion(). OnSuspend() and OnResume() may interleave any
/// number of times before completion.
class TxSynchronization {
public:
  /// Order of the synchronizations releasing physical connections. Those
  /// cleaning up objects running on a connection must run before them.
  static constexpr int32_t kConnectionSyncOrder = 1000;

  virtual ~TxSynchronization() = default;

  /// Synchronizations fire in ascending order.
  virtual int32_t Order() const {
    return 0;
  }

  /// The transaction is suspended, unbind resources from the context.
  virtual void OnSuspend() {
  }

  /// The transaction is resumed, rebind resources to the context.
  virtual void OnResume() {
  }

  /// The transaction is about to commit. An error rolls the transaction back.
  virtual Result<void> OnBeforeCommit(bool read_only [[maybe_unused]]) {
    return {};
  }

  /// The transaction is about to commit or roll back.
  virtual void OnBeforeCompletion() {
  }

  /// The transaction has committed or rolled back. May be called on a thread
  /// other than the one owning the execution context.
  virtual void OnAfterCompletion(TxCompletionStatus status [[maybe_unused]]) {
  }
};

} // namespace txsession
