#pragma once

#include "txsession/base/result.hpp"
#include "txsession/tx/ambient_registry.hpp"
#include "txsession/tx/tx_synchronization.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace txsession {

/// The ambient state of one execution context, i.e. one thread or one
/// logical task: bound resources, the synchronizations of the running
/// transaction and its attributes.
///
/// An ExecContext is created by whoever owns the execution context and passed
/// explicitly to the TxManager, the SessionCoordinator and the SessionProxy.
/// It must never be used by two execution contexts concurrently, except for the
/// completion callbacks which tolerate it.
class ExecContext {
public:
  explicit ExecContext(std::string name = "");
  ~ExecContext();

  ExecContext(const ExecContext&) = delete;
  ExecContext& operator=(const ExecContext&) = delete;

  const std::string& Name() const {
    return name_;
  }

  AmbientRegistry& Registry() {
    return registry_;
  }

  //----------------------------------------------------------------------------
  // Transaction synchronization
  //----------------------------------------------------------------------------

  /// Whether a transaction boundary is open and accepts synchronizations. The
  /// boundary may or may not run an actual transaction.
  bool IsSynchronizationActive() const;

  /// Activates synchronization for a new transaction boundary.
  Result<void> InitSynchronization();

  /// Registers a synchronization for the running transaction, fails with
  /// NoSynchronization if synchronization is not active.
  Result<void> RegisterSynchronization(std::shared_ptr<TxSynchronization> sync);

  /// Returns the registered synchronizations sorted by their order.
  std::vector<std::shared_ptr<TxSynchronization>> Synchronizations() const;

  /// Deactivates synchronization and forgets the registered synchronizations.
  void ClearSynchronization();

  //----------------------------------------------------------------------------
  // Attributes of the running transaction
  //----------------------------------------------------------------------------

  bool IsActualTxActive() const {
    return actual_tx_active_.load(std::memory_order_acquire);
  }

  void SetActualTxActive(bool active) {
    actual_tx_active_.store(active, std::memory_order_release);
  }

  bool IsTxReadOnly() const {
    return tx_read_only_.load(std::memory_order_acquire);
  }

  void SetTxReadOnly(bool read_only) {
    tx_read_only_.store(read_only, std::memory_order_release);
  }

  std::string TxName() const;

  void SetTxName(std::string name);

  /// Resets the transaction attributes and synchronizations, bound resources
  /// are kept.
  void Clear();

  /// Dumps the context for diagnostics.
  std::string ToJson();

private:
  const std::string name_;

  AmbientRegistry registry_;

  /// Protects the fields below.
  mutable std::mutex sync_mutex_;
  bool sync_active_ = false;
  std::vector<std::shared_ptr<TxSynchronization>> synchronizations_;
  std::string tx_name_;

  std::atomic<bool> actual_tx_active_ = false;
  std::atomic<bool> tx_read_only_ = false;
};

} // namespace txsession
