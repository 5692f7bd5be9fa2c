#include "txsession/tx/exec_context.hpp"

#include "txsession/base/log.hpp"
#include "utils/json.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace txsession {

ExecContext::ExecContext(std::string name) : name_(std::move(name)) {
}

ExecContext::~ExecContext() {
  auto left = registry_.Size();
  if (left > 0) {
    Log::Warn("Execution context destroyed with bound resources, context={}, resources={}", name_,
              left);
  }
}

bool ExecContext::IsSynchronizationActive() const {
  std::lock_guard<std::mutex> guard(sync_mutex_);
  return sync_active_;
}

Result<void> ExecContext::InitSynchronization() {
  std::lock_guard<std::mutex> guard(sync_mutex_);
  if (sync_active_) {
    return Error::General(
        std::format("Cannot activate transaction synchronization, already active, context={}",
                    name_));
  }
  sync_active_ = true;
  synchronizations_.clear();
  return {};
}

Result<void> ExecContext::RegisterSynchronization(std::shared_ptr<TxSynchronization> sync) {
  if (sync == nullptr) {
    return Error::InvalidArgument("Cannot register a null transaction synchronization");
  }
  std::lock_guard<std::mutex> guard(sync_mutex_);
  if (!sync_active_) {
    return Error::NoSynchronization(name_);
  }
  synchronizations_.push_back(std::move(sync));
  return {};
}

std::vector<std::shared_ptr<TxSynchronization>> ExecContext::Synchronizations() const {
  std::vector<std::shared_ptr<TxSynchronization>> sorted;
  {
    std::lock_guard<std::mutex> guard(sync_mutex_);
    sorted = synchronizations_;
  }
  std::stable_sort(sorted.begin(), sorted.end(), [](const auto& lhs, const auto& rhs) {
    return lhs->Order() < rhs->Order();
  });
  return sorted;
}

void ExecContext::ClearSynchronization() {
  std::lock_guard<std::mutex> guard(sync_mutex_);
  sync_active_ = false;
  synchronizations_.clear();
}

std::string ExecContext::TxName() const {
  std::lock_guard<std::mutex> guard(sync_mutex_);
  return tx_name_;
}

void ExecContext::SetTxName(std::string name) {
  std::lock_guard<std::mutex> guard(sync_mutex_);
  tx_name_ = std::move(name);
}

void ExecContext::Clear() {
  ClearSynchronization();
  SetTxName("");
  SetTxReadOnly(false);
  SetActualTxActive(false);
}

std::string ExecContext::ToJson() {
  utils::JsonObj registry;
  if (auto res = registry.Deserialize(registry_.ToJson()); !res) {
    Log::Error("Dump registry failed, context={}, error={}", name_, res.error().ToString());
  }

  utils::JsonObj obj;
  obj.AddString("name", name_);
  {
    std::lock_guard<std::mutex> guard(sync_mutex_);
    obj.AddBool("synchronization_active", sync_active_);
    obj.AddUint64("synchronizations", synchronizations_.size());
    obj.AddString("tx_name", tx_name_);
  }
  obj.AddBool("actual_tx_active", IsActualTxActive());
  obj.AddBool("tx_read_only", IsTxReadOnly());
  obj.AddJsonObj("registry", registry);
  return obj.Serialize();
}

} // namespace txsession
