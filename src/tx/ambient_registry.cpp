#include "txsession/tx/ambient_registry.hpp"

#include "txsession/base/log.hpp"
#include "utils/json.hpp"

#include <memory>
#include <mutex>
#include <utility>

namespace txsession {

std::shared_ptr<ResourceHolder> AmbientRegistry::Get(ResourceKey key) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = resources_.find(key);
  if (it == resources_.end()) {
    return nullptr;
  }
  if (it->second->IsVoid()) {
    TXSESSION_DLOG("Dropping void resource holder, key={}", ResourceKeyToString(key));
    resources_.erase(it);
    return nullptr;
  }
  return it->second;
}

Result<void> AmbientRegistry::Bind(ResourceKey key, std::shared_ptr<ResourceHolder> holder) {
  if (holder == nullptr) {
    return Error::InvalidArgument("Cannot bind a null resource holder");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = resources_.find(key);
  if (it != resources_.end()) {
    if (!it->second->IsVoid()) {
      return Error::AlreadyBound(ResourceKeyToString(key));
    }
    // a void holder doesn't count as bound
    resources_.erase(it);
  }
  resources_.emplace(key, std::move(holder));
  return {};
}

Result<std::shared_ptr<ResourceHolder>> AmbientRegistry::Unbind(ResourceKey key) {
  auto holder = UnbindIfPossible(key);
  if (holder == nullptr) {
    return Error::NotBound(ResourceKeyToString(key));
  }
  return holder;
}

std::shared_ptr<ResourceHolder> AmbientRegistry::UnbindIfPossible(ResourceKey key) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = resources_.find(key);
  if (it == resources_.end()) {
    return nullptr;
  }
  auto holder = std::move(it->second);
  resources_.erase(it);
  if (holder->IsVoid()) {
    return nullptr;
  }
  return holder;
}

std::shared_ptr<ResourceHolder> AmbientRegistry::Suspend(ResourceKey key) {
  return UnbindIfPossible(key);
}

Result<void> AmbientRegistry::Resume(ResourceKey key, std::shared_ptr<ResourceHolder> holder) {
  return Bind(key, std::move(holder));
}

bool AmbientRegistry::Contains(ResourceKey key) {
  return Get(key) != nullptr;
}

size_t AmbientRegistry::Size() {
  std::lock_guard<std::mutex> guard(mutex_);
  return resources_.size();
}

std::unordered_map<ResourceKey, std::shared_ptr<ResourceHolder>> AmbientRegistry::TakeAll() {
  std::lock_guard<std::mutex> guard(mutex_);
  auto taken = std::move(resources_);
  resources_.clear();
  return taken;
}

std::string AmbientRegistry::ToJson() {
  std::lock_guard<std::mutex> guard(mutex_);
  utils::JsonArray bindings;
  for (const auto& [key, holder] : resources_) {
    utils::JsonObj binding;
    binding.AddString("key", ResourceKeyToString(key));
    binding.AddInt64("ref_count", holder->RefCount());
    binding.AddBool("synchronized_with_tx", holder->IsSynchronizedWithTx());
    binding.AddBool("void", holder->IsVoid());
    bindings.AppendJsonObj(binding);
  }

  utils::JsonObj obj;
  obj.AddUint64("size", resources_.size());
  obj.AddJsonArray("bindings", bindings);
  return obj.Serialize();
}

} // namespace txsession
