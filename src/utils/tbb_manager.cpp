#include "tbb_manager.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

namespace dlmgr::utils {

namespace {
std::atomic<uint64_t> global_task_id{0};
}  // namespace

TBBManager& TBBManager::GetInstance() {
  static TBBManager instance;
  return instance;
}

void TBBManager::Init(const std::string& tbb_name, int concurrency) {
  if (concurrency <= 0) {
    concurrency = tbb::info::default_concurrency();
  }
  {
    std::lock_guard<std::mutex> lock(arenas_mutex_);
    if (task_arenas_.count(tbb_name) != 0) return;
  }

  RaiseParallelism(concurrency);

  TBBState state;
  state.concurrency = concurrency;
  // No slot is reserved for the caller: the orchestrating thread only waits.
  state.arena = std::make_shared<tbb::task_arena>(concurrency, 0);
  state.group = std::make_shared<tbb::task_group>();
  {
    std::lock_guard<std::mutex> lock(arenas_mutex_);
    task_arenas_[tbb_name] = state;
  }
  LOG(DEBUG) << "[TBBManager] Arena '" << tbb_name
             << "' initialized with concurrency: " << concurrency;
}

void TBBManager::Release(const std::string& tbb_name) {
  TBBState state;
  {
    std::lock_guard<std::mutex> lock(arenas_mutex_);
    auto it = task_arenas_.find(tbb_name);
    if (it == task_arenas_.end()) return;
    state = it->second;
    task_arenas_.erase(it);
  }
  state.arena->execute([&state]() { state.group->wait(); });
  LOG(DEBUG) << "[TBBManager] Arena '" << tbb_name << "' released.";
}

void TBBManager::Release() {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(arenas_mutex_);
    for (const auto& kv : task_arenas_) names.push_back(kv.first);
  }
  for (const auto& name : names) Release(name);
}

TBBManager::~TBBManager() { Release(); }

uint64_t TBBManager::GenerateUniqueTaskId() const {
  return global_task_id.fetch_add(1, std::memory_order_relaxed);
}

TBBState TBBManager::GetState(const std::string& tbb_name) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto it = task_arenas_.find(tbb_name);
  if (it == task_arenas_.end()) {
    throw std::runtime_error("[TBBManager] Arena '" + tbb_name +
                             "' not initialized.");
  }
  return it->second;
}

void TBBManager::RaiseParallelism(int concurrency) {
  // One extra thread for the external thread that enters the arena.
  const size_t needed = static_cast<size_t>(concurrency) + 1;
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  if (parallelism_ &&
      tbb::global_control::active_value(
          tbb::global_control::max_allowed_parallelism) >= needed) {
    return;
  }
  // The most restrictive active global_control wins, so drop the old one
  // before installing a larger limit.
  parallelism_.reset();
  if (static_cast<size_t>(tbb::info::default_concurrency()) >= needed) return;
  parallelism_ = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism, needed);
}

}  // namespace dlmgr::utils
