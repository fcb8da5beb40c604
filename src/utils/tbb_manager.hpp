#ifndef DLMGR_TBB_MANAGER_HPP_
#define DLMGR_TBB_MANAGER_HPP_

#include <tbb/global_control.h>
#include <tbb/info.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "logger.hpp"

namespace dlmgr::utils {

struct TBBState {
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
  std::shared_ptr<tbb::task_group> group;
};

/**
 * @brief TBB任务管理器，按名称管理arena及其task_group
 *
 * Tasks spawned into an arena may block (network, file and queue waits), so
 * the process-wide parallelism limit is raised to cover every arena slot.
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  // Creates the named arena. Names are expected to be unique per run
  // (see GenerateUniqueTaskId); an existing arena of that name is kept.
  void Init(const std::string& tbb_name, int concurrency);

  template <typename Func>
  void Spawn(const std::string& tbb_name, Func&& task);

  // Waits for and drops the named arena.
  void Release(const std::string& tbb_name);
  void Release();
  ~TBBManager();

  uint64_t GenerateUniqueTaskId() const;

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  TBBState GetState(const std::string& tbb_name);
  void RaiseParallelism(int concurrency);

  std::unordered_map<std::string, TBBState> task_arenas_;
  std::unique_ptr<tbb::global_control> parallelism_;

  mutable std::mutex arenas_mutex_;
};

template <typename Func>
void TBBManager::Spawn(const std::string& tbb_name, Func&& task) {
  TBBState state = GetState(tbb_name);
  auto group = state.group;
  state.arena->execute(
      [&group, &task]() { group->run(std::forward<Func>(task)); });
}

}  // namespace dlmgr::utils

#endif  // DLMGR_TBB_MANAGER_HPP_
