#ifndef DLMGR_DOWNLOADER_HPP_
#define DLMGR_DOWNLOADER_HPP_

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "DownloadTypes.hpp"
#include "InterruptSource.hpp"
#include "StateStore.hpp"
#include "Transfer.hpp"

namespace dlmgr {

struct DownloaderOptions {
  std::filesystem::path outDir;
  // 0 runs every download at once.
  size_t maxConcurrentDownloads = 0;
};

struct DownloadReport {
  std::vector<WorkerOutcome> outcomes;  // completion order
  std::vector<std::string> failedUrls;
  StateMap finalStates;

  size_t count(TransferStatus status) const;
};

/**
 * @brief Runs one worker per task and waits for all of them.
 *
 * Interrupts are relayed to the workers as a single cancellation signal each;
 * they never shorten the wait. The state store lives for the duration of
 * run() and is shut down by dropping its last handle.
 */
class Downloader {
 public:
  Downloader(std::shared_ptr<const Transfer> transfer,
             InterruptSource& interrupts, DownloaderOptions options);
  ~Downloader();

  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;

  // Observer for the state store, called on its thread per applied update.
  void setStateObserver(StateStore::Observer observer);

  DownloadReport run(std::vector<DownloadTask> tasks);

 private:
  std::shared_ptr<const Transfer> transfer_;
  InterruptSource& interrupts_;
  DownloaderOptions options_;
  StateStore::Observer stateObserver_;
};

}  // namespace dlmgr

#endif  // DLMGR_DOWNLOADER_HPP_
