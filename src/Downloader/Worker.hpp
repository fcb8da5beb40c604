#ifndef DLMGR_WORKER_HPP_
#define DLMGR_WORKER_HPP_

#include <filesystem>
#include <memory>

#include "Cancellation.hpp"
#include "DownloadTypes.hpp"
#include "StateStore.hpp"
#include "Transfer.hpp"

namespace dlmgr {

/**
 * @brief Owns one download from Downloading to its terminal state.
 *
 * run() records Downloading, runs the transfer, then records exactly one of
 * Completed, Interrupted or Failed. While that is in flight, the first
 * cancellation signal seen on the subscription fires the private token; every
 * later signal is dropped.
 */
class Worker {
 public:
  Worker(DownloadTask task, StateStoreHandle store,
         std::shared_ptr<CancellationSubscription> subscription,
         std::shared_ptr<const Transfer> transfer,
         std::filesystem::path outDir);

  // Never throws for transfer or state store failures; those are reported in
  // the outcome.
  WorkerOutcome run();

  // out_dir/file_name if set, else out_dir/<last path segment>, else
  // out_dir/index.html.
  static std::filesystem::path resolveDestination(
      const DownloadTask& task, const std::filesystem::path& outDir);

 private:
  // Fills destination once it is resolved.
  TransferStatus execute(std::filesystem::path& destination,
                         CancellationToken& token);

  DownloadTask task_;
  StateStoreHandle store_;
  std::shared_ptr<CancellationSubscription> subscription_;
  std::shared_ptr<const Transfer> transfer_;
  std::filesystem::path outDir_;
};

}  // namespace dlmgr

#endif  // DLMGR_WORKER_HPP_
