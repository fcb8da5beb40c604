#include "Worker.hpp"

#include <utility>

#include "CurlUtils.hpp"
#include "logger.hpp"

namespace dlmgr {

Worker::Worker(DownloadTask task, StateStoreHandle store,
               std::shared_ptr<CancellationSubscription> subscription,
               std::shared_ptr<const Transfer> transfer,
               std::filesystem::path outDir)
    : task_(std::move(task)),
      store_(std::move(store)),
      subscription_(std::move(subscription)),
      transfer_(std::move(transfer)),
      outDir_(std::move(outDir)) {}

std::filesystem::path Worker::resolveDestination(
    const DownloadTask& task, const std::filesystem::path& outDir) {
  if (task.fileName) {
    return outDir / *task.fileName;
  }
  std::string name = lastPathSegment(task.url);
  if (name.empty()) name = "index.html";
  return outDir / name;
}

WorkerOutcome Worker::run() {
  WorkerOutcome outcome;
  outcome.url = task_.url;

  CancellationToken token;
  {
    const std::string& url = task_.url;
    ListenerGuard listener(
        *subscription_, [&token, &url](const CancelSignal& signal) {
          if (token.trigger()) {
            LOG(INFO) << "cancelling download" << utils::kv("url", url)
                      << utils::kv("reason", signal.kind);
          }
        });

    try {
      outcome.status = execute(outcome.path, token);
    } catch (const std::exception& e) {
      outcome.error = e.what();
    }
  }
  // The listener is gone: signals arriving from here on are ignored.
  subscription_.reset();
  return outcome;
}

TransferStatus Worker::execute(std::filesystem::path& destination,
                               CancellationToken& token) {
  const std::string& url = task_.url;
  store_.updateState(url, DownloadState::Downloading);

  TransferStatus status;
  try {
    destination = resolveDestination(task_, outDir_);
    LOG(INFO) << "download started" << utils::kv("url", url)
              << utils::kv("path", destination.string());
    status = transfer_->run(url, destination, token);
  } catch (const std::exception& e) {
    LOG(WARN) << "transfer failed" << utils::kv("url", url)
              << utils::kv("error", e.what());
    store_.updateState(url, DownloadState::Failed);
    throw;
  }

  store_.updateState(url, status == TransferStatus::Completed
                              ? DownloadState::Completed
                              : DownloadState::Interrupted);
  return status;
}

}  // namespace dlmgr
