#include "Downloader.hpp"

#include <tbb/concurrent_queue.h>

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>

#include "Cancellation.hpp"
#include "Worker.hpp"
#include "logger.hpp"
#include "tbb_manager.hpp"

namespace dlmgr {

namespace {

// Everything the orchestration loop waits on arrives through one queue.
struct Event {
  enum class Kind { WorkerDone, Interrupt };

  Kind kind = Kind::Interrupt;
  WorkerOutcome outcome;
};

using EventQueue = tbb::concurrent_bounded_queue<Event>;

class InterruptSubscription {
 public:
  InterruptSubscription(InterruptSource& source, EventQueue& events)
      : source_(source) {
    source_.start([&events]() {
      Event event;
      event.kind = Event::Kind::Interrupt;
      events.push(std::move(event));
    });
  }
  ~InterruptSubscription() { source_.stop(); }

  InterruptSubscription(const InterruptSubscription&) = delete;
  InterruptSubscription& operator=(const InterruptSubscription&) = delete;

 private:
  InterruptSource& source_;
};

// Tears a run down on every exit path. Spawned workers reference locals of
// Downloader::run, so the arena must drain before those go away, and the
// store thread can only be joined once the last handle is dropped.
class RunTeardown {
 public:
  RunTeardown(std::optional<StateStoreHandle>& storeHandle,
              std::thread& storeThread, CancellationBroadcaster& broadcaster)
      : storeHandle_(storeHandle),
        storeThread_(storeThread),
        broadcaster_(broadcaster) {}

  ~RunTeardown() {
    if (!finished_) {
      // Abandoned run: stop whatever was already spawned.
      broadcaster_.publish(CancelSignal{CancelKind::Interrupt});
    }
    finish();
  }

  RunTeardown(const RunTeardown&) = delete;
  RunTeardown& operator=(const RunTeardown&) = delete;

  void setArena(std::string arena) { arena_ = std::move(arena); }

  void finish() {
    finished_ = true;
    if (!arena_.empty()) {
      utils::TBBManager::GetInstance().Release(arena_);
      arena_.clear();
    }
    storeHandle_.reset();
    if (storeThread_.joinable()) storeThread_.join();
  }

 private:
  std::optional<StateStoreHandle>& storeHandle_;
  std::thread& storeThread_;
  CancellationBroadcaster& broadcaster_;
  std::string arena_;
  bool finished_ = false;
};

void logOutcome(const WorkerOutcome& outcome) {
  if (!outcome.ok()) {
    LOG(ERROR) << "Download failed" << utils::kv("error", outcome.error)
               << utils::kv("url", outcome.url)
               << utils::kv("path", outcome.path.string());
  } else if (*outcome.status == TransferStatus::Completed) {
    LOG(INFO) << "Download completed" << utils::kv("url", outcome.url)
              << utils::kv("path", outcome.path.string());
  } else {
    LOG(WARN) << "Download cancelled" << utils::kv("url", outcome.url)
              << utils::kv("path", outcome.path.string());
  }
}

}  // namespace

size_t DownloadReport::count(TransferStatus status) const {
  return static_cast<size_t>(std::count_if(
      outcomes.begin(), outcomes.end(), [status](const WorkerOutcome& o) {
        return o.ok() && *o.status == status;
      }));
}

Downloader::Downloader(std::shared_ptr<const Transfer> transfer,
                       InterruptSource& interrupts, DownloaderOptions options)
    : transfer_(std::move(transfer)),
      interrupts_(interrupts),
      options_(std::move(options)) {}

Downloader::~Downloader() = default;

void Downloader::setStateObserver(StateStore::Observer observer) {
  stateObserver_ = std::move(observer);
}

DownloadReport Downloader::run(std::vector<DownloadTask> tasks) {
  DownloadReport report;
  const size_t total = tasks.size();

  EventQueue events;
  CancellationBroadcaster broadcaster;

  auto created = StateStore::create();
  StateStore store = std::move(created.first);
  std::optional<StateStoreHandle> storeHandle(std::move(created.second));
  store.setObserver(stateObserver_);
  std::thread storeThread([&store]() {
    try {
      store.run();
    } catch (const std::exception& e) {
      LOG(ERROR) << "State store task failed" << utils::kv("error", e.what());
    }
  });
  RunTeardown teardown(storeHandle, storeThread, broadcaster);

  InterruptSubscription interruptSubscription(interrupts_, events);

  auto& tbbManager = utils::TBBManager::GetInstance();
  const std::string arena =
      "download_" + std::to_string(tbbManager.GenerateUniqueTaskId());
  const size_t slots = options_.maxConcurrentDownloads > 0
                           ? options_.maxConcurrentDownloads
                           : std::max<size_t>(total, 1);
  tbbManager.Init(arena, static_cast<int>(slots));
  teardown.setArena(arena);

  LOG(INFO) << "Downloading " << total << " files"
            << utils::kv("out_dir", options_.outDir.string())
            << utils::kv("concurrency", slots);

  for (auto& task : tasks) {
    // Subscribe before the worker exists so no signal can slip past it.
    auto subscription = broadcaster.subscribe();
    tbbManager.Spawn(
        arena, [task = std::move(task), handle = *storeHandle,
                subscription = std::move(subscription),
                transfer = transfer_, outDir = options_.outDir,
                &events]() {
          Event event;
          event.kind = Event::Kind::WorkerDone;
          try {
            Worker worker(task, handle, subscription, transfer, outDir);
            event.outcome = worker.run();
          } catch (const std::exception& e) {
            LOG(ERROR) << "Download task failed" << utils::kv("url", task.url)
                       << utils::kv("error", e.what());
            event.outcome.url = task.url;
            event.outcome.error =
                std::string("download task failed: ") + e.what();
          } catch (...) {
            LOG(ERROR) << "Download task failed" << utils::kv("url", task.url)
                       << utils::kv("error", "unknown exception");
            event.outcome.url = task.url;
            event.outcome.error = "download task failed: unknown exception";
          }
          events.push(std::move(event));
        });
  }

  // Workers hold the only remaining handles; the store stops once they are
  // all gone.
  storeHandle.reset();

  size_t pending = total;
  while (pending > 0) {
    Event event;
    events.pop(event);
    if (event.kind == Event::Kind::Interrupt) {
      LOG(INFO) << "Interrupt received, cancelling downloads";
      const size_t reached =
          broadcaster.publish(CancelSignal{CancelKind::Interrupt});
      LOG(DEBUG) << "cancellation published" << utils::kv("receivers", reached);
      // Keep waiting: every worker still reports an outcome.
      continue;
    }

    --pending;
    logOutcome(event.outcome);
    if (!event.outcome.ok()) report.failedUrls.push_back(event.outcome.url);
    report.outcomes.push_back(std::move(event.outcome));
  }

  teardown.finish();
  report.finalStates = store.states();

  LOG(INFO) << "All downloads finished"
            << utils::kv("completed", report.count(TransferStatus::Completed))
            << utils::kv("cancelled", report.count(TransferStatus::Cancelled))
            << utils::kv("failed", report.failedUrls.size());
  return report;
}

}  // namespace dlmgr
