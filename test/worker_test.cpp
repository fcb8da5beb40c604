#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Cancellation.hpp"
#include "StateStore.hpp"
#include "Worker.hpp"
#include "fake_transfer.hpp"
#include "test_util.hpp"

namespace dlmgr {
namespace {

using Mode = test::FakeTransfer::Mode;

TEST(ResolveDestinationTest, UsesLastPathSegment) {
  EXPECT_EQ(Worker::resolveDestination({"https://host/a/foo.txt", {}}, "/out"),
            std::filesystem::path("/out/foo.txt"));
}

TEST(ResolveDestinationTest, FileNameOverridesUrl) {
  EXPECT_EQ(
      Worker::resolveDestination({"https://host/a/foo.txt", "bar.bin"}, "/out"),
      std::filesystem::path("/out/bar.bin"));
  EXPECT_EQ(Worker::resolveDestination({"https://host", "bar.bin"}, "/out"),
            std::filesystem::path("/out/bar.bin"));
}

TEST(ResolveDestinationTest, EmptyPathFallsBackToIndexHtml) {
  EXPECT_EQ(Worker::resolveDestination({"https://host", {}}, "/out"),
            std::filesystem::path("/out/index.html"));
  EXPECT_EQ(Worker::resolveDestination({"https://host/", {}}, "/out"),
            std::filesystem::path("/out/index.html"));
}

TEST(ResolveDestinationTest, SkipsTrailingSlash) {
  EXPECT_EQ(Worker::resolveDestination({"https://host/a/dir/", {}}, "/out"),
            std::filesystem::path("/out/dir"));
}

class WorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto created = StateStore::create();
    store_.emplace(std::move(created.first));
    handle_.emplace(std::move(created.second));
    store_->setObserver([this](const std::string& url, DownloadState state) {
      std::lock_guard<std::mutex> lock(mutex_);
      applied_[url].push_back(state);
    });
    storeDone_ = std::async(std::launch::async, [this]() { store_->run(); });
    transfer_ = std::make_shared<test::FakeTransfer>();
  }

  void TearDown() override {
    handle_.reset();
    if (storeDone_.valid()) storeDone_.get();
  }

  Worker makeWorker(const std::string& url) {
    return Worker({url, {}}, *handle_, broadcaster_.subscribe(), transfer_,
                  dir_.path());
  }

  std::vector<DownloadState> appliedFor(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_[url];
  }

  test::ScopedTempDir dir_;
  CancellationBroadcaster broadcaster_;
  std::shared_ptr<test::FakeTransfer> transfer_;
  std::optional<StateStore> store_;
  std::optional<StateStoreHandle> handle_;
  std::future<void> storeDone_;
  std::mutex mutex_;
  std::map<std::string, std::vector<DownloadState>> applied_;
};

TEST_F(WorkerTest, SuccessRecordsDownloadingThenCompleted) {
  const std::string url = "https://host/files/report.pdf";
  WorkerOutcome outcome = makeWorker(url).run();

  ASSERT_TRUE(outcome.ok()) << outcome.error;
  EXPECT_EQ(*outcome.status, TransferStatus::Completed);
  EXPECT_EQ(outcome.url, url);
  EXPECT_EQ(outcome.path, dir_.path() / "report.pdf");
  EXPECT_EQ(test::readFile(outcome.path), "payload:" + url);
  EXPECT_EQ(appliedFor(url),
            (std::vector<DownloadState>{DownloadState::Downloading,
                                        DownloadState::Completed}));
}

TEST_F(WorkerTest, TransferErrorRecordsFailed) {
  const std::string url = "https://host/broken.bin";
  transfer_->setMode(url, Mode::Fail);
  WorkerOutcome outcome = makeWorker(url).run();

  EXPECT_FALSE(outcome.ok());
  EXPECT_NE(outcome.error.find("simulated failure"), std::string::npos);
  EXPECT_EQ(appliedFor(url),
            (std::vector<DownloadState>{DownloadState::Downloading,
                                        DownloadState::Failed}));
}

TEST_F(WorkerTest, UnresolvableDestinationRecordsFailed) {
  const std::string url = "not/an/absolute/url";
  WorkerOutcome outcome = makeWorker(url).run();

  EXPECT_FALSE(outcome.ok());
  EXPECT_NE(outcome.error.find("not an absolute URL"), std::string::npos)
      << outcome.error;
  EXPECT_TRUE(outcome.path.empty());
  EXPECT_TRUE(transfer_->started().empty());
  EXPECT_EQ(appliedFor(url),
            (std::vector<DownloadState>{DownloadState::Downloading,
                                        DownloadState::Failed}));
}

TEST_F(WorkerTest, CancellationRecordsInterrupted) {
  const std::string url = "https://host/slow.iso";
  transfer_->setMode(url, Mode::BlockUntilCancelled);
  Worker worker = makeWorker(url);
  auto result = std::async(std::launch::async, [&worker]() { return worker.run(); });

  ASSERT_TRUE(transfer_->waitForStarted(1));
  // Repeated signals collapse into a single trigger.
  broadcaster_.publish(CancelSignal{CancelKind::Interrupt});
  broadcaster_.publish(CancelSignal{CancelKind::Interrupt});

  WorkerOutcome outcome = result.get();
  ASSERT_TRUE(outcome.ok()) << outcome.error;
  EXPECT_EQ(*outcome.status, TransferStatus::Cancelled);
  EXPECT_EQ(appliedFor(url),
            (std::vector<DownloadState>{DownloadState::Downloading,
                                        DownloadState::Interrupted}));
}

TEST_F(WorkerTest, SignalBeforeStartStillCancels) {
  const std::string url = "https://host/queued.iso";
  transfer_->setMode(url, Mode::BlockUntilCancelled);
  Worker worker = makeWorker(url);
  broadcaster_.publish(CancelSignal{CancelKind::Interrupt});

  WorkerOutcome outcome = worker.run();
  ASSERT_TRUE(outcome.ok()) << outcome.error;
  EXPECT_EQ(*outcome.status, TransferStatus::Cancelled);
  EXPECT_EQ(appliedFor(url),
            (std::vector<DownloadState>{DownloadState::Downloading,
                                        DownloadState::Interrupted}));
}

TEST_F(WorkerTest, SignalAfterCompletionIsIgnored) {
  const std::string url = "https://host/done.txt";
  WorkerOutcome outcome = makeWorker(url).run();
  ASSERT_TRUE(outcome.ok()) << outcome.error;

  EXPECT_EQ(broadcaster_.publish(CancelSignal{CancelKind::Interrupt}), 0u);
  EXPECT_EQ(handle_->snapshot().at(url), DownloadState::Completed);
  EXPECT_EQ(appliedFor(url),
            (std::vector<DownloadState>{DownloadState::Downloading,
                                        DownloadState::Completed}));
}

TEST(WorkerStoreTest, UnavailableStoreIsReportedInOutcome) {
  test::ScopedTempDir dir;
  CancellationBroadcaster broadcaster;
  auto created = StateStore::create();
  StateStoreHandle handle = std::move(created.second);
  { StateStore gone = std::move(created.first); }

  auto transfer = std::make_shared<test::FakeTransfer>();
  Worker worker({"https://host/a.txt", {}}, handle, broadcaster.subscribe(),
                transfer, dir.path());
  WorkerOutcome outcome = worker.run();

  EXPECT_FALSE(outcome.ok());
  EXPECT_NE(outcome.error.find("state store"), std::string::npos);
  EXPECT_TRUE(transfer->started().empty());
}

}  // namespace
}  // namespace dlmgr
