#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Transfer.hpp"
#include "test_http_server.hpp"
#include "test_util.hpp"

namespace dlmgr {
namespace {

using namespace std::chrono_literals;

class CurlTransferTest : public ::testing::Test {
 protected:
  test::TestHttpServer server_;
  test::ScopedTempDir dir_;
};

TEST_F(CurlTransferTest, WritesIdenticalBytes) {
  const std::string payload = test::makePayload(512 * 1024);
  server_.addRoute("/blob.bin", {payload});

  CurlTransfer transfer;
  CancellationToken token;
  const auto path = dir_.path() / "blob.bin";
  EXPECT_EQ(transfer.run(server_.url("/blob.bin"), path, token),
            TransferStatus::Completed);
  EXPECT_EQ(test::readFile(path), payload);
  EXPECT_EQ(test::openDescriptorsFor(path), 0);
}

TEST_F(CurlTransferTest, EmptyBodyCreatesEmptyFile) {
  server_.addRoute("/empty", {""});

  CurlTransfer transfer;
  CancellationToken token;
  const auto path = dir_.path() / "empty";
  EXPECT_EQ(transfer.run(server_.url("/empty"), path, token),
            TransferStatus::Completed);
  ASSERT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(CurlTransferTest, CancelMidStreamFlushesAndClosesFile) {
  test::TestHttpServer::Route slow;
  slow.body = test::makePayload(4 * 1024 * 1024);
  slow.chunkSize = 4096;
  slow.chunkDelay = 10ms;
  server_.addRoute("/slow.bin", slow);

  std::mutex mutex;
  std::vector<TransferProgress> reports;
  TransferOptions options;
  options.progressInterval = 50ms;
  options.onProgress = [&](const TransferProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex);
    reports.push_back(progress);
  };
  CurlTransfer transfer(options);
  CancellationToken token;
  const auto path = dir_.path() / "slow.bin";

  auto result = std::async(std::launch::async, [&]() {
    return transfer.run(server_.url("/slow.bin"), path, token);
  });

  // Wait until some bytes have landed.
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (!reports.empty() && reports.back().bytesDownloaded > 0) break;
    }
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_TRUE(token.trigger());

  ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
  EXPECT_EQ(result.get(), TransferStatus::Cancelled);
  EXPECT_EQ(test::openDescriptorsFor(path), 0);

  const std::string written = test::readFile(path);
  EXPECT_GT(written.size(), 0u);
  EXPECT_LT(written.size(), slow.body.size());
  EXPECT_EQ(written, slow.body.substr(0, written.size()));

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_FALSE(reports.empty());
  for (size_t i = 1; i < reports.size(); ++i) {
    EXPECT_GE(reports[i].bytesDownloaded, reports[i - 1].bytesDownloaded);
    EXPECT_GT(reports[i].elapsed, reports[i - 1].elapsed);
  }
  EXPECT_GE(reports.front().elapsed, 50ms);
}

TEST_F(CurlTransferTest, TriggeredTokenTruncatesExistingFile) {
  server_.addRoute("/file", {"contents"});

  CurlTransfer transfer;
  CancellationToken token;
  token.trigger();
  const auto path = dir_.path() / "file";
  test::writeFile(path, "left over from an earlier run");
  EXPECT_EQ(transfer.run(server_.url("/file"), path, token),
            TransferStatus::Cancelled);
  ASSERT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(test::readFile(path), "");
  EXPECT_EQ(test::openDescriptorsFor(path), 0);
}

TEST_F(CurlTransferTest, CancelBeforeBodyLeavesFreshFile) {
  // One byte right after the headers, then a long pause.
  test::TestHttpServer::Route stalled;
  stalled.body = test::makePayload(64);
  stalled.chunkSize = 1;
  stalled.chunkDelay = 1000ms;
  server_.addRoute("/stalled", stalled);

  CurlTransfer transfer;
  CancellationToken token;
  const auto path = dir_.path() / "stalled";
  test::writeFile(path, "stale");

  auto result = std::async(std::launch::async, [&]() {
    return transfer.run(server_.url("/stalled"), path, token);
  });
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline &&
         test::readFile(path) == "stale") {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_TRUE(token.trigger());

  ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
  EXPECT_EQ(result.get(), TransferStatus::Cancelled);
  const std::string written = test::readFile(path);
  EXPECT_LE(written.size(), 1u);
  EXPECT_EQ(written, stalled.body.substr(0, written.size()));
  EXPECT_EQ(test::openDescriptorsFor(path), 0);
}

TEST_F(CurlTransferTest, UnreachableHostFails) {
  CurlTransfer transfer;
  CancellationToken token;
  const auto path = dir_.path() / "nothing";
  const std::string url = "http://127.0.0.1:" +
                          std::to_string(test::TestHttpServer::closedPort()) +
                          "/nothing";
  EXPECT_THROW(transfer.run(url, path, token), TransferError);
  EXPECT_FALSE(std::filesystem::exists(path));

  // Without a response an existing file is left alone.
  test::writeFile(path, "kept");
  EXPECT_THROW(transfer.run(url, path, token), TransferError);
  EXPECT_EQ(test::readFile(path), "kept");
}

TEST_F(CurlTransferTest, HttpErrorStatusSavesResponseBody) {
  test::TestHttpServer::Route unavailable;
  unavailable.status = 503;
  unavailable.body = "try again later";
  server_.addRoute("/busy", unavailable);

  CurlTransfer transfer;
  CancellationToken token;
  const auto missing = dir_.path() / "missing";
  EXPECT_EQ(transfer.run(server_.url("/missing"), missing, token),
            TransferStatus::Completed);
  EXPECT_EQ(test::readFile(missing), "not found");

  const auto busy = dir_.path() / "busy";
  EXPECT_EQ(transfer.run(server_.url("/busy"), busy, token),
            TransferStatus::Completed);
  EXPECT_EQ(test::readFile(busy), "try again later");
}

TEST_F(CurlTransferTest, UnwritableDestinationFails) {
  server_.addRoute("/file", {"contents"});

  CurlTransfer transfer;
  CancellationToken token;
  EXPECT_THROW(transfer.run(server_.url("/file"),
                            dir_.path() / "no-such-dir" / "file", token),
               TransferError);
}

TEST_F(CurlTransferTest, ReadsFileUrls) {
  const std::string payload = test::makePayload(10000);
  const auto source = dir_.path() / "source.bin";
  test::writeFile(source, payload);

  CurlTransfer transfer;
  CancellationToken token;
  const auto path = dir_.path() / "copy.bin";
  EXPECT_EQ(transfer.run("file://" + source.string(), path, token),
            TransferStatus::Completed);
  EXPECT_EQ(test::readFile(path), payload);
}

}  // namespace
}  // namespace dlmgr
