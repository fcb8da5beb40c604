#ifndef DLMGR_FAKE_TRANSFER_HPP_
#define DLMGR_FAKE_TRANSFER_HPP_

#include <chrono>
#include <condition_variable>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "Transfer.hpp"

namespace dlmgr::test {

/**
 * @brief Scriptable Transfer: per-url behaviour, no network.
 */
class FakeTransfer : public Transfer {
 public:
  enum class Mode {
    Complete,             // writes "payload:<url>" and completes
    Fail,                 // throws TransferError
    BlockUntilCancelled,  // waits for the token, then returns Cancelled
    ThrowNonStandard,     // throws an int, which no worker path expects
  };

  void setMode(const std::string& url, Mode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    modes_[url] = mode;
  }

  TransferStatus run(const std::string& url,
                     const std::filesystem::path& destination,
                     CancellationToken& token) const override {
    Mode mode;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = modes_.find(url);
      mode = it == modes_.end() ? Mode::Complete : it->second;
      started_.push_back(url);
      cv_.notify_all();
    }

    switch (mode) {
      case Mode::Complete: {
        std::ofstream ofs(destination, std::ios::binary | std::ios::trunc);
        ofs << "payload:" << url;
        return TransferStatus::Completed;
      }
      case Mode::Fail:
        throw TransferError("simulated failure for " + url);
      case Mode::ThrowNonStandard:
        throw 42;
      case Mode::BlockUntilCancelled:
        break;
    }

    // The waker runs under the token's lock, so never call into the token
    // while holding wakeMutex.
    std::mutex wakeMutex;
    std::condition_variable wakeCv;
    bool woken = false;
    token.setWaker([&]() {
      std::lock_guard<std::mutex> lock(wakeMutex);
      woken = true;
      wakeCv.notify_all();
    });
    const bool already = token.isTriggered();
    {
      std::unique_lock<std::mutex> lock(wakeMutex);
      if (already) woken = true;
      wakeCv.wait(lock, [&]() { return woken; });
    }
    token.clearWaker();
    return TransferStatus::Cancelled;
  }

  // Waits until at least n transfers have started. Returns false on timeout.
  bool waitForStarted(size_t n, std::chrono::milliseconds timeout =
                                    std::chrono::seconds(10)) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return started_.size() >= n; });
  }

  std::vector<std::string> started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  mutable std::vector<std::string> started_;
  std::map<std::string, Mode> modes_;
};

}  // namespace dlmgr::test

#endif  // DLMGR_FAKE_TRANSFER_HPP_
