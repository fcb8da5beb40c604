#include "InterruptSource.hpp"

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

#include "logger.hpp"

namespace dlmgr {

SignalInterruptSource::SignalInterruptSource() {
  sigemptyset(&signals_);
  sigaddset(&signals_, SIGINT);
  int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previousMask_);
  if (rc != 0) {
    throw std::runtime_error(std::string("pthread_sigmask: ") +
                             std::strerror(rc));
  }
}

SignalInterruptSource::~SignalInterruptSource() {
  stop();
  pthread_sigmask(SIG_SETMASK, &previousMask_, nullptr);
}

void SignalInterruptSource::start(Handler handler) {
  if (running_.exchange(true)) return;
  listener_ = std::thread([this, handler = std::move(handler)]() {
    // Short timeout so stop() is noticed promptly.
    const timespec timeout{0, 200 * 1000 * 1000};
    while (running_.load()) {
      int sig = sigtimedwait(&signals_, nullptr, &timeout);
      if (sig == SIGINT) {
        LOG(DEBUG) << "SIGINT received";
        handler();
      } else if (sig < 0 && errno != EAGAIN && errno != EINTR) {
        LOG(ERROR) << "sigtimedwait failed" << utils::kv("error",
                                                          std::strerror(errno));
        break;
      }
    }
  });
}

void SignalInterruptSource::stop() {
  running_.store(false);
  if (listener_.joinable()) listener_.join();
}

void ManualInterruptSource::start(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void ManualInterruptSource::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = nullptr;
}

bool ManualInterruptSource::interrupt() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handler_) return false;
  handler_();
  return true;
}

}  // namespace dlmgr
