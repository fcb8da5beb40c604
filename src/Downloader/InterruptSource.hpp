#ifndef DLMGR_INTERRUPT_SOURCE_HPP_
#define DLMGR_INTERRUPT_SOURCE_HPP_

#include <signal.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace dlmgr {

// Producer of external interrupt events. The handler may be invoked from any
// thread, once per interrupt.
class InterruptSource {
 public:
  using Handler = std::function<void()>;

  virtual ~InterruptSource() = default;

  virtual void start(Handler handler) = 0;
  virtual void stop() = 0;
};

/**
 * @brief Turns SIGINT into interrupt events.
 *
 * Construct it before any other thread is started: the constructor blocks
 * SIGINT for the calling thread, and threads created afterwards inherit the
 * mask, so the signal is only ever consumed by sigtimedwait on the listener
 * thread.
 */
class SignalInterruptSource final : public InterruptSource {
 public:
  SignalInterruptSource();
  ~SignalInterruptSource() override;

  SignalInterruptSource(const SignalInterruptSource&) = delete;
  SignalInterruptSource& operator=(const SignalInterruptSource&) = delete;

  void start(Handler handler) override;
  void stop() override;

 private:
  sigset_t signals_;
  sigset_t previousMask_;
  std::atomic<bool> running_{false};
  std::thread listener_;
};

// Synthetic interrupts, fired by calling interrupt().
class ManualInterruptSource final : public InterruptSource {
 public:
  void start(Handler handler) override;
  void stop() override;

  // Returns false when nobody is listening.
  bool interrupt();

 private:
  std::mutex mutex_;
  Handler handler_;
};

}  // namespace dlmgr

#endif  // DLMGR_INTERRUPT_SOURCE_HPP_
