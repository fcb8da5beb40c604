#ifndef DLMGR_CANCELLATION_HPP_
#define DLMGR_CANCELLATION_HPP_

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <utility>
#include <vector>

namespace dlmgr {

enum class CancelKind {
  Interrupt,  // SIGINT (Ctrl-C) or a synthetic interrupt
};

std::ostream& operator<<(std::ostream& os, CancelKind kind);

struct CancelSignal {
  CancelKind kind;
};

/**
 * @brief One-shot cancellation trigger with a single consumer.
 *
 * The consumer registers a waker that is invoked (at most once) when the
 * token fires. Once clearWaker() returns the waker is never called again.
 */
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Returns true only for the call that actually fired the token.
  bool trigger();
  bool isTriggered() const;

  void setWaker(std::function<void()> waker);
  void clearWaker();

 private:
  mutable std::mutex mutex_;
  bool triggered_ = false;
  std::function<void()> waker_;
};

/**
 * @brief A worker's view of the broadcast channel.
 *
 * Signals published before a listener is attached are queued and replayed by
 * listen(). After stopListening() every signal is dropped.
 */
class CancellationSubscription {
 public:
  using Listener = std::function<void(const CancelSignal&)>;

  void listen(Listener listener);
  void stopListening();

  size_t pending() const;

 private:
  friend class CancellationBroadcaster;
  // False once the subscription stopped listening.
  bool deliver(const CancelSignal& signal);

  mutable std::mutex mutex_;
  std::deque<CancelSignal> pending_;
  Listener listener_;
  bool closed_ = false;
};

class CancellationBroadcaster {
 public:
  std::shared_ptr<CancellationSubscription> subscribe();

  // Delivers the signal to every live subscription. Returns how many
  // accepted it.
  size_t publish(const CancelSignal& signal);

  size_t subscriberCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<CancellationSubscription>> subscribers_;
};

// Detaches the listener on scope exit.
class ListenerGuard {
 public:
  ListenerGuard(CancellationSubscription& subscription,
                CancellationSubscription::Listener listener)
      : subscription_(subscription) {
    subscription_.listen(std::move(listener));
  }
  ~ListenerGuard() { subscription_.stopListening(); }

  ListenerGuard(const ListenerGuard&) = delete;
  ListenerGuard& operator=(const ListenerGuard&) = delete;

 private:
  CancellationSubscription& subscription_;
};

}  // namespace dlmgr

#endif  // DLMGR_CANCELLATION_HPP_
