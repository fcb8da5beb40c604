#include "Cancellation.hpp"

#include <algorithm>
#include <utility>

namespace dlmgr {

std::ostream& operator<<(std::ostream& os, CancelKind kind) {
  switch (kind) {
    case CancelKind::Interrupt:
      return os << "Interrupt";
  }
  return os << "Unknown";
}

bool CancellationToken::trigger() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (triggered_) return false;
  triggered_ = true;
  // Called under the lock so clearWaker() cannot race with it.
  if (waker_) waker_();
  return true;
}

bool CancellationToken::isTriggered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return triggered_;
}

void CancellationToken::setWaker(std::function<void()> waker) {
  std::lock_guard<std::mutex> lock(mutex_);
  waker_ = std::move(waker);
}

void CancellationToken::clearWaker() {
  std::lock_guard<std::mutex> lock(mutex_);
  waker_ = nullptr;
}

void CancellationSubscription::listen(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return;
  listener_ = std::move(listener);
  while (!pending_.empty()) {
    CancelSignal signal = pending_.front();
    pending_.pop_front();
    listener_(signal);
  }
}

void CancellationSubscription::stopListening() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  listener_ = nullptr;
  pending_.clear();
}

size_t CancellationSubscription::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool CancellationSubscription::deliver(const CancelSignal& signal) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return false;
  if (listener_) {
    listener_(signal);
  } else {
    pending_.push_back(signal);
  }
  return true;
}

std::shared_ptr<CancellationSubscription> CancellationBroadcaster::subscribe() {
  auto subscription = std::make_shared<CancellationSubscription>();
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [](const auto& weak) { return weak.expired(); }),
      subscribers_.end());
  subscribers_.push_back(subscription);
  return subscription;
}

size_t CancellationBroadcaster::publish(const CancelSignal& signal) {
  std::vector<std::shared_ptr<CancellationSubscription>> live;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& weak : subscribers_) {
      if (auto subscription = weak.lock()) live.push_back(subscription);
    }
  }
  size_t accepted = 0;
  for (const auto& subscription : live) {
    if (subscription->deliver(signal)) ++accepted;
  }
  return accepted;
}

size_t CancellationBroadcaster::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(subscribers_.begin(), subscribers_.end(),
                    [](const auto& weak) { return !weak.expired(); }));
}

}  // namespace dlmgr
