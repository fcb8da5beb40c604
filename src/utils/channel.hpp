#ifndef DLMGR_CHANNEL_HPP_
#define DLMGR_CHANNEL_HPP_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace dlmgr::utils {

template <typename T>
class Sender;
template <typename T>
class Receiver;

namespace detail {

template <typename T>
struct ChannelState {
  explicit ChannelState(size_t cap) : capacity(cap == 0 ? 1 : cap) {}

  std::mutex mutex;
  std::condition_variable notEmpty;
  std::condition_variable notFull;
  std::deque<T> queue;
  size_t capacity;
  size_t senders = 0;
  bool receiverAlive = true;
};

}  // namespace detail

/**
 * @brief Bounded multi-producer single-consumer channel.
 *
 * The channel closes from the receiving side once every Sender has been
 * destroyed and the queue is drained; there is no explicit close message.
 */
template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel(size_t capacity) {
  auto state = std::make_shared<detail::ChannelState<T>>(capacity);
  return {Sender<T>(state), Receiver<T>(state)};
}

template <typename T>
class Sender {
 public:
  Sender(const Sender& other) : state_(other.state_) { acquire(); }
  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

  Sender& operator=(const Sender& other) {
    if (this != &other) {
      release();
      state_ = other.state_;
      acquire();
    }
    return *this;
  }

  Sender& operator=(Sender&& other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Sender() { release(); }

  // Blocks while the channel is full. Returns false (and drops the value) when
  // the receiver is gone.
  bool send(T value) {
    if (!state_) return false;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->notFull.wait(lock, [this] {
      return !state_->receiverAlive ||
             state_->queue.size() < state_->capacity;
    });
    if (!state_->receiverAlive) return false;
    state_->queue.push_back(std::move(value));
    state_->notEmpty.notify_one();
    return true;
  }

  bool isClosed() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->receiverAlive;
  }

 private:
  friend std::pair<Sender<T>, Receiver<T>> makeChannel<T>(size_t);

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    acquire();
  }

  void acquire() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  void release() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (--state_->senders == 0) state_->notEmpty.notify_all();
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
class Receiver {
 public:
  Receiver(Receiver&&) noexcept = default;
  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  ~Receiver() { close(); }

  // Blocks until a value arrives. Returns std::nullopt once all senders are
  // gone and nothing is left in the queue.
  std::optional<T> recv() {
    if (!state_) return std::nullopt;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->notEmpty.wait(lock, [this] {
      return !state_->queue.empty() || state_->senders == 0;
    });
    if (state_->queue.empty()) return std::nullopt;
    T value = std::move(state_->queue.front());
    state_->queue.pop_front();
    state_->notFull.notify_one();
    return value;
  }

  // Stops accepting values. Queued values are destroyed, which breaks any
  // promise they carry.
  void close() {
    if (!state_) return;
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiverAlive = false;
      dropped.swap(state_->queue);
      state_->notFull.notify_all();
    }
    state_.reset();
  }

 private:
  friend std::pair<Sender<T>, Receiver<T>> makeChannel<T>(size_t);

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::ChannelState<T>> state_;
};

}  // namespace dlmgr::utils

#endif  // DLMGR_CHANNEL_HPP_
