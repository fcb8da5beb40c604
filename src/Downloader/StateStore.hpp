#ifndef DLMGR_STATE_STORE_HPP_
#define DLMGR_STATE_STORE_HPP_

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <string>
#include <utility>
#include <variant>

#include "DownloadTypes.hpp"
#include "channel.hpp"

namespace dlmgr {

using StateMap = std::map<std::string, DownloadState>;

namespace detail {

struct UpdateStateMessage {
  std::string url;
  DownloadState state;
  std::promise<void> done;
};

struct SnapshotMessage {
  std::promise<StateMap> reply;
};

using StateStoreMessage = std::variant<UpdateStateMessage, SnapshotMessage>;

}  // namespace detail

// Cloneable handle used by workers to talk to the state store.
class StateStoreHandle {
 public:
  // Returns once the store has applied the update. Throws
  // StateStoreUnavailable if the store is gone and InvalidStateTransition if
  // the url already reached a terminal state.
  void updateState(const std::string& url, DownloadState state) const;

  StateMap snapshot() const;

 private:
  friend class StateStore;
  explicit StateStoreHandle(utils::Sender<detail::StateStoreMessage> sender)
      : sender_(std::move(sender)) {}

  // Sender::send is logically const: it only touches the shared queue.
  mutable utils::Sender<detail::StateStoreMessage> sender_;
};

/**
 * @brief In-memory owner of the url -> state mapping.
 *
 * All access goes through StateStoreHandle messages, each acknowledged once
 * applied. run() returns when every handle has been dropped.
 */
class StateStore {
 public:
  using Observer = std::function<void(const std::string&, DownloadState)>;

  static constexpr size_t kDefaultCapacity = 16;

  static std::pair<StateStore, StateStoreHandle> create(
      size_t capacity = kDefaultCapacity);

  StateStore(StateStore&&) = default;
  StateStore& operator=(StateStore&&) = default;

  // Called on the store's thread for every applied update. Set before run().
  void setObserver(Observer observer) { observer_ = std::move(observer); }

  void run();

  // Only meaningful once run() has returned.
  const StateMap& states() const { return states_; }

 private:
  explicit StateStore(utils::Receiver<detail::StateStoreMessage> receiver)
      : receiver_(std::move(receiver)) {}

  void handle(detail::UpdateStateMessage& message);
  void handle(detail::SnapshotMessage& message);

  utils::Receiver<detail::StateStoreMessage> receiver_;
  StateMap states_;
  Observer observer_;
};

}  // namespace dlmgr

#endif  // DLMGR_STATE_STORE_HPP_
