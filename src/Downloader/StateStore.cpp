#include "StateStore.hpp"

#include "logger.hpp"

namespace dlmgr {

void StateStoreHandle::updateState(const std::string& url,
                                   DownloadState state) const {
  detail::UpdateStateMessage message{url, state, std::promise<void>()};
  std::future<void> done = message.done.get_future();
  if (!sender_.send(detail::StateStoreMessage(std::move(message)))) {
    throw StateStoreUnavailable();
  }
  try {
    done.get();
  } catch (const std::future_error&) {
    throw StateStoreUnavailable();
  }
}

StateMap StateStoreHandle::snapshot() const {
  detail::SnapshotMessage message;
  std::future<StateMap> reply = message.reply.get_future();
  if (!sender_.send(detail::StateStoreMessage(std::move(message)))) {
    throw StateStoreUnavailable();
  }
  try {
    return reply.get();
  } catch (const std::future_error&) {
    throw StateStoreUnavailable();
  }
}

std::pair<StateStore, StateStoreHandle> StateStore::create(size_t capacity) {
  auto channel = utils::makeChannel<detail::StateStoreMessage>(capacity);
  return {StateStore(std::move(channel.second)),
          StateStoreHandle(std::move(channel.first))};
}

void StateStore::run() {
  try {
    while (auto message = receiver_.recv()) {
      std::visit([this](auto& m) { handle(m); }, *message);
    }
  } catch (...) {
    // Fail pending and future requests instead of leaving them waiting.
    receiver_.close();
    throw;
  }
  LOG(INFO) << "no more senders, state store shutting down"
            << utils::kv("entries", states_.size());
}

void StateStore::handle(detail::UpdateStateMessage& message) {
  auto it = states_.find(message.url);
  if (it != states_.end() && isTerminal(it->second)) {
    LOG(ERROR) << "rejecting state update" << utils::kv("url", message.url)
               << utils::kv("current", it->second)
               << utils::kv("requested", message.state);
    message.done.set_exception(
        std::make_exception_ptr(InvalidStateTransition(
            message.url + " is already " + toString(it->second))));
    return;
  }

  LOG(INFO) << "updating state" << utils::kv("url", message.url)
            << utils::kv("state", message.state);
  states_[message.url] = message.state;
  if (observer_) observer_(message.url, message.state);
  message.done.set_value();
}

void StateStore::handle(detail::SnapshotMessage& message) {
  message.reply.set_value(states_);
}

}  // namespace dlmgr
