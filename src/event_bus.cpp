#include "event_bus.hpp"

#include <algorithm>

EventBus::EventBus(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

SubscriptionHandle EventBus::subscribe(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(mutex_);
  auto handle = next_handle_++;
  listeners_.emplace_back(handle, std::make_shared<Listener>(std::move(listener)));
  return handle;
}

void EventBus::unsubscribe(SubscriptionHandle handle) {
  std::lock_guard lg(mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [&](const auto& entry){ return entry.first == handle; }),
                   listeners_.end());
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard lg(mutex_);
  return listeners_.size();
}

void EventBus::publish(const Event& event) {
  std::vector<std::shared_ptr<Listener>> snapshot;
  {
    std::lock_guard lg(mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  for(const auto& listener : snapshot) {
    try {
      (*listener)(event);
    } catch(const std::exception& e) {
      log_error(logger_.get(), "Event listener threw: {}", e.what());
    }
  }
}
