#include "ui/event_bus.hpp"

#include <algorithm>

namespace hookrelay {

std::string_view to_string(TransportState state) {
  switch (state) {
  case TransportState::Connecting:
    return "connecting";
  case TransportState::Open:
    return "open";
  case TransportState::Draining:
    return "draining";
  case TransportState::Closed:
    return "closed";
  }
  return "closed";
}

std::string_view to_string(ReportState state) {
  switch (state) {
  case ReportState::Pending:
    return "pending";
  case ReportState::Sent:
    return "sent";
  case ReportState::Fallback:
    return "fallback";
  case ReportState::Unreported:
    return "unreported";
  }
  return "pending";
}

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_id_++;
  handlers_.emplace_back(id, std::move(handler));
  return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                 [id](const auto &h) { return h.first == id; }),
                  handlers_.end());
}

void EventBus::Publish(const BusEvent &event) {
  std::vector<Handler> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto *status = std::get_if<TransportStatusEvent>(&event)) {
      last_status_ = *status;
    }
    targets.reserve(handlers_.size());
    for (const auto &h : handlers_) {
      targets.push_back(h.second);
    }
  }
  for (const auto &handler : targets) {
    handler(event);
  }
}

std::optional<TransportStatusEvent> EventBus::LastTransportStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_status_;
}

} // namespace hookrelay
