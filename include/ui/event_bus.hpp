#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tunnel/attempt.hpp"

namespace hookrelay {

enum class TransportState { Connecting, Open, Draining, Closed };

std::string_view to_string(TransportState state);

// How an AttemptResult reached the dispatcher.
enum class ReportState { Pending, Sent, Fallback, Unreported };

std::string_view to_string(ReportState state);

struct TransportStatusEvent {
  TransportState state{TransportState::Connecting};
  // Plain English line for the status bar.
  std::string message;
  std::optional<std::chrono::milliseconds> retry_in;
  int consecutive_failures{0};
  bool reauth_required{false};
};

struct DeliveryEvent {
  InboundAttempt attempt;
  AttemptResult result;
  std::string source_name;
  std::string connection_name;
  // Full URL the attempt was replayed against; empty for unknown routes.
  std::string local_url;
  ReportState report{ReportState::Pending};
};

struct ReportUpdateEvent {
  std::string attempt_id;
  ReportState report{ReportState::Pending};
};

struct NoticeEvent {
  enum class Level { Info, Warning, Error };
  Level level{Level::Info};
  std::string text;
};

using BusEvent = std::variant<TransportStatusEvent, DeliveryEvent,
                              ReportUpdateEvent, NoticeEvent>;

// Fan-out of pipeline and transport events to any number of subscribers.
// Handlers run on the publishing thread; the subscriber list is guarded so
// subscriptions may be made from the main thread while io threads publish.
class EventBus {
public:
  using Handler = std::function<void(const BusEvent &)>;
  using SubscriptionId = std::uint64_t;

  SubscriptionId Subscribe(Handler handler);
  void Unsubscribe(SubscriptionId id);
  void Publish(const BusEvent &event);

  // Latest transport status, for subscribers that join late.
  std::optional<TransportStatusEvent> LastTransportStatus() const;

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<SubscriptionId, Handler>> handlers_;
  SubscriptionId next_id_{1};
  std::optional<TransportStatusEvent> last_status_;
};

} // namespace hookrelay
