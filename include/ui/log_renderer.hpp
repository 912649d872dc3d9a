#pragma once

#include <chrono>
#include <mutex>
#include <ostream>
#include <string>

#include "customio/color_printer.hpp"
#include "ui/event_bus.hpp"
#include "ui/output_mode.hpp"

namespace hookrelay {

// "POST /hooks?x=1"
std::string RequestLine(const InboundAttempt &attempt);
// "200 OK-ish" status or "connect error: <reason>".
std::string OutcomeText(const AttemptResult &result);
// Local wall clock, HH:MM:SS.
std::string ClockText(std::chrono::system_clock::time_point at);

// Line oriented renderer for log, compact and quiet modes.
//   log      every delivery, transport change and notice
//   compact  one line per delivery plus errors
//   quiet    failed deliveries and errors only
class LogRenderer {
public:
  LogRenderer(EventBus &event_bus, OutputMode mode, std::ostream &out);
  ~LogRenderer();

  LogRenderer(const LogRenderer &) = delete;
  LogRenderer &operator=(const LogRenderer &) = delete;

  void Start();
  void Stop();

  void OnEvent(const BusEvent &event);

  std::string FormatDelivery(const DeliveryEvent &delivery) const;

  OutputMode mode() const { return mode_; }

private:
  void Line(const std::string &text);

  EventBus &event_bus_;
  OutputMode mode_;
  std::ostream &out_;
  const customio::ColorPrinter palette_;
  std::mutex mutex_;
  EventBus::SubscriptionId subscription_{0};
};

} // namespace hookrelay
