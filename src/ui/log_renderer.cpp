#include "ui/log_renderer.hpp"

#include <fmt/format.h>

#include <ctime>

namespace hookrelay {

std::string RequestLine(const InboundAttempt &attempt) {
  std::string line = attempt.method + ' ' + attempt.path;
  if (!attempt.query.empty()) {
    line += '?';
    line += attempt.query;
  }
  return line;
}

std::string OutcomeText(const AttemptResult &result) {
  if (result.ok()) {
    std::string text = std::to_string(result.status.value_or(0));
    if (result.truncated) {
      text += " (truncated)";
    }
    return text;
  }
  return fmt::format("{} error: {}", to_string(result.error_class),
                     result.reason);
}

std::string ClockText(std::chrono::system_clock::time_point at) {
  const std::time_t t = std::chrono::system_clock::to_time_t(at);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

LogRenderer::LogRenderer(EventBus &event_bus, OutputMode mode,
                         std::ostream &out)
    : event_bus_(event_bus), mode_(mode), out_(out), palette_(out) {}

LogRenderer::~LogRenderer() { Stop(); }

void LogRenderer::Start() {
  if (subscription_ != 0) {
    return;
  }
  subscription_ =
      event_bus_.Subscribe([this](const BusEvent &event) { OnEvent(event); });
}

void LogRenderer::Stop() {
  if (subscription_ == 0) {
    return;
  }
  event_bus_.Unsubscribe(subscription_);
  subscription_ = 0;
}

std::string LogRenderer::FormatDelivery(const DeliveryEvent &delivery) const {
  const auto &result = delivery.result;
  const char *color = result.ok() ? palette_.status_color(result.status.value_or(0))
                                  : palette_.red();
  std::string line = fmt::format(
      "{} {}{}{} {} -> {}{}{} ({} ms)", ClockText(std::chrono::system_clock::now()),
      palette_.dim(),
      delivery.source_name.empty() ? std::string("?") : delivery.source_name,
      palette_.reset(), RequestLine(delivery.attempt), color,
      OutcomeText(result), palette_.reset(), result.elapsed.count());
  if (mode_ == OutputMode::Log && !delivery.local_url.empty()) {
    line += fmt::format(" {}{}{}", palette_.dim(), delivery.local_url,
                        palette_.reset());
  }
  if (delivery.report == ReportState::Unreported) {
    line += fmt::format(" {}[unreported]{}", palette_.yellow(),
                        palette_.reset());
  }
  return line;
}

void LogRenderer::OnEvent(const BusEvent &event) {
  if (const auto *delivery = std::get_if<DeliveryEvent>(&event)) {
    if (mode_ == OutputMode::Quiet && delivery->result.ok()) {
      return;
    }
    Line(FormatDelivery(*delivery));
    return;
  }
  if (const auto *status = std::get_if<TransportStatusEvent>(&event)) {
    if (mode_ != OutputMode::Log && !status->reauth_required) {
      return;
    }
    Line(fmt::format("{}{}{}", palette_.cyan(), status->message,
                     palette_.reset()));
    return;
  }
  if (const auto *update = std::get_if<ReportUpdateEvent>(&event)) {
    if (update->report == ReportState::Unreported) {
      Line(fmt::format("{}result {} could not be reported{}",
                       palette_.yellow(), update->attempt_id,
                       palette_.reset()));
    } else if (mode_ == OutputMode::Log &&
               update->report == ReportState::Fallback) {
      Line(fmt::format("result {} reported over HTTP", update->attempt_id));
    }
    return;
  }
  if (const auto *notice = std::get_if<NoticeEvent>(&event)) {
    if (notice->level == NoticeEvent::Level::Info &&
        mode_ != OutputMode::Log) {
      return;
    }
    const char *color = notice->level == NoticeEvent::Level::Error
                            ? palette_.red()
                            : palette_.yellow();
    Line(fmt::format("{}{}{}", color, notice->text, palette_.reset()));
  }
}

void LogRenderer::Line(const std::string &text) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << text << '\n';
  out_.flush();
}

} // namespace hookrelay
