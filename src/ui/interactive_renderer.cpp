#include "ui/interactive_renderer.hpp"

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <set>

#include "my_error_codes.hpp"
#include "ui/log_renderer.hpp"

namespace hookrelay {
namespace net = boost::asio;

namespace {

constexpr std::size_t kPreviewBytes = 240;

// Cuts to `width` bytes without splitting a UTF-8 sequence.
std::string Clip(std::string text, int width) {
  if (width <= 0) {
    return {};
  }
  const auto limit = static_cast<std::size_t>(width);
  if (text.size() <= limit) {
    return text;
  }
  std::size_t cut = limit;
  while (cut > 0 &&
         (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  text.resize(cut);
  return text;
}

// `size` is the length of the body before the history ring cut it.
std::string Preview(const std::string &body, std::size_t size) {
  if (size == 0) {
    return "(empty)";
  }
  std::string out;
  out.reserve(std::min(body.size(), kPreviewBytes));
  for (std::size_t i = 0; i < body.size() && i < kPreviewBytes; ++i) {
    const auto c = static_cast<unsigned char>(body[i]);
    if (c == '\n' || c == '\r' || c == '\t') {
      out += ' ';
    } else if (c < 0x20 || c == 0x7f) {
      out += '.';
    } else {
      out += static_cast<char>(c);
    }
  }
  if (size > std::min(body.size(), kPreviewBytes)) {
    out += fmt::format(" … ({} bytes)", size);
  }
  return out;
}

const char *ReportTag(ReportState report) {
  switch (report) {
  case ReportState::Pending:
    return "pending";
  case ReportState::Sent:
    return "";
  case ReportState::Fallback:
    return "via http";
  case ReportState::Unreported:
    return "unreported";
  }
  return "";
}

} // namespace

InteractiveRenderer::InteractiveRenderer(boost::asio::io_context &ioc,
                                         EventBus &event_bus,
                                         EventActions &actions,
                                         std::ostream &out,
                                         DashboardHeader header,
                                         RouteTablePtr routes,
                                         std::size_t history_size)
    : ioc_(ioc), event_bus_(event_bus), actions_(actions), out_(out),
      header_(std::move(header)), routes_(std::move(routes)),
      history_(history_size), palette_(out, true), resize_signals_(ioc),
      redraw_timer_(ioc) {}

InteractiveRenderer::~InteractiveRenderer() {
  if (subscription_ != 0) {
    event_bus_.Unsubscribe(subscription_);
  }
  terminal_.Leave();
}

monad::MyVoidResult
InteractiveRenderer::Start(std::function<void()> on_quit,
                           std::function<void()> on_fallback) {
  on_quit_ = std::move(on_quit);
  on_fallback_ = std::move(on_fallback);
  if (auto r = terminal_.Enter(out_); r.is_err()) {
    return r;
  }
  running_ = true;
  status_ = event_bus_.LastTransportStatus();

  std::weak_ptr<InteractiveRenderer> weak = weak_from_this();
  subscription_ = event_bus_.Subscribe([weak, this](const BusEvent &event) {
    net::post(ioc_, [weak, event] {
      if (auto self = weak.lock()) {
        self->OnEvent(event);
      }
    });
  });

  const int fd = ::dup(STDIN_FILENO);
  if (fd < 0) {
    Stop();
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::LISTEN::TERMINAL_ERROR, "cannot duplicate stdin"));
  }
  input_.emplace(ioc_, fd);
  ReadInput();
  resize_signals_.add(SIGWINCH);
  WatchResize();
  RequestRedraw();
  BOOST_LOG_SEV(lg, trivial::debug) << "interactive dashboard started";
  return monad::MyVoidResult::Ok();
}

void InteractiveRenderer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (subscription_ != 0) {
    event_bus_.Unsubscribe(subscription_);
    subscription_ = 0;
  }
  boost::system::error_code ignore;
  resize_signals_.cancel(ignore);
  redraw_timer_.cancel();
  if (input_) {
    input_->cancel(ignore);
    input_->close(ignore);
  }
  terminal_.Leave();
  BOOST_LOG_SEV(lg, trivial::debug) << "interactive dashboard stopped";
}

void InteractiveRenderer::SetRoutes(RouteTablePtr routes) {
  routes_ = std::move(routes);
  RequestRedraw();
}

void InteractiveRenderer::OnEvent(const BusEvent &event) {
  if (const auto *delivery = std::get_if<DeliveryEvent>(&event)) {
    history_.Push(*delivery);
    // Keep the same entry highlighted unless following the newest one.
    if (selected_ > 0) {
      selected_ = std::min(selected_ + 1, history_.size() - 1);
    }
  } else if (const auto *status = std::get_if<TransportStatusEvent>(&event)) {
    status_ = *status;
  } else if (const auto *update = std::get_if<ReportUpdateEvent>(&event)) {
    history_.UpdateReport(update->attempt_id, update->report);
  } else if (const auto *notice = std::get_if<NoticeEvent>(&event)) {
    notice_ = *notice;
  }
  RequestRedraw();
}

void InteractiveRenderer::HandleKey(Key key) {
  switch (key) {
  case Key::Up:
    MoveSelection(-1);
    break;
  case Key::Down:
    MoveSelection(1);
    break;
  case Key::PageUp:
    MoveSelection(-10);
    break;
  case Key::PageDown:
    MoveSelection(10);
    break;
  case Key::Details:
    details_ = !details_;
    break;
  case Key::Retry:
    if (!history_.empty()) {
      actions_.Retry(history_.at(selected_).delivery.attempt.event_id);
    }
    break;
  case Key::Open:
    if (!history_.empty()) {
      auto opened = actions_.Open(history_.at(selected_).delivery.attempt.event_id);
      if (opened.is_err()) {
        notice_ = NoticeEvent{NoticeEvent::Level::Warning, opened.error().what};
      }
    }
    break;
  case Key::Quit:
  case Key::Interrupt:
    if (!quitting_) {
      quitting_ = true;
      notice_ = NoticeEvent{NoticeEvent::Level::Info, "Shutting down…"};
      if (on_quit_) {
        on_quit_();
      }
    } else if (on_quit_) {
      // Second press gives up on the drain.
      on_quit_();
    }
    break;
  }
  RequestRedraw();
}

void InteractiveRenderer::MoveSelection(long delta) {
  if (history_.empty()) {
    selected_ = 0;
    return;
  }
  const long max_index = static_cast<long>(history_.size()) - 1;
  const long next = std::clamp(static_cast<long>(selected_) + delta, 0L,
                               max_index);
  selected_ = static_cast<std::size_t>(next);
}

void InteractiveRenderer::RequestRedraw() {
  if (!running_ || redraw_pending_) {
    return;
  }
  redraw_pending_ = true;
  const auto now = std::chrono::steady_clock::now();
  const auto due = last_draw_ + kFrameInterval;
  redraw_timer_.expires_after(due > now ? due - now
                                        : std::chrono::steady_clock::duration(0));
  std::weak_ptr<InteractiveRenderer> weak = weak_from_this();
  redraw_timer_.async_wait([weak](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->redraw_pending_ = false;
      self->Redraw();
    }
  });
}

void InteractiveRenderer::Redraw() {
  if (!running_) {
    return;
  }
  last_draw_ = std::chrono::steady_clock::now();
  std::string frame;
  try {
    frame = RenderFrame(RawTerminal::Size());
  } catch (const std::exception &ex) {
    Fallback(ex.what());
    return;
  }
  out_ << "\033[H\033[2J" << frame;
  out_.flush();
  if (!out_) {
    Fallback("terminal write failed");
  }
}

void InteractiveRenderer::Fallback(const std::string &why) {
  if (fallen_back_) {
    return;
  }
  fallen_back_ = true;
  out_.clear();
  BOOST_LOG_SEV(lg, trivial::error)
      << "dashboard redraw failed, switching to log mode: " << why;
  Stop();
  if (on_fallback_) {
    on_fallback_();
  }
}

void InteractiveRenderer::ReadInput() {
  if (!input_ || !running_) {
    return;
  }
  std::weak_ptr<InteractiveRenderer> weak = weak_from_this();
  input_->async_read_some(
      net::buffer(input_buffer_),
      [weak](const boost::system::error_code &ec, std::size_t n) {
        auto self = weak.lock();
        if (!self || ec) {
          if (self && ec && ec != net::error::operation_aborted) {
            BOOST_LOG_SEV(self->lg, trivial::warning)
                << "stdin closed: " << ec.message();
          }
          return;
        }
        for (auto key : self->decoder_.Feed(
                 std::string_view(self->input_buffer_.data(), n))) {
          self->HandleKey(key);
        }
        self->ReadInput();
      });
}

void InteractiveRenderer::WatchResize() {
  std::weak_ptr<InteractiveRenderer> weak = weak_from_this();
  resize_signals_.async_wait(
      [weak](const boost::system::error_code &ec, int) {
        if (ec) {
          return;
        }
        if (auto self = weak.lock()) {
          self->RequestRedraw();
          self->WatchResize();
        }
      });
}

std::string InteractiveRenderer::StatusLine() const {
  if (!status_) {
    return fmt::format("{}○ Starting…{}", palette_.dim(), palette_.reset());
  }
  const char *color = palette_.yellow();
  switch (status_->state) {
  case TransportState::Open:
    color = palette_.green();
    break;
  case TransportState::Connecting:
    color = palette_.yellow();
    break;
  case TransportState::Draining:
    color = palette_.cyan();
    break;
  case TransportState::Closed:
    color = palette_.red();
    break;
  }
  std::string line =
      fmt::format("{}● {}{}", color, status_->message, palette_.reset());
  if (status_->consecutive_failures > 1 &&
      status_->state == TransportState::Connecting) {
    line += fmt::format(" {}({} failed attempts){}", palette_.dim(),
                        status_->consecutive_failures, palette_.reset());
  }
  return line;
}

std::string InteractiveRenderer::HistoryRow(const HistoryEntry &entry,
                                            bool selected, int width) const {
  const auto &d = entry.delivery;
  std::string plain = fmt::format(
      "{} {}  {:<32}  {:<24}  {:>6} ms  {}", selected ? '>' : ' ',
      ClockText(entry.recorded_at), Clip(RequestLine(d.attempt), 32),
      Clip(OutcomeText(d.result), 24), d.result.elapsed.count(),
      d.source_name);
  const char *tag = ReportTag(d.report);
  if (*tag != '\0') {
    plain += fmt::format("  [{}]", tag);
  }
  plain = Clip(std::move(plain), width);
  const char *color = d.result.ok() ? palette_.status_color(d.result.status.value_or(0))
                                    : palette_.red();
  if (selected) {
    return fmt::format("{}{}{}", palette_.inverse(), plain, palette_.reset());
  }
  return fmt::format("{}{}{}", color, plain, palette_.reset());
}

void InteractiveRenderer::DetailLines(const HistoryEntry &entry, int width,
                                      std::vector<std::string> &lines) const {
  const auto &d = entry.delivery;
  lines.push_back(Clip(fmt::format("Request   {} {}", d.attempt.method,
                                   d.local_url.empty() ? d.attempt.path
                                                       : d.local_url),
                       width));
  lines.push_back(Clip(
      "  body    " + Preview(d.attempt.body, entry.request_body_size), width));
  if (d.result.ok()) {
    lines.push_back(Clip(fmt::format("Response  {} in {} ms{}",
                                     d.result.status.value_or(0),
                                     d.result.elapsed.count(),
                                     d.result.truncated ? " (truncated)" : ""),
                         width));
    lines.push_back(Clip(
        "  body    " + Preview(d.result.body, entry.response_body_size),
        width));
  } else {
    lines.push_back(Clip(fmt::format("Failed    {} after {} ms",
                                     to_string(d.result.error_class),
                                     d.result.elapsed.count()),
                         width));
    lines.push_back(Clip("  reason  " + d.result.reason, width));
  }
  lines.push_back(Clip(fmt::format("Event     {}  attempt {}",
                                   d.attempt.event_id.empty()
                                       ? std::string("-")
                                       : d.attempt.event_id,
                                   d.attempt.attempt_id),
                       width));
}

std::string InteractiveRenderer::RenderFrame(TerminalSize size) const {
  const int width = std::max(20, size.cols);
  const int height = std::max(10, size.rows);
  std::vector<std::string> top;
  top.push_back(fmt::format(
      "{}hookrelay {}{}{}{}", palette_.bold(), header_.version,
      palette_.reset(),
      header_.identity.empty() ? std::string{} : "  " + header_.identity,
      header_.project.empty() ? std::string{} : "  project " + header_.project));
  top.emplace_back();
  top.push_back(fmt::format("{}Sources{}", palette_.bold(), palette_.reset()));
  if (routes_) {
    std::set<std::string> seen;
    for (const auto &r : routes_->routes()) {
      if (!seen.insert(r.source_id + '/' + r.connection_id).second) {
        continue;
      }
      top.push_back(Clip(
          fmt::format("  {}  {}  ->  {}", r.source_name,
                      r.source_url.empty() ? std::string("-") : r.source_url,
                      r.target.url() + (r.cli_path == "/" ? "" : "  (" + r.cli_path + ")")),
          width));
    }
  }
  top.emplace_back();
  top.push_back(StatusLine());
  if (notice_) {
    const char *color = notice_->level == NoticeEvent::Level::Error
                            ? palette_.red()
                            : notice_->level == NoticeEvent::Level::Warning
                                  ? palette_.yellow()
                                  : palette_.dim();
    top.push_back(fmt::format("{}{}{}", color, Clip(notice_->text, width),
                              palette_.reset()));
  }
  top.emplace_back();
  top.push_back(fmt::format("{}Deliveries ({}){}", palette_.bold(),
                            history_.size(), palette_.reset()));

  std::vector<std::string> details;
  if (details_ && !history_.empty()) {
    details.push_back(std::string(static_cast<std::size_t>(width), '-'));
    DetailLines(history_.at(selected_), width, details);
  }
  const std::string footer =
      fmt::format("{}↑/↓ select  r retry  o open  d details  q quit{}",
                  palette_.dim(), palette_.reset());

  const int fixed = static_cast<int>(top.size() + details.size()) + 1;
  const int rows = std::max(1, height - fixed);

  std::string out;
  for (const auto &line : top) {
    out += line;
    out += "\r\n";
  }
  if (history_.empty()) {
    out += fmt::format("{}  Waiting for events…{}\r\n", palette_.dim(),
                       palette_.reset());
  } else {
    const auto visible = static_cast<std::size_t>(rows);
    std::size_t first = 0;
    if (selected_ >= visible) {
      first = selected_ - visible + 1;
    }
    for (std::size_t i = first; i < history_.size() && i < first + visible;
         ++i) {
      out += HistoryRow(history_.at(i), i == selected_, width);
      out += "\r\n";
    }
  }
  for (const auto &line : details) {
    out += line;
    out += "\r\n";
  }
  out += footer;
  return out;
}

} // namespace hookrelay
