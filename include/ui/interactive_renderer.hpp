#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "customio/color_printer.hpp"
#include "tunnel/route_table.hpp"
#include "ui/event_actions.hpp"
#include "ui/event_bus.hpp"
#include "ui/history_ring.hpp"
#include "ui/terminal.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

struct DashboardHeader {
  std::string version;
  std::string identity;
  std::string project;
};

// Full screen dashboard: header, sources, transport status, delivery history
// and the key bindings. Bus events are marshalled onto the io thread, where
// all state lives; redraws are coalesced to at most 15 per second.
class InteractiveRenderer
    : public std::enable_shared_from_this<InteractiveRenderer> {
public:
  static constexpr std::chrono::milliseconds kFrameInterval{1000 / 15};

  InteractiveRenderer(boost::asio::io_context &ioc, EventBus &event_bus,
                      EventActions &actions, std::ostream &out,
                      DashboardHeader header, RouteTablePtr routes,
                      std::size_t history_size);
  ~InteractiveRenderer();

  // `on_quit` runs for q / Ctrl+C. `on_fallback` runs once if the screen
  // cannot be drawn; the terminal is already restored by then.
  monad::MyVoidResult Start(std::function<void()> on_quit,
                            std::function<void()> on_fallback);
  // Restores the terminal. Idempotent.
  void Stop();

  void SetRoutes(RouteTablePtr routes);
  void OnEvent(const BusEvent &event);
  void HandleKey(Key key);

  std::string RenderFrame(TerminalSize size) const;

  const HistoryRing &history() const { return history_; }
  std::size_t selected() const { return selected_; }
  bool details() const { return details_; }
  bool quitting() const { return quitting_; }

private:
  void RequestRedraw();
  void Redraw();
  void Fallback(const std::string &why);
  void ReadInput();
  void WatchResize();
  void MoveSelection(long delta);
  std::string StatusLine() const;
  std::string HistoryRow(const HistoryEntry &entry, bool selected,
                         int width) const;
  void DetailLines(const HistoryEntry &entry, int width,
                   std::vector<std::string> &lines) const;

  boost::asio::io_context &ioc_;
  EventBus &event_bus_;
  EventActions &actions_;
  std::ostream &out_;
  DashboardHeader header_;
  RouteTablePtr routes_;
  HistoryRing history_;
  const customio::ColorPrinter palette_;

  std::optional<TransportStatusEvent> status_;
  std::optional<NoticeEvent> notice_;
  std::size_t selected_{0};
  bool details_{false};
  bool quitting_{false};

  RawTerminal terminal_;
  KeyDecoder decoder_;
  std::optional<boost::asio::posix::stream_descriptor> input_;
  std::array<char, 64> input_buffer_{};
  boost::asio::signal_set resize_signals_;
  boost::asio::steady_timer redraw_timer_;
  std::chrono::steady_clock::time_point last_draw_{};
  bool redraw_pending_{false};
  bool running_{false};
  bool fallen_back_{false};
  EventBus::SubscriptionId subscription_{0};
  std::function<void()> on_quit_;
  std::function<void()> on_fallback_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
