#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <memory>
#include <sstream>

#include "my_error_codes.hpp"
#include "test_support.hpp"
#include "ui/event_actions.hpp"
#include "ui/interactive_renderer.hpp"
#include "ui/log_renderer.hpp"
#include "ui/output_mode.hpp"
#include "ui/terminal.hpp"

namespace hookrelay {

namespace {

DeliveryEvent Delivery(const std::string &id, std::optional<int> status,
                       ErrorClass error_class = ErrorClass::None) {
  DeliveryEvent d;
  d.attempt.attempt_id = id;
  d.attempt.event_id = "evt_" + id;
  d.attempt.method = "POST";
  d.attempt.path = "/hooks";
  d.attempt.query = "x=1";
  d.result.attempt_id = id;
  d.result.status = status;
  d.result.error_class = error_class;
  if (error_class != ErrorClass::None) {
    d.result.reason = "connection refused";
  }
  d.result.elapsed = std::chrono::milliseconds(12);
  d.source_name = "shop";
  d.local_url = "http://localhost:3000/hooks?x=1";
  return d;
}

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(OutputModeTest, ParseAndResolve) {
  EXPECT_EQ(ParseOutputMode("").value(), OutputMode::Interactive);
  EXPECT_EQ(ParseOutputMode(" Compact ").value(), OutputMode::Compact);
  EXPECT_EQ(ParseOutputMode("quiet").value(), OutputMode::Quiet);
  auto bad = ParseOutputMode("fancy");
  ASSERT_TRUE(bad.is_err());
  EXPECT_EQ(bad.error().code, my_errors::GENERAL::INVALID_ARGUMENT);

  EXPECT_EQ(ResolveOutputMode(OutputMode::Interactive, true, "xterm"),
            OutputMode::Interactive);
  EXPECT_EQ(ResolveOutputMode(OutputMode::Interactive, false, "xterm"),
            OutputMode::Log);
  EXPECT_EQ(ResolveOutputMode(OutputMode::Interactive, true, nullptr),
            OutputMode::Log);
  EXPECT_EQ(ResolveOutputMode(OutputMode::Interactive, true, "dumb"),
            OutputMode::Log);
  EXPECT_EQ(ResolveOutputMode(OutputMode::Quiet, false, nullptr),
            OutputMode::Quiet);
}

TEST(KeyDecoderTest, LettersAndEscapeSequences) {
  KeyDecoder decoder;
  auto keys = decoder.Feed("kjrodq\x03x");
  EXPECT_EQ(keys, (std::vector<Key>{Key::Up, Key::Down, Key::Retry, Key::Open,
                                    Key::Details, Key::Quit, Key::Interrupt}));

  keys = decoder.Feed("\033[A\033[B\033[5~\033[6~");
  EXPECT_EQ(keys,
            (std::vector<Key>{Key::Up, Key::Down, Key::PageUp, Key::PageDown}));
}

TEST(KeyDecoderTest, SplitSequenceIsBuffered) {
  KeyDecoder decoder;
  EXPECT_TRUE(decoder.Feed("\033").empty());
  EXPECT_TRUE(decoder.Feed("[").empty());
  EXPECT_EQ(decoder.Feed("B"), std::vector<Key>{Key::Down});
  EXPECT_TRUE(decoder.Feed("\033[6").empty());
  EXPECT_EQ(decoder.Feed("~q"), (std::vector<Key>{Key::PageDown, Key::Quit}));
}

TEST(EventWebUrlTest, ConsoleAndDashboard) {
  ListenConfig cfg;
  cfg.console_base_url = "https://console.example.test/";
  cfg.dashboard_base_url = "https://dash.example.test";
  EXPECT_EQ(EventWebUrl(cfg, "console", "evt_1"),
            "https://console.example.test/?event_id=evt_1");
  EXPECT_EQ(EventWebUrl(cfg, "inbound", "evt_1"),
            "https://dash.example.test/events/evt_1");
}

TEST(LogRendererTest, FormatsDeliveries) {
  EventBus bus;
  std::ostringstream out;
  LogRenderer renderer(bus, OutputMode::Log, out);

  auto ok = Delivery("a", 201);
  ok.report = ReportState::Unreported;
  const auto line = renderer.FormatDelivery(ok);
  EXPECT_TRUE(Contains(line, "shop")) << line;
  EXPECT_TRUE(Contains(line, "POST /hooks?x=1 -> 201")) << line;
  EXPECT_TRUE(Contains(line, "(12 ms)")) << line;
  EXPECT_TRUE(Contains(line, "http://localhost:3000/hooks?x=1")) << line;
  EXPECT_TRUE(Contains(line, "[unreported]")) << line;

  auto failed = Delivery("b", std::nullopt, ErrorClass::Connect);
  EXPECT_EQ(OutcomeText(failed.result), "connect error: connection refused");
  EXPECT_TRUE(Contains(renderer.FormatDelivery(failed), "connect error"));
}

TEST(LogRendererTest, QuietShowsOnlyFailures) {
  EventBus bus;
  std::ostringstream out;
  LogRenderer renderer(bus, OutputMode::Quiet, out);
  renderer.Start();

  bus.Publish(Delivery("a", 200));
  bus.Publish(NoticeEvent{NoticeEvent::Level::Info, "hello"});
  TransportStatusEvent status;
  status.message = "Connecting";
  bus.Publish(status);
  EXPECT_TRUE(out.str().empty()) << out.str();

  bus.Publish(Delivery("b", std::nullopt, ErrorClass::Timeout));
  bus.Publish(ReportUpdateEvent{"b", ReportState::Unreported});
  const auto text = out.str();
  EXPECT_TRUE(Contains(text, "timeout error")) << text;
  EXPECT_TRUE(Contains(text, "result b could not be reported")) << text;

  renderer.Stop();
  bus.Publish(Delivery("c", std::nullopt, ErrorClass::Read));
  EXPECT_EQ(out.str(), text);
}

TEST(LogRendererTest, LogModeShowsTransportAndNotices) {
  EventBus bus;
  std::ostringstream out;
  LogRenderer renderer(bus, OutputMode::Log, out);
  renderer.Start();

  TransportStatusEvent status;
  status.state = TransportState::Open;
  status.message = "Connected to dispatcher";
  bus.Publish(status);
  bus.Publish(NoticeEvent{NoticeEvent::Level::Info, "Opened link"});
  bus.Publish(ReportUpdateEvent{"a", ReportState::Fallback});

  const auto text = out.str();
  EXPECT_TRUE(Contains(text, "Connected to dispatcher"));
  EXPECT_TRUE(Contains(text, "Opened link"));
  EXPECT_TRUE(Contains(text, "result a reported over HTTP"));
}

class InteractiveRendererTest : public ::testing::Test {
protected:
  InteractiveRendererTest()
      : actions_(control_plane_, listen_config_, credential_, bus_) {
    actions_.set_launcher([this](const std::vector<std::string> &argv) {
      launched_ = argv;
      return monad::MyVoidResult::Ok();
    });
    Route route;
    route.connection_id = "web_1";
    route.source_id = "src_1";
    route.source_name = "shop";
    route.source_url = "https://in.example.test/src_1";
    route.target = ParseForwardTarget("3000").value();
    renderer_ = std::make_shared<InteractiveRenderer>(
        ioc_, bus_, actions_, out_,
        DashboardHeader{"1.2.3", "dev@example.test", "Acme"},
        std::make_shared<const RouteTable>(std::vector<Route>{route}), 50);
  }

  boost::asio::io_context ioc_;
  EventBus bus_;
  std::ostringstream out_;
  testinfra::FakeControlPlane control_plane_;
  testinfra::TestListenConfigProvider listen_config_;
  Credential credential_;
  EventActions actions_;
  std::vector<std::string> launched_;
  std::shared_ptr<InteractiveRenderer> renderer_;
};

TEST_F(InteractiveRendererTest, RendersSourcesAndHistory) {
  auto empty = renderer_->RenderFrame(TerminalSize{30, 120});
  EXPECT_TRUE(Contains(empty, "hookrelay 1.2.3"));
  EXPECT_TRUE(Contains(empty, "https://in.example.test/src_1"));
  EXPECT_TRUE(Contains(empty, "http://localhost:3000/"));
  EXPECT_TRUE(Contains(empty, "Waiting for events"));

  renderer_->OnEvent(Delivery("a", 200));
  renderer_->OnEvent(Delivery("b", std::nullopt, ErrorClass::Connect));
  auto frame = renderer_->RenderFrame(TerminalSize{30, 120});
  EXPECT_TRUE(Contains(frame, "Deliveries (2)"));
  EXPECT_TRUE(Contains(frame, "connect error"));
  EXPECT_FALSE(Contains(frame, "Waiting for events"));
}

TEST_F(InteractiveRendererTest, SelectionClampsAndDetailsToggle) {
  for (const char *id : {"a", "b", "c"}) {
    renderer_->OnEvent(Delivery(id, 200));
  }
  renderer_->HandleKey(Key::Up);
  EXPECT_EQ(renderer_->selected(), 0u);
  renderer_->HandleKey(Key::PageDown);
  EXPECT_EQ(renderer_->selected(), 2u);
  renderer_->HandleKey(Key::Up);
  EXPECT_EQ(renderer_->selected(), 1u);

  // A new delivery keeps the same entry selected.
  renderer_->OnEvent(Delivery("d", 200));
  EXPECT_EQ(renderer_->selected(), 2u);
  EXPECT_EQ(renderer_->history().at(renderer_->selected())
                .delivery.attempt.attempt_id,
            "b");

  renderer_->HandleKey(Key::Details);
  EXPECT_TRUE(renderer_->details());
  auto frame = renderer_->RenderFrame(TerminalSize{40, 120});
  EXPECT_TRUE(Contains(frame, "attempt b"));
}

TEST_F(InteractiveRendererTest, DetailsReportFullBodySize) {
  auto d = Delivery("a", 200);
  d.attempt.body = std::string(2 * 1024 * 1024, 'z');
  renderer_->OnEvent(d);
  EXPECT_LE(renderer_->history().at(0).delivery.attempt.body.size(),
            HistoryRing::kDefaultBodyBytes);

  renderer_->HandleKey(Key::Details);
  auto frame = renderer_->RenderFrame(TerminalSize{40, 400});
  EXPECT_TRUE(Contains(frame, "(2097152 bytes)"));
}

TEST_F(InteractiveRendererTest, RetryAndOpenUseSelectedEvent) {
  renderer_->OnEvent(Delivery("a", 500));
  renderer_->HandleKey(Key::Retry);
  EXPECT_TRUE(control_plane_.Called("RetryEvent:evt_a"));

  renderer_->HandleKey(Key::Open);
  ASSERT_EQ(launched_.size(), 2u);
  EXPECT_TRUE(Contains(launched_[1], "/events/evt_a"));
}

TEST_F(InteractiveRendererTest, QuitRunsCallbackEachPress) {
  int quits = 0;
  // Start fails without a terminal, but the callbacks are kept.
  auto started = renderer_->Start([&quits] { ++quits; }, [] {});
  if (started.is_ok()) {
    renderer_->Stop();
  }
  renderer_->HandleKey(Key::Quit);
  EXPECT_TRUE(renderer_->quitting());
  EXPECT_EQ(quits, 1);
  renderer_->HandleKey(Key::Interrupt);
  EXPECT_EQ(quits, 2);
}

} // namespace hookrelay
