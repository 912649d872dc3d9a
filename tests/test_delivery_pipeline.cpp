#include <gtest/gtest.h>

#include <boost/asio/post.hpp>

#include <algorithm>
#include <future>
#include <memory>
#include <mutex>

#include "my_error_codes.hpp"
#include "pipeline/delivery_pipeline.hpp"
#include "test_servers.hpp"
#include "test_support.hpp"

namespace {

using namespace hookrelay;
using testinfra::TestLocalHttpServer;
using testinfra::WaitUntil;
using namespace std::chrono_literals;

class FakeSender : public IResultSender {
public:
  monad::MyVoidResult SendResult(const AttemptResult &result) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
      return monad::MyVoidResult::Err(
          monad::make_error(my_errors::LISTEN::NOT_OPEN, "socket closed"));
    }
    sent_.push_back(result);
    return monad::MyVoidResult::Ok();
  }

  std::vector<AttemptResult> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  std::atomic<bool> fail{false};

private:
  mutable std::mutex mutex_;
  std::vector<AttemptResult> sent_;
};

class DeliveryPipelineTest : public ::testing::Test {
protected:
  DeliveryPipelineTest() : ioc_manager_(ioc_config_, out_.sink) {
    bus_.Subscribe([this](const BusEvent &event) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (const auto *d = std::get_if<DeliveryEvent>(&event)) {
        deliveries_.push_back(*d);
      } else if (const auto *u = std::get_if<ReportUpdateEvent>(&event)) {
        updates_.push_back(*u);
      }
    });
  }

  ~DeliveryPipelineTest() override {
    ioc_manager_.stop();
    server_.Stop();
  }

  // Builds the pipeline after the test had a chance to tune the config.
  void Init(const std::string &target_url) {
    pipeline_ = std::make_shared<DeliveryPipeline>(
        ioc_manager_, listen_config_, control_plane_, bus_, out_.console);
    pipeline_->SetSender(&sender_);
    Route route;
    route.connection_id = "web_1";
    route.connection_name = "orders";
    route.source_name = "shop";
    route.target = ParseForwardTarget(target_url).value();
    pipeline_->SetRoutes(
        std::make_shared<const RouteTable>(std::vector<Route>{route}));
  }

  void InitWithServer() {
    server_.Start();
    Init(server_.base_url() + "/base");
  }

  // Runs `fn` on the io thread and waits for it.
  void OnIo(std::function<void()> fn) {
    std::promise<void> done;
    boost::asio::post(ioc_manager_.ioc(), [&] {
      fn();
      done.set_value();
    });
    done.get_future().wait();
  }

  void Send(InboundAttempt attempt) {
    OnIo([this, &attempt] { pipeline_->OnAttempt(std::move(attempt)); });
  }

  static InboundAttempt Attempt(const std::string &id,
                                const std::string &connection = "web_1") {
    InboundAttempt a;
    a.attempt_id = id;
    a.connection_id = connection;
    a.method = "POST";
    a.path = "/hook";
    a.body = "{}";
    a.headers = {{"Content-Type", "application/json"}};
    return a;
  }

  bool WaitForDeliveries(std::size_t n, std::chrono::milliseconds t = 5s) {
    return WaitUntil([&] { return deliveries().size() >= n; }, t);
  }

  std::vector<DeliveryEvent> deliveries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_;
  }

  std::vector<ReportUpdateEvent> updates() {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_;
  }

  // Starts a drain on the io thread; the future yields `clean`.
  std::future<bool> StartDrain(std::chrono::milliseconds deadline) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    OnIo([this, deadline, promise] {
      pipeline_->Drain(deadline,
                       [promise](bool clean) { promise->set_value(clean); });
    });
    return future;
  }

  testinfra::CapturedOutput out_;
  testinfra::TestIocConfigProvider ioc_config_;
  testinfra::TestListenConfigProvider listen_config_;
  testinfra::FakeControlPlane control_plane_;
  EventBus bus_;
  FakeSender sender_;
  TestLocalHttpServer server_;
  IoContextManager ioc_manager_;
  std::shared_ptr<DeliveryPipeline> pipeline_;

  std::mutex mutex_;
  std::vector<DeliveryEvent> deliveries_;
  std::vector<ReportUpdateEvent> updates_;
};

TEST_F(DeliveryPipelineTest, ForwardsRequestAndReportsOverSocket) {
  server_.set_response(testinfra::http::status::created, "created",
                       {{"X-App", "yes"}});
  InitWithServer();

  auto attempt = Attempt("atm_1");
  attempt.query = "a=1";
  attempt.headers.push_back({"Connection", "keep-alive"});
  attempt.headers.push_back({"X-Signature", "abc"});
  Send(attempt);

  ASSERT_TRUE(WaitForDeliveries(1));
  const auto requests = server_.requests();
  ASSERT_EQ(requests.size(), 1u);
  const auto &req = requests[0];
  EXPECT_EQ(req.method, "POST");
  EXPECT_EQ(req.target, "/base/hook?a=1");
  EXPECT_EQ(req.body, "{}");
  EXPECT_EQ(req.header("X-Signature").value_or(""), "abc");
  EXPECT_EQ(req.header("X-Forwarded-Source").value_or(""), "shop");
  EXPECT_EQ(req.header("X-Forwarded-Attempt-Id").value_or(""), "atm_1");
  EXPECT_EQ(req.header("Host").value_or(""),
            "127.0.0.1:" + std::to_string(server_.port()));

  const auto d = deliveries()[0];
  EXPECT_EQ(d.result.status.value_or(0), 201);
  EXPECT_EQ(d.result.body, "created");
  EXPECT_EQ(d.result.path, "/hook");
  EXPECT_GE(d.result.elapsed.count(), 1);
  EXPECT_EQ(d.report, ReportState::Sent);
  EXPECT_EQ(d.source_name, "shop");
  EXPECT_EQ(d.local_url, server_.base_url() + "/base/hook?a=1");
  bool has_app_header = false;
  for (const auto &[n, v] : d.result.headers) {
    has_app_header = has_app_header || (n == "X-App" && v == "yes");
  }
  EXPECT_TRUE(has_app_header);
  ASSERT_EQ(sender_.sent().size(), 1u);
  EXPECT_EQ(sender_.sent()[0].attempt_id, "atm_1");
}

TEST_F(DeliveryPipelineTest, UnknownRouteIsLocalNonHttp) {
  InitWithServer();
  Send(Attempt("atm_1", "web_404"));
  ASSERT_TRUE(WaitForDeliveries(1));
  const auto d = deliveries()[0];
  EXPECT_EQ(d.result.error_class, ErrorClass::LocalNonHttp);
  EXPECT_EQ(d.result.reason, "unknown route for connection web_404");
  EXPECT_EQ(d.result.elapsed.count(), 1);
  EXPECT_TRUE(d.local_url.empty());
  EXPECT_TRUE(server_.requests().empty());
  EXPECT_EQ(pipeline_->stats().unknown_route, 1u);
}

TEST_F(DeliveryPipelineTest, ClosedPortIsConnectError) {
  Init("http://127.0.0.1:" + std::to_string(testinfra::PickFreePort()));
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  const auto d = deliveries()[0];
  EXPECT_EQ(d.result.error_class, ErrorClass::Connect);
  EXPECT_FALSE(d.result.status.has_value());
  EXPECT_FALSE(d.result.reason.empty());
}

TEST_F(DeliveryPipelineTest, PerAttemptTimeoutOverridesConfig) {
  server_.set_mode(TestLocalHttpServer::Mode::Hang);
  InitWithServer();
  auto attempt = Attempt("atm_1");
  attempt.timeout_ms = 200;
  Send(attempt);
  ASSERT_TRUE(WaitForDeliveries(1, 1500ms));
  const auto d = deliveries()[0];
  EXPECT_EQ(d.result.error_class, ErrorClass::Timeout);
  EXPECT_NE(d.result.reason.find("200 ms"), std::string::npos);
  EXPECT_GE(d.result.elapsed.count(), 200);
}

TEST_F(DeliveryPipelineTest, NonHttpRepliesAreLocalNonHttp) {
  server_.set_mode(TestLocalHttpServer::Mode::Close);
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  EXPECT_EQ(deliveries()[0].result.error_class, ErrorClass::LocalNonHttp);

  server_.set_mode(TestLocalHttpServer::Mode::Garbage);
  Send(Attempt("atm_2"));
  ASSERT_TRUE(WaitForDeliveries(2));
  EXPECT_EQ(deliveries()[1].result.error_class, ErrorClass::LocalNonHttp);
}

TEST_F(DeliveryPipelineTest, LargeBodiesAreTruncated) {
  listen_config_.config.max_body_bytes = 4;
  server_.set_response(testinfra::http::status::ok, "abcdefgh");
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  const auto d = deliveries()[0];
  EXPECT_TRUE(d.result.ok());
  EXPECT_EQ(d.result.body, "abcd");
  EXPECT_TRUE(d.result.truncated);
}

TEST_F(DeliveryPipelineTest, HugeBodyKeepsOnlyTheCap) {
  listen_config_.config.max_body_bytes = 4;
  server_.set_response(testinfra::http::status::created,
                       std::string(8 * 1024 * 1024, 'x'),
                       {{"X-Trace", "t1"}});
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  const auto d = deliveries()[0];
  EXPECT_TRUE(d.result.ok());
  EXPECT_EQ(d.result.status.value_or(0), 201);
  EXPECT_EQ(d.result.body, "xxxx");
  EXPECT_TRUE(d.result.truncated);
  EXPECT_NE(std::find(d.result.headers.begin(), d.result.headers.end(),
                      std::make_pair(std::string("X-Trace"), std::string("t1"))),
            d.result.headers.end());
}

TEST_F(DeliveryPipelineTest, BodyAtTheCapIsNotTruncated) {
  listen_config_.config.max_body_bytes = 4;
  server_.set_response(testinfra::http::status::ok, "abcd");
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  const auto d = deliveries()[0];
  EXPECT_EQ(d.result.body, "abcd");
  EXPECT_FALSE(d.result.truncated);
}

TEST_F(DeliveryPipelineTest, ConcurrencyIsCapped) {
  listen_config_.config.max_concurrent_attempts = 2;
  server_.set_delay(150ms);
  InitWithServer();
  for (int i = 0; i < 5; ++i) {
    Send(Attempt("atm_" + std::to_string(i)));
  }
  ASSERT_TRUE(WaitForDeliveries(5));
  EXPECT_LE(server_.max_concurrent(), 2);
  EXPECT_EQ(server_.requests().size(), 5u);
  EXPECT_EQ(pipeline_->stats().completed, 5u);
}

TEST_F(DeliveryPipelineTest, FullQueueSignalsBackpressure) {
  listen_config_.config.max_concurrent_attempts = 1;
  listen_config_.config.pending_queue_capacity = 1;
  server_.set_delay(200ms);
  InitWithServer();

  Send(Attempt("atm_1"));
  Send(Attempt("atm_2"));
  bool ready = true;
  std::atomic<bool> resumed{false};
  OnIo([&] {
    ready = pipeline_->Ready();
    pipeline_->WhenReady([&resumed] { resumed = true; });
  });
  EXPECT_FALSE(ready);
  EXPECT_FALSE(resumed.load());
  EXPECT_TRUE(WaitUntil([&] { return resumed.load(); }));
  ASSERT_TRUE(WaitForDeliveries(2));
}

TEST_F(DeliveryPipelineTest, DuplicateAttemptIsIgnored) {
  server_.set_delay(100ms);
  InitWithServer();
  Send(Attempt("atm_1"));
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(deliveries().size(), 1u);
  EXPECT_EQ(server_.requests().size(), 1u);
}

TEST_F(DeliveryPipelineTest, FallsBackToControlPlane) {
  sender_.fail = true;
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitForDeliveries(1));
  ASSERT_TRUE(WaitUntil([&] { return !updates().empty(); }));
  EXPECT_EQ(deliveries()[0].report, ReportState::Pending);
  EXPECT_EQ(updates()[0].attempt_id, "atm_1");
  EXPECT_EQ(updates()[0].report, ReportState::Fallback);
  ASSERT_EQ(control_plane_.submitted().size(), 1u);
  EXPECT_EQ(control_plane_.submitted()[0].status.value_or(0), 200);
}

TEST_F(DeliveryPipelineTest, FailedFallbackIsUnreported) {
  sender_.fail = true;
  control_plane_.submit_error =
      monad::make_error(my_errors::NETWORK::CONNECT_ERROR, "offline");
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitUntil([&] { return !updates().empty(); }));
  EXPECT_EQ(updates()[0].report, ReportState::Unreported);
  std::vector<std::string> ids;
  OnIo([&] { ids = pipeline_->unreported_ids(); });
  EXPECT_EQ(ids, std::vector<std::string>{"atm_1"});
}

TEST_F(DeliveryPipelineTest, DrainWaitsForInFlightAttempts) {
  server_.set_delay(150ms);
  InitWithServer();
  Send(Attempt("atm_1"));
  auto clean = StartDrain(2s);
  ASSERT_EQ(clean.wait_for(3s), std::future_status::ready);
  EXPECT_TRUE(clean.get());
  ASSERT_EQ(deliveries().size(), 1u);
  EXPECT_TRUE(deliveries()[0].result.ok());
}

TEST_F(DeliveryPipelineTest, DrainDeliversQueuedAttemptsBeforeDeadline) {
  listen_config_.config.max_concurrent_attempts = 1;
  server_.set_delay(100ms);
  InitWithServer();
  Send(Attempt("atm_1"));
  Send(Attempt("atm_2"));
  ASSERT_TRUE(server_.WaitForRequests(1, 2s));

  auto clean = StartDrain(5s);
  ASSERT_EQ(clean.wait_for(3s), std::future_status::ready);
  EXPECT_TRUE(clean.get());
  ASSERT_EQ(deliveries().size(), 2u);
  EXPECT_EQ(deliveries()[0].attempt.attempt_id, "atm_1");
  EXPECT_EQ(deliveries()[1].attempt.attempt_id, "atm_2");
  EXPECT_TRUE(deliveries()[0].result.ok());
  EXPECT_TRUE(deliveries()[1].result.ok());
  EXPECT_EQ(server_.requests().size(), 2u);
  EXPECT_EQ(sender_.sent().size(), 2u);
}

TEST_F(DeliveryPipelineTest, DrainDeadlineFinishesStragglersAsShutdown) {
  listen_config_.config.max_concurrent_attempts = 1;
  server_.set_mode(TestLocalHttpServer::Mode::Hang);
  InitWithServer();
  Send(Attempt("atm_1"));
  Send(Attempt("atm_2"));
  ASSERT_TRUE(server_.WaitForRequests(1, 2s));

  auto clean = StartDrain(200ms);
  // Nothing is written off before the deadline.
  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(deliveries().empty());

  ASSERT_EQ(clean.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(clean.get());
  ASSERT_EQ(deliveries().size(), 2u);
  // The queued attempt is finished first and never reaches the server.
  EXPECT_EQ(deliveries()[0].attempt.attempt_id, "atm_2");
  EXPECT_EQ(deliveries()[1].attempt.attempt_id, "atm_1");
  for (const auto &d : deliveries()) {
    EXPECT_EQ(d.result.error_class, ErrorClass::Timeout);
    EXPECT_EQ(d.result.reason, "shutdown");
  }
  EXPECT_EQ(server_.requests().size(), 1u);

  // Attempts arriving while drained are answered without a local call.
  Send(Attempt("atm_3"));
  ASSERT_TRUE(WaitForDeliveries(3));
  EXPECT_EQ(deliveries()[2].result.reason, "shutdown");
  EXPECT_EQ(server_.requests().size(), 1u);

  server_.set_mode(TestLocalHttpServer::Mode::Respond);
  OnIo([this] { pipeline_->Resume(); });
  Send(Attempt("atm_4"));
  ASSERT_TRUE(WaitForDeliveries(4));
  EXPECT_TRUE(deliveries()[3].result.ok());
}

TEST_F(DeliveryPipelineTest, DrainDeadlineWritesOffPendingFallbacks) {
  sender_.fail = true;
  control_plane_.hold_submits = true;
  InitWithServer();
  Send(Attempt("atm_1"));
  ASSERT_TRUE(WaitUntil([&] { return control_plane_.held_count() == 1; }));

  auto clean = StartDrain(150ms);
  ASSERT_EQ(clean.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(clean.get());
  ASSERT_TRUE(WaitUntil([&] { return !updates().empty(); }));
  EXPECT_EQ(updates()[0].report, ReportState::Unreported);
}

} // namespace
