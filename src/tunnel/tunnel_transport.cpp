#include "tunnel/tunnel_transport.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/json.hpp>
#include <boost/url.hpp>

#include <algorithm>
#include <deque>
#include <fmt/format.h>
#include <openssl/err.h>
#include <type_traits>

#include "my_error_codes.hpp"
#include "version.h"

namespace hookrelay {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace json = boost::json;
namespace urls = boost::urls;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(10);
constexpr auto kWelcomeTimeout = std::chrono::seconds(10);
constexpr auto kCloseTimeout = std::chrono::seconds(2);

std::string DefaultPort(bool secure) { return secure ? "443" : "80"; }

monad::MyResult<TransportEndpoint> ParseEndpoint(const std::string &endpoint,
                                                 bool use_wss) {
  auto parsed = urls::parse_uri(endpoint);
  if (!parsed) {
    return monad::MyResult<TransportEndpoint>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("invalid transport endpoint '{}': {}", endpoint,
                    parsed.error().message())));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    return monad::MyResult<TransportEndpoint>::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          fmt::format("transport endpoint missing host: '{}'",
                                      endpoint)));
  }
  const std::string scheme(url.scheme());
  TransportEndpoint parts;
  if (scheme == "wss" || scheme == "https") {
    parts.secure = use_wss;
  } else if (scheme == "ws" || scheme == "http") {
    parts.secure = false;
  } else {
    return monad::MyResult<TransportEndpoint>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("transport endpoint must use ws:// or wss:// (got '{}')",
                    scheme)));
  }
  parts.host = std::string(url.host());
  parts.port = url.has_port() ? std::string(url.port())
                              : DefaultPort(parts.secure);
  std::string target(url.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (url.has_query()) {
    target += '?';
    target += std::string(url.encoded_query());
  }
  parts.target = std::move(target);
  return monad::MyResult<TransportEndpoint>::Ok(std::move(parts));
}

std::string DeriveFromApiBase(const std::string &api_base_url) {
  auto parsed = urls::parse_uri(api_base_url);
  if (!parsed || !parsed.value().has_authority()) {
    return {};
  }
  const auto &url = parsed.value();
  const bool secure = url.scheme() != "http";
  std::string out = secure ? "wss://" : "ws://";
  out += std::string(url.encoded_authority());
  out += "/ws";
  return out;
}

std::string ProgressMessage(std::chrono::milliseconds delay) {
  const auto secs = std::chrono::ceil<std::chrono::seconds>(delay).count();
  return fmt::format("Reconnecting in {}s…", std::max<long long>(1, secs));
}

} // namespace

std::string TransportEndpoint::url() const {
  std::string out = secure ? "wss://" : "ws://";
  out += host;
  if (port != DefaultPort(secure)) {
    out += ':';
    out += port;
  }
  out += target;
  return out;
}

monad::MyResult<TransportEndpoint>
ResolveTransportEndpoint(const ListenConfig &config,
                         const std::string &ws_base_override,
                         const CliSession &session) {
  std::string base = ws_base_override;
  if (base.empty()) {
    base = session.websocket_url;
  }
  if (base.empty()) {
    base = config.ws_base_url;
  }
  if (base.empty()) {
    base = DeriveFromApiBase(config.api_base_url);
  }
  if (base.empty()) {
    return monad::MyResult<TransportEndpoint>::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          "no transport endpoint configured"));
  }
  auto parsed = ParseEndpoint(base, config.use_wss);
  if (parsed.is_err()) {
    return parsed;
  }
  auto endpoint = std::move(parsed).value();
  if (!session.id.empty()) {
    auto origin = urls::parse_origin_form(endpoint.target);
    if (!origin) {
      return monad::MyResult<TransportEndpoint>::Err(monad::make_error(
          my_errors::GENERAL::INVALID_ARGUMENT,
          fmt::format("invalid transport target '{}': {}", endpoint.target,
                      origin.error().message())));
    }
    urls::url target(origin.value());
    target.params().set("session_id", session.id);
    endpoint.target = std::string(target.buffer());
  }
  return monad::MyResult<TransportEndpoint>::Ok(std::move(endpoint));
}

// One socket, one transport epoch.
class TunnelTransport::Session {
public:
  virtual ~Session() = default;
  virtual void Start() = 0;
  // WebSocket upgraded and not yet closing.
  virtual bool open() const = 0;
  virtual std::size_t queued() const = 0;
  // `bounded` frames are refused once the outbound queue is full.
  virtual monad::MyVoidResult Enqueue(std::string payload, bool bounded) = 0;
  virtual void SetHeartbeat(std::chrono::milliseconds interval) = 0;
  // Flushes the queue, sends BYE and closes.
  virtual void Close(const std::string &reason) = 0;
  virtual void Abort() = 0;
};

template <typename WsStream>
class TunnelTransport::SessionImpl
    : public TunnelTransport::Session,
      public std::enable_shared_from_this<SessionImpl<WsStream>> {
public:
  static constexpr bool kTls =
      !std::is_same_v<WsStream, websocket::stream<beast::tcp_stream>>;

  template <typename... StreamArgs>
  SessionImpl(std::weak_ptr<TunnelTransport> client, net::io_context &ioc,
              TransportEndpoint endpoint, std::string token,
              std::size_t queue_capacity, customio::ConsoleOutput &output,
              StreamArgs &&...args)
      : client_(std::move(client)), endpoint_(std::move(endpoint)),
        token_(std::move(token)), queue_capacity_(queue_capacity),
        output_(output), resolver_(net::make_strand(ioc)),
        ws_(net::make_strand(ioc), std::forward<StreamArgs>(args)...),
        ping_timer_(ioc), welcome_timer_(ioc), close_timer_(ioc) {
    ws_.text(true);
  }

  void Start() override {
    output_.logger().info() << "Connecting to " << endpoint_.host << ':'
                            << endpoint_.port << std::endl;
    BOOST_LOG_SEV(lg, trivial::debug) << "resolving " << endpoint_.url();
    resolver_.async_resolve(
        endpoint_.host, endpoint_.port,
        beast::bind_front_handler(&SessionImpl::OnResolve, this->shared_from_this()));
  }

  bool open() const override {
    return upgraded_ && !close_started_ && !notified_close_;
  }

  std::size_t queued() const override { return write_queue_.size(); }

  monad::MyVoidResult Enqueue(std::string payload, bool bounded) override {
    if (!open()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::LISTEN::NOT_OPEN, "transport has no open socket"));
    }
    if (bounded && write_queue_.size() >= queue_capacity_) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::LISTEN::OVERLOADED,
          fmt::format("outbound queue full ({} frames)", queue_capacity_)));
    }
    Push(std::move(payload));
    return monad::MyVoidResult::Ok();
  }

  void SetHeartbeat(std::chrono::milliseconds interval) override {
    heartbeat_ = std::max(std::chrono::milliseconds(100), interval);
    awaiting_pong_ = false;
    missed_pongs_ = 0;
    ping_timer_.cancel();
    SchedulePing();
  }

  void Close(const std::string &reason) override {
    if (notified_close_) {
      return;
    }
    if (!open()) {
      Abort();
      return;
    }
    Push(json::serialize(json::value_from(ByeFrame{reason})));
    close_started_ = true;
    ping_timer_.cancel();
    close_timer_.expires_after(kCloseTimeout);
    close_timer_.async_wait([weak = this->weak_from_this()](
                                const beast::error_code &ec) {
      if (ec) {
        return;
      }
      if (auto self = weak.lock()) {
        BOOST_LOG_SEV(self->lg, trivial::warning)
            << "close handshake timed out";
        self->Abort();
      }
    });
  }

  void Abort() override {
    closing_ = true;
    resolver_.cancel();
    beast::error_code ignore;
    beast::get_lowest_layer(ws_).socket().close(ignore);
    NotifyClosed(true);
  }

private:
  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Fail("resolve", ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
    beast::get_lowest_layer(ws_).async_connect(
        results,
        beast::bind_front_handler(&SessionImpl::OnConnect, this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail("connect", ec);
      return;
    }
    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(),
                                    endpoint_.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Fail("set_sni", sni_error);
        return;
      }
      ws_.next_layer().set_verify_callback(
          ssl::host_name_verification(endpoint_.host));
      beast::get_lowest_layer(ws_).expires_after(kConnectTimeout);
      ws_.next_layer().async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&SessionImpl::OnTlsHandshake,
                                    this->shared_from_this()));
    } else {
      WsHandshake();
    }
  }

  void OnTlsHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail("tls_handshake", ec);
      return;
    }
    WsHandshake();
  }

  void WsHandshake() {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator(
        [token = token_](websocket::request_type &req) {
          req.set(http::field::user_agent,
                  std::string("hookrelay/") + HOOKRELAY_VERSION);
          req.set(http::field::authorization, "Bearer " + token);
        }));
    std::string host = endpoint_.host;
    if (endpoint_.port != DefaultPort(kTls)) {
      host += ':' + endpoint_.port;
    }
    ws_.async_handshake(upgrade_response_, host, endpoint_.target,
                        beast::bind_front_handler(&SessionImpl::OnWsHandshake,
                                                  this->shared_from_this()));
  }

  void OnWsHandshake(const beast::error_code &ec) {
    if (ec) {
      const auto status = upgrade_response_.result_int();
      if (status == 401 || status == 403) {
        BOOST_LOG_SEV(lg, trivial::warning)
            << "upgrade rejected with HTTP " << status;
        if (auto client = client_.lock()) {
          client->RequireReauth(
              fmt::format("dispatcher rejected the session token ({})",
                          status));
        }
        Abort();
        return;
      }
      Fail("ws_handshake", ec);
      return;
    }
    upgraded_ = true;
    BOOST_LOG_SEV(lg, trivial::info)
        << "websocket established to " << endpoint_.url();

    HelloFrame hello;
    if (auto client = client_.lock()) {
      hello.session_id = client->session_.id;
    }
    hello.token = token_;
    hello.client_version = HOOKRELAY_VERSION;
    hello.capabilities = {"attempt_parts", "body_base64", "control"};
    Push(json::serialize(json::value_from(hello)));

    welcome_timer_.expires_after(kWelcomeTimeout);
    welcome_timer_.async_wait(
        [weak = this->weak_from_this()](const beast::error_code &tec) {
          if (tec) {
            return;
          }
          if (auto self = weak.lock(); self && !self->welcomed_) {
            self->FailWith("no WELCOME from dispatcher");
          }
        });
    StartRead();
  }

  void StartRead() {
    ws_.async_read(read_buffer_,
                   beast::bind_front_handler(&SessionImpl::OnRead,
                                             this->shared_from_this()));
  }

  void ResumeRead() {
    if (!paused_ || notified_close_) {
      return;
    }
    paused_ = false;
    BOOST_LOG_SEV(lg, trivial::debug) << "pipeline has slack, reading again";
    StartRead();
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      if (ec == websocket::error::closed) {
        BOOST_LOG_SEV(lg, trivial::info) << "websocket closed by peer";
        NotifyClosed(true);
        return;
      }
      Fail("read", ec);
      return;
    }
    std::string payload = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    HandleMessage(payload);
    if (notified_close_ || closing_) {
      return;
    }
    auto client = client_.lock();
    if (!client) {
      return;
    }
    if (client->sink_ && !client->sink_->Ready()) {
      paused_ = true;
      BOOST_LOG_SEV(lg, trivial::debug) << "pipeline full, pausing reads";
      client->sink_->WhenReady([weak = this->weak_from_this()] {
        if (auto self = weak.lock()) {
          self->ResumeRead();
        }
      });
      return;
    }
    StartRead();
  }

  void HandleMessage(const std::string &payload) {
    boost::system::error_code jec;
    auto jv = json::parse(payload, jec);
    if (jec) {
      BOOST_LOG_SEV(lg, trivial::warning)
          << "dropping unparsable frame: " << jec.message();
      return;
    }
    auto client = client_.lock();
    if (!client) {
      return;
    }
    const auto kind = PeekFrameKind(jv);
    try {
      switch (kind) {
      case FrameKind::Welcome:
        HandleWelcome(*client, json::value_to<WelcomeFrame>(jv));
        break;
      case FrameKind::Ping: {
        auto ping = json::value_to<PingFrame>(jv);
        Push(json::serialize(json::value_from(PongFrame{ping.token})));
        break;
      }
      case FrameKind::Pong: {
        auto pong = json::value_to<PongFrame>(jv);
        if (pong.token != 0 && pong.token <= ping_token_) {
          awaiting_pong_ = false;
          missed_pongs_ = 0;
        }
        break;
      }
      case FrameKind::Attempt:
        client->HandleAttemptFrame(json::value_to<AttemptFrame>(jv));
        break;
      case FrameKind::Control:
        client->HandleControl(json::value_to<ControlFrame>(jv));
        break;
      case FrameKind::Bye: {
        auto bye = json::value_to<ByeFrame>(jv);
        output_.logger().info()
            << "Dispatcher closed the session"
            << (bye.reason.empty() ? std::string{} : ": " + bye.reason)
            << std::endl;
        BOOST_LOG_SEV(lg, trivial::info) << "BYE received: " << bye.reason;
        Abort();
        break;
      }
      default:
        BOOST_LOG_SEV(lg, trivial::debug)
            << "ignoring frame: " << json::serialize(jv).substr(0, 120);
        break;
      }
    } catch (const std::exception &ex) {
      output_.logger().warning()
          << "Malformed frame from dispatcher: " << ex.what() << std::endl;
      BOOST_LOG_SEV(lg, trivial::warning) << "malformed frame: " << ex.what();
    }
  }

  void HandleWelcome(TunnelTransport &client, const WelcomeFrame &welcome) {
    welcome_timer_.cancel();
    if (!welcome.error.empty()) {
      if (welcome.error == "invalid_token" || welcome.error == "unauthorized") {
        client.RequireReauth("dispatcher reported " + welcome.error);
        Abort();
        return;
      }
      FailWith("dispatcher refused the session: " + welcome.error);
      return;
    }
    welcomed_ = true;
    client.HandleWelcome(welcome);
  }

  void SchedulePing() {
    if (notified_close_ || close_started_) {
      return;
    }
    ping_timer_.expires_after(heartbeat_);
    ping_timer_.async_wait(beast::bind_front_handler(
        &SessionImpl::OnPingTimer, this->shared_from_this()));
  }

  void OnPingTimer(const beast::error_code &ec) {
    if (ec) {
      return;
    }
    // Nothing is read while paused, so an unanswered ping proves nothing.
    if (awaiting_pong_ && !paused_) {
      ++missed_pongs_;
      if (missed_pongs_ >= 2) {
        FailWith(fmt::format("no PONG for {} heartbeat intervals",
                             missed_pongs_));
        return;
      }
    }
    awaiting_pong_ = true;
    Push(json::serialize(json::value_from(PingFrame{++ping_token_})));
    SchedulePing();
  }

  void Push(std::string payload) {
    write_queue_.push_back(std::move(payload));
    if (write_queue_.size() == 1) {
      DoWrite();
    }
  }

  void DoWrite() {
    ws_.async_write(net::buffer(write_queue_.front()),
                    beast::bind_front_handler(&SessionImpl::OnWrite,
                                              this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail("write", ec);
      return;
    }
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
      DoWrite();
      return;
    }
    if (close_started_ && !close_sent_) {
      close_sent_ = true;
      ws_.async_close(websocket::close_code::normal,
                      beast::bind_front_handler(&SessionImpl::OnClose,
                                                this->shared_from_this()));
    }
  }

  void OnClose(const beast::error_code &ec) {
    close_timer_.cancel();
    if (ec && ec != net::error::operation_aborted) {
      BOOST_LOG_SEV(lg, trivial::debug) << "close error: " << ec.message();
    }
    closing_ = true;
    NotifyClosed(true);
  }

  void Fail(const char *context, const beast::error_code &ec) {
    if (notified_close_) {
      return;
    }
    if (ec == net::error::operation_aborted && closing_) {
      NotifyClosed(true);
      return;
    }
    FailWith(fmt::format("{} failed: {}", context, ec.message()));
  }

  void FailWith(const std::string &why) {
    if (notified_close_) {
      return;
    }
    output_.logger().warning() << "Transport: " << why << std::endl;
    BOOST_LOG_SEV(lg, trivial::warning) << "transport failure: " << why;
    Abort();
  }

  void NotifyClosed(bool should_retry) {
    if (notified_close_) {
      return;
    }
    auto self = this->shared_from_this();
    notified_close_ = true;
    ping_timer_.cancel();
    welcome_timer_.cancel();
    close_timer_.cancel();
    resolver_.cancel();
    if (auto client = client_.lock()) {
      client->HandleSessionClosed(should_retry);
    }
  }

  std::weak_ptr<TunnelTransport> client_;
  TransportEndpoint endpoint_;
  std::string token_;
  std::size_t queue_capacity_;
  customio::ConsoleOutput &output_;
  tcp::resolver resolver_;
  WsStream ws_;
  http::response<http::string_body> upgrade_response_;
  beast::flat_buffer read_buffer_;
  std::deque<std::string> write_queue_;
  net::steady_timer ping_timer_;
  net::steady_timer welcome_timer_;
  net::steady_timer close_timer_;
  std::chrono::milliseconds heartbeat_{30000};
  std::uint64_t ping_token_{0};
  int missed_pongs_{0};
  bool awaiting_pong_{false};
  bool upgraded_{false};
  bool welcomed_{false};
  bool paused_{false};
  bool closing_{false};
  bool close_started_{false};
  bool close_sent_{false};
  bool notified_close_{false};
  src::severity_logger<trivial::severity_level> lg;
};

namespace {

ssl::context &TransportSslContext(bool verify_tls) {
  static ssl::context verified = [] {
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
    return ctx;
  }();
  static ssl::context unverified = [] {
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_verify_mode(ssl::verify_none);
    return ctx;
  }();
  return verify_tls ? verified : unverified;
}

} // namespace

TunnelTransport::TunnelTransport(IoContextManager &io_context_manager,
                                 IListenConfigProvider &config_provider,
                                 EventBus &event_bus,
                                 customio::ConsoleOutput &output)
    : ioc_(io_context_manager.ioc()), config_(config_provider.get()),
      event_bus_(event_bus), output_(output),
      assembler_(64, static_cast<std::size_t>(
                         std::max<std::uint64_t>(config_.max_body_bytes * 16,
                                                 16 * 1024 * 1024))),
      reconnect_timer_(io_context_manager.ioc()),
      stable_timer_(io_context_manager.ioc()), rng_(std::random_device{}()) {}

TunnelTransport::~TunnelTransport() {
  reconnect_timer_.cancel();
  stable_timer_.cancel();
}

std::size_t TunnelTransport::outbound_queued() const {
  return socket_ ? socket_->queued() : 0;
}

void TunnelTransport::Run(CliSession session, TransportEndpoint endpoint,
                          DoneCallback done) {
  net::dispatch(ioc_, [self = shared_from_this(), session = std::move(session),
                       endpoint = std::move(endpoint),
                       done = std::move(done)]() mutable {
    if (self->running_) {
      done(monad::MyVoidResult::Err(monad::make_error(
          my_errors::GENERAL::INVALID_ARGUMENT, "transport already running")));
      return;
    }
    self->session_ = std::move(session);
    self->endpoint_ = std::move(endpoint);
    self->done_ = std::move(done);
    self->running_ = true;
    self->stop_requested_ = false;
    self->server_drain_ = false;
    self->reauth_required_ = false;
    self->drain_clean_ = true;
    self->sink_draining_ = false;
    self->consecutive_failures_ = 0;
    self->heartbeat_interval_ = std::chrono::milliseconds(
        self->session_.heartbeat_interval_ms.value_or(
            self->config_.heartbeat_interval_ms));
    self->backoff_.UpdateOptions(self->BuildBackoffOptions());
    self->backoff_.Reset();
    BOOST_LOG_SEV(self->lg, trivial::info)
        << "transport starting toward " << self->endpoint_.url();
    self->StartSession();
  });
}

void TunnelTransport::Shutdown() {
  net::dispatch(ioc_, [weak = weak_from_this()] {
    if (auto self = weak.lock(); self && self->running_) {
      self->BeginDrain(true, "shutdown");
    }
  });
}

monad::MyVoidResult TunnelTransport::SendResult(const AttemptResult &result) {
  if (!socket_ || !socket_->open()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::LISTEN::NOT_OPEN, "transport has no open socket"));
  }
  return socket_->Enqueue(
      json::serialize(json::value_from(AttemptResultFrame{result})), true);
}

void TunnelTransport::StartSession() {
  if (!running_ || stop_requested_) {
    return;
  }
  reconnect_timer_.cancel();
  Publish(TransportState::Connecting,
          consecutive_failures_ == 0
              ? fmt::format("Connecting to {}", endpoint_.host)
              : std::string("Reconnecting…"));
  const auto capacity =
      static_cast<std::size_t>(std::max(1, config_.outbound_queue_capacity));
  if (endpoint_.secure) {
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    socket_ = std::make_shared<SessionImpl<Stream>>(
        weak_from_this(), ioc_, endpoint_, session_.token, capacity, output_,
        TransportSslContext(config_.verify_tls));
  } else {
    using Stream = websocket::stream<beast::tcp_stream>;
    socket_ = std::make_shared<SessionImpl<Stream>>(
        weak_from_this(), ioc_, endpoint_, session_.token, capacity, output_);
  }
  socket_->Start();
}

void TunnelTransport::HandleWelcome(const WelcomeFrame &welcome) {
  if (!welcome.session_id.empty() && welcome.session_id != session_.id) {
    BOOST_LOG_SEV(lg, trivial::info)
        << "new transport epoch: session " << session_.id << " -> "
        << welcome.session_id;
    session_.id = welcome.session_id;
    if (epoch_handler_) {
      epoch_handler_(session_.id);
    }
  }
  if (welcome.heartbeat_interval_ms && *welcome.heartbeat_interval_ms > 0) {
    heartbeat_interval_ =
        std::chrono::milliseconds(*welcome.heartbeat_interval_ms);
  }
  if (socket_) {
    socket_->SetHeartbeat(heartbeat_interval_);
  }
  Publish(TransportState::Open, "Connected");
  if (!welcome.notice.empty()) {
    output_.logger().info() << welcome.notice << std::endl;
    event_bus_.Publish(NoticeEvent{NoticeEvent::Level::Info, welcome.notice});
  }

  stable_timer_.expires_after(
      std::chrono::milliseconds(std::max(0, config_.stable_window_ms)));
  stable_timer_.async_wait(
      [weak = weak_from_this()](const boost::system::error_code &ec) {
        if (ec) {
          return;
        }
        if (auto self = weak.lock()) {
          BOOST_LOG_SEV(self->lg, trivial::debug)
              << "connection stable, backoff reset";
          self->backoff_.Reset();
          self->consecutive_failures_ = 0;
        }
      });
}

void TunnelTransport::HandleAttemptFrame(AttemptFrame frame) {
  if (!sink_) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "attempt " << frame.attempt.attempt_id << " dropped: no sink";
    return;
  }
  auto assembled = assembler_.Add(std::move(frame));
  if (assembled.is_err()) {
    output_.logger().warning()
        << "Could not reassemble attempt: " << assembled.error().what
        << std::endl;
    BOOST_LOG_SEV(lg, trivial::warning)
        << "frame assembly failed: " << assembled.error();
    return;
  }
  if (assembled.value()) {
    sink_->OnAttempt(std::move(*assembled.value()));
  }
}

void TunnelTransport::HandleControl(const ControlFrame &control) {
  switch (control.kind) {
  case ControlKind::RateLimit: {
    std::string text = control.message.empty()
                           ? std::string("Dispatcher is rate limiting this "
                                         "session")
                           : control.message;
    output_.logger().warning() << text << std::endl;
    BOOST_LOG_SEV(lg, trivial::warning) << "rate limit: " << text;
    event_bus_.Publish(NoticeEvent{NoticeEvent::Level::Warning, text});
    break;
  }
  case ControlKind::SessionRevoked:
    RequireReauth(control.message.empty() ? "session revoked"
                                          : control.message);
    if (socket_) {
      socket_->Abort();
    }
    break;
  case ControlKind::Drain:
    BeginDrain(false, control.message.empty() ? "Dispatcher requested drain"
                                              : control.message);
    break;
  case ControlKind::Unknown:
    BOOST_LOG_SEV(lg, trivial::debug)
        << "ignoring control kind " << control.raw_kind;
    break;
  }
}

void TunnelTransport::BeginDrain(bool shutting_down, const std::string &why) {
  if (shutting_down) {
    stop_requested_ = true;
    reconnect_timer_.cancel();
  }
  if (state_ == TransportState::Draining) {
    return;
  }
  server_drain_ = !shutting_down;
  Publish(TransportState::Draining,
          shutting_down ? std::string("Shutting down, finishing deliveries")
                        : why);
  if (!sink_) {
    if (socket_) {
      socket_->Close(shutting_down ? "shutdown" : "drain");
    } else {
      HandleSessionClosed(true);
    }
    return;
  }
  sink_draining_ = true;
  std::weak_ptr<TunnelTransport> weak = weak_from_this();
  sink_->Drain(std::chrono::milliseconds(config_.drain_deadline_ms),
               [weak](bool clean) {
                 auto self = weak.lock();
                 if (!self) {
                   return;
                 }
                 self->sink_draining_ = false;
                 self->drain_clean_ = self->drain_clean_ && clean;
                 // The socket may have died while the pipeline drained.
                 if (self->socket_) {
                   self->socket_->Close(self->stop_requested_ ? "shutdown"
                                                              : "drain");
                 } else {
                   self->HandleSessionClosed(true);
                 }
               });
}

void TunnelTransport::RequireReauth(const std::string &why) {
  if (reauth_required_) {
    return;
  }
  reauth_required_ = true;
  BOOST_LOG_SEV(lg, trivial::warning) << "reauth required: " << why;
}

void TunnelTransport::HandleSessionClosed(bool should_retry) {
  socket_.reset();
  stable_timer_.cancel();
  assembler_.Clear();
  if (!running_) {
    return;
  }
  if (reauth_required_) {
    Publish(TransportState::Closed, "Session expired, re-authenticating");
    Finish(monad::MyVoidResult::Err(monad::make_error(
        my_errors::LISTEN::REAUTH_REQUIRED, "session token rejected")));
    return;
  }
  // The drain callback comes back here once the sink is done.
  if (sink_draining_) {
    return;
  }
  if (stop_requested_ || !should_retry) {
    Publish(TransportState::Closed, "Disconnected");
    Finish(drain_clean_
               ? monad::MyVoidResult::Ok()
               : monad::MyVoidResult::Err(monad::make_error(
                     my_errors::LISTEN::DRAIN_TIMEOUT,
                     "drain deadline cut deliveries short")));
    return;
  }
  if (server_drain_) {
    server_drain_ = false;
    if (sink_) {
      sink_->Resume();
    }
  }
  ScheduleReconnect();
}

void TunnelTransport::ScheduleReconnect() {
  if (!running_ || stop_requested_) {
    return;
  }
  ++consecutive_failures_;
  backoff_.UpdateOptions(BuildBackoffOptions());
  const auto delay = backoff_.NextDelay(rng_);
  BOOST_LOG_SEV(lg, trivial::warning)
      << "reconnect scheduled in " << delay.count() << " ms (failure "
      << consecutive_failures_ << ")";
  Publish(TransportState::Connecting, ProgressMessage(delay), delay);
  reconnect_timer_.expires_after(delay);
  reconnect_timer_.async_wait(
      [weak = weak_from_this()](const boost::system::error_code &ec) {
        if (ec) {
          return;
        }
        if (auto self = weak.lock()) {
          self->StartSession();
        }
      });
}

void TunnelTransport::Finish(monad::MyVoidResult result) {
  if (!running_) {
    return;
  }
  running_ = false;
  reconnect_timer_.cancel();
  stable_timer_.cancel();
  if (result.is_err()) {
    BOOST_LOG_SEV(lg, trivial::info)
        << "transport finished: " << result.error();
  } else {
    BOOST_LOG_SEV(lg, trivial::info) << "transport finished cleanly";
  }
  if (auto done = std::move(done_)) {
    done_ = nullptr;
    done(std::move(result));
  }
}

void TunnelTransport::Publish(TransportState state, std::string message,
                              std::optional<std::chrono::milliseconds> retry_in) {
  state_ = state;
  output_.logger().info() << message << std::endl;
  BOOST_LOG_SEV(lg, trivial::info)
      << "transport " << to_string(state) << ": " << message;
  TransportStatusEvent ev;
  ev.state = state;
  ev.message = std::move(message);
  ev.retry_in = retry_in;
  ev.consecutive_failures = consecutive_failures_;
  ev.reauth_required = reauth_required_;
  event_bus_.Publish(ev);
}

monad::ExponentialBackoffOptions TunnelTransport::BuildBackoffOptions() const {
  monad::ExponentialBackoffOptions opts;
  const int initial = std::max(1, config_.reconnect_initial_delay_ms);
  const int maximum = std::max(initial, config_.reconnect_max_delay_ms);
  opts.initial_delay = std::chrono::milliseconds(initial);
  opts.max_delay = std::chrono::milliseconds(maximum);
  opts.multiplier = 2.0;
  opts.jitter_ratio = std::clamp(config_.reconnect_jitter_ratio, 0.0, 1.0);
  return opts;
}

} // namespace hookrelay
