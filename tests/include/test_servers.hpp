#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "tunnel/attempt.hpp"
#include "tunnel/tunnel_messages.hpp"

namespace testinfra {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace json = boost::json;
using tcp = net::ip::tcp;

inline unsigned short PickFreePort() {
  net::io_context ioc;
  tcp::acceptor acceptor(ioc, {net::ip::make_address("127.0.0.1"), 0});
  return acceptor.local_endpoint().port();
}

struct RecordedRequest {
  std::string method;
  std::string target;
  std::string body;
  hookrelay::HeaderList headers;

  std::optional<std::string> header(const std::string &name) const {
    for (const auto &[n, v] : headers) {
      if (beast::iequals(n, name)) {
        return v;
      }
    }
    return std::nullopt;
  }
};

// Local HTTP server standing in for the developer's app. Every connection
// gets its own thread so concurrent deliveries overlap.
class TestLocalHttpServer {
public:
  enum class Mode {
    Respond,
    // Reads the request and never answers until Stop().
    Hang,
    // Reads the request and closes without a reply.
    Close,
    // Answers with bytes that are not HTTP.
    Garbage
  };

  explicit TestLocalHttpServer(Mode mode = Mode::Respond)
      : port_(PickFreePort()), mode_(mode) {}

  ~TestLocalHttpServer() { Stop(); }

  unsigned short port() const { return port_; }
  std::string base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  void Start() {
    acceptor_.emplace(ioc_, tcp::endpoint{net::ip::make_address("127.0.0.1"),
                                          port_});
    running_.store(true);
    accept_thread_ = std::thread([this] { AcceptLoop(); });
  }

  void Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    WakeAccept();
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    std::vector<std::thread> workers;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      workers.swap(workers_);
    }
    for (auto &t : workers) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  void set_mode(Mode mode) { mode_.store(mode); }
  void set_response(http::status status, std::string body,
                    hookrelay::HeaderList headers = {}) {
    std::lock_guard<std::mutex> lk(mutex_);
    status_ = status;
    body_ = std::move(body);
    extra_headers_ = std::move(headers);
  }
  void set_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mutex_);
    delay_ = delay;
  }

  bool WaitForRequests(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [&] { return recorded_.size() >= n; });
  }

  std::vector<RecordedRequest> requests() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return recorded_;
  }

  int max_concurrent() const { return max_active_.load(); }

private:
  void AcceptLoop() {
    while (running_.load()) {
      tcp::socket socket(ioc_);
      beast::error_code ec;
      acceptor_->accept(socket, ec);
      if (ec || !running_.load()) {
        continue;
      }
      std::lock_guard<std::mutex> lk(mutex_);
      workers_.emplace_back(
          [this, s = std::move(socket)]() mutable { Serve(std::move(s)); });
    }
  }

  void Serve(tcp::socket socket) {
    const int active = ++active_;
    int seen = max_active_.load();
    while (active > seen && !max_active_.compare_exchange_weak(seen, active)) {
    }

    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    beast::error_code ec;
    http::read(socket, buffer, request, ec);
    if (!ec) {
      Record(request);
      std::unique_lock<std::mutex> lk(mutex_);
      const auto delay = delay_;
      const auto status = status_;
      const auto body = body_;
      const auto extra = extra_headers_;
      if (mode_.load() == Mode::Hang) {
        cv_.wait(lk, [this] { return stopping_; });
      } else if (delay.count() > 0) {
        cv_.wait_for(lk, delay, [this] { return stopping_; });
      }
      lk.unlock();

      switch (mode_.load()) {
      case Mode::Respond: {
        http::response<http::string_body> response{status, request.version()};
        response.set(http::field::content_type, "text/plain");
        for (const auto &[n, v] : extra) {
          response.insert(n, v);
        }
        response.body() = body;
        response.prepare_payload();
        http::write(socket, response, ec);
        break;
      }
      case Mode::Garbage: {
        static const std::string kJunk = "SSH-2.0-OpenSSH_9.6\r\n\r\n";
        net::write(socket, net::buffer(kJunk), ec);
        break;
      }
      case Mode::Hang:
      case Mode::Close:
        break;
      }
    }
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    --active_;
  }

  void Record(const http::request<http::string_body> &req) {
    RecordedRequest rec;
    rec.method = std::string(req.method_string());
    rec.target = std::string(req.target());
    rec.body = req.body();
    for (const auto &field : req) {
      rec.headers.emplace_back(std::string(field.name_string()),
                               std::string(field.value()));
    }
    {
      std::lock_guard<std::mutex> lk(mutex_);
      recorded_.push_back(std::move(rec));
    }
    cv_.notify_all();
  }

  void WakeAccept() {
    net::io_context ioc;
    tcp::socket socket(ioc);
    beast::error_code ec;
    socket.connect({net::ip::make_address("127.0.0.1"), port_}, ec);
  }

  unsigned short port_;
  std::atomic<Mode> mode_;
  net::io_context ioc_;
  std::optional<tcp::acceptor> acceptor_;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::thread> workers_;
  std::vector<RecordedRequest> recorded_;
  http::status status_{http::status::ok};
  std::string body_{"ok"};
  hookrelay::HeaderList extra_headers_;
  std::chrono::milliseconds delay_{0};
  bool stopping_{false};
};

struct FakeDispatcherOptions {
  // Answer the upgrade with 401.
  bool reject_upgrade{false};
  // Put into connect_response.error.
  std::string welcome_error;
  // Session id announced in connect_response; empty echoes the HELLO.
  std::string session_id;
  std::optional<int> heartbeat_interval_ms;
  bool answer_hello{true};
  bool answer_ping{true};
};

// Plain ws:// dispatcher. Answers HELLO with connect_response and PING with
// PONG, records every frame and attempt result, and lets the test push
// frames or cut the connection. All socket work runs on its own thread.
class FakeDispatcher {
public:
  using Options = FakeDispatcherOptions;

  FakeDispatcher() : FakeDispatcher(Options{}) {}
  explicit FakeDispatcher(Options options)
      : options_(std::move(options)),
        acceptor_(ioc_, {net::ip::make_address("127.0.0.1"), 0}) {
    DoAccept();
    thread_ = std::thread([this] { ioc_.run(); });
  }

  ~FakeDispatcher() {
    net::post(ioc_, [this] {
      beast::error_code ec;
      acceptor_.close(ec);
      for (auto &c : conns_) {
        c->ws.next_layer().socket().close(ec);
      }
      ioc_.stop();
    });
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  unsigned short port() const { return acceptor_.local_endpoint().port(); }
  std::string url() const {
    return "ws://127.0.0.1:" + std::to_string(port()) + "/ws";
  }

  void set_options(Options options) {
    net::post(ioc_, [this, options = std::move(options)]() mutable {
      options_ = std::move(options);
    });
  }

  // Sends to the newest open connection.
  void Send(const json::value &frame) {
    net::post(ioc_, [this, payload = json::serialize(frame)]() mutable {
      if (auto c = Latest()) {
        c->Push(std::move(payload));
      }
    });
  }

  // Closes the newest connection without a close handshake.
  void DropConnection() {
    net::post(ioc_, [this] {
      if (auto c = Latest()) {
        beast::error_code ec;
        c->ws.next_layer().socket().close(ec);
      }
    });
  }

  bool WaitForConnections(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [&] { return connections_ >= n; });
  }

  bool WaitForUpgrades(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout,
                        [&] { return upgrade_targets_.size() >= n; });
  }

  std::vector<hookrelay::AttemptResult>
  WaitForResults(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait_for(lk, timeout, [&] { return results_.size() >= n; });
    return results_;
  }

  // Waits for a client frame whose "event" equals `event`.
  std::optional<json::value> WaitForFrame(const std::string &event,
                                          std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    std::optional<json::value> found;
    cv_.wait_for(lk, timeout, [&] {
      for (const auto &f : frames_) {
        const auto *obj = f.if_object();
        if (!obj) {
          continue;
        }
        if (auto *e = obj->if_contains("event");
            e && e->is_string() && e->as_string() == event) {
          found = f;
          return true;
        }
      }
      return false;
    });
    return found;
  }

  std::vector<std::string> upgrade_targets() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return upgrade_targets_;
  }
  std::vector<std::string> authorizations() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return authorizations_;
  }
  std::size_t disconnects() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return disconnects_;
  }

private:
  struct Conn : std::enable_shared_from_this<Conn> {
    Conn(FakeDispatcher &owner, tcp::socket socket)
        : owner(owner), ws(beast::tcp_stream(std::move(socket))) {}

    void Start() {
      http::async_read(ws.next_layer(), buffer, upgrade,
                       [self = shared_from_this()](beast::error_code ec,
                                                   std::size_t) {
                         self->OnUpgradeRead(ec);
                       });
    }

    void OnUpgradeRead(beast::error_code ec) {
      if (ec) {
        return;
      }
      owner.RecordUpgrade(upgrade);
      auto self = shared_from_this();
      if (owner.options_.reject_upgrade) {
        auto res = std::make_shared<http::response<http::string_body>>(
            http::status::unauthorized, upgrade.version());
        res->body() = "invalid token";
        res->prepare_payload();
        http::async_write(ws.next_layer(), *res,
                          [self, res](beast::error_code, std::size_t) {
                            beast::error_code ignore;
                            self->ws.next_layer().socket().shutdown(
                                tcp::socket::shutdown_both, ignore);
                          });
        return;
      }
      ws.text(true);
      ws.async_accept(upgrade, [self](beast::error_code aec) {
        if (aec) {
          return;
        }
        self->open = true;
        self->owner.OnAccepted(self);
        self->Read();
      });
    }

    void Read() {
      buffer.consume(buffer.size());
      ws.async_read(buffer, [self = shared_from_this()](beast::error_code ec,
                                                        std::size_t) {
        if (ec) {
          self->open = false;
          self->owner.OnDisconnected();
          return;
        }
        std::string payload = beast::buffers_to_string(self->buffer.data());
        self->owner.OnFrame(*self, payload);
        self->Read();
      });
    }

    void Push(std::string payload) {
      if (!open) {
        return;
      }
      outbox.push_back(std::move(payload));
      if (outbox.size() == 1) {
        DoWrite();
      }
    }

    void DoWrite() {
      ws.async_write(net::buffer(outbox.front()),
                     [self = shared_from_this()](beast::error_code ec,
                                                 std::size_t) {
                       if (ec) {
                         self->outbox.clear();
                         return;
                       }
                       self->outbox.pop_front();
                       if (!self->outbox.empty()) {
                         self->DoWrite();
                       }
                     });
    }

    FakeDispatcher &owner;
    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    http::request<http::string_body> upgrade;
    std::deque<std::string> outbox;
    bool open{false};
  };

  void DoAccept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec) {
        return;
      }
      auto conn = std::make_shared<Conn>(*this, std::move(socket));
      conn->Start();
      DoAccept();
    });
  }

  std::shared_ptr<Conn> Latest() {
    for (auto it = conns_.rbegin(); it != conns_.rend(); ++it) {
      if ((*it)->open) {
        return *it;
      }
    }
    return nullptr;
  }

  void RecordUpgrade(const http::request<http::string_body> &req) {
    std::lock_guard<std::mutex> lk(mutex_);
    const auto target = req.target();
    const auto auth = req[http::field::authorization];
    upgrade_targets_.emplace_back(target.data(), target.size());
    authorizations_.emplace_back(auth.data(), auth.size());
    cv_.notify_all();
  }

  void OnAccepted(const std::shared_ptr<Conn> &conn) {
    conns_.push_back(conn);
    std::lock_guard<std::mutex> lk(mutex_);
    ++connections_;
    cv_.notify_all();
  }

  void OnDisconnected() {
    std::lock_guard<std::mutex> lk(mutex_);
    ++disconnects_;
    cv_.notify_all();
  }

  void OnFrame(Conn &conn, const std::string &payload) {
    boost::system::error_code ec;
    auto jv = json::parse(payload, ec);
    if (ec) {
      return;
    }
    const auto kind = hookrelay::PeekFrameKind(jv);
    if (kind == hookrelay::FrameKind::Hello && options_.answer_hello) {
      auto hello = json::value_to<hookrelay::HelloFrame>(jv);
      hookrelay::WelcomeFrame welcome;
      welcome.session_id = options_.session_id.empty() ? hello.session_id
                                                       : options_.session_id;
      welcome.heartbeat_interval_ms = options_.heartbeat_interval_ms;
      welcome.error = options_.welcome_error;
      conn.Push(json::serialize(json::value_from(welcome)));
    } else if (kind == hookrelay::FrameKind::Ping && options_.answer_ping) {
      auto ping = json::value_to<hookrelay::PingFrame>(jv);
      conn.Push(json::serialize(json::value_from(hookrelay::PongFrame{ping.token})));
    }
    std::lock_guard<std::mutex> lk(mutex_);
    if (kind == hookrelay::FrameKind::AttemptResult) {
      results_.push_back(
          json::value_to<hookrelay::AttemptResultFrame>(jv).result);
    }
    frames_.push_back(std::move(jv));
    cv_.notify_all();
  }

  Options options_;
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::thread thread_;
  std::vector<std::shared_ptr<Conn>> conns_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t connections_{0};
  std::size_t disconnects_{0};
  std::vector<std::string> upgrade_targets_;
  std::vector<std::string> authorizations_;
  std::vector<hookrelay::AttemptResult> results_;
  std::vector<json::value> frames_;
};

} // namespace testinfra
