#include "pipeline/local_dispatcher.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>
#include <openssl/err.h>

#include <algorithm>
#include <array>
#include <limits>
#include <type_traits>

#include "pipeline/header_policy.hpp"

namespace hookrelay {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

std::int64_t NowEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

template <typename Stream>
class LocalCall : public LocalDispatcher::Call,
                  public std::enable_shared_from_this<LocalCall<Stream>> {
public:
  static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

  template <typename... StreamArgs>
  LocalCall(net::io_context &ioc, LocalRequest request,
            LocalDispatcher::Callback callback, StreamArgs &&...args)
      : request_(std::move(request)), callback_(std::move(callback)),
        resolver_(net::make_strand(ioc)),
        stream_(net::make_strand(ioc), std::forward<StreamArgs>(args)...),
        deadline_(ioc) {}

  void Start() {
    auto self = this->shared_from_this();
    started_ = std::chrono::steady_clock::now();
    BuildHttpRequest();
    // The body is streamed through chunk_ and only max_body_bytes of it are
    // kept, so the parser itself needs no limit.
    parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    deadline_.expires_after(request_.timeout);
    deadline_.async_wait(
        [self](const beast::error_code &ec) { self->OnTimeout(ec); });
    resolver_.async_resolve(
        request_.target.host, request_.target.port,
        beast::bind_front_handler(&LocalCall::OnResolve, self));
  }

  void Cancel(const std::string &reason) override {
    if (completed_) {
      return;
    }
    Complete(ErrorClass::Timeout, reason);
    Abort();
  }

private:
  void BuildHttpRequest() {
    http_request_.version(11);
    auto verb = http::string_to_verb(request_.method);
    if (verb == http::verb::unknown) {
      http_request_.method_string(request_.method);
    } else {
      http_request_.method(verb);
    }
    http_request_.target(request_.request_target);
    BuildLocalRequestHeaders(request_.headers, request_.target.host_header,
                             request_.source_name, request_.attempt_id,
                             request_.body.size(), http_request_.base());
    http_request_.body() = request_.body;
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Fail(ErrorClass::Connect, "resolve", ec);
      return;
    }
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&LocalCall::OnConnect,
                                           this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail(ErrorClass::Connect, "connect", ec);
      return;
    }
    if constexpr (kTls) {
      // Local development servers use self-signed certificates.
      stream_.set_verify_mode(ssl::verify_none);
      if (!SSL_set_tlsext_host_name(stream_.native_handle(),
                                    request_.target.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Fail(ErrorClass::Connect, "set_sni", sni_error);
        return;
      }
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&LocalCall::OnHandshake,
                                    this->shared_from_this()));
    } else {
      Write();
    }
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail(ErrorClass::Connect, "tls handshake", ec);
      return;
    }
    Write();
  }

  void Write() {
    http::async_write(stream_, http_request_,
                      beast::bind_front_handler(&LocalCall::OnWrite,
                                                this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(ErrorClass::Connect, "write", ec);
      return;
    }
    http::async_read_header(
        stream_, buffer_, parser_,
        beast::bind_front_handler(&LocalCall::OnReadHeader,
                                  this->shared_from_this()));
  }

  void OnReadHeader(const beast::error_code &ec, std::size_t) {
    if (ec) {
      if (ec.category() == http::make_error_code(http::error::end_of_stream).category() ||
          ec == http::error::end_of_stream || ec == net::error::eof) {
        Fail(ErrorClass::LocalNonHttp, "read response", ec);
      } else {
        Fail(ErrorClass::Read, "read response", ec);
      }
      return;
    }
    const auto &res = parser_.get();
    result_.status = res.result_int();
    result_.headers = FilterResponseHeaders(res.base());
    if (parser_.is_done()) {
      Finish();
      return;
    }
    ReadBodyChunk();
  }

  void ReadBodyChunk() {
    auto &body = parser_.get().body();
    body.data = chunk_.data();
    body.size = chunk_.size();
    http::async_read(stream_, buffer_, parser_,
                     beast::bind_front_handler(&LocalCall::OnReadBody,
                                               this->shared_from_this()));
  }

  void OnReadBody(beast::error_code ec, std::size_t) {
    KeepBody(chunk_.size() - parser_.get().body().size);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      Fail(ErrorClass::Read, "read body", ec);
      return;
    }
    // Whatever follows the cap is never read.
    if (parser_.is_done() || result_.truncated) {
      Finish();
      return;
    }
    ReadBodyChunk();
  }

  void KeepBody(std::size_t n) {
    const auto room = request_.max_body_bytes - result_.body.size();
    if (n > room) {
      result_.truncated = true;
      n = room;
    }
    result_.body.append(chunk_.data(), n);
  }

  void Finish() {
    Complete(ErrorClass::None, {});
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().shutdown(
        tcp::socket::shutdown_both, ignore);
  }

  void OnTimeout(const beast::error_code &ec) {
    if (ec == net::error::operation_aborted || completed_) {
      return;
    }
    Complete(ErrorClass::Timeout,
             fmt::format("no response within {} ms", request_.timeout.count()));
    Abort();
  }

  void Abort() {
    resolver_.cancel();
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().cancel(ignore);
    beast::get_lowest_layer(stream_).socket().close(ignore);
  }

  void Fail(ErrorClass error_class, const char *stage,
            const beast::error_code &ec) {
    if (completed_) {
      return;
    }
    Complete(error_class,
             fmt::format("{} {}:{} failed: {}", stage, request_.target.host,
                         request_.target.port, ec.message()));
  }

  void Complete(ErrorClass error_class, std::string reason) {
    if (completed_) {
      return;
    }
    completed_ = true;
    deadline_.cancel();
    result_.attempt_id = request_.attempt_id;
    result_.path = request_.path;
    result_.error_class = error_class;
    result_.reason = std::move(reason);
    if (error_class != ErrorClass::None) {
      result_.status.reset();
      result_.headers.clear();
      result_.body.clear();
    }
    const auto elapsed = std::chrono::ceil<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    result_.elapsed = std::max(std::chrono::milliseconds(1), elapsed);
    result_.finished_at_ms = NowEpochMillis();
    auto callback = std::move(callback_);
    callback(std::move(result_));
  }

  LocalRequest request_;
  LocalDispatcher::Callback callback_;
  tcp::resolver resolver_;
  Stream stream_;
  net::steady_timer deadline_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> http_request_;
  http::response_parser<http::buffer_body> parser_;
  std::array<char, 16 * 1024> chunk_{};
  AttemptResult result_;
  std::chrono::steady_clock::time_point started_;
  bool completed_{false};
};

} // namespace

LocalDispatcher::LocalDispatcher(net::io_context &ioc)
    : ioc_(ioc), ssl_ctx_(ssl::context::tls_client) {
  ssl_ctx_.set_verify_mode(ssl::verify_none);
}

std::shared_ptr<LocalDispatcher::Call>
LocalDispatcher::Dispatch(LocalRequest request, Callback callback) {
  if (request.target.secure()) {
    auto call =
        std::make_shared<LocalCall<beast::ssl_stream<beast::tcp_stream>>>(
            ioc_, std::move(request), std::move(callback), ssl_ctx_);
    call->Start();
    return call;
  }
  auto call = std::make_shared<LocalCall<beast::tcp_stream>>(
      ioc_, std::move(request), std::move(callback));
  call->Start();
  return call;
}

} // namespace hookrelay
