#include "control_plane/http_exchange.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>
#include <fmt/format.h>
#include <openssl/err.h>

#include <type_traits>

#include "version.h"

namespace hookrelay {
namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

void HttpExchange::setRequestJsonBody(const boost::json::value &body) {
  request.set(http::field::content_type, "application/json");
  request.body() = boost::json::serialize(body);
  request.prepare_payload();
}

void HttpExchange::setBearer(const std::string &token) {
  request.set(http::field::authorization, "Bearer " + token);
}

bool HttpExchange::is_2xx() const {
  return response && response->result_int() >= 200 &&
         response->result_int() < 300;
}

monad::IO<HttpExchangePtr> http_io(const std::string &url, http::verb verb) {
  using IO = monad::IO<HttpExchangePtr>;
  auto parsed = urls::parse_uri(url);
  if (!parsed) {
    return IO::fail(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("invalid URL '{}': {}", url, parsed.error().message())));
  }
  const auto &u = parsed.value();
  if ((u.scheme() != "http" && u.scheme() != "https") || u.host().empty()) {
    return IO::fail(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          fmt::format("unsupported URL '{}'", url)));
  }
  auto ex = std::make_shared<HttpExchange>();
  ex->secure = u.scheme() == "https";
  ex->host = std::string(u.host());
  ex->port = u.has_port() ? std::string(u.port())
                          : std::string(ex->secure ? "443" : "80");
  std::string target = std::string(u.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (u.has_query()) {
    target += '?';
    target += std::string(u.encoded_query());
  }
  ex->request.version(11);
  ex->request.method(verb);
  ex->request.target(target);
  ex->request.set(http::field::host, ex->host);
  ex->request.set(http::field::user_agent,
                  std::string("hookrelay/") + HOOKRELAY_VERSION);
  ex->request.set(http::field::accept, "application/json");
  return IO::pure(std::move(ex));
}

namespace {

// Resolve, connect, optional TLS handshake, write, read. Reports exactly once.
template <typename Stream>
class HttpCall : public std::enable_shared_from_this<HttpCall<Stream>> {
public:
  using Callback = monad::IO<HttpExchangePtr>::Callback;
  static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

  template <typename... StreamArgs>
  HttpCall(net::io_context &ioc, HttpExchangePtr ex, Callback cb,
           bool verify_tls, StreamArgs &&...args)
      : ex_(std::move(ex)), cb_(std::move(cb)), verify_tls_(verify_tls),
        resolver_(net::make_strand(ioc)),
        stream_(net::make_strand(ioc), std::forward<StreamArgs>(args)...),
        deadline_(ioc) {}

  void Start() {
    auto self = this->shared_from_this();
    deadline_.expires_after(ex_->timeout);
    deadline_.async_wait(
        [self](const beast::error_code &ec) { self->OnTimeout(ec); });
    resolver_.async_resolve(
        ex_->host, ex_->port,
        beast::bind_front_handler(&HttpCall::OnResolve, self));
  }

private:
  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Fail(my_errors::NETWORK::CONNECT_ERROR, "resolve", ec);
      return;
    }
    beast::get_lowest_layer(stream_).async_connect(
        results,
        beast::bind_front_handler(&HttpCall::OnConnect,
                                  this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail(my_errors::NETWORK::CONNECT_ERROR, "connect", ec);
      return;
    }
    if constexpr (kTls) {
      if (verify_tls_) {
        stream_.set_verify_mode(ssl::verify_peer);
      } else {
        stream_.set_verify_mode(ssl::verify_none);
      }
      if (!SSL_set_tlsext_host_name(stream_.native_handle(),
                                    ex_->host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Fail(my_errors::NETWORK::SSL_ERROR, "set_sni", sni_error);
        return;
      }
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&HttpCall::OnHandshake,
                                    this->shared_from_this()));
    } else {
      Write();
    }
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail(my_errors::NETWORK::SSL_ERROR, "tls_handshake", ec);
      return;
    }
    Write();
  }

  void Write() {
    http::async_write(stream_, ex_->request,
                      beast::bind_front_handler(&HttpCall::OnWrite,
                                                this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(my_errors::NETWORK::WRITE_ERROR, "write", ec);
      return;
    }
    http::async_read(stream_, buffer_, response_,
                     beast::bind_front_handler(&HttpCall::OnRead,
                                               this->shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail(my_errors::NETWORK::READ_ERROR, "read", ec);
      return;
    }
    ex_->response = std::move(response_);
    Complete(monad::MyResult<HttpExchangePtr>::Ok(ex_));
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().shutdown(
        tcp::socket::shutdown_both, ignore);
  }

  void OnTimeout(const beast::error_code &ec) {
    if (ec == net::error::operation_aborted || completed_) {
      return;
    }
    Complete(monad::MyResult<HttpExchangePtr>::Err(monad::make_error(
        my_errors::NETWORK::TIMEOUT_ERROR,
        fmt::format("{} {} timed out after {} ms",
                    std::string(ex_->request.method_string()),
                    ex_->host, ex_->timeout.count()))));
    resolver_.cancel();
    beast::get_lowest_layer(stream_).cancel();
  }

  void Fail(int code, const char *stage, const beast::error_code &ec) {
    Complete(monad::MyResult<HttpExchangePtr>::Err(monad::make_error(
        code, fmt::format("{} {}:{} failed: {}", stage, ex_->host, ex_->port,
                          ec.message()))));
  }

  void Complete(monad::MyResult<HttpExchangePtr> result) {
    if (completed_) {
      return;
    }
    completed_ = true;
    deadline_.cancel();
    auto cb = std::move(cb_);
    cb(std::move(result));
  }

  HttpExchangePtr ex_;
  Callback cb_;
  bool verify_tls_;
  bool completed_{false};
  tcp::resolver resolver_;
  Stream stream_;
  net::steady_timer deadline_;
  beast::flat_buffer buffer_;
  http::response<http::string_body> response_;
};

} // namespace

HttpClient::HttpClient(net::io_context &ioc, bool verify_tls)
    : ioc_(ioc), ssl_ctx_(ssl::context::tls_client), verify_tls_(verify_tls) {
  if (verify_tls_) {
    ssl_ctx_.set_default_verify_paths();
  }
}

monad::IO<HttpExchangePtr> HttpClient::send(HttpExchangePtr exchange) {
  return monad::IO<HttpExchangePtr>(
      [this, exchange](monad::IO<HttpExchangePtr>::Callback cb) {
        if (exchange->secure) {
          auto call = std::make_shared<HttpCall<beast::ssl_stream<beast::tcp_stream>>>(
              ioc_, exchange, std::move(cb), verify_tls_, ssl_ctx_);
          call->Start();
        } else {
          auto call = std::make_shared<HttpCall<beast::tcp_stream>>(
              ioc_, exchange, std::move(cb), verify_tls_);
          call->Start();
        }
      });
}

} // namespace hookrelay
