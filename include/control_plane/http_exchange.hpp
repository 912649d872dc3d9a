#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "my_error_codes.hpp"
#include "util/io_monad.hpp"

namespace hookrelay {

namespace http = boost::beast::http;

// One request/response pair against an absolute URL.
struct HttpExchange {
  bool secure{true};
  std::string host;
  std::string port;
  http::request<http::string_body> request;
  std::optional<http::response<http::string_body>> response;
  std::chrono::milliseconds timeout{15000};

  void setRequestJsonBody(const boost::json::value &body);
  void setBearer(const std::string &token);

  bool is_2xx() const;
  int status() const { return response ? response->result_int() : 0; }

  // Decodes the response body; decode failures come back as
  // JSON::DECODE_ERROR instead of escaping as exceptions.
  template <typename T> monad::MyResult<T> parseJsonResponse() const {
    using R = monad::MyResult<T>;
    if (!response) {
      return R::Err(monad::make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                                      "no response received"));
    }
    try {
      auto jv = boost::json::parse(response->body());
      return R::Ok(boost::json::value_to<T>(jv));
    } catch (const std::exception &ex) {
      return R::Err(monad::make_error(
          my_errors::JSON::DECODE_ERROR,
          std::string("invalid response from ") + host + ": " + ex.what()));
    }
  }
};

using HttpExchangePtr = std::shared_ptr<HttpExchange>;

// Creates an exchange for `url`; fails with GENERAL::INVALID_ARGUMENT when the
// URL is not an absolute http(s) URL.
monad::IO<HttpExchangePtr> http_io(const std::string &url, http::verb verb);

// Performs exchanges on an io_context over plain TCP or TLS.
class HttpClient {
public:
  HttpClient(boost::asio::io_context &ioc, bool verify_tls);

  monad::IO<HttpExchangePtr> send(HttpExchangePtr exchange);

  boost::asio::io_context &ioc() { return ioc_; }

private:
  boost::asio::io_context &ioc_;
  boost::asio::ssl::context ssl_ctx_;
  bool verify_tls_;
};

inline auto http_request_io(HttpClient &client) {
  return [&client](HttpExchangePtr ex) { return client.send(std::move(ex)); };
}

} // namespace hookrelay
