#include "util/healthcheck.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <fmt/format.h>
#include <openssl/err.h>

#include "my_error_codes.hpp"

namespace hookrelay {
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

monad::MyVoidResult CheckServerHealth(const ForwardTarget &target,
                                      std::chrono::milliseconds timeout) {
  net::io_context ioc;
  ssl::context ssl_ctx(ssl::context::tls_client);
  ssl_ctx.set_verify_mode(ssl::verify_none);
  tcp::resolver resolver(ioc);
  ssl::stream<tcp::socket> stream(ioc, ssl_ctx);

  boost::system::error_code result_ec = net::error::timed_out;
  const char *stage = "connect";

  resolver.async_resolve(
      target.host, target.port,
      [&](const boost::system::error_code &ec,
          tcp::resolver::results_type results) {
        if (ec) {
          stage = "resolve";
          result_ec = ec;
          return;
        }
        net::async_connect(
            stream.next_layer(), results,
            [&](const boost::system::error_code &cec, const tcp::endpoint &) {
              if (cec || !target.secure()) {
                result_ec = cec;
                return;
              }
              stage = "tls handshake";
              if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                            target.host.c_str())) {
                result_ec = {static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category()};
                return;
              }
              stream.async_handshake(
                  ssl::stream_base::client,
                  [&](const boost::system::error_code &hec) {
                    result_ec = hec;
                  });
            });
      });

  ioc.run_for(timeout);
  if (!ioc.stopped()) {
    // Deadline hit with work still pending; drop it before the locals go.
    boost::system::error_code ignore;
    stream.next_layer().close(ignore);
    resolver.cancel();
    ioc.restart();
    ioc.poll();
    result_ec = net::error::timed_out;
  }
  if (result_ec) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::NETWORK::CONNECT_ERROR,
        fmt::format("{} {}:{} failed: {}", stage, target.host, target.port,
                    result_ec.message())));
  }
  return monad::MyVoidResult::Ok();
}

} // namespace hookrelay
