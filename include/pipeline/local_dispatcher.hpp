#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "session/forward_target.hpp"
#include "tunnel/attempt.hpp"

namespace hookrelay {

struct LocalRequest {
  std::string attempt_id;
  // Inbound path, echoed back in the result.
  std::string path;
  ForwardTarget target;
  std::string method{"POST"};
  // Origin-form target: path plus optional "?query".
  std::string request_target{"/"};
  HeaderList headers;
  std::string body;
  std::string source_name;
  std::chrono::milliseconds timeout{30000};
  std::size_t max_body_bytes{1024 * 1024};
};

// Replays one request against the local server and classifies the outcome:
// Connect (resolve/connect/TLS/write), Timeout (deadline), Read (failure
// after the status line), LocalNonHttp (empty or unparsable reply).
class LocalDispatcher {
public:
  using Callback = std::function<void(AttemptResult)>;

  class Call {
  public:
    virtual ~Call() = default;
    // Completes the call with Timeout and `reason` unless it already
    // finished. The callback still fires exactly once.
    virtual void Cancel(const std::string &reason) = 0;
  };

  explicit LocalDispatcher(boost::asio::io_context &ioc);

  std::shared_ptr<Call> Dispatch(LocalRequest request, Callback callback);

private:
  boost::asio::io_context &ioc_;
  boost::asio::ssl::context ssl_ctx_;
};

} // namespace hookrelay
