#include "session/forward_target.hpp"

#include <boost/url.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "my_error_codes.hpp"

namespace hookrelay {
namespace urls = boost::urls;

namespace {

bool IsAllDigits(std::string_view value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

monad::MyResult<int> ParsePort(std::string_view value) {
  if (!IsAllDigits(value) || value.size() > 5) {
    return monad::MyResult<int>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("invalid port '{}'", value)));
  }
  const int port = std::stoi(std::string(value));
  if (port < 1 || port > 65535) {
    return monad::MyResult<int>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("port {} out of range 1-65535", port)));
  }
  return monad::MyResult<int>::Ok(port);
}

} // namespace

std::string ForwardTarget::url() const {
  std::string out = scheme + "://" + host;
  const bool default_port = (scheme == "http" && port == "80") ||
                            (scheme == "https" && port == "443");
  if (!default_port) {
    out += ':';
    out += port;
  }
  out += base_path;
  return out;
}

monad::MyResult<ForwardTarget> ParseForwardTarget(std::string_view input) {
  using R = monad::MyResult<ForwardTarget>;
  if (IsAllDigits(input)) {
    auto port = ParsePort(input);
    if (port.is_err()) {
      return R::Err(port.error());
    }
    ForwardTarget target;
    target.port = std::to_string(port.value());
    target.host_header = "localhost:" + target.port;
    return R::Ok(std::move(target));
  }

  auto parsed = urls::parse_uri(input);
  if (!parsed) {
    return R::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("invalid forwarding URL '{}': {}", input,
                    parsed.error().message())));
  }
  const auto &url = parsed.value();
  const std::string scheme = std::string(url.scheme());
  if (scheme != "http" && scheme != "https") {
    return R::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("forwarding URL must use http or https (got '{}')",
                    scheme)));
  }
  if (!url.has_authority() || url.host().empty()) {
    return R::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          fmt::format("forwarding URL missing host: '{}'",
                                      input)));
  }
  if (url.has_query()) {
    return R::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("forwarding URL must not contain a query string: '{}'",
                    input)));
  }

  ForwardTarget target;
  target.scheme = scheme;
  target.host = std::string(url.host());
  const std::string default_port = scheme == "https" ? "443" : "80";
  if (url.has_port()) {
    auto port = ParsePort(url.port());
    if (port.is_err()) {
      return R::Err(port.error());
    }
    target.port = std::to_string(port.value());
  } else {
    target.port = default_port;
  }
  std::string base_path = std::string(url.encoded_path());
  if (base_path.empty() || base_path.front() != '/') {
    base_path.insert(base_path.begin(), '/');
  }
  target.base_path = std::move(base_path);
  target.host_header = target.host;
  if (target.port != default_port) {
    target.host_header += ':';
    target.host_header += target.port;
  }
  return R::Ok(std::move(target));
}

} // namespace hookrelay
