#pragma once

#include <string>
#include <string_view>

#include "util/io_monad.hpp"

namespace hookrelay {

// Local endpoint every route forwards to.
struct ForwardTarget {
  std::string scheme{"http"};
  std::string host{"localhost"};
  std::string port{"80"};
  // Always starts with '/'.
  std::string base_path{"/"};
  // Value for the Host header: host plus port unless it is the default one.
  std::string host_header;

  bool secure() const { return scheme == "https"; }
  std::string url() const;
};

// Accepts a bare port ("3000" -> http://localhost:3000/) or an absolute
// http/https URL without a query string.
monad::MyResult<ForwardTarget> ParseForwardTarget(std::string_view input);

} // namespace hookrelay
