#pragma once

#include <boost/beast/http/fields.hpp>

#include <string>
#include <string_view>

#include "tunnel/attempt.hpp"

namespace hookrelay {

inline constexpr const char *kForwardedSourceHeader = "X-Forwarded-Source";
inline constexpr const char *kForwardedAttemptHeader = "X-Forwarded-Attempt-Id";

// Connection, Keep-Alive, Proxy-*, TE, Trailer(s), Transfer-Encoding,
// Upgrade and Host. Fixed list; the inbound Connection header is not
// consulted.
bool IsHopByHopHeader(std::string_view name);

// Fills `out` with the inbound headers minus hop-by-hop ones, in their
// original order and casing, then Host and the attribution headers.
// A Content-Length that disagrees with `body_size` is corrected in place.
void BuildLocalRequestHeaders(const HeaderList &inbound,
                              const std::string &host_header,
                              const std::string &source_name,
                              const std::string &attempt_id,
                              std::size_t body_size,
                              boost::beast::http::fields &out);

HeaderList FilterResponseHeaders(const boost::beast::http::fields &fields);

} // namespace hookrelay
