#include "pipeline/header_policy.hpp"

#include <array>

#include "util/string_util.hpp"

namespace hookrelay {

namespace {

constexpr std::array<std::string_view, 8> kHopByHop{
    "connection", "keep-alive",        "te",      "trailer",
    "trailers",   "transfer-encoding", "upgrade", "host"};

} // namespace

bool IsHopByHopHeader(std::string_view name) {
  if (stringutil::istarts_with(name, "proxy-")) {
    return true;
  }
  for (auto h : kHopByHop) {
    if (stringutil::iequals(name, h)) {
      return true;
    }
  }
  return false;
}

void BuildLocalRequestHeaders(const HeaderList &inbound,
                              const std::string &host_header,
                              const std::string &source_name,
                              const std::string &attempt_id,
                              std::size_t body_size,
                              boost::beast::http::fields &out) {
  bool has_length = false;
  for (const auto &[name, value] : inbound) {
    if (IsHopByHopHeader(name)) {
      continue;
    }
    if (stringutil::iequals(name, "content-length")) {
      if (has_length) {
        continue;
      }
      has_length = true;
      out.insert(name, std::to_string(body_size));
      continue;
    }
    out.insert(name, value);
  }
  out.set(boost::beast::http::field::host, host_header);
  if (!has_length && body_size > 0) {
    out.set(boost::beast::http::field::content_length,
            std::to_string(body_size));
  }
  if (!source_name.empty()) {
    out.insert(kForwardedSourceHeader, source_name);
  }
  out.insert(kForwardedAttemptHeader, attempt_id);
}

HeaderList FilterResponseHeaders(const boost::beast::http::fields &fields) {
  HeaderList out;
  for (const auto &field : fields) {
    const std::string name(field.name_string());
    if (IsHopByHopHeader(name)) {
      continue;
    }
    out.emplace_back(name, std::string(field.value()));
  }
  return out;
}

} // namespace hookrelay
