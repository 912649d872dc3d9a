#include "tunnel/tunnel_messages.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>

#include "openssl/openssl_util.hpp"

namespace hookrelay {
namespace json = boost::json;

std::string_view to_string(ErrorClass error_class) {
  switch (error_class) {
  case ErrorClass::None:
    return "none";
  case ErrorClass::Connect:
    return "connect";
  case ErrorClass::Timeout:
    return "timeout";
  case ErrorClass::Read:
    return "read";
  case ErrorClass::LocalNonHttp:
    return "local-nonhttp";
  }
  return "none";
}

std::optional<ErrorClass> error_class_from_string(std::string_view value) {
  if (value == "none") {
    return ErrorClass::None;
  }
  if (value == "connect") {
    return ErrorClass::Connect;
  }
  if (value == "timeout") {
    return ErrorClass::Timeout;
  }
  if (value == "read") {
    return ErrorClass::Read;
  }
  if (value == "local-nonhttp" || value == "local_nonhttp") {
    return ErrorClass::LocalNonHttp;
  }
  return std::nullopt;
}

namespace {

const json::object &RequireObject(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format("{} must be an object", ctx));
  }
  return jv.as_object();
}

// Frames put their payload either under "body" or at the top level.
const json::object &Payload(const json::object &obj) {
  if (auto *p = obj.if_contains("body")) {
    if (p->is_object()) {
      return p->as_object();
    }
  }
  return obj;
}

std::string RequireString(const json::object &obj, const char *key,
                          const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return std::string(p->as_string().c_str());
    }
  }
  throw std::runtime_error(
      fmt::format("{} missing string field '{}'", ctx, key));
}

std::string OptString(const json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return std::string(p->as_string().c_str());
    }
    if (p->is_int64()) {
      return std::to_string(p->as_int64());
    }
  }
  return {};
}

std::optional<std::int64_t> OptInt(const json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_int64()) {
      return p->as_int64();
    }
    if (p->is_uint64()) {
      return static_cast<std::int64_t>(p->as_uint64());
    }
    if (p->is_double()) {
      return static_cast<std::int64_t>(p->as_double());
    }
  }
  return std::nullopt;
}

std::uint64_t RequireToken(const json::object &obj, const char *ctx) {
  if (auto *p = obj.if_contains("token")) {
    if (p->is_uint64()) {
      return p->as_uint64();
    }
    if (p->is_int64() && p->as_int64() >= 0) {
      return static_cast<std::uint64_t>(p->as_int64());
    }
  }
  throw std::runtime_error(fmt::format("{} missing integer field 'token'", ctx));
}

bool OptBool(const json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_bool()) {
      return p->as_bool();
    }
  }
  return false;
}

// Headers arrive either as an object (document order is kept) or as an
// array of [name, value] pairs, which is the only way to carry duplicates.
HeaderList ParseHeaders(const json::value &jv, const char *ctx) {
  HeaderList headers;
  if (jv.is_object()) {
    for (const auto &kv : jv.as_object()) {
      if (kv.value().is_string()) {
        headers.emplace_back(std::string(kv.key()),
                             std::string(kv.value().as_string().c_str()));
      } else if (kv.value().is_array()) {
        for (const auto &v : kv.value().as_array()) {
          if (!v.is_string()) {
            throw std::runtime_error(fmt::format(
                "{} header '{}' has a non-string value", ctx, kv.key()));
          }
          headers.emplace_back(std::string(kv.key()),
                               std::string(v.as_string().c_str()));
        }
      } else {
        throw std::runtime_error(
            fmt::format("{} header '{}' is not string", ctx, kv.key()));
      }
    }
    return headers;
  }
  if (jv.is_array()) {
    for (const auto &entry : jv.as_array()) {
      if (!entry.is_array() || entry.as_array().size() != 2 ||
          !entry.as_array()[0].is_string() ||
          !entry.as_array()[1].is_string()) {
        throw std::runtime_error(
            fmt::format("{} header entries must be [name, value]", ctx));
      }
      const auto &pair = entry.as_array();
      headers.emplace_back(std::string(pair[0].as_string().c_str()),
                           std::string(pair[1].as_string().c_str()));
    }
    return headers;
  }
  if (jv.is_null()) {
    return headers;
  }
  throw std::runtime_error(fmt::format("{} headers must be object", ctx));
}

json::array HeadersToJson(const HeaderList &headers) {
  json::array arr;
  arr.reserve(headers.size());
  for (const auto &[name, value] : headers) {
    arr.push_back(json::array{json::value(name), json::value(value)});
  }
  return arr;
}

// Body bytes: "data_base64" wins, a string "data" is taken verbatim, any
// other JSON "data" is re-serialised.
std::string ReadBodyBytes(const json::object &obj, const char *ctx) {
  if (auto *p = obj.if_contains("data_base64")) {
    if (!p->is_string()) {
      throw std::runtime_error(fmt::format("{} data_base64 must be string", ctx));
    }
    auto decoded = opensslutil::base64_decode(p->as_string().c_str());
    if (decoded.is_err()) {
      throw std::runtime_error(
          fmt::format("{} data_base64: {}", ctx, decoded.error().what));
    }
    return decoded.value();
  }
  if (auto *p = obj.if_contains("data")) {
    if (p->is_string()) {
      const auto &s = p->as_string();
      return std::string(s.data(), s.size());
    }
    if (p->is_null()) {
      return {};
    }
    return json::serialize(*p);
  }
  return {};
}

std::optional<FramePart> ReadPart(const json::object &obj) {
  const json::value *p = obj.if_contains("part");
  if (!p || !p->is_object()) {
    return std::nullopt;
  }
  const auto &part_obj = p->as_object();
  const auto index = OptInt(part_obj, "index").value_or(0);
  const auto total = OptInt(part_obj, "total").value_or(1);
  if (total < 1 || total > kMaxAttemptParts) {
    throw std::runtime_error(fmt::format(
        "attempt part count {} outside 1..{}", total, kMaxAttemptParts));
  }
  if (index < 0 || index >= total) {
    throw std::runtime_error(
        fmt::format("attempt part {}/{} out of range", index, total));
  }
  FramePart part;
  part.index = static_cast<int>(index);
  part.total = static_cast<int>(total);
  return part;
}

} // namespace

FrameKind PeekFrameKind(const json::value &jv) {
  if (!jv.is_object()) {
    return FrameKind::Unknown;
  }
  const auto &obj = jv.as_object();
  const json::value *p = obj.if_contains("event");
  if (!p) {
    p = obj.if_contains("type");
  }
  if (!p || !p->is_string()) {
    return FrameKind::Unknown;
  }
  std::string_view kind = p->as_string();
  if (kind == "hello") {
    return FrameKind::Hello;
  }
  if (kind == "connect_response" || kind == "welcome") {
    return FrameKind::Welcome;
  }
  if (kind == "ping") {
    return FrameKind::Ping;
  }
  if (kind == "pong") {
    return FrameKind::Pong;
  }
  if (kind == "attempt") {
    return FrameKind::Attempt;
  }
  if (kind == "attempt_response") {
    return FrameKind::AttemptResult;
  }
  if (kind == "control") {
    return FrameKind::Control;
  }
  if (kind == "bye") {
    return FrameKind::Bye;
  }
  return FrameKind::Unknown;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const HelloFrame &hello) {
  json::array caps;
  for (const auto &c : hello.capabilities) {
    caps.emplace_back(c);
  }
  json::array connections;
  for (const auto &c : hello.connection_ids) {
    connections.emplace_back(c);
  }
  json::object obj{{"event", "hello"},
                   {"session_id", hello.session_id},
                   {"token", hello.token},
                   {"client_version", hello.client_version},
                   {"capabilities", std::move(caps)},
                   {"connection_ids", std::move(connections)}};
  if (!hello.source_id.empty()) {
    obj["source_id"] = hello.source_id;
  }
  jv = std::move(obj);
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const WelcomeFrame &welcome) {
  json::object obj{{"event", "connect_response"},
                   {"session_id", welcome.session_id}};
  if (welcome.heartbeat_interval_ms) {
    obj["heartbeat_interval_ms"] = *welcome.heartbeat_interval_ms;
  }
  if (!welcome.notice.empty()) {
    obj["notice"] = welcome.notice;
  }
  if (!welcome.error.empty()) {
    obj["error"] = welcome.error;
  }
  jv = std::move(obj);
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const PingFrame &ping) {
  jv = json::object{{"event", "ping"}, {"token", ping.token}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const PongFrame &pong) {
  jv = json::object{{"event", "pong"}, {"token", pong.token}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const AttemptFrame &frame) {
  const auto &a = frame.attempt;
  json::object request{{"method", a.method},
                       {"headers", HeadersToJson(a.headers)}};
  if (opensslutil::is_valid_utf8(a.body)) {
    request["data"] = a.body;
  } else {
    request["data_base64"] = opensslutil::base64_encode(a.body);
  }
  if (a.timeout_ms) {
    request["timeout"] = *a.timeout_ms;
  }
  json::object body{{"attempt_id", a.attempt_id},
                    {"webhook_id", a.connection_id},
                    {"cli_path", a.path},
                    {"attempt_number", a.attempt_number},
                    {"request", std::move(request)}};
  if (!a.query.empty()) {
    body["query"] = a.query;
  }
  if (!a.requested_at.empty()) {
    body["requested_at"] = a.requested_at;
  }
  if (!a.event_id.empty()) {
    body["event_id"] = a.event_id;
  }
  json::object obj{{"event", "attempt"}, {"body", std::move(body)}};
  if (frame.part) {
    obj["part"] =
        json::object{{"index", frame.part->index}, {"total", frame.part->total}};
  }
  jv = std::move(obj);
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const AttemptResultFrame &frame) {
  const auto &r = frame.result;
  json::object body{{"attempt_id", r.attempt_id},
                    {"cli_path", r.path},
                    {"headers", HeadersToJson(r.headers)},
                    {"truncated", r.truncated},
                    {"duration_ms", r.elapsed.count()},
                    {"finished_at", r.finished_at_ms}};
  if (r.status) {
    body["status"] = *r.status;
  }
  if (opensslutil::is_valid_utf8(r.body)) {
    body["data"] = r.body;
  } else {
    body["data"] = opensslutil::base64_encode(r.body);
    body["body_encoding"] = "base64";
  }
  if (!r.ok()) {
    body["error"] = true;
    body["error_class"] = std::string(to_string(r.error_class));
    body["reason"] = r.reason;
  }
  jv = json::object{{"event", "attempt_response"}, {"body", std::move(body)}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const ControlFrame &control) {
  std::string kind = control.raw_kind;
  if (kind.empty()) {
    switch (control.kind) {
    case ControlKind::RateLimit:
      kind = "rate_limit";
      break;
    case ControlKind::SessionRevoked:
      kind = "session_revoked";
      break;
    case ControlKind::Drain:
      kind = "drain";
      break;
    case ControlKind::Unknown:
      kind = "unknown";
      break;
    }
  }
  json::object obj{{"event", "control"}, {"kind", kind}};
  if (!control.message.empty()) {
    obj["message"] = control.message;
  }
  jv = std::move(obj);
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const ByeFrame &bye) {
  json::object obj{{"event", "bye"}};
  if (!bye.reason.empty()) {
    obj["reason"] = bye.reason;
  }
  jv = std::move(obj);
}

HelloFrame tag_invoke(const json::value_to_tag<HelloFrame> &,
                      const json::value &jv) {
  const auto &obj = Payload(RequireObject(jv, "HelloFrame"));
  HelloFrame hello;
  hello.session_id = RequireString(obj, "session_id", "HelloFrame");
  hello.token = RequireString(obj, "token", "HelloFrame");
  hello.client_version = OptString(obj, "client_version");
  hello.source_id = OptString(obj, "source_id");
  if (auto *p = obj.if_contains("capabilities"); p && p->is_array()) {
    for (const auto &c : p->as_array()) {
      if (c.is_string()) {
        hello.capabilities.emplace_back(c.as_string().c_str());
      }
    }
  }
  if (auto *p = obj.if_contains("connection_ids"); p && p->is_array()) {
    for (const auto &c : p->as_array()) {
      if (c.is_string()) {
        hello.connection_ids.emplace_back(c.as_string().c_str());
      }
    }
  }
  return hello;
}

WelcomeFrame tag_invoke(const json::value_to_tag<WelcomeFrame> &,
                        const json::value &jv) {
  const auto &obj = Payload(RequireObject(jv, "WelcomeFrame"));
  WelcomeFrame welcome;
  welcome.session_id = OptString(obj, "session_id");
  if (auto hb = OptInt(obj, "heartbeat_interval_ms")) {
    welcome.heartbeat_interval_ms = static_cast<int>(*hb);
  }
  welcome.notice = OptString(obj, "notice");
  welcome.error = OptString(obj, "error");
  return welcome;
}

PingFrame tag_invoke(const json::value_to_tag<PingFrame> &,
                     const json::value &jv) {
  const auto &obj = Payload(RequireObject(jv, "PingFrame"));
  return PingFrame{RequireToken(obj, "PingFrame")};
}

PongFrame tag_invoke(const json::value_to_tag<PongFrame> &,
                     const json::value &jv) {
  const auto &obj = Payload(RequireObject(jv, "PongFrame"));
  return PongFrame{RequireToken(obj, "PongFrame")};
}

AttemptFrame tag_invoke(const json::value_to_tag<AttemptFrame> &,
                        const json::value &jv) {
  const auto &top = RequireObject(jv, "AttemptFrame");
  const auto &body = Payload(top);
  AttemptFrame frame;
  frame.part = ReadPart(top);
  if (!frame.part) {
    frame.part = ReadPart(body);
  }
  auto &a = frame.attempt;
  a.attempt_id = RequireString(body, "attempt_id", "AttemptFrame");

  const bool continuation = frame.part && frame.part->index > 0;
  const json::object *request = nullptr;
  if (auto *p = body.if_contains("request")) {
    request = &RequireObject(*p, "AttemptFrame.request");
  }
  if (continuation) {
    a.body = ReadBodyBytes(request ? *request : body, "AttemptFrame");
    return frame;
  }

  a.connection_id = OptString(body, "webhook_id");
  if (a.connection_id.empty()) {
    a.connection_id = OptString(body, "connection_id");
  }
  if (a.connection_id.empty()) {
    throw std::runtime_error("AttemptFrame missing string field 'webhook_id'");
  }
  a.path = OptString(body, "cli_path");
  if (a.path.empty()) {
    a.path = "/";
  }
  if (auto q = a.path.find('?'); q != std::string::npos) {
    a.query = a.path.substr(q + 1);
    a.path.erase(q);
  }
  if (auto query = OptString(body, "query"); !query.empty()) {
    a.query = query.front() == '?' ? query.substr(1) : query;
  }
  a.requested_at = OptString(body, "requested_at");
  a.event_id = OptString(body, "event_id");
  if (auto n = OptInt(body, "attempt_number")) {
    a.attempt_number = static_cast<int>(*n);
  }

  if (!request) {
    throw std::runtime_error("AttemptFrame missing object field 'request'");
  }
  a.method = RequireString(*request, "method", "AttemptFrame.request");
  if (auto *h = request->if_contains("headers")) {
    a.headers = ParseHeaders(*h, "AttemptFrame.request");
  }
  a.body = ReadBodyBytes(*request, "AttemptFrame.request");
  if (auto t = OptInt(*request, "timeout"); t && *t > 0) {
    a.timeout_ms = static_cast<int>(*t);
  }
  return frame;
}

AttemptResultFrame
tag_invoke(const json::value_to_tag<AttemptResultFrame> &,
           const json::value &jv) {
  const auto &body = Payload(RequireObject(jv, "AttemptResultFrame"));
  AttemptResultFrame frame;
  auto &r = frame.result;
  r.attempt_id = RequireString(body, "attempt_id", "AttemptResultFrame");
  r.path = OptString(body, "cli_path");
  if (auto s = OptInt(body, "status")) {
    r.status = static_cast<int>(*s);
  }
  if (auto *h = body.if_contains("headers")) {
    r.headers = ParseHeaders(*h, "AttemptResultFrame");
  }
  if (OptString(body, "body_encoding") == "base64") {
    json::object tmp{{"data_base64", OptString(body, "data")}};
    r.body = ReadBodyBytes(tmp, "AttemptResultFrame");
  } else {
    r.body = ReadBodyBytes(body, "AttemptResultFrame");
  }
  r.truncated = OptBool(body, "truncated");
  r.elapsed = std::chrono::milliseconds(OptInt(body, "duration_ms").value_or(0));
  r.finished_at_ms = OptInt(body, "finished_at").value_or(0);
  r.reason = OptString(body, "reason");
  if (OptBool(body, "error")) {
    r.error_class = error_class_from_string(OptString(body, "error_class"))
                        .value_or(ErrorClass::LocalNonHttp);
  }
  return frame;
}

ControlFrame tag_invoke(const json::value_to_tag<ControlFrame> &,
                        const json::value &jv) {
  const auto &obj = Payload(RequireObject(jv, "ControlFrame"));
  ControlFrame control;
  control.raw_kind = RequireString(obj, "kind", "ControlFrame");
  if (control.raw_kind == "rate_limit") {
    control.kind = ControlKind::RateLimit;
  } else if (control.raw_kind == "session_revoked") {
    control.kind = ControlKind::SessionRevoked;
  } else if (control.raw_kind == "drain") {
    control.kind = ControlKind::Drain;
  }
  control.message = OptString(obj, "message");
  return control;
}

ByeFrame tag_invoke(const json::value_to_tag<ByeFrame> &,
                    const json::value &jv) {
  const auto &obj = Payload(RequireObject(jv, "ByeFrame"));
  return ByeFrame{OptString(obj, "reason")};
}

} // namespace hookrelay
