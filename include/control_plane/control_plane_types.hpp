#pragma once

#include <boost/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hookrelay {

namespace cp_detail {

inline std::string get_string(const boost::json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key); p && p->is_string()) {
    return std::string(p->as_string().c_str());
  }
  return {};
}

inline const boost::json::object &require_object(const boost::json::value &jv,
                                                 const char *what) {
  if (!jv.is_object()) {
    throw std::runtime_error(std::string(what) + " is not an object");
  }
  return jv.as_object();
}

} // namespace cp_detail

struct Source {
  std::string id;
  std::string name;
  // Public ingest URL.
  std::string url;

  friend Source tag_invoke(const boost::json::value_to_tag<Source> &,
                           const boost::json::value &jv) {
    const auto &obj = cp_detail::require_object(jv, "source");
    Source s;
    s.id = cp_detail::get_string(obj, "id");
    if (s.id.empty()) {
      throw std::runtime_error("source missing id");
    }
    s.name = cp_detail::get_string(obj, "name");
    s.url = cp_detail::get_string(obj, "url");
    return s;
  }
};

struct Destination {
  std::string id;
  std::string name;
  std::string type{"CLI"};
  std::string cli_path{"/"};

  friend Destination tag_invoke(const boost::json::value_to_tag<Destination> &,
                                const boost::json::value &jv) {
    const auto &obj = cp_detail::require_object(jv, "destination");
    Destination d;
    d.id = cp_detail::get_string(obj, "id");
    if (d.id.empty()) {
      throw std::runtime_error("destination missing id");
    }
    d.name = cp_detail::get_string(obj, "name");
    if (auto type = cp_detail::get_string(obj, "type"); !type.empty()) {
      d.type = type;
    }
    // Newer API versions nest the path under config.
    std::string path = cp_detail::get_string(obj, "cli_path");
    if (path.empty()) {
      if (auto *cfg = obj.if_contains("config"); cfg && cfg->is_object()) {
        path = cp_detail::get_string(cfg->as_object(), "path");
      }
    }
    if (!path.empty()) {
      d.cli_path = path;
    }
    return d;
  }
};

struct Connection {
  std::string id;
  std::string name;
  std::string full_name;
  Source source;
  Destination destination;

  friend Connection tag_invoke(const boost::json::value_to_tag<Connection> &,
                               const boost::json::value &jv) {
    const auto &obj = cp_detail::require_object(jv, "connection");
    Connection c;
    c.id = cp_detail::get_string(obj, "id");
    if (c.id.empty()) {
      throw std::runtime_error("connection missing id");
    }
    c.name = cp_detail::get_string(obj, "name");
    c.full_name = cp_detail::get_string(obj, "full_name");
    if (auto *p = obj.if_contains("source"); p && p->is_object()) {
      c.source = boost::json::value_to<Source>(*p);
    } else {
      c.source.id = cp_detail::get_string(obj, "source_id");
    }
    if (auto *p = obj.if_contains("destination"); p && p->is_object()) {
      c.destination = boost::json::value_to<Destination>(*p);
    } else {
      c.destination.id = cp_detail::get_string(obj, "destination_id");
    }
    return c;
  }
};

// Reply to POST /cli-sessions.
struct CliSession {
  std::string id;
  std::string token;
  std::string websocket_url;
  std::optional<int> heartbeat_interval_ms;

  friend CliSession tag_invoke(const boost::json::value_to_tag<CliSession> &,
                               const boost::json::value &jv) {
    const auto &obj = cp_detail::require_object(jv, "cli session");
    CliSession s;
    s.id = cp_detail::get_string(obj, "id");
    if (s.id.empty()) {
      s.id = cp_detail::get_string(obj, "session_id");
    }
    if (s.id.empty()) {
      throw std::runtime_error("cli session missing id");
    }
    s.token = cp_detail::get_string(obj, "token");
    s.websocket_url = cp_detail::get_string(obj, "websocket_url");
    if (auto *p = obj.if_contains("heartbeat_interval_ms");
        p && p->is_number()) {
      s.heartbeat_interval_ms = p->to_number<int>();
    }
    return s;
  }
};

// List endpoints answer either a bare array or {"models": [...]}.
template <typename T>
std::vector<T> parse_model_list(const boost::json::value &jv) {
  const boost::json::array *arr = jv.if_array();
  if (!arr) {
    if (auto *obj = jv.if_object()) {
      if (auto *models = obj->if_contains("models")) {
        arr = models->if_array();
      }
    }
  }
  if (!arr) {
    throw std::runtime_error("list response has no models array");
  }
  std::vector<T> out;
  out.reserve(arr->size());
  for (const auto &item : *arr) {
    out.push_back(boost::json::value_to<T>(item));
  }
  return out;
}

} // namespace hookrelay
