#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "conf/config_sources.hpp"
#include "customio/output.hpp"
#include "my_error_codes.hpp"
#include "util/io_monad.hpp"

namespace hookrelay {

struct ListenConfig {
  std::string api_base_url{"https://api.hookrelay.dev/v1"};
  // Empty means: use the endpoint returned by the session handshake.
  std::string ws_base_url{};
  std::string dashboard_base_url{"https://dashboard.hookrelay.dev"};
  std::string console_base_url{"https://console.hookrelay.dev"};
  bool verify_tls{true};
  bool use_wss{true};

  int request_timeout_ms{30000};
  std::uint64_t max_body_bytes{1024 * 1024};
  int max_concurrent_attempts{16};
  int pending_queue_capacity{256};
  int outbound_queue_capacity{1024};
  int drain_deadline_ms{10000};

  int heartbeat_interval_ms{30000};
  int reconnect_initial_delay_ms{500};
  int reconnect_max_delay_ms{30000};
  double reconnect_jitter_ratio{0.2};
  int stable_window_ms{60000};

  int bootstrap_max_attempts{5};
  int control_plane_timeout_ms{15000};
  int healthcheck_timeout_ms{3000};
  int history_size{200};

  friend ListenConfig tag_invoke(const boost::json::value_to_tag<ListenConfig> &,
                                 const boost::json::value &jv) {
    const auto *obj = jv.if_object();
    if (!obj) {
      throw std::runtime_error("ListenConfig is not an object");
    }
    ListenConfig cfg{};
    auto read_string = [obj](const char *key, std::string &out) {
      if (auto *p = obj->if_contains(key); p && p->is_string()) {
        out = std::string(p->as_string().c_str());
      }
    };
    auto read_int = [obj](const char *key, int &out) {
      if (auto *p = obj->if_contains(key)) {
        out = p->to_number<int>();
      }
    };
    read_string("api_base_url", cfg.api_base_url);
    read_string("ws_base_url", cfg.ws_base_url);
    read_string("dashboard_base_url", cfg.dashboard_base_url);
    read_string("console_base_url", cfg.console_base_url);
    if (auto *p = obj->if_contains("verify_tls")) {
      cfg.verify_tls = p->as_bool();
    }
    if (auto *p = obj->if_contains("use_wss")) {
      cfg.use_wss = p->as_bool();
    }
    read_int("request_timeout_ms", cfg.request_timeout_ms);
    if (auto *p = obj->if_contains("max_body_bytes")) {
      cfg.max_body_bytes = p->to_number<std::uint64_t>();
    }
    read_int("max_concurrent_attempts", cfg.max_concurrent_attempts);
    read_int("pending_queue_capacity", cfg.pending_queue_capacity);
    read_int("outbound_queue_capacity", cfg.outbound_queue_capacity);
    read_int("drain_deadline_ms", cfg.drain_deadline_ms);
    read_int("heartbeat_interval_ms", cfg.heartbeat_interval_ms);
    read_int("reconnect_initial_delay_ms", cfg.reconnect_initial_delay_ms);
    read_int("reconnect_max_delay_ms", cfg.reconnect_max_delay_ms);
    if (auto *p = obj->if_contains("reconnect_jitter_ratio")) {
      cfg.reconnect_jitter_ratio = p->to_number<double>();
    }
    read_int("stable_window_ms", cfg.stable_window_ms);
    read_int("bootstrap_max_attempts", cfg.bootstrap_max_attempts);
    read_int("control_plane_timeout_ms", cfg.control_plane_timeout_ms);
    read_int("healthcheck_timeout_ms", cfg.healthcheck_timeout_ms);
    read_int("history_size", cfg.history_size);
    return cfg;
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const ListenConfig &cfg) {
    jv = boost::json::object{
        {"api_base_url", cfg.api_base_url},
        {"ws_base_url", cfg.ws_base_url},
        {"dashboard_base_url", cfg.dashboard_base_url},
        {"console_base_url", cfg.console_base_url},
        {"verify_tls", cfg.verify_tls},
        {"use_wss", cfg.use_wss},
        {"request_timeout_ms", cfg.request_timeout_ms},
        {"max_body_bytes", cfg.max_body_bytes},
        {"max_concurrent_attempts", cfg.max_concurrent_attempts},
        {"pending_queue_capacity", cfg.pending_queue_capacity},
        {"outbound_queue_capacity", cfg.outbound_queue_capacity},
        {"drain_deadline_ms", cfg.drain_deadline_ms},
        {"heartbeat_interval_ms", cfg.heartbeat_interval_ms},
        {"reconnect_initial_delay_ms", cfg.reconnect_initial_delay_ms},
        {"reconnect_max_delay_ms", cfg.reconnect_max_delay_ms},
        {"reconnect_jitter_ratio", cfg.reconnect_jitter_ratio},
        {"stable_window_ms", cfg.stable_window_ms},
        {"bootstrap_max_attempts", cfg.bootstrap_max_attempts},
        {"control_plane_timeout_ms", cfg.control_plane_timeout_ms},
        {"healthcheck_timeout_ms", cfg.healthcheck_timeout_ms},
        {"history_size", cfg.history_size}};
  }
};

class IListenConfigProvider {
public:
  virtual ~IListenConfigProvider() = default;
  virtual const ListenConfig &get() const = 0;
  virtual ListenConfig &get() = 0;
};

// Loads listen_config.json through ConfigSources; values from the command
// line are applied on top by the entry point through get().
class ListenConfigProviderFile : public IListenConfigProvider {
public:
  ListenConfigProviderFile(ConfigSources &config_sources,
                           customio::IOutput &output) {
    auto result = config_sources.json_content("listen_config");
    if (result.is_err()) {
      if (result.error().code != my_errors::GENERAL::FILE_NOT_FOUND) {
        throw std::runtime_error(result.error().what);
      }
      output.debug() << "listen_config.json not found; using defaults"
                     << std::endl;
      return;
    }
    config_ = boost::json::value_to<ListenConfig>(result.value());
  }

  const ListenConfig &get() const override { return config_; }
  ListenConfig &get() override { return config_; }

private:
  ListenConfig config_{};
};

} // namespace hookrelay
