#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "conf/ioc_config.hpp"
#include "conf/listen_config.hpp"
#include "control_plane/control_plane_client.hpp"
#include "customio/console_output.hpp"
#include "my_error_codes.hpp"
#include "util/io_monad.hpp"

namespace testinfra {

using namespace std::chrono_literals;

class TestIocConfigProvider : public hookrelay::IIocConfigProvider {
public:
  TestIocConfigProvider() : config_(1, "hookrelay-test-ioc") {}

  const hookrelay::IocConfig &get() const override { return config_; }

private:
  hookrelay::IocConfig config_;
};

class TestListenConfigProvider : public hookrelay::IListenConfigProvider {
public:
  TestListenConfigProvider() {
    config.verify_tls = false;
    config.use_wss = false;
    config.request_timeout_ms = 2000;
    config.reconnect_initial_delay_ms = 50;
    config.reconnect_max_delay_ms = 200;
    config.reconnect_jitter_ratio = 0.0;
    config.drain_deadline_ms = 2000;
    config.bootstrap_max_attempts = 3;
  }

  const hookrelay::ListenConfig &get() const override { return config; }
  hookrelay::ListenConfig &get() override { return config; }

  hookrelay::ListenConfig config;
};

// Console sink that keeps everything in memory.
struct CapturedOutput {
  std::ostringstream text;
  hookrelay::customio::ConsoleOutputWithColor sink{5, text};
  hookrelay::customio::ConsoleOutput console{sink};
};

// Polls `pred` until it holds or `timeout` passes.
inline bool WaitUntil(const std::function<bool()> &pred,
                      std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// Runs `io` and blocks for its result. Completions may come from the io
// thread (timers) or inline.
template <typename T>
typename hookrelay::monad::IO<T>::ResultType
RunIO(const hookrelay::monad::IO<T> &io,
      std::chrono::milliseconds timeout = 10s) {
  using R = typename hookrelay::monad::IO<T>::ResultType;
  auto promise = std::make_shared<std::promise<R>>();
  auto future = promise->get_future();
  io.run([promise](R r) { promise->set_value(std::move(r)); });
  if (future.wait_for(timeout) != std::future_status::ready) {
    throw std::runtime_error("IO did not complete in time");
  }
  return future.get();
}

// In-memory control plane. Failures are injected per operation; calls and
// fallback submissions are recorded.
class FakeControlPlane : public hookrelay::IControlPlaneClient {
public:
  using Source = hookrelay::Source;
  using Destination = hookrelay::Destination;
  using Connection = hookrelay::Connection;
  using CliSession = hookrelay::CliSession;
  using Error = hookrelay::monad::Error;

  FakeControlPlane() {
    session.id = "ses_1";
    session.token = "tok_1";
  }

  Source &AddSource(const std::string &name) {
    Source s;
    s.id = "src_" + std::to_string(next_id_++);
    s.name = name;
    s.url = "https://in.example.test/" + s.id;
    sources.push_back(s);
    return sources.back();
  }

  Connection &AddCliConnection(const Source &source, const std::string &name,
                               const std::string &cli_path) {
    Connection c;
    c.id = "web_" + std::to_string(next_id_++);
    c.name = name;
    c.source = source;
    c.destination.id = "des_" + std::to_string(next_id_++);
    c.destination.name = name;
    c.destination.type = "CLI";
    c.destination.cli_path = cli_path;
    connections[source.id].push_back(c);
    return connections[source.id].back();
  }

  hookrelay::monad::IO<std::vector<Source>>
  ListSources(const std::string &name) override {
    Record("ListSources:" + name);
    if (auto err = TakeFailure(list_sources_error, list_sources_failures)) {
      return hookrelay::monad::IO<std::vector<Source>>::fail(*err);
    }
    std::vector<Source> out;
    for (const auto &s : sources) {
      if (name.empty() || s.name == name) {
        out.push_back(s);
      }
    }
    return hookrelay::monad::IO<std::vector<Source>>::pure(std::move(out));
  }

  hookrelay::monad::IO<Source> CreateSource(const std::string &name) override {
    Record("CreateSource:" + name);
    return hookrelay::monad::IO<Source>::pure(AddSource(name));
  }

  hookrelay::monad::IO<std::vector<Destination>>
  ListCliDestinations(const std::string &name) override {
    Record("ListCliDestinations:" + name);
    std::vector<Destination> out;
    for (const auto &d : destinations) {
      if (d.name == name) {
        out.push_back(d);
      }
    }
    return hookrelay::monad::IO<std::vector<Destination>>::pure(std::move(out));
  }

  hookrelay::monad::IO<Destination>
  CreateCliDestination(const std::string &name,
                       const std::string &cli_path) override {
    Record("CreateCliDestination:" + name + ":" + cli_path);
    Destination d;
    d.id = "des_" + std::to_string(next_id_++);
    d.name = name;
    d.cli_path = cli_path;
    destinations.push_back(d);
    return hookrelay::monad::IO<Destination>::pure(d);
  }

  hookrelay::monad::IO<Destination>
  UpdateDestinationPath(const std::string &destination_id,
                        const std::string &cli_path) override {
    Record("UpdateDestinationPath:" + destination_id + ":" + cli_path);
    Destination d;
    d.id = destination_id;
    d.cli_path = cli_path;
    return hookrelay::monad::IO<Destination>::pure(d);
  }

  hookrelay::monad::IO<std::vector<Connection>>
  ListConnections(const std::string &source_id) override {
    Record("ListConnections:" + source_id);
    auto it = connections.find(source_id);
    std::vector<Connection> out;
    if (it != connections.end()) {
      out = it->second;
    }
    return hookrelay::monad::IO<std::vector<Connection>>::pure(std::move(out));
  }

  hookrelay::monad::IO<Connection>
  CreateConnection(const std::string &name, const std::string &source_id,
                   const std::string &destination_id) override {
    Record("CreateConnection:" + name);
    Connection c;
    c.id = "web_" + std::to_string(next_id_++);
    c.name = name;
    c.source.id = source_id;
    for (const auto &d : destinations) {
      if (d.id == destination_id) {
        c.destination = d;
      }
    }
    connections[source_id].push_back(c);
    return hookrelay::monad::IO<Connection>::pure(c);
  }

  hookrelay::monad::IO<CliSession>
  OpenSession(const std::vector<std::string> &source_ids,
              const std::vector<std::string> &connection_ids,
              const std::string &device_name) override {
    Record("OpenSession:" + device_name);
    opened_sources = source_ids;
    opened_connections = connection_ids;
    if (auto err = TakeFailure(open_session_error, open_session_failures)) {
      return hookrelay::monad::IO<CliSession>::fail(*err);
    }
    return hookrelay::monad::IO<CliSession>::pure(session);
  }

  hookrelay::monad::IO<void>
  SubmitAttemptResult(const hookrelay::AttemptResult &result) override {
    return hookrelay::monad::IO<void>(
        [this, result](hookrelay::monad::IO<void>::Callback cb) {
          std::unique_lock<std::mutex> lock(mutex_);
          submitted_.push_back(result);
          if (hold_submits) {
            held_submits_.push_back(std::move(cb));
            return;
          }
          auto err = submit_error;
          lock.unlock();
          if (err) {
            cb(hookrelay::monad::MyVoidResult::Err(*err));
          } else {
            cb(hookrelay::monad::MyVoidResult::Ok());
          }
        });
  }

  hookrelay::monad::IO<void> RetryEvent(const std::string &event_id) override {
    Record("RetryEvent:" + event_id);
    if (retry_error) {
      return hookrelay::monad::IO<void>::fail(*retry_error);
    }
    return hookrelay::monad::IO<void>::pure();
  }

  std::vector<hookrelay::AttemptResult> submitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  bool Called(const std::string &prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &c : calls_) {
      if (c.rfind(prefix, 0) == 0) {
        return true;
      }
    }
    return false;
  }

  std::size_t held_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_submits_.size();
  }

  std::vector<Source> sources;
  std::vector<Destination> destinations;
  std::map<std::string, std::vector<Connection>> connections;
  CliSession session;
  std::vector<std::string> opened_sources;
  std::vector<std::string> opened_connections;

  // An error set here fails the next `*_failures` calls (all calls when the
  // count is negative).
  std::optional<Error> list_sources_error;
  int list_sources_failures{-1};
  std::optional<Error> open_session_error;
  int open_session_failures{-1};
  std::optional<Error> submit_error;
  std::optional<Error> retry_error;
  // Fallback submissions never complete while set.
  bool hold_submits{false};

private:
  void Record(std::string call) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(std::move(call));
  }

  static std::optional<Error> TakeFailure(const std::optional<Error> &error,
                                          int &remaining) {
    if (!error || remaining == 0) {
      return std::nullopt;
    }
    if (remaining > 0) {
      --remaining;
    }
    return error;
  }

  int next_id_{1};
  mutable std::mutex mutex_;
  std::vector<std::string> calls_;
  std::vector<hookrelay::AttemptResult> submitted_;
  std::vector<hookrelay::monad::IO<void>::Callback> held_submits_;
};

} // namespace testinfra
