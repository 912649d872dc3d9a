#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "conf/listen_config.hpp"
#include "control_plane/control_plane_types.hpp"
#include "customio/console_output.hpp"
#include "pipeline/delivery_pipeline.hpp"
#include "tunnel/frame_assembler.hpp"
#include "tunnel/tunnel_messages.hpp"
#include "ui/event_bus.hpp"
#include "util/backoff_utils.hpp"
#include "util/io_context_manager.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

struct TransportEndpoint {
  bool secure{true};
  std::string host;
  std::string port{"443"};
  // Path plus query, always carrying session_id.
  std::string target{"/"};

  std::string url() const;
};

// Picks the dispatcher URL: explicit override, then the URL issued with the
// session, then ws_base_url from the configuration, then api_base_url with
// its scheme switched to ws(s) and path "/ws". use_wss=false downgrades
// wss to ws.
monad::MyResult<TransportEndpoint>
ResolveTransportEndpoint(const ListenConfig &config,
                         const std::string &ws_base_override,
                         const CliSession &session);

// Keeps one WebSocket to the dispatcher open. Reads ATTEMPT frames into the
// attempt sink (pausing while the sink is full), carries results back
// through a bounded outbound queue, answers and sends heartbeats, and
// reconnects with jittered exponential backoff. All state lives on the io
// thread.
class TunnelTransport : public IResultSender,
                        public std::enable_shared_from_this<TunnelTransport> {
public:
  using DoneCallback = std::function<void(monad::MyVoidResult)>;
  using EpochCallback = std::function<void(const std::string &session_id)>;

  TunnelTransport(IoContextManager &io_context_manager,
                  IListenConfigProvider &config_provider, EventBus &event_bus,
                  customio::ConsoleOutput &output);
  ~TunnelTransport() override;

  void SetSink(IAttemptSink *sink) { sink_ = sink; }
  // Called when a WELCOME names a session other than the current one.
  void SetEpochHandler(EpochCallback handler) {
    epoch_handler_ = std::move(handler);
  }

  // Connects and keeps reconnecting until Shutdown() or a terminal error.
  // `done` fires once: Ok after a clean shutdown, LISTEN::DRAIN_TIMEOUT
  // when the drain deadline cut attempts short, LISTEN::REAUTH_REQUIRED
  // when the dispatcher refused the session token.
  void Run(CliSession session, TransportEndpoint endpoint, DoneCallback done);

  // Enters Draining: the sink finishes what it accepted, queued frames are
  // flushed, BYE is sent and the socket closed. Safe from any thread.
  void Shutdown();

  monad::MyVoidResult SendResult(const AttemptResult &result) override;

  TransportState state() const { return state_; }
  const std::string &session_id() const { return session_.id; }
  std::size_t outbound_queued() const;

private:
  class Session;
  template <typename WsStream> class SessionImpl;

  void StartSession();
  void HandleWelcome(const WelcomeFrame &welcome);
  void HandleAttemptFrame(AttemptFrame frame);
  void HandleControl(const ControlFrame &control);
  void HandleSessionClosed(bool should_retry);
  void ScheduleReconnect();
  void BeginDrain(bool shutting_down, const std::string &why);
  void RequireReauth(const std::string &why);
  void Finish(monad::MyVoidResult result);
  void Publish(TransportState state, std::string message,
               std::optional<std::chrono::milliseconds> retry_in = {});
  monad::ExponentialBackoffOptions BuildBackoffOptions() const;

  boost::asio::io_context &ioc_;
  const ListenConfig &config_;
  EventBus &event_bus_;
  customio::ConsoleOutput &output_;
  IAttemptSink *sink_{nullptr};
  EpochCallback epoch_handler_;
  DoneCallback done_;

  CliSession session_;
  TransportEndpoint endpoint_;
  std::shared_ptr<Session> socket_;
  FrameAssembler assembler_;
  TransportState state_{TransportState::Closed};
  std::chrono::milliseconds heartbeat_interval_{30000};

  bool running_{false};
  bool stop_requested_{false};
  bool server_drain_{false};
  bool reauth_required_{false};
  bool drain_clean_{true};
  bool sink_draining_{false};
  int consecutive_failures_{0};

  boost::asio::steady_timer reconnect_timer_;
  boost::asio::steady_timer stable_timer_;
  monad::JitteredExponentialBackoff backoff_;
  std::mt19937 rng_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
