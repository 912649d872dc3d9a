#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "conf/credential_store.hpp"
#include "conf/listen_config.hpp"
#include "control_plane/control_plane_client.hpp"
#include "customio/console_output.hpp"
#include "pipeline/delivery_pipeline.hpp"
#include "session/session_bootstrapper.hpp"
#include "tunnel/tunnel_transport.hpp"
#include "ui/event_actions.hpp"
#include "ui/event_bus.hpp"
#include "ui/interactive_renderer.hpp"
#include "ui/log_renderer.hpp"
#include "ui/output_mode.hpp"
#include "util/io_context_manager.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

namespace exit_codes {
inline constexpr int kClean = 0;
inline constexpr int kRuntimeFailure = 1;
inline constexpr int kBadArgument = 2;
inline constexpr int kUnauthorized = 3;
} // namespace exit_codes

// 3 for authentication failures, 2 for argument and resolution errors, 1 for
// everything else.
int ExitCodeFor(const monad::Error &error);

struct SupervisorOptions {
  ValidatedBootstrap request;
  OutputMode output_mode{OutputMode::Log};
  std::string ws_base_override;
  std::string version;
  bool skip_healthcheck{false};
};

// Runs one `listen` invocation: bootstrap, transport plus pipeline, the
// status UI, re-authentication and the drain on shutdown. Work happens on
// the io thread; Run() blocks the calling thread until the exit code is
// known.
class ListenSupervisor
    : public std::enable_shared_from_this<ListenSupervisor> {
public:
  // Re-authentications in a row without reaching Open before giving up.
  static constexpr int kMaxReauthAttempts = 3;

  ListenSupervisor(IoContextManager &io_context_manager,
                   IListenConfigProvider &config_provider,
                   IControlPlaneClient &control_plane,
                   customio::ConsoleOutput &output, const Credential &credential,
                   EventBus &event_bus);
  ~ListenSupervisor();

  // Must not be called from the io thread.
  int Run(SupervisorOptions options, std::ostream &screen);

  // SIGINT/SIGTERM or the q key. The first call drains, a second one gives
  // up on the drain. Safe from any thread.
  void RequestShutdown();

  std::size_t unreported_count() const;

private:
  void Start();
  void OnBootstrapped(BootstrapResult result);
  void StartTransport();
  void OnTransportDone(monad::MyVoidResult result);
  void Reauthenticate();
  void OnEpoch(const std::string &session_id);
  void StartRenderer();
  void StartLogRenderer(OutputMode mode);
  void OnBusEvent(const BusEvent &event);
  void Complete(int exit_code, std::optional<monad::Error> error = {});
  void PrintUnreportedSummary();

  IoContextManager &io_context_manager_;
  boost::asio::io_context &ioc_;
  IListenConfigProvider &config_provider_;
  IControlPlaneClient &control_plane_;
  customio::ConsoleOutput &output_;
  const Credential &credential_;
  EventBus &event_bus_;
  SessionBootstrapper bootstrapper_;
  EventActions actions_;

  SupervisorOptions options_;
  std::ostream *screen_{nullptr};
  std::optional<BootstrapResult> bootstrap_;
  std::shared_ptr<DeliveryPipeline> pipeline_;
  std::shared_ptr<TunnelTransport> transport_;
  std::shared_ptr<InteractiveRenderer> interactive_;
  std::unique_ptr<LogRenderer> log_renderer_;
  EventBus::SubscriptionId subscription_{0};
  std::size_t console_verbosity_{3};

  bool stopping_{false};
  bool completed_{false};
  int reauth_attempts_{0};
  std::atomic<int> shutdown_requests_{0};
  std::promise<int> exit_code_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
