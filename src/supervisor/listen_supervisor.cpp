#include "supervisor/listen_supervisor.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>

#include "my_error_codes.hpp"
#include "util/healthcheck.hpp"

namespace hookrelay {
namespace net = boost::asio;

int ExitCodeFor(const monad::Error &error) {
  switch (error.code) {
  case my_errors::GENERAL::UNAUTHORIZED:
  case my_errors::GENERAL::FORBIDDEN:
  case my_errors::LISTEN::REAUTH_REQUIRED:
  case my_errors::LISTEN::SESSION_REVOKED:
    return exit_codes::kUnauthorized;
  case my_errors::GENERAL::INVALID_ARGUMENT:
  case my_errors::GENERAL::SHOW_OPT_DESC:
  case my_errors::GENERAL::NOT_FOUND:
  case my_errors::GENERAL::CONFLICT:
  case my_errors::GENERAL::FILE_NOT_FOUND:
    return exit_codes::kBadArgument;
  default:
    return exit_codes::kRuntimeFailure;
  }
}

ListenSupervisor::ListenSupervisor(IoContextManager &io_context_manager,
                                   IListenConfigProvider &config_provider,
                                   IControlPlaneClient &control_plane,
                                   customio::ConsoleOutput &output,
                                   const Credential &credential,
                                   EventBus &event_bus)
    : io_context_manager_(io_context_manager),
      ioc_(io_context_manager.ioc()), config_provider_(config_provider),
      control_plane_(control_plane), output_(output), credential_(credential),
      event_bus_(event_bus),
      bootstrapper_(control_plane, io_context_manager, config_provider, output),
      actions_(control_plane, config_provider, credential, event_bus),
      console_verbosity_(output.logger().verbosity()) {}

ListenSupervisor::~ListenSupervisor() {
  if (subscription_ != 0) {
    event_bus_.Unsubscribe(subscription_);
  }
}

int ListenSupervisor::Run(SupervisorOptions options, std::ostream &screen) {
  options_ = std::move(options);
  screen_ = &screen;
  auto exit_code = exit_code_.get_future();

  if (!options_.skip_healthcheck) {
    const auto &target = options_.request.target;
    auto health = CheckServerHealth(
        target, std::chrono::milliseconds(
                    config_provider_.get().healthcheck_timeout_ms));
    if (health.is_err()) {
      output_.logger().warning()
          << "Nothing answers at " << target.url() << " ("
          << health.error().what
          << "). Events will fail until the server starts." << std::endl;
    }
  }

  net::post(ioc_, [self = shared_from_this()] { self->Start(); });
  return exit_code.get();
}

void ListenSupervisor::RequestShutdown() {
  const int request = ++shutdown_requests_;
  net::post(ioc_, [weak = weak_from_this(), request] {
    auto self = weak.lock();
    if (!self || self->completed_) {
      return;
    }
    if (request > 1) {
      self->Complete(exit_codes::kRuntimeFailure,
                     monad::make_error(my_errors::LISTEN::DRAIN_TIMEOUT,
                                       "shutdown forced before the drain "
                                       "finished"));
      return;
    }
    self->stopping_ = true;
    BOOST_LOG_SEV(self->lg, trivial::info) << "shutdown requested";
    if (self->transport_) {
      self->output_.logger().info()
          << "Finishing in-flight deliveries…" << std::endl;
      self->transport_->Shutdown();
    } else {
      self->output_.logger().info()
          << "Stopping once setup completes…" << std::endl;
    }
  });
}

std::size_t ListenSupervisor::unreported_count() const {
  return pipeline_ ? pipeline_->unreported_ids().size() : 0;
}

void ListenSupervisor::Start() {
  std::weak_ptr<ListenSupervisor> weak = weak_from_this();
  subscription_ = event_bus_.Subscribe([weak, this](const BusEvent &event) {
    net::post(ioc_, [weak, event] {
      if (auto self = weak.lock()) {
        self->OnBusEvent(event);
      }
    });
  });

  bootstrapper_.Run(options_.request)
      .run([weak](monad::MyResult<BootstrapResult> r) {
        auto self = weak.lock();
        if (!self || self->completed_) {
          return;
        }
        if (r.is_err()) {
          const int code = ExitCodeFor(r.error()) == exit_codes::kUnauthorized
                               ? exit_codes::kUnauthorized
                               : exit_codes::kBadArgument;
          self->Complete(code, std::move(r.error()));
          return;
        }
        if (self->stopping_) {
          self->Complete(exit_codes::kClean);
          return;
        }
        self->OnBootstrapped(std::move(r).value());
      });
}

void ListenSupervisor::OnBootstrapped(BootstrapResult result) {
  bootstrap_ = std::move(result);
  for (const auto &source : bootstrap_->sources) {
    output_.logger().info() << "Source " << source.name << ": "
                            << (source.url.empty() ? "-" : source.url)
                            << " -> " << bootstrap_->target.url() << std::endl;
  }

  pipeline_ = std::make_shared<DeliveryPipeline>(
      io_context_manager_, config_provider_, control_plane_, event_bus_,
      output_);
  transport_ = std::make_shared<TunnelTransport>(
      io_context_manager_, config_provider_, event_bus_, output_);
  pipeline_->SetRoutes(bootstrap_->routes);
  pipeline_->SetSender(transport_.get());
  transport_->SetSink(pipeline_.get());
  transport_->SetEpochHandler(
      [weak = weak_from_this()](const std::string &session_id) {
        if (auto self = weak.lock()) {
          self->OnEpoch(session_id);
        }
      });

  StartRenderer();
  StartTransport();
}

void ListenSupervisor::StartTransport() {
  auto endpoint = ResolveTransportEndpoint(
      config_provider_.get(), options_.ws_base_override, bootstrap_->session);
  if (endpoint.is_err()) {
    Complete(exit_codes::kBadArgument, std::move(endpoint.error()));
    return;
  }
  set_log_session_id(bootstrap_->session.id);
  BOOST_LOG_SEV(lg, trivial::info)
      << "session " << bootstrap_->session.id << " via "
      << endpoint.value().url();
  transport_->Run(bootstrap_->session, std::move(endpoint).value(),
                  [weak = weak_from_this()](monad::MyVoidResult r) {
                    if (auto self = weak.lock()) {
                      self->OnTransportDone(std::move(r));
                    }
                  });
}

void ListenSupervisor::OnTransportDone(monad::MyVoidResult result) {
  if (result.is_ok()) {
    Complete(exit_codes::kClean);
    return;
  }
  const auto &error = result.error();
  if (error.code == my_errors::LISTEN::REAUTH_REQUIRED) {
    if (stopping_) {
      Complete(exit_codes::kClean);
    } else {
      Reauthenticate();
    }
    return;
  }
  Complete(ExitCodeFor(error), error);
}

void ListenSupervisor::Reauthenticate() {
  if (++reauth_attempts_ > kMaxReauthAttempts) {
    Complete(exit_codes::kUnauthorized,
             monad::make_error(my_errors::LISTEN::REAUTH_REQUIRED,
                               "the dispatcher keeps rejecting new sessions"));
    return;
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "re-authenticating, attempt " << reauth_attempts_;
  bootstrapper_.Run(options_.request)
      .run([weak = weak_from_this()](monad::MyResult<BootstrapResult> r) {
        auto self = weak.lock();
        if (!self || self->completed_) {
          return;
        }
        if (r.is_err()) {
          self->Complete(ExitCodeFor(r.error()), std::move(r.error()));
          return;
        }
        if (self->stopping_) {
          self->Complete(exit_codes::kClean);
          return;
        }
        self->bootstrap_ = std::move(r).value();
        self->pipeline_->SetRoutes(self->bootstrap_->routes);
        if (self->interactive_) {
          self->interactive_->SetRoutes(self->bootstrap_->routes);
        }
        self->StartTransport();
      });
}

void ListenSupervisor::OnEpoch(const std::string &session_id) {
  if (!bootstrap_) {
    return;
  }
  bootstrap_->session.id = session_id;
  set_log_session_id(session_id);
  bootstrapper_
      .RefreshRoutes(*bootstrap_, options_.request.connection_filter)
      .run([weak = weak_from_this()](monad::MyResult<RouteTablePtr> r) {
        auto self = weak.lock();
        if (!self || self->completed_) {
          return;
        }
        if (r.is_err()) {
          self->output_.logger().warning()
              << "Could not refresh routes: " << r.error().what << std::endl;
          return;
        }
        self->bootstrap_->routes = r.value();
        self->pipeline_->SetRoutes(r.value());
        if (self->interactive_) {
          self->interactive_->SetRoutes(r.value());
        }
      });
}

void ListenSupervisor::StartRenderer() {
  if (options_.output_mode != OutputMode::Interactive) {
    StartLogRenderer(options_.output_mode);
    return;
  }
  DashboardHeader header{options_.version, credential_.identity,
                         credential_.project_name};
  interactive_ = std::make_shared<InteractiveRenderer>(
      ioc_, event_bus_, actions_, *screen_, std::move(header),
      bootstrap_->routes,
      static_cast<std::size_t>(std::max(1, config_provider_.get().history_size)));
  std::weak_ptr<ListenSupervisor> weak = weak_from_this();
  auto started = interactive_->Start(
      [weak] {
        if (auto self = weak.lock()) {
          self->RequestShutdown();
        }
      },
      [weak] {
        if (auto self = weak.lock()) {
          self->output_.logger().set_verbosity(self->console_verbosity_);
          self->StartLogRenderer(OutputMode::Log);
        }
      });
  if (started.is_err()) {
    output_.logger().warning() << "Interactive mode unavailable ("
                               << started.error().what
                               << "); using log output." << std::endl;
    interactive_.reset();
    StartLogRenderer(OutputMode::Log);
    return;
  }
  output_.mute_below_error();
}

void ListenSupervisor::StartLogRenderer(OutputMode mode) {
  if (log_renderer_) {
    return;
  }
  log_renderer_ = std::make_unique<LogRenderer>(event_bus_, mode, *screen_);
  log_renderer_->Start();
}

void ListenSupervisor::OnBusEvent(const BusEvent &event) {
  if (const auto *status = std::get_if<TransportStatusEvent>(&event);
      status && status->state == TransportState::Open) {
    reauth_attempts_ = 0;
  }
}

void ListenSupervisor::Complete(int exit_code,
                                std::optional<monad::Error> error) {
  if (completed_) {
    return;
  }
  completed_ = true;
  if (interactive_) {
    interactive_->Stop();
  }
  if (log_renderer_) {
    log_renderer_->Stop();
  }
  if (subscription_ != 0) {
    event_bus_.Unsubscribe(subscription_);
    subscription_ = 0;
  }
  output_.logger().set_verbosity(console_verbosity_);

  if (error) {
    output_.logger().error() << error->what << std::endl;
    BOOST_LOG_SEV(lg, trivial::error) << "listen failed: " << *error;
  }
  PrintUnreportedSummary();
  if (pipeline_) {
    const auto stats = pipeline_->stats();
    BOOST_LOG_SEV(lg, trivial::info)
        << "completed=" << stats.completed << " sent=" << stats.sent
        << " fallback=" << stats.fallback
        << " unreported=" << stats.unreported
        << " unknown_route=" << stats.unknown_route;
  }
  BOOST_LOG_SEV(lg, trivial::info) << "exit code " << exit_code;
  exit_code_.set_value(exit_code);
}

void ListenSupervisor::PrintUnreportedSummary() {
  if (!pipeline_ || pipeline_->unreported_ids().empty()) {
    return;
  }
  const auto &ids = pipeline_->unreported_ids();
  output_.logger().warning()
      << ids.size()
      << " delivery result(s) could not be reported; the dispatcher will "
         "retry them:"
      << std::endl;
  for (const auto &id : ids) {
    output_.logger().warning() << "  " << id << std::endl;
  }
}

} // namespace hookrelay
