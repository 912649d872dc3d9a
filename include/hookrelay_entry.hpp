#pragma once

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

#include "boost/di.hpp"
#include "conf/config_sources.hpp"
#include "conf/credential_store.hpp"
#include "conf/ioc_config.hpp"
#include "conf/listen_config.hpp"
#include "control_plane/control_plane_client.hpp"
#include "customio/console_output.hpp"
#include "hookrelay_common.hpp"
#include "my_error_codes.hpp"
#include "session/session_bootstrapper.hpp"
#include "supervisor/listen_supervisor.hpp"
#include "ui/event_bus.hpp"
#include "ui/output_mode.hpp"
#include "ui/terminal.hpp"
#include "util/io_context_manager.hpp"
#include "version.h"

namespace di = boost::di;
namespace hookrelay {

class App : public std::enable_shared_from_this<App> {
  hookrelay::CliCtx &cli_ctx_;
  ConfigSources &config_sources_;
  customio::ConsoleOutput *output_hub_{nullptr};
  IoContextManager *io_context_manager_{nullptr};
  Credential credential_;
  std::shared_ptr<ListenSupervisor> supervisor_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::once_flag shutdown_once_flag_;

public:
  App(ConfigSources &config_sources, hookrelay::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources) {}

  void print_error(customio::IOutput &out, const monad::Error &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      out.error() << err.what << std::endl;
    }
  }

  // Returns the process exit code.
  int start() {
    static customio::ConsoleOutputWithColor output_hub(
        cli_ctx_.verbosity_level());

    CredentialStoreFile store(cli_ctx_.params.credentials.value_or(
        CredentialStoreFile::default_path()));
    auto credential = store.load();
    if (credential.is_err()) {
      print_error(output_hub, credential.error());
      return credential.error().code == my_errors::GENERAL::UNAUTHORIZED
                 ? exit_codes::kUnauthorized
                 : exit_codes::kBadArgument;
    }
    credential_ = std::move(credential).value();

    auto validated =
        SessionBootstrapper::Validate(cli_ctx_.bootstrap_request());
    if (validated.is_err()) {
      print_error(output_hub, validated.error());
      return exit_codes::kBadArgument;
    }

    auto injector = di::make_injector(
        di::bind<ConfigSources>().to(config_sources_),
        di::bind<customio::IOutput>().to(output_hub),
        di::bind<IIocConfigProvider>().to<IocConfigProviderFile>(),
        di::bind<IListenConfigProvider>().to<ListenConfigProviderFile>(),
        di::bind<IControlPlaneClient>().to<ControlPlaneClient>(),
        di::bind<Credential>().to(credential_),
        di::bind<hookrelay::CliCtx>().to(cli_ctx_));

    auto &listen_config =
        injector.template create<IListenConfigProvider &>().get();
    cli_ctx_.apply_overrides(listen_config);

    output_hub_ = &injector.template create<customio::ConsoleOutput &>();
    io_context_manager_ = &injector.template create<IoContextManager &>();
    supervisor_ =
        injector.template create<std::shared_ptr<ListenSupervisor>>();

    output_hub_->logger().debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths_) {
      output_hub_->logger().debug() << " - " << source.string() << std::endl;
    }

    SupervisorOptions options;
    options.request = std::move(validated).value();
    options.output_mode = ResolveOutputMode(
        cli_ctx_.output_mode, RawTerminal::StdoutIsTty(), std::getenv("TERM"));
    options.ws_base_override = cli_ctx_.params.ws_base;
    options.version = HOOKRELAY_VERSION;

    signals_ = std::make_unique<boost::asio::signal_set>(
        io_context_manager_->ioc(), SIGINT, SIGTERM);
    watch_signals();

    const int exit_code = supervisor_->Run(std::move(options), std::cout);
    output_hub_->logger().debug()
        << "supervisor returned " << exit_code << std::endl;
    shutdown();
    return exit_code;
  }

  void shutdown() {
    std::call_once(shutdown_once_flag_, [this] {
      output_hub_->logger().debug() << "Shutting down App..." << std::endl;
      if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
      }
      io_context_manager_->stop();
      signals_.reset();
      supervisor_.reset();
      output_hub_->logger().debug() << "App shutdown completed." << std::endl;
    });
  }

private:
  void watch_signals() {
    signals_->async_wait([weak = weak_from_this()](
                             const boost::system::error_code &error,
                             int signal) {
      auto self = weak.lock();
      if (error || !self) {
        return;
      }
      const char *signal_name = (signal == SIGINT) ? "SIGINT" : "SIGTERM";
      self->output_hub_->logger().info()
          << signal_name << " received, shutting down (again to force)."
          << std::endl;
      self->supervisor_->RequestShutdown();
      self->watch_signals();
    });
  }
};

inline int launch(ConfigSources &config, hookrelay::CliCtx &ctx) {
  auto app = std::make_shared<App>(config, ctx);
  return app->start();
}

} // namespace hookrelay
