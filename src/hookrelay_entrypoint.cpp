#include <boost/json.hpp>

#include "hookrelay_common.hpp"
#include "hookrelay_entry.hpp"
#include "util/my_logging.hpp"
#include "version.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// HOOKRELAY_CONFIG_DIR, then $XDG_CONFIG_HOME/hookrelay, then
// ~/.config/hookrelay.
fs::path default_config_dir() {
  if (auto dir = get_env_path("HOOKRELAY_CONFIG_DIR"); !dir.empty()) {
    return dir;
  }
  if (auto xdg = get_env_path("XDG_CONFIG_HOME"); !xdg.empty()) {
    return xdg / "hookrelay";
  }
  if (auto home = get_env_path("HOME"); !home.empty()) {
    return home / ".config" / "hookrelay";
  }
  return {};
}

// HOOKRELAY_STATE_DIR, then $XDG_STATE_HOME/hookrelay, then
// ~/.local/state/hookrelay. Holds the rotated log files.
fs::path default_state_dir() {
  if (auto dir = get_env_path("HOOKRELAY_STATE_DIR"); !dir.empty()) {
    return dir;
  }
  if (auto xdg = get_env_path("XDG_STATE_HOME"); !xdg.empty()) {
    return xdg / "hookrelay";
  }
  if (auto home = get_env_path("HOME"); !home.empty()) {
    return home / ".local" / "state" / "hookrelay";
  }
  return fs::temp_directory_path() / "hookrelay";
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

} // namespace

int RunHookrelayApplication(int argc, char *argv[]) {
  std::vector<std::string> args(argv, argv + argc);
  auto parsed = hookrelay::ParseCommandLine(args);
  if (parsed.is_err()) {
    const auto &err = parsed.error();
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cout << err.what << std::endl;
      return EXIT_SUCCESS;
    }
    std::cerr << "error: " << err.what << std::endl
              << "Run 'hookrelay --help' for usage." << std::endl;
    return hookrelay::exit_codes::kBadArgument;
  }
  static std::unique_ptr<hookrelay::CliCtx> cli_ctx = std::move(parsed).value();

  try {
    std::vector<fs::path> ordered_config_dirs;
    const fs::path default_dir = default_config_dir();
    if (!default_dir.empty() && fs::exists(default_dir)) {
      add_unique_path(ordered_config_dirs, default_dir);
    }
    for (const auto &dir : cli_ctx->params.config_dirs) {
      if (!fs::exists(dir)) {
        std::cerr << "Config directory does not exist: " << dir.string()
                  << std::endl;
        return hookrelay::exit_codes::kBadArgument;
      }
      add_unique_path(ordered_config_dirs, dir);
    }
    cli_ctx->params.config_dirs = ordered_config_dirs;

    static hookrelay::ConfigSources config_sources(
        cli_ctx->params.config_dirs, cli_ctx->params.profiles,
        std::map<std::string, std::string>{});

    {
      hookrelay::LoggingConfig logging_config;
      logging_config.log_dir = (default_state_dir() / "logs").string();
      auto configured = config_sources.logging_config();
      if (configured.is_ok()) {
        logging_config = configured.value();
      } else if (configured.error().code !=
                 my_errors::GENERAL::FILE_NOT_FOUND) {
        std::cerr << "Ignoring log_config: " << configured.error().what
                  << std::endl;
      }
      std::error_code ec;
      fs::create_directories(logging_config.log_dir, ec);
      if (ec && !fs::exists(logging_config.log_dir)) {
        std::cerr << "Cannot create log directory '" << logging_config.log_dir
                  << "': " << ec.message() << std::endl;
        return hookrelay::exit_codes::kRuntimeFailure;
      }
      hookrelay::init_my_log(logging_config);
    }

    return hookrelay::launch(config_sources, *cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "fatal: " << e.what() << std::endl;
    return hookrelay::exit_codes::kRuntimeFailure;
  }
}

int main(int argc, char *argv[]) { return RunHookrelayApplication(argc, argv); }
