#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "conf/listen_config.hpp"
#include "my_error_codes.hpp"
#include "session/session_bootstrapper.hpp"
#include "ui/output_mode.hpp"
#include "util/io_monad.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace hookrelay {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;

  // listen <target> [<source-query> [<connection-filter>]]
  std::string target;
  std::string source_query;
  std::string connection_filter;
  std::optional<std::string> path;

  std::string output{"interactive"};
  std::string ws_base;
  bool no_wss = false;
  std::optional<double> request_timeout_seconds;
  std::optional<int> max_connections;
  std::optional<fs::path> credentials;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  hookrelay::CliParams params;
  OutputMode output_mode{OutputMode::Interactive};

  CliCtx(po::variables_map &&vm,                 //
         std::vector<std::string> &&positionals, //
         hookrelay::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        params(std::move(params_)) {}

  // True iff the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  std::size_t positional_count() const { return positionals.size(); }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  BootstrapRequest bootstrap_request() const {
    BootstrapRequest request;
    request.target = params.target;
    request.source_query = params.source_query;
    request.connection_filter = params.connection_filter;
    request.path = params.path;
    return request;
  }

  // Command line flags win over listen_config.json.
  void apply_overrides(ListenConfig &config) const {
    if (params.no_wss) {
      config.use_wss = false;
    }
    if (params.request_timeout_seconds) {
      config.request_timeout_ms =
          static_cast<int>(*params.request_timeout_seconds * 1000.0);
    }
    if (params.max_connections) {
      config.max_concurrent_attempts = *params.max_connections;
    }
  }
};

// Option table shared by the parser and --help.
po::options_description MakeVisibleOptions(CliParams &params,
                                           std::vector<std::string> &config_dirs);

// Parses argv into a CliCtx. --help and --version come back as
// GENERAL::SHOW_OPT_DESC with the text to print in `what`; malformed input
// is GENERAL::INVALID_ARGUMENT.
monad::MyResult<std::unique_ptr<CliCtx>>
ParseCommandLine(const std::vector<std::string> &args);

} // namespace hookrelay
