#include "hookrelay_common.hpp"

#include <sstream>

#include "version.h"

namespace hookrelay {

namespace {

monad::MyResult<std::unique_ptr<CliCtx>> bad_argument(std::string what) {
  return monad::MyResult<std::unique_ptr<CliCtx>>::Err(
      monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT, std::move(what)));
}

std::string usage_text(const po::options_description &visible) {
  std::ostringstream oss;
  oss << "Usage: hookrelay listen <port-or-url> [<source-query> "
         "[<connection-filter>]] [options]"
      << "\n\n"
      << "  <port-or-url>        local port (3000) or base URL "
         "(http://localhost:3000/api)\n"
      << "  <source-query>       source alias, comma separated list, or '*'\n"
      << "  <connection-filter>  connection name, or a path fragment "
         "starting with '/'\n\n"
      << visible;
  return oss.str();
}

} // namespace

po::options_description
MakeVisibleOptions(CliParams &params, std::vector<std::string> &config_dirs) {
  po::options_description desc("Options");
  desc.add_options() //
      ("path", po::value<std::string>()->value_name("PATH")->notifier(
                   [&params](const std::string &v) { params.path = v; }),
       "destination CLI path (single source only)") //
      ("output",
       po::value<std::string>(&params.output)->default_value("interactive"),
       "interactive | log | compact | quiet") //
      ("request-timeout",
       po::value<double>()->value_name("SECONDS")->notifier(
           [&params](double v) { params.request_timeout_seconds = v; }),
       "timeout of each local request") //
      ("max-connections",
       po::value<int>()->value_name("N")->notifier(
           [&params](int v) { params.max_connections = v; }),
       "maximum concurrent local requests") //
      ("config-dirs,c",
       po::value<std::vector<std::string>>(&config_dirs)
           ->multitoken()
           ->composing(),
       "paths of the configuration directories.") //
      ("profiles",
       po::value<std::vector<std::string>>(&params.profiles)->multitoken(),
       "profiles to use from the configuration directories.") //
      ("credentials",
       po::value<std::string>()->value_name("FILE")->notifier(
           [&params](const std::string &v) { params.credentials = v; }),
       "credential file written by the login flow") //
      ("verbose",
       po::value<std::string>(&params.verbose)->default_value("info"),
       "verbosity level, like info, trace, vvvv.") //
      ("silent", po::bool_switch(&params.silent)->default_value(false),
       "suppress console output.") //
      ("version,v", "print the version") //
      ("help,h", "print help");
  return desc;
}

monad::MyResult<std::unique_ptr<CliCtx>>
ParseCommandLine(const std::vector<std::string> &args) {
  CliParams params;
  std::vector<std::string> config_dirs_args;
  po::options_description visible =
      MakeVisibleOptions(params, config_dirs_args);

  po::options_description hidden("Hidden options");
  hidden.add_options() //
      ("ws-base", po::value<std::string>(&params.ws_base),
       "override the dispatcher WebSocket endpoint") //
      ("no-wss", po::bool_switch(&params.no_wss)->default_value(false),
       "connect with ws:// instead of wss://") //
      ("positionals",
       po::value<std::vector<std::string>>()->default_value({}, ""),
       "all positional arguments");

  po::options_description all("Allowed options");
  all.add(visible).add(hidden);
  po::positional_options_description p;
  p.add("positionals", -1);

  std::vector<const char *> argv;
  argv.reserve(args.size());
  for (const auto &a : args) {
    argv.push_back(a.c_str());
  }

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(static_cast<int>(argv.size()),
                                      argv.data())
                  .options(all)
                  .positional(p)
                  .run(),
              vm);
    if (vm.count("help")) {
      return monad::MyResult<std::unique_ptr<CliCtx>>::Err(monad::make_error(
          my_errors::GENERAL::SHOW_OPT_DESC, usage_text(visible)));
    }
    if (vm.count("version")) {
      return monad::MyResult<std::unique_ptr<CliCtx>>::Err(
          monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC, HOOKRELAY_VERSION));
    }
    po::notify(vm);
  } catch (const po::error &e) {
    return bad_argument(e.what());
  }

  for (const auto &dir : config_dirs_args) {
    params.config_dirs.emplace_back(dir);
  }
  if (params.profiles.empty()) {
    params.profiles.push_back("default");
  }

  auto positionals = vm["positionals"].as<std::vector<std::string>>();
  if (positionals.empty()) {
    return monad::MyResult<std::unique_ptr<CliCtx>>::Err(monad::make_error(
        my_errors::GENERAL::SHOW_OPT_DESC, usage_text(visible)));
  }
  params.subcmd = positionals[0];
  if (params.subcmd != "listen") {
    return bad_argument("unknown command '" + params.subcmd +
                        "'; expected 'listen'");
  }
  if (positionals.size() < 2) {
    return bad_argument("listen needs a port or URL to forward to");
  }
  if (positionals.size() > 4) {
    return bad_argument("too many arguments after '" + positionals[3] + "'");
  }
  params.target = positionals[1];
  if (positionals.size() > 2) {
    params.source_query = positionals[2];
  }
  if (positionals.size() > 3) {
    params.connection_filter = positionals[3];
  }

  if (params.request_timeout_seconds && *params.request_timeout_seconds <= 0) {
    return bad_argument("--request-timeout must be positive");
  }
  if (params.max_connections && *params.max_connections <= 0) {
    return bad_argument("--max-connections must be positive");
  }
  auto mode = ParseOutputMode(params.output);
  if (mode.is_err()) {
    return monad::MyResult<std::unique_ptr<CliCtx>>::Err(
        std::move(mode.error()));
  }

  auto ctx = std::make_unique<CliCtx>(std::move(vm), std::move(positionals),
                                      std::move(params));
  ctx->output_mode = mode.value();
  return monad::MyResult<std::unique_ptr<CliCtx>>::Ok(std::move(ctx));
}

} // namespace hookrelay
