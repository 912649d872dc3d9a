#pragma once

#include <optional>
#include <string>
#include <vector>

#include "conf/listen_config.hpp"
#include "control_plane/control_plane_client.hpp"
#include "customio/console_output.hpp"
#include "session/forward_target.hpp"
#include "tunnel/route_table.hpp"
#include "util/io_context_manager.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

inline constexpr std::size_t kMaxSourceAliases = 10;
inline constexpr const char *kDefaultSourceName = "cli";

struct BootstrapRequest {
  // "3000" or "http://host:port/base".
  std::string target;
  // Comma (or space) separated aliases, "*" for every source.
  std::string source_query;
  // Connection name, or a path fragment matched against CLI paths.
  std::string connection_filter;
  // Destination CLI path; single source only.
  std::optional<std::string> path;
  // Empty means StableDeviceName().
  std::string device_name;
};

struct SourceSelection {
  std::vector<std::string> aliases;
  bool all{false};
  bool multi() const { return all || aliases.size() > 1; }
};

struct ValidatedBootstrap {
  ForwardTarget target;
  SourceSelection sources;
  std::string connection_filter;
  std::optional<std::string> path;
  std::string device_name;
};

struct BootstrapResult {
  CliSession session;
  std::vector<Source> sources;
  std::vector<Connection> connections;
  RouteTablePtr routes;
  ForwardTarget target;
  std::string device_name;
};

// Splits on ',' (or on whitespace when there is no comma), trims, drops
// empties. Empty input selects the default source.
monad::MyResult<SourceSelection> ParseSourceQuery(const std::string &query);

// CLI path grammar: one or more leading slashes then URL path characters.
bool IsValidCliPath(const std::string &path);

// A filter that starts with '/' is matched as a path fragment.
bool ConnectionMatchesFilter(const Connection &connection,
                             const std::string &filter);

RouteTablePtr BuildRouteTable(const std::vector<Connection> &connections,
                              const ForwardTarget &target);

// Turns user input into a Session plus its Routes by resolving or creating
// sources, the CLI destination and connections through the control plane.
class SessionBootstrapper {
public:
  SessionBootstrapper(IControlPlaneClient &client,
                      IoContextManager &io_context_manager,
                      IListenConfigProvider &config_provider,
                      customio::ConsoleOutput &output);

  // Synchronous argument checks; failures are GENERAL::INVALID_ARGUMENT.
  static monad::MyResult<ValidatedBootstrap>
  Validate(const BootstrapRequest &request);

  // Remote-unavailable failures are retried with exponential backoff up to
  // bootstrap_max_attempts times.
  monad::IO<BootstrapResult> Run(ValidatedBootstrap request);

  // Re-lists the CLI connections of the bootstrapped sources, for a new
  // transport epoch. Keeps the previous table when nothing matches.
  monad::IO<RouteTablePtr> RefreshRoutes(const BootstrapResult &previous,
                                         const std::string &connection_filter);

private:
  monad::IO<BootstrapResult> RunOnce(const ValidatedBootstrap &request);
  monad::IO<std::vector<Source>> ResolveSources(const SourceSelection &sel);
  monad::IO<Source> ResolveSource(const std::string &alias, bool create);
  monad::IO<std::vector<Connection>>
  ResolveConnections(const ValidatedBootstrap &request,
                     const std::vector<Source> &sources);
  monad::IO<std::vector<Connection>>
  ResolveConnectionsFor(const ValidatedBootstrap &request, const Source &source);
  monad::IO<Destination> EnsureDestination(const ValidatedBootstrap &request);
  monad::IO<std::vector<Connection>>
  ApplyPath(const ValidatedBootstrap &request,
            std::vector<Connection> connections);

  IControlPlaneClient &client_;
  boost::asio::io_context &ioc_;
  IListenConfigProvider &config_provider_;
  customio::ConsoleOutput &output_;
  std::optional<Destination> destination_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
