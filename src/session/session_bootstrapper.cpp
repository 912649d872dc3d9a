#include "session/session_bootstrapper.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>

#include "util/device_name.hpp"
#include "util/string_util.hpp"

namespace hookrelay {

namespace {

// Runs f over items one after another and collects the results. The
// accumulator is created per run so a retried IO starts from scratch.
template <typename Out, typename In, typename F>
monad::IO<std::vector<Out>> Traverse(std::vector<In> items, F f) {
  return monad::IO<std::vector<Out>>(
      [items = std::move(items),
       f](typename monad::IO<std::vector<Out>>::Callback cb) {
        auto acc = std::make_shared<std::vector<Out>>();
        auto chain = monad::IO<void>::pure();
        for (const auto &item : items) {
          chain = chain.then([acc, f, item]() {
            return f(item).map([acc](Out out) { acc->push_back(std::move(out)); });
          });
        }
        chain.map([acc]() { return std::move(*acc); }).run(std::move(cb));
      });
}

monad::Error InvalidArgument(std::string what) {
  return monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                           std::move(what));
}

} // namespace

monad::MyResult<SourceSelection> ParseSourceQuery(const std::string &query) {
  using R = monad::MyResult<SourceSelection>;
  SourceSelection sel;
  const std::string trimmed = stringutil::trim_copy(query);
  if (trimmed.empty()) {
    sel.aliases.push_back(kDefaultSourceName);
    return R::Ok(std::move(sel));
  }
  if (trimmed == "*") {
    sel.all = true;
    return R::Ok(std::move(sel));
  }
  if (trimmed.find(',') != std::string::npos) {
    sel.aliases = stringutil::split_trim(trimmed, ',');
  } else {
    std::string normalized = trimmed;
    std::replace_if(
        normalized.begin(), normalized.end(),
        [](unsigned char c) { return std::isspace(c) != 0; }, ' ');
    sel.aliases = stringutil::split_trim(normalized, ' ');
  }
  if (sel.aliases.empty()) {
    return R::Err(InvalidArgument(
        fmt::format("source query '{}' names no source", query)));
  }
  if (sel.aliases.size() > kMaxSourceAliases) {
    return R::Err(InvalidArgument(
        fmt::format("too many sources: {} (at most {})", sel.aliases.size(),
                    kMaxSourceAliases)));
  }
  if (std::find(sel.aliases.begin(), sel.aliases.end(), "*") !=
      sel.aliases.end()) {
    return R::Err(
        InvalidArgument("'*' cannot be combined with other source names"));
  }
  return R::Ok(std::move(sel));
}

bool IsValidCliPath(const std::string &path) {
  static const std::regex kPathGrammar(
      R"(^/+[A-Za-z0-9\-_%.~!$&'()*+,;=:@/]*$)");
  return std::regex_match(path, kPathGrammar);
}

bool ConnectionMatchesFilter(const Connection &connection,
                             const std::string &filter) {
  if (filter.empty()) {
    return true;
  }
  if (IsValidCliPath(filter) &&
      connection.destination.cli_path.find(filter) != std::string::npos) {
    return true;
  }
  return connection.name == filter;
}

RouteTablePtr BuildRouteTable(const std::vector<Connection> &connections,
                              const ForwardTarget &target) {
  std::vector<Route> routes;
  routes.reserve(connections.size());
  for (const auto &c : connections) {
    Route r;
    r.connection_id = c.id;
    r.connection_name = c.name.empty() ? c.full_name : c.name;
    r.source_id = c.source.id;
    r.source_name = c.source.name;
    r.source_url = c.source.url;
    r.cli_path = c.destination.cli_path;
    r.target = target;
    routes.push_back(std::move(r));
  }
  return std::make_shared<const RouteTable>(std::move(routes));
}

SessionBootstrapper::SessionBootstrapper(IControlPlaneClient &client,
                                         IoContextManager &io_context_manager,
                                         IListenConfigProvider &config_provider,
                                         customio::ConsoleOutput &output)
    : client_(client), ioc_(io_context_manager.ioc()),
      config_provider_(config_provider), output_(output) {}

monad::MyResult<ValidatedBootstrap>
SessionBootstrapper::Validate(const BootstrapRequest &request) {
  using R = monad::MyResult<ValidatedBootstrap>;
  ValidatedBootstrap out;
  auto target = ParseForwardTarget(request.target);
  if (target.is_err()) {
    return R::Err(target.error());
  }
  out.target = std::move(target.value());
  auto sources = ParseSourceQuery(request.source_query);
  if (sources.is_err()) {
    return R::Err(sources.error());
  }
  out.sources = std::move(sources.value());
  if (request.path) {
    if (out.sources.multi()) {
      return R::Err(InvalidArgument(
          "--path can only be set when listening to a single source"));
    }
    if (!IsValidCliPath(*request.path)) {
      return R::Err(InvalidArgument(
          fmt::format("invalid path '{}': must start with '/' and contain "
                      "only URL path characters",
                      *request.path)));
    }
  }
  out.path = request.path;
  out.connection_filter = stringutil::trim_copy(request.connection_filter);
  out.device_name =
      request.device_name.empty() ? StableDeviceName() : request.device_name;
  return R::Ok(std::move(out));
}

monad::IO<BootstrapResult> SessionBootstrapper::Run(ValidatedBootstrap request) {
  const auto &cfg = config_provider_.get();
  const int max_attempts = std::max(1, cfg.bootstrap_max_attempts);
  const auto base_delay =
      std::chrono::milliseconds(std::max(100, cfg.reconnect_initial_delay_ms));
  auto req = std::make_shared<ValidatedBootstrap>(std::move(request));
  return monad::IO<BootstrapResult>([this, req](auto cb) {
           RunOnce(*req).run(std::move(cb));
         })
      .retry_exponential_if(max_attempts, base_delay, ioc_,
                            [this](const monad::Error &err) {
                              if (err.code !=
                                  my_errors::NETWORK::REMOTE_UNAVAILABLE) {
                                return false;
                              }
                              output_.logger().warning()
                                  << "Control plane unavailable, retrying: "
                                  << err.what << std::endl;
                              return true;
                            });
}

monad::IO<BootstrapResult>
SessionBootstrapper::RunOnce(const ValidatedBootstrap &request) {
  BOOST_LOG_SEV(lg, trivial::debug)
      << "bootstrap target=" << request.target.url()
      << " sources=" << stringutil::join(request.sources.aliases, ",")
      << " filter=" << request.connection_filter;
  auto result = std::make_shared<BootstrapResult>();
  result->target = request.target;
  result->device_name = request.device_name;
  return ResolveSources(request.sources)
      .then([this, request, result](std::vector<Source> sources) {
        result->sources = std::move(sources);
        return ResolveConnections(request, result->sources);
      })
      .then([this, request](std::vector<Connection> connections) {
        return ApplyPath(request, std::move(connections));
      })
      .then([this, request, result](std::vector<Connection> connections) {
        result->connections = std::move(connections);
        std::vector<std::string> source_ids;
        for (const auto &s : result->sources) {
          source_ids.push_back(s.id);
        }
        std::vector<std::string> connection_ids;
        for (const auto &c : result->connections) {
          connection_ids.push_back(c.id);
        }
        return client_.OpenSession(source_ids, connection_ids,
                                   request.device_name);
      })
      .map([this, result](CliSession session) {
        result->session = std::move(session);
        result->routes = BuildRouteTable(result->connections, result->target);
        BOOST_LOG_SEV(lg, trivial::info)
            << "session " << result->session.id << " opened with "
            << result->routes->size() << " route(s)";
        return *result;
      });
}

monad::IO<RouteTablePtr>
SessionBootstrapper::RefreshRoutes(const BootstrapResult &previous,
                                   const std::string &connection_filter) {
  auto fallback = previous.routes;
  auto target = previous.target;
  return Traverse<std::vector<Connection>>(
             previous.sources,
             [this, connection_filter](const Source &source) {
               return client_.ListConnections(source.id).map(
                   [source, connection_filter](std::vector<Connection> all) {
                     std::vector<Connection> kept;
                     for (auto &c : all) {
                       if (!stringutil::iequals(c.destination.type, "CLI") ||
                           c.destination.cli_path.empty() ||
                           !ConnectionMatchesFilter(c, connection_filter)) {
                         continue;
                       }
                       if (c.source.name.empty()) {
                         c.source = source;
                       }
                       kept.push_back(std::move(c));
                     }
                     return kept;
                   });
             })
      .map([this, fallback, target](std::vector<std::vector<Connection>> nested) {
        std::vector<Connection> flat;
        for (auto &group : nested) {
          std::move(group.begin(), group.end(), std::back_inserter(flat));
        }
        if (flat.empty()) {
          BOOST_LOG_SEV(lg, trivial::warning)
              << "route refresh found no connections, keeping previous table";
          return fallback;
        }
        return BuildRouteTable(flat, target);
      });
}

monad::IO<std::vector<Source>>
SessionBootstrapper::ResolveSources(const SourceSelection &sel) {
  if (sel.all) {
    return client_.ListSources("").then([](std::vector<Source> sources) {
      if (sources.empty()) {
        return monad::IO<std::vector<Source>>::fail(monad::make_error(
            my_errors::GENERAL::NOT_FOUND, "unable to find any sources"));
      }
      return monad::IO<std::vector<Source>>::pure(std::move(sources));
    });
  }
  const bool create = !sel.multi();
  return Traverse<Source>(sel.aliases, [this, create](const std::string &alias) {
    return ResolveSource(alias, create);
  });
}

monad::IO<Source> SessionBootstrapper::ResolveSource(const std::string &alias,
                                                     bool create) {
  return client_.ListSources(alias).then(
      [this, alias, create](std::vector<Source> found) {
        std::vector<Source> exact;
        const std::string slug = stringutil::slugify(alias);
        for (auto &s : found) {
          if (s.name == alias || s.name == slug) {
            exact.push_back(std::move(s));
          }
        }
        if (exact.size() > 1) {
          return monad::IO<Source>::fail(monad::make_error(
              my_errors::GENERAL::CONFLICT,
              fmt::format("source name '{}' is ambiguous ({} matches)", alias,
                          exact.size())));
        }
        if (exact.size() == 1) {
          return monad::IO<Source>::pure(std::move(exact.front()));
        }
        if (!create) {
          return monad::IO<Source>::fail(monad::make_error(
              my_errors::GENERAL::NOT_FOUND,
              fmt::format("source '{}' not found", alias)));
        }
        output_.logger().info()
            << "Source \"" << alias << "\" not found, creating it" << std::endl;
        return client_.CreateSource(slug.empty() ? alias : slug);
      });
}

monad::IO<std::vector<Connection>>
SessionBootstrapper::ResolveConnections(const ValidatedBootstrap &request,
                                        const std::vector<Source> &sources) {
  return Traverse<std::vector<Connection>>(
             sources,
             [this, request](const Source &source) {
               return ResolveConnectionsFor(request, source);
             })
      .map([](std::vector<std::vector<Connection>> nested) {
        std::vector<Connection> flat;
        for (auto &group : nested) {
          for (auto &c : group) {
            flat.push_back(std::move(c));
          }
        }
        return flat;
      });
}

monad::IO<std::vector<Connection>>
SessionBootstrapper::ResolveConnectionsFor(const ValidatedBootstrap &request,
                                           const Source &source) {
  return client_.ListConnections(source.id).then(
      [this, request, source](std::vector<Connection> all) {
        std::vector<Connection> matching;
        for (auto &c : all) {
          if (!stringutil::iequals(c.destination.type, "CLI") ||
              c.destination.cli_path.empty()) {
            continue;
          }
          if (!ConnectionMatchesFilter(c, request.connection_filter)) {
            continue;
          }
          if (c.source.name.empty()) {
            c.source = source;
          }
          matching.push_back(std::move(c));
        }
        if (!matching.empty()) {
          return monad::IO<std::vector<Connection>>::pure(std::move(matching));
        }
        std::string name = request.device_name;
        if (!request.connection_filter.empty() &&
            !IsValidCliPath(request.connection_filter)) {
          name = request.connection_filter;
        }
        output_.logger().info()
            << "No CLI connection on source \"" << source.name
            << "\", creating \"" << name << "\"" << std::endl;
        return EnsureDestination(request)
            .then([this, name, source](Destination destination) {
              return client_.CreateConnection(name, source.id, destination.id)
                  .map([source, destination](Connection c) {
                    if (c.source.name.empty()) {
                      c.source = source;
                    }
                    if (c.destination.name.empty()) {
                      c.destination = destination;
                    }
                    return std::vector<Connection>{std::move(c)};
                  });
            });
      });
}

monad::IO<Destination>
SessionBootstrapper::EnsureDestination(const ValidatedBootstrap &request) {
  if (destination_) {
    return monad::IO<Destination>::pure(*destination_);
  }
  const std::string cli_path = request.path.value_or("/");
  return client_.ListCliDestinations(request.device_name)
      .then([this, request, cli_path](std::vector<Destination> found) {
        for (auto &d : found) {
          if (d.name == request.device_name) {
            return monad::IO<Destination>::pure(std::move(d));
          }
        }
        return client_.CreateCliDestination(request.device_name, cli_path);
      })
      .map([this](Destination d) {
        destination_ = d;
        return d;
      });
}

monad::IO<std::vector<Connection>>
SessionBootstrapper::ApplyPath(const ValidatedBootstrap &request,
                               std::vector<Connection> connections) {
  using IO = monad::IO<std::vector<Connection>>;
  if (!request.path) {
    return IO::pure(std::move(connections));
  }
  if (connections.size() > 1) {
    return IO::fail(InvalidArgument(fmt::format(
        "{} CLI connections match; pass a connection name to choose the one "
        "whose path should become '{}'",
        connections.size(), *request.path)));
  }
  if (connections.empty() ||
      connections.front().destination.cli_path == *request.path) {
    return IO::pure(std::move(connections));
  }
  auto &dest = connections.front().destination;
  output_.logger().info() << "Updating destination CLI path from \""
                          << dest.cli_path << "\" to \"" << *request.path
                          << "\"" << std::endl;
  const std::string dest_id = dest.id;
  return client_.UpdateDestinationPath(dest_id, *request.path)
      .map([connections = std::move(connections),
            path = *request.path](Destination updated) mutable {
        connections.front().destination.cli_path =
            updated.cli_path.empty() ? path : updated.cli_path;
        return std::move(connections);
      });
}

} // namespace hookrelay
