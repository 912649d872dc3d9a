#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conf/credential_store.hpp"
#include "conf/listen_config.hpp"
#include "control_plane/control_plane_types.hpp"
#include "control_plane/http_exchange.hpp"
#include "tunnel/attempt.hpp"
#include "util/io_context_manager.hpp"
#include "util/io_monad.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// REST calls the listen core needs. Errors carry GENERAL::UNAUTHORIZED for
// 401/403, GENERAL::NOT_FOUND for 404, GENERAL::CONFLICT for 409,
// NETWORK::REMOTE_UNAVAILABLE for 5xx and transport failures, and
// GENERAL::UNEXPECTED_RESULT for anything else; response_status holds the
// HTTP status when there was one.
class IControlPlaneClient {
public:
  virtual ~IControlPlaneClient() = default;

  // All sources when `name` is empty.
  virtual monad::IO<std::vector<Source>>
  ListSources(const std::string &name) = 0;
  virtual monad::IO<Source> CreateSource(const std::string &name) = 0;

  virtual monad::IO<std::vector<Destination>>
  ListCliDestinations(const std::string &name) = 0;
  virtual monad::IO<Destination>
  CreateCliDestination(const std::string &name, const std::string &cli_path) = 0;
  virtual monad::IO<Destination>
  UpdateDestinationPath(const std::string &destination_id,
                        const std::string &cli_path) = 0;

  virtual monad::IO<std::vector<Connection>>
  ListConnections(const std::string &source_id) = 0;
  virtual monad::IO<Connection>
  CreateConnection(const std::string &name, const std::string &source_id,
                   const std::string &destination_id) = 0;

  virtual monad::IO<CliSession>
  OpenSession(const std::vector<std::string> &source_ids,
              const std::vector<std::string> &connection_ids,
              const std::string &device_name) = 0;

  // Fallback when the socket cannot carry the result.
  virtual monad::IO<void> SubmitAttemptResult(const AttemptResult &result) = 0;

  virtual monad::IO<void> RetryEvent(const std::string &event_id) = 0;
};

class ControlPlaneClient : public IControlPlaneClient {
public:
  ControlPlaneClient(IoContextManager &io_context_manager,
                     IListenConfigProvider &config_provider,
                     const Credential &credential);

  monad::IO<std::vector<Source>> ListSources(const std::string &name) override;
  monad::IO<Source> CreateSource(const std::string &name) override;
  monad::IO<std::vector<Destination>>
  ListCliDestinations(const std::string &name) override;
  monad::IO<Destination>
  CreateCliDestination(const std::string &name,
                       const std::string &cli_path) override;
  monad::IO<Destination>
  UpdateDestinationPath(const std::string &destination_id,
                        const std::string &cli_path) override;
  monad::IO<std::vector<Connection>>
  ListConnections(const std::string &source_id) override;
  monad::IO<Connection> CreateConnection(const std::string &name,
                                         const std::string &source_id,
                                         const std::string &destination_id) override;
  monad::IO<CliSession>
  OpenSession(const std::vector<std::string> &source_ids,
              const std::vector<std::string> &connection_ids,
              const std::string &device_name) override;
  monad::IO<void> SubmitAttemptResult(const AttemptResult &result) override;
  monad::IO<void> RetryEvent(const std::string &event_id) override;

private:
  std::string Url(const std::string &path) const;
  monad::IO<HttpExchangePtr> Call(http::verb verb, const std::string &path,
                                  std::optional<boost::json::value> body);
  template <typename T>
  monad::IO<T> CallJson(http::verb verb, const std::string &path,
                        std::optional<boost::json::value> body);
  template <typename T>
  monad::IO<std::vector<T>> CallList(const std::string &path);

  HttpClient http_client_;
  const ListenConfig &config_;
  Credential credential_;
  src::severity_logger<trivial::severity_level> lg;
};

// Maps a finished non-2xx exchange onto the error codes listed above.
monad::Error ErrorFromResponse(const HttpExchange &ex);

// Origin-form request target with every path segment and query parameter
// percent-encoded, e.g. {"events", "evt 1", "retry"} -> /events/evt%201/retry.
std::string MakeRequestTarget(
    const std::vector<std::string_view> &segments,
    const std::vector<std::pair<std::string_view, std::string_view>> &params =
        {});

} // namespace hookrelay
