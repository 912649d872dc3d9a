#include "control_plane/control_plane_client.hpp"

#include <boost/url.hpp>
#include <fmt/format.h>

#include <algorithm>

#include "openssl/openssl_util.hpp"

namespace hookrelay {
namespace json = boost::json;
namespace urls = boost::urls;

monad::Error ErrorFromResponse(const HttpExchange &ex) {
  const int status = ex.status();
  std::string detail;
  if (ex.response && !ex.response->body().empty()) {
    detail = ex.response->body();
    // Server messages are JSON with a "message" member most of the time.
    json::error_code ec;
    auto jv = json::parse(detail, ec);
    if (!ec && jv.is_object()) {
      if (auto *m = jv.as_object().if_contains("message"); m && m->is_string()) {
        detail = std::string(m->as_string().c_str());
      }
    }
    if (detail.size() > 300) {
      detail.resize(300);
    }
  }
  int code = my_errors::GENERAL::UNEXPECTED_RESULT;
  if (status == 401 || status == 403) {
    code = my_errors::GENERAL::UNAUTHORIZED;
  } else if (status == 404) {
    code = my_errors::GENERAL::NOT_FOUND;
  } else if (status == 409) {
    code = my_errors::GENERAL::CONFLICT;
  } else if (status >= 500) {
    code = my_errors::NETWORK::REMOTE_UNAVAILABLE;
  }
  auto err = monad::make_error(
      code, fmt::format("{} {} returned HTTP {}{}{}",
                        std::string(ex.request.method_string()),
                        std::string(ex.request.target()), status,
                        detail.empty() ? "" : ": ", detail));
  err.response_status = status;
  return err;
}

std::string MakeRequestTarget(
    const std::vector<std::string_view> &segments,
    const std::vector<std::pair<std::string_view, std::string_view>> &params) {
  urls::url target;
  target.set_path_absolute(true);
  for (auto segment : segments) {
    target.segments().push_back(segment);
  }
  for (const auto &[key, value] : params) {
    target.params().append(urls::param_view(key, value));
  }
  return std::string(target.buffer());
}

ControlPlaneClient::ControlPlaneClient(IoContextManager &io_context_manager,
                                       IListenConfigProvider &config_provider,
                                       const Credential &credential)
    : http_client_(io_context_manager.ioc(), config_provider.get().verify_tls),
      config_(config_provider.get()), credential_(credential) {}

std::string ControlPlaneClient::Url(const std::string &path) const {
  std::string base = config_.api_base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + path;
}

monad::IO<HttpExchangePtr>
ControlPlaneClient::Call(http::verb verb, const std::string &path,
                         std::optional<json::value> body) {
  const auto timeout = std::chrono::milliseconds(
      std::max(1000, config_.control_plane_timeout_ms));
  BOOST_LOG_SEV(lg, trivial::debug)
      << "control plane " << http::to_string(verb) << ' ' << path;
  return http_io(Url(path), verb)
      .map([this, body = std::move(body), timeout](HttpExchangePtr ex) {
        ex->timeout = timeout;
        ex->setBearer(credential_.api_key);
        if (!credential_.project_id.empty()) {
          ex->request.set("X-Project-Id", credential_.project_id);
        }
        if (body) {
          ex->setRequestJsonBody(*body);
        } else {
          ex->request.prepare_payload();
        }
        return ex;
      })
      .then(http_request_io(http_client_))
      .map_err([](monad::Error err) {
        // Transport level failures are all "remote unavailable" to callers;
        // the original message is kept.
        if (err.code >= my_errors::NETWORK::CONNECT_ERROR &&
            err.code <= my_errors::NETWORK::REMOTE_UNAVAILABLE) {
          err.code = my_errors::NETWORK::REMOTE_UNAVAILABLE;
        }
        return err;
      })
      .then([](HttpExchangePtr ex) {
        if (!ex->is_2xx()) {
          return monad::IO<HttpExchangePtr>::fail(ErrorFromResponse(*ex));
        }
        return monad::IO<HttpExchangePtr>::pure(std::move(ex));
      });
}

template <typename T>
monad::IO<T> ControlPlaneClient::CallJson(http::verb verb,
                                          const std::string &path,
                                          std::optional<json::value> body) {
  return Call(verb, path, std::move(body)).then([](HttpExchangePtr ex) {
    return monad::IO<T>::from_result(ex->template parseJsonResponse<T>());
  });
}

template <typename T>
monad::IO<std::vector<T>> ControlPlaneClient::CallList(const std::string &path) {
  return Call(http::verb::get, path, std::nullopt).then([](HttpExchangePtr ex) {
    using R = monad::MyResult<std::vector<T>>;
    auto parsed = ex->template parseJsonResponse<json::value>();
    if (parsed.is_err()) {
      return monad::IO<std::vector<T>>::fail(parsed.error());
    }
    try {
      return monad::IO<std::vector<T>>::from_result(
          R::Ok(parse_model_list<T>(parsed.value())));
    } catch (const std::exception &ex_err) {
      return monad::IO<std::vector<T>>::fail(monad::make_error(
          my_errors::JSON::DECODE_ERROR,
          fmt::format("invalid list response: {}", ex_err.what())));
    }
  });
}

monad::IO<std::vector<Source>>
ControlPlaneClient::ListSources(const std::string &name) {
  if (name.empty()) {
    return CallList<Source>(MakeRequestTarget({"sources"}));
  }
  return CallList<Source>(MakeRequestTarget({"sources"}, {{"name", name}}));
}

monad::IO<Source> ControlPlaneClient::CreateSource(const std::string &name) {
  BOOST_LOG_SEV(lg, trivial::info) << "creating source " << name;
  return CallJson<Source>(http::verb::post, "/sources",
                          json::value(json::object{{"name", name}}));
}

monad::IO<std::vector<Destination>>
ControlPlaneClient::ListCliDestinations(const std::string &name) {
  return CallList<Destination>(MakeRequestTarget(
      {"destinations"}, {{"type", "CLI"}, {"name", name}}));
}

monad::IO<Destination>
ControlPlaneClient::CreateCliDestination(const std::string &name,
                                         const std::string &cli_path) {
  BOOST_LOG_SEV(lg, trivial::info) << "creating CLI destination " << name;
  return CallJson<Destination>(
      http::verb::post, "/destinations",
      json::value(
          json::object{{"name", name}, {"type", "CLI"}, {"cli_path", cli_path}}));
}

monad::IO<Destination>
ControlPlaneClient::UpdateDestinationPath(const std::string &destination_id,
                                          const std::string &cli_path) {
  return CallJson<Destination>(
      http::verb::put, MakeRequestTarget({"destinations", destination_id}),
      json::value(json::object{{"cli_path", cli_path}}));
}

monad::IO<std::vector<Connection>>
ControlPlaneClient::ListConnections(const std::string &source_id) {
  return CallList<Connection>(
      MakeRequestTarget({"connections"}, {{"source_id", source_id}}));
}

monad::IO<Connection>
ControlPlaneClient::CreateConnection(const std::string &name,
                                     const std::string &source_id,
                                     const std::string &destination_id) {
  return CallJson<Connection>(http::verb::post, "/connections",
                              json::value(json::object{
                                  {"name", name},
                                  {"source_id", source_id},
                                  {"destination_id", destination_id}}));
}

monad::IO<CliSession>
ControlPlaneClient::OpenSession(const std::vector<std::string> &source_ids,
                                const std::vector<std::string> &connection_ids,
                                const std::string &device_name) {
  json::array sources(source_ids.begin(), source_ids.end());
  json::array webhooks(connection_ids.begin(), connection_ids.end());
  json::object body{{"source_ids", std::move(sources)},
                    {"webhook_ids", std::move(webhooks)},
                    {"device_name", device_name}};
  // Older dispatchers only read the singular form.
  if (source_ids.size() == 1) {
    body["source_id"] = source_ids.front();
  }
  return CallJson<CliSession>(http::verb::post, "/cli-sessions",
                              json::value(std::move(body)));
}

monad::IO<void>
ControlPlaneClient::SubmitAttemptResult(const AttemptResult &result) {
  json::object body{{"cli_path", result.path},
                    {"truncated", result.truncated},
                    {"duration_ms", result.elapsed.count()}};
  if (result.status) {
    body["status"] = *result.status;
  }
  if (opensslutil::is_valid_utf8(result.body)) {
    body["data"] = result.body;
  } else {
    body["data"] = opensslutil::base64_encode(result.body);
    body["body_encoding"] = "base64";
  }
  if (!result.ok()) {
    body["error"] = true;
    body["error_class"] = std::string(to_string(result.error_class));
    body["reason"] = result.reason;
  }
  return Call(http::verb::put,
              MakeRequestTarget({"cli-attempts", result.attempt_id}),
              json::value(std::move(body)))
      .map([](HttpExchangePtr) {});
}

monad::IO<void> ControlPlaneClient::RetryEvent(const std::string &event_id) {
  return Call(http::verb::post,
              MakeRequestTarget({"events", event_id, "retry"}),
              json::value(json::object{}))
      .map([](HttpExchangePtr) {});
}

} // namespace hookrelay
