#include "conf/credential_store.hpp"

#include <fmt/format.h>

#include <cstdlib>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace hookrelay {
namespace json = boost::json;

Credential tag_invoke(const json::value_to_tag<Credential> &,
                      const json::value &jv) {
  const auto *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("credential file must contain a JSON object");
  }
  Credential cred;
  auto read = [obj](const char *key, std::string &out) {
    if (auto *p = obj->if_contains(key); p && p->is_string()) {
      out = std::string(p->as_string().c_str());
    }
  };
  read("api_key", cred.api_key);
  read("project_id", cred.project_id);
  read("project_mode", cred.project_mode);
  read("project_name", cred.project_name);
  read("identity", cred.identity);
  return cred;
}

fs::path CredentialStoreFile::default_path() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "hookrelay" / "credentials.json";
  }
  if (const char *home = std::getenv("HOME"); home && *home) {
    return fs::path(home) / ".config" / "hookrelay" / "credentials.json";
  }
  return fs::path("credentials.json");
}

monad::MyResult<Credential> CredentialStoreFile::load() const {
  using R = monad::MyResult<Credential>;
  const char *env_key = std::getenv("HOOKRELAY_API_KEY");
  const bool has_env_key = env_key != nullptr && *env_key != '\0';

  Credential cred;
  std::error_code exists_ec;
  if (fs::exists(path_, exists_ec)) {
    std::error_code ec;
    auto content = stringutil::readFile(path_, ec);
    if (ec) {
      return R::Err(monad::make_error(
          my_errors::GENERAL::FILE_READ_WRITE,
          fmt::format("Unable to read credentials {}: {}", path_.string(),
                      ec.message())));
    }
    try {
      cred = json::value_to<Credential>(json::parse(content));
    } catch (const std::exception &ex) {
      return R::Err(monad::make_error(
          my_errors::JSON::DECODE_ERROR,
          fmt::format("Invalid credentials {}: {}", path_.string(), ex.what())));
    }
  } else if (!has_env_key) {
    auto err = monad::make_error(
        my_errors::GENERAL::UNAUTHORIZED,
        fmt::format("No credentials found at {}. Log in first or set "
                    "HOOKRELAY_API_KEY.",
                    path_.string()));
    return R::Err(std::move(err));
  }

  if (has_env_key) {
    cred.api_key = env_key;
  }
  if (cred.api_key.empty()) {
    return R::Err(monad::make_error(
        my_errors::GENERAL::UNAUTHORIZED,
        fmt::format("Credential file {} has no api_key", path_.string())));
  }
  return R::Ok(std::move(cred));
}

} // namespace hookrelay
