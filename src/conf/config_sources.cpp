#include "conf/config_sources.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace hookrelay {
namespace json = boost::json;

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles,
                             std::map<std::string, std::string> cli_overrides)
    : paths_(std::move(paths)), profiles_(std::move(profiles)),
      cli_overrides_(std::move(cli_overrides)) {}

monad::MyResult<json::value>
ConfigSources::json_content(const std::string &name) const {
  using R = monad::MyResult<json::value>;
  std::vector<fs::path> candidates;
  for (const auto &dir : paths_) {
    candidates.push_back(dir / (name + ".json"));
    for (const auto &profile : profiles_) {
      candidates.push_back(dir / fmt::format("{}.{}.json", name, profile));
    }
    candidates.push_back(dir / (name + ".override.json"));
  }

  json::object merged;
  bool found = false;
  for (const auto &file : candidates) {
    std::error_code exists_ec;
    if (!fs::exists(file, exists_ec)) {
      continue;
    }
    std::error_code ec;
    auto content = stringutil::readFile(file, ec);
    if (ec) {
      return R::Err(monad::make_error(
          my_errors::GENERAL::FILE_READ_WRITE,
          fmt::format("Unable to read {}: {}", file.string(), ec.message())));
    }
    boost::system::error_code parse_ec;
    auto parsed = json::parse(content, parse_ec);
    if (parse_ec) {
      return R::Err(monad::make_error(
          my_errors::JSON::MALFORMED,
          fmt::format("Invalid JSON in {}: {}", file.string(),
                      parse_ec.message())));
    }
    if (!parsed.is_object()) {
      return R::Err(monad::make_error(
          my_errors::JSON::MALFORMED,
          fmt::format("{} must contain a JSON object", file.string())));
    }
    for (const auto &kv : parsed.as_object()) {
      merged[kv.key()] = kv.value();
    }
    found = true;
  }
  if (!found) {
    return R::Err(monad::make_error(
        my_errors::GENERAL::FILE_NOT_FOUND,
        fmt::format("No {}.json found in configuration directories", name)));
  }
  return R::Ok(json::value(std::move(merged)));
}

monad::MyResult<LoggingConfig> ConfigSources::logging_config() const {
  using R = monad::MyResult<LoggingConfig>;
  auto content = json_content("log_config");
  if (content.is_err()) {
    return R::Err(content.error());
  }
  try {
    return R::Ok(json::value_to<LoggingConfig>(content.value()));
  } catch (const std::exception &ex) {
    return R::Err(monad::make_error(my_errors::JSON::DECODE_ERROR, ex.what()));
  }
}

} // namespace hookrelay
