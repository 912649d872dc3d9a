#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/io_monad.hpp"

namespace hookrelay {
namespace fs = std::filesystem;

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"logs"};
  std::string log_file{"hookrelay"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const boost::json::value_to_tag<LoggingConfig> &,
                                  const boost::json::value &jv) {
    LoggingConfig cfg{};
    const auto *obj = jv.if_object();
    if (!obj) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    if (auto *p = obj->if_contains("level"); p && p->is_string()) {
      cfg.level = std::string(p->as_string().c_str());
    }
    if (auto *p = obj->if_contains("log_dir"); p && p->is_string()) {
      cfg.log_dir = std::string(p->as_string().c_str());
    }
    if (auto *p = obj->if_contains("log_file"); p && p->is_string()) {
      cfg.log_file = std::string(p->as_string().c_str());
    }
    if (auto *p = obj->if_contains("rotation_size")) {
      cfg.rotation_size = p->to_number<std::uint64_t>();
    }
    return cfg;
  }
};

// Ordered set of configuration directories. For a logical name `foo` every
// directory contributes `foo.json`, then `foo.<profile>.json` per profile,
// then `foo.override.json`; later files override keys of earlier ones
// (shallow object merge).
class ConfigSources {
public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles,
                std::map<std::string, std::string> cli_overrides = {});

  monad::MyResult<boost::json::value> json_content(const std::string &name) const;

  monad::MyResult<LoggingConfig> logging_config() const;

  const std::map<std::string, std::string> &cli_overrides() const {
    return cli_overrides_;
  }

  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;

private:
  std::map<std::string, std::string> cli_overrides_;
};

} // namespace hookrelay
