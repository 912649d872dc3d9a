#pragma once

#include <boost/json.hpp>

#include <string>

#include "conf/config_sources.hpp"
#include "customio/output.hpp"

namespace hookrelay {

struct IocConfig {
  int threads_num{1};
  std::string name{"hookrelay-ioc"};

  IocConfig() = default;
  IocConfig(int threads, std::string ioc_name)
      : threads_num(threads), name(std::move(ioc_name)) {}

  friend IocConfig tag_invoke(const boost::json::value_to_tag<IocConfig> &,
                              const boost::json::value &jv) {
    IocConfig cfg{};
    if (const auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("threads_num")) {
        cfg.threads_num = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("name"); p && p->is_string()) {
        cfg.name = std::string(p->as_string().c_str());
      }
    }
    return cfg;
  }
};

class IIocConfigProvider {
public:
  virtual ~IIocConfigProvider() = default;
  virtual const IocConfig &get() const = 0;
};

class IocConfigProviderFile : public IIocConfigProvider {
public:
  IocConfigProviderFile(ConfigSources &config_sources, customio::IOutput &output) {
    auto result = config_sources.json_content("ioc_config");
    if (result.is_err()) {
      output.debug() << "ioc_config.json not found; using one io thread"
                     << std::endl;
      return;
    }
    config_ = boost::json::value_to<IocConfig>(result.value());
    // Listen state is owned by a single io thread.
    if (config_.threads_num != 1) {
      output.warning() << "ioc_config threads_num=" << config_.threads_num
                       << " ignored; hookrelay runs one io thread"
                       << std::endl;
      config_.threads_num = 1;
    }
  }

  const IocConfig &get() const override { return config_; }

private:
  IocConfig config_{};
};

} // namespace hookrelay
