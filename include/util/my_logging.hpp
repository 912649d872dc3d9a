#pragma once

#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <fmt/format.h>

#include <string>

#include "conf/config_sources.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

namespace hookrelay {

// Tags every file log record from now on with the control plane session id,
// so the logs of consecutive sessions can be told apart.
inline void set_log_session_id(const std::string &session_id) {
  auto core = logging::core::get();
  auto attr = logging::attributes::constant<std::string>(session_id);
  auto [it, added] = core->add_global_attribute("SessionID", attr);
  if (!added) {
    core->remove_global_attribute(it);
    core->add_global_attribute("SessionID", attr);
  }
}

inline trivial::severity_level severity_from_string(const std::string &level) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return trivial::info;
}

// File sink with size based rotation; console output goes through
// customio::IOutput instead.
inline void init_my_log(const LoggingConfig &logging_config) {
  std::string logfile = fmt::format("{}/{}_%N.log", logging_config.log_dir,
                                    logging_config.log_file);

  auto sink = logging::add_file_log(
      logging::keywords::file_name = logfile,
      logging::keywords::rotation_size = logging_config.rotation_size,
      logging::keywords::format =
          "[%TimeStamp%] [%Severity%] [%SessionID%]: %Message%",
      logging::keywords::auto_flush = true,
      logging::keywords::open_mode = std::ios_base::app);
  sink->locked_backend()->set_file_collector(
      logging::sinks::file::make_collector(
          logging::keywords::target = logging_config.log_dir,
          logging::keywords::max_size = logging_config.rotation_size * 10,
          logging::keywords::max_files = 10));
  sink->locked_backend()->scan_for_files();

  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   severity_from_string(logging_config.level));
}

} // namespace hookrelay
