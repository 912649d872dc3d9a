#include "ui/output_mode.hpp"

#include <fmt/format.h>

#include <cstring>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace hookrelay {

std::string_view to_string(OutputMode mode) {
  switch (mode) {
  case OutputMode::Interactive:
    return "interactive";
  case OutputMode::Log:
    return "log";
  case OutputMode::Compact:
    return "compact";
  case OutputMode::Quiet:
    return "quiet";
  }
  return "log";
}

monad::MyResult<OutputMode> ParseOutputMode(const std::string &value) {
  const std::string v = stringutil::to_lower_copy(stringutil::trim_copy(value));
  if (v.empty() || v == "interactive") {
    return monad::MyResult<OutputMode>::Ok(OutputMode::Interactive);
  }
  if (v == "log") {
    return monad::MyResult<OutputMode>::Ok(OutputMode::Log);
  }
  if (v == "compact") {
    return monad::MyResult<OutputMode>::Ok(OutputMode::Compact);
  }
  if (v == "quiet") {
    return monad::MyResult<OutputMode>::Ok(OutputMode::Quiet);
  }
  return monad::MyResult<OutputMode>::Err(monad::make_error(
      my_errors::GENERAL::INVALID_ARGUMENT,
      fmt::format("unknown output mode '{}' (interactive, compact, quiet)",
                  value)));
}

OutputMode ResolveOutputMode(OutputMode requested, bool stdout_is_tty,
                             const char *term_env) {
  if (requested != OutputMode::Interactive) {
    return requested;
  }
  if (!stdout_is_tty || term_env == nullptr || *term_env == '\0' ||
      std::strcmp(term_env, "dumb") == 0) {
    return OutputMode::Log;
  }
  return OutputMode::Interactive;
}

} // namespace hookrelay
