#pragma once

#include <string>
#include <string_view>

#include "util/io_monad.hpp"

namespace hookrelay {

enum class OutputMode { Interactive, Log, Compact, Quiet };

std::string_view to_string(OutputMode mode);

// interactive | log | compact | quiet; anything else is INVALID_ARGUMENT.
monad::MyResult<OutputMode> ParseOutputMode(const std::string &value);

// Interactive only survives when stdout is a terminal and TERM is set and not
// "dumb"; it degrades to Log otherwise. Other modes are kept as asked.
OutputMode ResolveOutputMode(OutputMode requested, bool stdout_is_tty,
                             const char *term_env);

} // namespace hookrelay
