#pragma once

#include <algorithm>
#include <cstddef>

#include "customio/color_printer.hpp"
#include "customio/output.hpp"

namespace hookrelay::customio {

// Leveled logger plus a colour printer for user-facing stdout/stderr text.
class ConsoleOutput {
  IOutput &logger_;
  ColorPrinter printer_{};

public:
  explicit ConsoleOutput(IOutput &logger) : logger_(logger) {}

  IOutput &logger() { return logger_; }
  ColorPrinter &printer() { return printer_; }

  // Interactive screens own the terminal; only errors stay on stderr.
  void mute_below_error() {
    logger_.set_verbosity(std::min<std::size_t>(logger_.verbosity(), 1));
  }
};

} // namespace hookrelay::customio
