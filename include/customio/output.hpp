#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>
#include <streambuf>

#include "customio/color_printer.hpp"

namespace hookrelay::customio {

// Leveled console sink. Verbosity: 0 silent, 1 error, 2 warning, 3 info,
// 4 debug, 5 trace.
class IOutput {
public:
  virtual ~IOutput() = default;

  virtual std::ostream &trace() = 0;
  virtual std::ostream &debug() = 0;
  virtual std::ostream &info() = 0;
  virtual std::ostream &warning() = 0;
  virtual std::ostream &error() = 0;

  virtual std::size_t verbosity() const = 0;
  virtual void set_verbosity(std::size_t level) = 0;
};

class ConsoleOutputWithColor : public IOutput {
public:
  explicit ConsoleOutputWithColor(std::size_t verbosity,
                                  std::ostream &os = std::cerr)
      : verbosity_(verbosity), os_(os), printer_(os) {}

  std::ostream &trace() override { return level(5, "TRACE", palette().dim()); }
  std::ostream &debug() override { return level(4, "DEBUG", palette().cyan()); }
  std::ostream &info() override { return level(3, "INFO", palette().green()); }
  std::ostream &warning() override {
    return level(2, "WARN", palette().yellow());
  }
  std::ostream &error() override { return level(1, "ERROR", palette().red()); }

  std::size_t verbosity() const override { return verbosity_; }
  void set_verbosity(std::size_t level) override { verbosity_ = level; }

private:
  class NullBuffer : public std::streambuf {
  protected:
    int overflow(int c) override { return c; }
  };

  const ColorPrinter &palette() const { return printer_; }

  std::ostream &level(std::size_t required, const char *tag,
                      const char *color) {
    if (verbosity_ < required) {
      return null_stream_;
    }
    os_ << color << '[' << tag << ']' << printer_.reset() << ' ';
    return os_;
  }

  std::size_t verbosity_;
  std::ostream &os_;
  ColorPrinter printer_;
  NullBuffer null_buffer_;
  std::ostream null_stream_{&null_buffer_};
};

} // namespace hookrelay::customio
