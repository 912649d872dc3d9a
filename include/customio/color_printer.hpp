#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

// ANSI color helper for terminal output.
//
//   customio::ColorPrinter cp;             // std::cerr, auto-detects a TTY
//   cp.red() << "connect failed" << '\n';  // colour reset at end of expression
//   os << cp.status_color(502) << "502" << cp.reset();

namespace hookrelay::customio {

// True when `os` is std::cout/std::cerr attached to a terminal whose TERM
// is set and not "dumb".
inline bool stream_is_terminal(std::ostream &os) {
  int fd = -1;
  if (&os == &std::cout) {
    fd = fileno(stdout);
  } else if (&os == &std::cerr) {
    fd = fileno(stderr);
  }
  if (fd < 0 || ::isatty(fd) == 0) {
    return false;
  }
  const char *term = std::getenv("TERM");
  return term != nullptr && *term != '\0' && std::strcmp(term, "dumb") != 0;
}

class ColorPrinter {
public:
  // Emits the colour on construction and the reset sequence on destruction.
  class ColorProxy {
  public:
    ColorProxy(std::ostream &os, const char *code, bool enabled)
        : os_(os), enabled_(enabled) {
      if (enabled_) {
        os_ << code;
      }
    }
    ~ColorProxy() {
      if (enabled_) {
        os_ << "\033[0m";
      }
    }
    template <typename T> ColorProxy &operator<<(const T &v) {
      os_ << v;
      return *this;
    }
    using Manip = std::ostream &(*)(std::ostream &);
    ColorProxy &operator<<(Manip m) {
      m(os_);
      return *this;
    }

  private:
    std::ostream &os_;
    bool enabled_;
  };

  ColorPrinter() : stream_(&std::cerr), enabled_(stream_is_terminal(std::cerr)) {}
  explicit ColorPrinter(std::ostream &os)
      : stream_(&os), enabled_(stream_is_terminal(os)) {}
  ColorPrinter(std::ostream &os, bool enabled) : stream_(&os), enabled_(enabled) {}

  void set_enabled(bool enabled) { enabled_ = enabled; }
  bool enabled() const { return enabled_; }
  std::ostream &stream() const { return *stream_; }

  const char *reset() const { return code("\033[0m"); }
  const char *bold() const { return code("\033[1m"); }
  const char *dim() const { return code("\033[2m"); }
  const char *inverse() const { return code("\033[7m"); }
  const char *red() const { return code("\033[31m"); }
  const char *green() const { return code("\033[32m"); }
  const char *yellow() const { return code("\033[33m"); }
  const char *blue() const { return code("\033[34m"); }
  const char *magenta() const { return code("\033[35m"); }
  const char *cyan() const { return code("\033[36m"); }

  // 2xx green, 3xx cyan, 4xx yellow, 5xx and failures red.
  const char *status_color(int status) const {
    if (status >= 200 && status < 300) {
      return green();
    }
    if (status >= 300 && status < 400) {
      return cyan();
    }
    if (status >= 400 && status < 500) {
      return yellow();
    }
    return red();
  }

  ColorProxy red() { return proxy("\033[31m"); }
  ColorProxy green() { return proxy("\033[32m"); }
  ColorProxy yellow() { return proxy("\033[33m"); }
  ColorProxy cyan() { return proxy("\033[36m"); }
  ColorProxy bold() { return proxy("\033[1m"); }

private:
  const char *code(const char *seq) const { return enabled_ ? seq : ""; }
  ColorProxy proxy(const char *seq) {
    return ColorProxy(*stream_, seq, enabled_);
  }

  std::ostream *stream_;
  bool enabled_;
};

} // namespace hookrelay::customio
