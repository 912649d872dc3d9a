#pragma once

#include <termios.h>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "util/io_monad.hpp"

namespace hookrelay {

struct TerminalSize {
  int rows{24};
  int cols{80};
};

enum class Key { Up, Down, PageUp, PageDown, Retry, Open, Details, Quit, Interrupt };

// Turns raw stdin bytes into keys. Escape sequences split across reads are
// kept until complete; unknown bytes are dropped.
class KeyDecoder {
public:
  std::vector<Key> Feed(std::string_view bytes);

private:
  std::string pending_;
};

// Puts stdin in raw mode and stdout on the alternate screen for the
// dashboard; the destructor puts both back.
class RawTerminal {
public:
  RawTerminal() = default;
  ~RawTerminal() { Leave(); }

  RawTerminal(const RawTerminal &) = delete;
  RawTerminal &operator=(const RawTerminal &) = delete;

  // LISTEN::TERMINAL_ERROR when stdin is not a terminal.
  monad::MyVoidResult Enter(std::ostream &out);
  void Leave();
  bool active() const { return active_; }

  static TerminalSize Size();
  static bool StdoutIsTty();
  static bool StdinIsTty();

private:
  termios backup_{};
  std::ostream *out_{nullptr};
  bool active_{false};
};

} // namespace hookrelay
