#include "ui/terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace hookrelay {

namespace {

constexpr const char *kAltScreenOn = "\033[?1049h\033[?25l";
constexpr const char *kAltScreenOff = "\033[?25h\033[?1049l";

} // namespace

std::vector<Key> KeyDecoder::Feed(std::string_view bytes) {
  pending_.append(bytes.data(), bytes.size());
  std::vector<Key> keys;
  std::size_t i = 0;
  while (i < pending_.size()) {
    const char c = pending_[i];
    if (c == '\033') {
      if (i + 1 >= pending_.size()) {
        break;
      }
      if (pending_[i + 1] != '[') {
        // Lone escape.
        ++i;
        continue;
      }
      if (i + 2 >= pending_.size()) {
        break;
      }
      const char code = pending_[i + 2];
      if (code == 'A') {
        keys.push_back(Key::Up);
        i += 3;
      } else if (code == 'B') {
        keys.push_back(Key::Down);
        i += 3;
      } else if (code == '5' || code == '6') {
        if (i + 3 >= pending_.size()) {
          break;
        }
        if (pending_[i + 3] == '~') {
          keys.push_back(code == '5' ? Key::PageUp : Key::PageDown);
        }
        i += 4;
      } else {
        i += 3;
      }
      continue;
    }
    switch (c) {
    case 'k':
      keys.push_back(Key::Up);
      break;
    case 'j':
      keys.push_back(Key::Down);
      break;
    case 'r':
    case 'R':
      keys.push_back(Key::Retry);
      break;
    case 'o':
    case 'O':
      keys.push_back(Key::Open);
      break;
    case 'd':
    case 'D':
      keys.push_back(Key::Details);
      break;
    case 'q':
    case 'Q':
      keys.push_back(Key::Quit);
      break;
    case '\003':
      keys.push_back(Key::Interrupt);
      break;
    default:
      break;
    }
    ++i;
  }
  pending_.erase(0, i);
  return keys;
}

monad::MyVoidResult RawTerminal::Enter(std::ostream &out) {
  if (active_) {
    return monad::MyVoidResult::Ok();
  }
  if (!StdinIsTty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::LISTEN::TERMINAL_ERROR, "stdin is not a terminal"));
  }
  if (::tcgetattr(STDIN_FILENO, &backup_) != 0) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::LISTEN::TERMINAL_ERROR,
        fmt::format("tcgetattr failed: {}", std::strerror(errno))));
  }
  termios raw = backup_;
  ::cfmakeraw(&raw);
  // Keep "\n" -> "\r\n" on output so ordinary writes still line up.
  raw.c_oflag |= OPOST;
  if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::LISTEN::TERMINAL_ERROR,
        fmt::format("tcsetattr failed: {}", std::strerror(errno))));
  }
  out_ = &out;
  out << kAltScreenOn;
  out.flush();
  active_ = true;
  return monad::MyVoidResult::Ok();
}

void RawTerminal::Leave() {
  if (!active_) {
    return;
  }
  active_ = false;
  ::tcsetattr(STDIN_FILENO, TCSANOW, &backup_);
  if (out_) {
    *out_ << kAltScreenOff;
    out_->flush();
  }
}

TerminalSize RawTerminal::Size() {
  TerminalSize size;
  winsize win{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == 0 && win.ws_row > 0 &&
      win.ws_col > 0) {
    size.rows = win.ws_row;
    size.cols = win.ws_col;
  }
  return size;
}

bool RawTerminal::StdoutIsTty() { return ::isatty(STDOUT_FILENO) != 0; }

bool RawTerminal::StdinIsTty() { return ::isatty(STDIN_FILENO) != 0; }

} // namespace hookrelay
