#include "ui/Terminal.hpp"
#include "util/AsciiLower.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace xferwatch::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* nothing to do from a signal handler */ }
}

void restore_terminal_minimal() {
  // Async-signal-safe: leave alt screen first, then show cursor, reset SGR
  static const char alt_off[] = "\x1B[?1049l";
  static const char show_cur[] = "\x1B[?25h";
  static const char reset[] = "\x1B[0m";
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, sizeof(alt_off) - 1);
  best_effort_write(STDOUT_FILENO, show_cur, sizeof(show_cur) - 1);
  best_effort_write(STDOUT_FILENO, reset, sizeof(reset) - 1);
}

void on_sigint(int) { restore_terminal_minimal(); g_stop.store(true); }

bool install_sigint_handler() {
  struct sigaction sa{};
  sa.sa_handler = on_sigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: blocking reads return EINTR
  return ::sigaction(SIGINT, &sa, nullptr) == 0;
}

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) tcdrain(STDOUT_FILENO);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  auto s = xferwatch::util::ascii_lower(lc);
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* c = std::getenv("COLUMNS");
  if (c && *c) {
    int v = std::atoi(c);
    if (v > 0) return std::max(20, v);
  }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
    return ws.ws_row;
  const char* env = std::getenv("LINES");
  if (env) { int r = std::atoi(env); if (r > 0) return r; }
  return 24;
}

std::string sgr(Color c) {
  if (!tty_stdout()) return {};
  const char* code = "37";
  switch (c) {
    case Color::Header: code = "36"; break;
    case Color::Text:   code = "37"; break;
    case Color::Notice: code = "33"; break;
    case Color::Name:   code = "32"; break;
    case Color::Source: code = "31"; break;
    case Color::Dest:   code = "34"; break;
    case Color::Bar:    code = "35"; break;
    case Color::Rate:   code = "96"; break;
  }
  return std::string("\x1B[") + code + "m";
}

std::string sgr_bold() {
  if (!tty_stdout()) return {};
  return "\x1B[1m";
}

std::string sgr_reset() {
  if (!tty_stdout()) return {};
  return "\x1B[0m";
}

int wait_key(int timeout_ms) {
  struct pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
  timeout_ms = std::max(0, timeout_ms);
  int rv = ::poll(&pfd, 1, timeout_ms);
  if (rv <= 0) return -1;
  unsigned char c = 0;
  if ((pfd.revents & POLLIN) && ::read(STDIN_FILENO, &c, 1) == 1) return c;
  // stdin at EOF or hung up stays "ready" forever; still honor the interval
  ::poll(nullptr, 0, timeout_ms);
  return -1;
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0; // non-blocking by poll
      neo.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSANOW, &neo);
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
    g_alt_in_use.store(false);
  }
}

} // namespace xferwatch::ui
