#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <termios.h>

namespace xferwatch::ui {

// Set by SIGINT; polled by the main loop between iterations
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
void on_sigint(int);
// Route SIGINT to on_sigint without restarting interrupted syscalls. Install
// only once the UI loop owns the terminal; before that SIGINT keeps its
// default action so prompts can be abandoned.
[[nodiscard]] bool install_sigint_handler();
void on_atexit_restore();

[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// Dashboard color roles, mapped to the terminal's own 16-color palette
enum class Color { Header, Text, Notice, Name, Source, Dest, Bar, Rate };

// Empty when stdout is not a terminal
[[nodiscard]] std::string sgr(Color c);
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_reset();

// Wait up to timeout_ms for a key on stdin. Returns the byte read or -1.
[[nodiscard]] int wait_key(int timeout_ms);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
};

} // namespace xferwatch::ui
