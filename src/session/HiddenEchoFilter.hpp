#ifndef __FT_HIDDEN_ECHO_FILTER_HPP__
#define __FT_HIDDEN_ECHO_FILTER_HPP__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Removes the terminal's echo of a command the engine typed on the
 * operator's behalf.
 *
 * The non-whitespace characters of the command are matched in order against
 * the output. Escape sequences, whitespace and control bytes between them are
 * tolerated (line editors redraw freely, and wrap long lines with CR/LF) and
 * a backspace takes back the last matched character. Bytes that might belong
 * to the echo are held until the match either completes (they are dropped) or
 * fails (they are released). On a mismatch the match falls back KMP style to
 * the longest matched suffix that is still a prefix of the command.
 */
class HiddenEchoFilter {
 public:
  static const size_t DEFAULT_WINDOW = 8192;

  explicit HiddenEchoFilter(size_t window = DEFAULT_WINDOW);

  /** @brief Starts looking for the echo of `command`. */
  void arm(const string& command);

  /** @brief Stops filtering and returns any bytes still held. */
  string flush();

  bool isArmed() const { return armed; }

  /** @brief Returns the part of `chunk` that should be displayed. */
  string filter(const string& chunk);

 private:
  enum EscapeState { ESC_NONE, ESC_START, ESC_CSI, ESC_OSC, ESC_OSC_END };

  void emit(char c, string* out);
  void match(char c, string* out);
  void release(size_t count, string* out);

  bool armed;
  size_t window;
  string expected;
  // fallback[i]: length of the longest proper prefix of expected[0..i] that
  // is also a suffix of it.
  vector<size_t> fallback;
  size_t matched;
  size_t seen;
  string held;
  // Offset in `held` of each matched character.
  vector<size_t> matchedAt;
  EscapeState escape;
};
}  // namespace ft

#endif  // __FT_HIDDEN_ECHO_FILTER_HPP__
