#ifndef __FT_TERMINAL_TEXT_HPP__
#define __FT_TERMINAL_TEXT_HPP__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Text utilities for raw terminal output.
 *
 * Everything here operates on bytes as emitted by the PTY, so callers may pass
 * chunks containing partial escape sequences or partial UTF-8 characters.
 */
namespace TerminalText {
/** @brief Longest block reason kept, in UTF-8 characters. */
const size_t MAX_REASON_CHARS = 240;

/** @brief Removes CSI sequences (`ESC [ params intermediates final`). */
string stripAnsi(const string& value);

/**
 * @brief Replaces OSC sequences (`ESC ] ... BEL` or `ESC ] ... ESC \`) with
 * `replacement`.
 */
string stripOsc(const string& value, const string& replacement);

/**
 * @brief Strips OSC and CSI sequences and turns carriage returns into line
 * feeds; this is the form kept in the classifier's rolling tail.
 */
string cleanForTail(const string& value);

/**
 * @brief Returns the last alternate-screen toggle (`CSI ?1049/?1047/?47 h|l`)
 * in the chunk, if any.
 */
optional<bool> detectAltScreen(const string& chunk);

/**
 * @brief Keeps the first `maxChars` UTF-8 characters of `value`. Stray
 * continuation bytes count toward the character before them.
 */
string truncateCharacters(const string& value, size_t maxChars);

/**
 * @brief Collapses control characters and whitespace in a prompt line and
 * repairs words glued together by cursor-addressed redraws.
 */
string normalizeReasonText(const string& value);

/**
 * @brief Scans lines from the end and returns the first one that reads like a
 * confirmation prompt, normalized and truncated.
 */
optional<string> extractBlockReason(const string& value);

/** @brief Shell prompts, continuation prompts, "command not found" errors. */
bool hasShellSignal(const string& value);

/** @brief Known agent CLI banners, optionally narrowed by a provider hint. */
bool hasAgentSignal(const string& value, const string& providerHint);

/** @brief Banner and chrome text of known full-screen programs. */
bool looksLikeTuiChunk(const string& value);
}  // namespace TerminalText
}  // namespace ft

#endif  // __FT_TERMINAL_TEXT_HPP__
