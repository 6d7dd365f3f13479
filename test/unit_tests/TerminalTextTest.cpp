#include "TerminalText.hpp"
#include "TestHeaders.hpp"

using namespace ft;
using namespace ft::TerminalText;

TEST_CASE("stripAnsi removes CSI sequences", "[TerminalText]") {
  REQUIRE(stripAnsi("\x1b[31mred\x1b[0m plain") == "red plain");
  REQUIRE(stripAnsi("\x1b[?2004hprompt") == "prompt");
  REQUIRE(stripAnsi("no escapes") == "no escapes");
}

TEST_CASE("stripAnsi keeps an unterminated sequence", "[TerminalText]") {
  REQUIRE(stripAnsi("abc\x1b[12") == "abc\x1b[12");
}

TEST_CASE("stripOsc handles both terminators", "[TerminalText]") {
  REQUIRE(stripOsc("a\x1b]0;title\x07" "b", "") == "ab");
  REQUIRE(stripOsc("a\x1b]0;title\x1b\\b", " ") == "a b");
}

TEST_CASE("cleanForTail strips escapes and turns CR into LF",
          "[TerminalText]") {
  REQUIRE(cleanForTail("\x1b]0;t\x07\x1b[1mhi\x1b[0m\r\nthere\r") ==
          "hi\n\nthere\n");
}

TEST_CASE("detectAltScreen reports the last toggle", "[TerminalText]") {
  REQUIRE(detectAltScreen("\x1b[?1049h") == optional<bool>(true));
  REQUIRE(detectAltScreen("\x1b[?1049hvim\x1b[?1049l") ==
          optional<bool>(false));
  REQUIRE(detectAltScreen("\x1b[?47h") == optional<bool>(true));
  REQUIRE_FALSE(detectAltScreen("plain text").has_value());
  REQUIRE_FALSE(detectAltScreen("\x1b[?1049").has_value());
}

TEST_CASE("truncateCharacters counts UTF-8 characters", "[TerminalText]") {
  REQUIRE(truncateCharacters("abc", 10) == "abc");
  REQUIRE(truncateCharacters("abcdef", 3) == "abc");
  // "é" is two bytes but one character.
  REQUIRE(truncateCharacters("a\xc3\xa9" "b", 2) == "a\xc3\xa9");
  // "─" is three bytes.
  REQUIRE(truncateCharacters("\xe2\x94\x80\xe2\x94\x80x", 1) ==
          "\xe2\x94\x80");
  REQUIRE(truncateCharacters("", 5) == "");
}

TEST_CASE("normalizeReasonText collapses whitespace and control bytes",
          "[TerminalText]") {
  REQUIRE(normalizeReasonText("  Do\tyou\x01 want\r\nto  proceed?  ") ==
          "Do you want to proceed?");
  REQUIRE(normalizeReasonText("") == "");
  REQUIRE(normalizeReasonText("\x1b]0;title\x07") == "");
}

TEST_CASE("normalizeReasonText repairs glued words", "[TerminalText]") {
  REQUIRE(normalizeReasonText(
              "Claudehas written up a plan.Would you like to proceed??") ==
          "Claude has written up a plan. Would you like to proceed?");
  REQUIRE(normalizeReasonText("Claudehaswrittenupaplanandisreadytoexecute "
                              "Wouldyouliketoproceed?") ==
          "Action Required: Claude has written up a plan and is ready to "
          "execute. Would you like to proceed?");
}

TEST_CASE("extractBlockReason finds the last prompt line", "[TerminalText]") {
  auto reason = extractBlockReason("building...\nContinue? (y/n)\n");
  REQUIRE(reason.has_value());
  REQUIRE(*reason == "Continue? (y/n)");

  reason = extractBlockReason("Overwrite file? [Y/n]\ndone\nPress Enter to "
                              "continue");
  REQUIRE(reason.has_value());
  REQUIRE(*reason == "Press Enter to continue");
}

TEST_CASE("extractBlockReason recognizes provider phrases", "[TerminalText]") {
  auto reason =
      extractBlockReason("\x1b[1mDo you want to proceed?\x1b[0m\n 1. Yes");
  REQUIRE(reason.has_value());
  REQUIRE(*reason == "Do you want to proceed?");
}

TEST_CASE("extractBlockReason ignores ordinary output", "[TerminalText]") {
  REQUIRE_FALSE(extractBlockReason("$ ls\nfile.txt\n").has_value());
  REQUIRE_FALSE(extractBlockReason("").has_value());
}

TEST_CASE("extractBlockReason caps the reason", "[TerminalText]") {
  string longLine = string(400, 'x') + " (y/n)";
  auto reason = extractBlockReason(longLine);
  REQUIRE(reason.has_value());
  REQUIRE(reason->size() == MAX_REASON_CHARS);
}

TEST_CASE("extractBlockReason caps accented reasons by character",
          "[TerminalText]") {
  string accented;
  for (int i = 0; i < 300; i++) {
    accented += "\xc3\xa9";
  }
  auto reason = extractBlockReason(accented + " (y/n)");
  REQUIRE(reason.has_value());

  string expected;
  for (size_t i = 0; i < MAX_REASON_CHARS; i++) {
    expected += "\xc3\xa9";
  }
  REQUIRE(*reason == expected);
  REQUIRE(reason->size() == 2 * MAX_REASON_CHARS);
}

TEST_CASE("hasShellSignal recognizes prompts and shell errors",
          "[TerminalText]") {
  REQUIRE(hasShellSignal("user@host:~/src$ "));
  REQUIRE(hasShellSignal("root@box:/# "));
  REQUIRE(hasShellSignal("quote> "));
  REQUIRE(hasShellSignal("PS C:\\Users\\me> "));
  REQUIRE(hasShellSignal("~/src/project main"));
  REQUIRE(hasShellSignal("zsh: command not found: clude"));
  REQUIRE_FALSE(hasShellSignal("compiling 3 files"));
  REQUIRE_FALSE(hasShellSignal(""));
}

TEST_CASE("hasAgentSignal recognizes banners", "[TerminalText]") {
  REQUIRE(hasAgentSignal("\xe2\x95\xad\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80 "
                         "Claude Code v1.0.3 \xe2\x94\x80\xe2\x94\x80",
                         ""));
  REQUIRE(hasAgentSignal("Welcome back, Sam!", ""));
  REQUIRE(hasAgentSignal("> Type your message or @path/to/file", ""));
  REQUIRE(hasAgentSignal("Gemini CLI", "gemini"));
  REQUIRE_FALSE(hasAgentSignal("Gemini CLI", ""));
  REQUIRE_FALSE(hasAgentSignal("Gemini CLI", "claude"));
  REQUIRE_FALSE(hasAgentSignal("", "claude"));
}

TEST_CASE("looksLikeTuiChunk recognizes full-screen chrome",
          "[TerminalText]") {
  REQUIRE(looksLikeTuiChunk("  ? for shortcuts"));
  REQUIRE(looksLikeTuiChunk("Using 1 GEMINI.md file"));
  string blocks;
  for (int i = 0; i < 8; i++) {
    blocks += "\xe2\x96\x88";
  }
  REQUIRE(looksLikeTuiChunk("  " + blocks + " banner"));
  REQUIRE_FALSE(looksLikeTuiChunk("\xe2\x96\x88\xe2\x96\x88 short"));
  REQUIRE_FALSE(looksLikeTuiChunk("   \r\n"));
  REQUIRE_FALSE(looksLikeTuiChunk("make: nothing to be done"));
}
