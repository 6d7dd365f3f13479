#include "TerminalText.hpp"

#include <regex>

namespace ft {
namespace TerminalText {
namespace {
const auto ICASE = std::regex::ECMAScript | std::regex::icase;

// "╭───", the top-left corner of Claude Code's welcome box.
const string CLAUDE_BOX_PREFIX = "\xe2\x95\xad\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80";

bool isSpaceChar(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

string ltrim(const string& s) {
  size_t i = 0;
  while (i < s.size() && isSpaceChar(s[i])) {
    i++;
  }
  return s.substr(i);
}

vector<string> splitLines(const string& value) {
  vector<string> lines;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find('\n', start);
    if (end == string::npos) {
      end = value.size();
    }
    string line = value.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

const std::regex& blockPromptRegex() {
  static const std::regex re(
      R"(((?:\(|\[)\s*y(?:es)?\s*/\s*n(?:o)?\s*(?:\)|\])\s*$))"
      R"(|(\b(?:yes/no|y/n)\b\s*$))"
      R"(|(\b(?:press|hit)\s+(?:enter|return)\b(?:\s+to\s+(?:continue|confirm))?\s*$))"
      R"(|(\bselect\s+(?:an?\s+)?option\b\s*[:?]?\s*$))"
      R"(|(\benter\s+(?:choice|selection)\b\s*[:?]?\s*$))"
      R"(|(\btype\s+(?:yes|no|y|n)\b\s*[:?]?\s*$))"
      R"(|(\b(?:approve|reject)\s*\(\s*[yn]\s*\)\s*$))",
      ICASE);
  return re;
}

const std::regex& providerPromptRegex() {
  static const std::regex re(
      R"(action\s+required[:\s]|would\s+you\s+like\s+to\s+proceed\?)"
      R"(|do\s+you\s+want\s+to\s+proceed\?|are\s+you\s+sure\?|approve|reject)",
      ICASE);
  return re;
}

bool isPromptLine(const string& line) {
  return std::regex_search(line, blockPromptRegex()) ||
         std::regex_search(line, providerPromptRegex());
}

// Block-element glyphs drawn by full-screen banners: █ ░ ▐ ▛ ▜ ▌ ▘ ▝
bool isBannerGlyph(const string& s, size_t i) {
  if (i + 2 >= s.size()) {
    return false;
  }
  if ((unsigned char)s[i] != 0xe2 || (unsigned char)s[i + 1] != 0x96) {
    return false;
  }
  switch ((unsigned char)s[i + 2]) {
    case 0x88:  // █
    case 0x91:  // ░
    case 0x90:  // ▐
    case 0x9b:  // ▛
    case 0x9c:  // ▜
    case 0x8c:  // ▌
    case 0x98:  // ▘
    case 0x9d:  // ▝
      return true;
    default:
      return false;
  }
}

bool hasBannerGlyphRun(const string& line) {
  string s = ltrim(line);
  int run = 0;
  for (size_t i = 0; i + 3 <= s.size() && isBannerGlyph(s, i); i += 3) {
    run++;
    if (run >= 8) {
      return true;
    }
  }
  return false;
}

bool hasClaudeBanner(const string& text) {
  for (const auto& line : splitLines(text)) {
    string s = ltrim(line);
    if (s.compare(0, CLAUDE_BOX_PREFIX.size(), CLAUDE_BOX_PREFIX) != 0) {
      continue;
    }
    s = toLower(ltrim(s.substr(CLAUDE_BOX_PREFIX.size())));
    if (s.compare(0, 13, "claude code v") == 0) {
      return true;
    }
  }
  return false;
}
}  // namespace

string stripAnsi(const string& value) {
  string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (value[i] == '\x1b' && i + 1 < value.size() && value[i + 1] == '[') {
      size_t j = i + 2;
      while (j < value.size() &&
             (isdigit((unsigned char)value[j]) || value[j] == ';' ||
              value[j] == '?')) {
        j++;
      }
      while (j < value.size() && value[j] >= 0x20 && value[j] <= 0x2f) {
        j++;
      }
      if (j < value.size() && value[j] >= 0x40 && value[j] <= 0x7e) {
        i = j + 1;
        continue;
      }
    }
    out.push_back(value[i]);
    i++;
  }
  return out;
}

string stripOsc(const string& value, const string& replacement) {
  string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (value[i] == '\x1b' && i + 1 < value.size() && value[i + 1] == ']') {
      size_t j = i + 2;
      size_t end = string::npos;
      while (j < value.size()) {
        if (value[j] == '\x07') {
          end = j + 1;
          break;
        }
        if (value[j] == '\x1b' && j + 1 < value.size() &&
            value[j + 1] == '\\') {
          end = j + 2;
          break;
        }
        j++;
      }
      if (end != string::npos) {
        out.append(replacement);
        i = end;
        continue;
      }
    }
    out.push_back(value[i]);
    i++;
  }
  return out;
}

string cleanForTail(const string& value) {
  string cleaned = stripAnsi(stripOsc(value, ""));
  std::replace(cleaned.begin(), cleaned.end(), '\r', '\n');
  return cleaned;
}

optional<bool> detectAltScreen(const string& chunk) {
  static const vector<string> modes = {"\x1b[?1049", "\x1b[?1047", "\x1b[?47"};
  optional<bool> result;
  size_t lastPos = 0;
  bool found = false;
  for (const auto& prefix : modes) {
    size_t pos = 0;
    while ((pos = chunk.find(prefix, pos)) != string::npos) {
      size_t flag = pos + prefix.size();
      if (flag < chunk.size() && (chunk[flag] == 'h' || chunk[flag] == 'l')) {
        if (!found || pos >= lastPos) {
          lastPos = pos;
          found = true;
          result = (chunk[flag] == 'h');
        }
      }
      pos = flag;
    }
  }
  return result;
}

string truncateCharacters(const string& value, size_t maxChars) {
  size_t count = 0;
  for (size_t i = 0; i < value.size(); i++) {
    // Continuation bytes belong to the character already counted.
    if (((unsigned char)value[i] & 0xC0) == 0x80) {
      continue;
    }
    if (count == maxChars) {
      return value.substr(0, i);
    }
    count++;
  }
  return value;
}

string normalizeReasonText(const string& value) {
  if (value.empty()) {
    return string();
  }
  string raw = stripOsc(value, " ");
  for (auto& c : raw) {
    unsigned char u = (unsigned char)c;
    if (u <= 0x08 || u == 0x0b || u == 0x0c || (u >= 0x0e && u <= 0x1f) ||
        u == 0x7f || u == '\r') {
      c = ' ';
    }
  }
  string text;
  text.reserve(raw.size());
  bool pendingSpace = false;
  for (char c : raw) {
    if (isSpaceChar(c)) {
      pendingSpace = !text.empty();
      continue;
    }
    if (pendingSpace) {
      text.push_back(' ');
      pendingSpace = false;
    }
    text.push_back(c);
  }
  if (text.empty()) {
    return text;
  }

  static const std::regex sentenceGlue(R"(([.?!])([A-Za-z]))");
  static const std::regex providerGlue(
      R"(\b(Claude|Codex|Gemini|Aider|Amp)(has|is|would|wants|can)\b)");
  static const std::regex planGlue(
      R"(\bhaswrittenupaplanandisreadytoexecute\b)", ICASE);
  static const std::regex planGlueShort(
      R"(\bwrittenupaplanandisreadytoexecute\b)", ICASE);
  static const std::regex proceedGlue(R"(\bwouldyouliketoproceed\??\b)",
                                      ICASE);
  static const std::regex repeatedQuestion(R"(\?{2,})");

  text = std::regex_replace(text, sentenceGlue, "$1 $2");
  text = std::regex_replace(text, providerGlue, "$1 $2");
  text = std::regex_replace(text, planGlue,
                            "has written up a plan and is ready to execute");
  text = std::regex_replace(text, planGlueShort,
                            "written up a plan and is ready to execute");
  text = std::regex_replace(text, proceedGlue, "Would you like to proceed?");
  text = std::regex_replace(text, repeatedQuestion, "?");

  string compact;
  for (char c : toLower(text)) {
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '?') {
      compact.push_back(c);
    }
  }
  if (compact.find(
          "claudehaswrittenupaplanandisreadytoexecutewouldyouliketoproceed") !=
      string::npos) {
    return "Action Required: Claude has written up a plan and is ready to "
           "execute. Would you like to proceed?";
  }
  return text;
}

optional<string> extractBlockReason(const string& value) {
  string cleaned = stripAnsi(value);
  vector<string> lines;
  for (const auto& line : splitLines(cleaned)) {
    string normalized = normalizeReasonText(line);
    if (!normalized.empty()) {
      lines.push_back(normalized);
    }
  }

  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    if (isPromptLine(*it)) {
      return truncateCharacters(*it, MAX_REASON_CHARS);
    }
  }

  string singleLine = normalizeReasonText(cleaned);
  if (!singleLine.empty() && isPromptLine(singleLine)) {
    return truncateCharacters(singleLine, MAX_REASON_CHARS);
  }
  return nullopt;
}

bool hasShellSignal(const string& value) {
  static const std::regex continuationPrompt(
      R"(^\s*(?:quote|dquote|bquote|cmdsubst|heredoc|for|while|if|then|else|do)>\s*$)");
  static const std::regex powershellPrompt(R"(^\s*PS [^\n\r>]{0,220}>\s*$)");
  static const std::regex sigilPrompt(R"(^\s*[^\n\r]{0,220}[#$%]\s*$)");
  static const std::regex pathPrompt(
      R"(^\s*(?:~|/)[^\s]{1,260}(?:\s+[A-Za-z0-9._/-]{1,120}){1,3}\s*$)");
  static const std::regex shellError(
      R"(\b(?:zsh|bash|fish|pwsh|powershell|sh):\s+(?:command not found|not recognized|no such file|permission denied)\b)",
      ICASE);

  for (const auto& rawLine : splitLines(value)) {
    string line = trim(rawLine);
    if (line.empty()) {
      continue;
    }
    if (std::regex_search(line, continuationPrompt) ||
        std::regex_search(line, powershellPrompt) ||
        std::regex_search(line, sigilPrompt) ||
        std::regex_search(line, pathPrompt) ||
        std::regex_search(line, shellError)) {
      return true;
    }
  }
  return false;
}

bool hasAgentSignal(const string& value, const string& providerHint) {
  if (value.empty()) {
    return false;
  }
  static const std::regex welcomeBack(R"(\bWelcome back\b)", ICASE);
  static const std::regex recentActivity(R"(\bRecent activity\b)", ICASE);
  static const std::regex messagePrompt(
      R"(\bType your message or @path/to/file\b)", ICASE);
  static const std::regex authenticated(R"(\bAuthenticated with .*/auth\b)",
                                        ICASE);
  static const std::map<string, std::regex> providerBanners = {
      {"claude", std::regex(R"(\bClaude Code\b)", ICASE)},
      {"gemini", std::regex(R"(\bGemini\b)", ICASE)},
      {"aider", std::regex(R"(\baider\b)", ICASE)},
      {"codex", std::regex(R"(\bcodex\b)", ICASE)},
      {"amp", std::regex(R"(\bamp\b)", ICASE)},
  };

  if (hasClaudeBanner(value)) return true;
  if (std::regex_search(value, welcomeBack) ||
      std::regex_search(value, recentActivity)) {
    return true;
  }
  if (std::regex_search(value, messagePrompt)) return true;
  if (std::regex_search(value, authenticated)) return true;

  auto it = providerBanners.find(providerHint);
  if (it != providerBanners.end() && std::regex_search(value, it->second)) {
    return true;
  }
  return false;
}

bool looksLikeTuiChunk(const string& value) {
  string cleaned = stripAnsi(value);
  std::replace(cleaned.begin(), cleaned.end(), '\r', '\n');
  if (trim(cleaned).empty()) {
    return false;
  }
  static const vector<std::regex> chrome = {
      std::regex(R"(Type your message or @path/to/file)", ICASE),
      std::regex(R"(for shortcuts)", ICASE),
      std::regex(R"(\bno sandbox\b)", ICASE),
      std::regex(R"(Welcome back)", ICASE),
      std::regex(R"(Authenticated with .*/auth)", ICASE),
      std::regex(R"(GEMINI\.md file)", ICASE),
  };
  for (const auto& re : chrome) {
    if (std::regex_search(cleaned, re)) {
      return true;
    }
  }
  for (const auto& line : splitLines(cleaned)) {
    if (hasBannerGlyphRun(line)) {
      return true;
    }
  }
  return false;
}
}  // namespace TerminalText
}  // namespace ft
