#include "HiddenEchoFilter.hpp"

namespace ft {
const size_t HiddenEchoFilter::DEFAULT_WINDOW;

HiddenEchoFilter::HiddenEchoFilter(size_t _window)
    : armed(false),
      window(_window),
      matched(0),
      seen(0),
      escape(ESC_NONE) {}

void HiddenEchoFilter::arm(const string& command) {
  expected.clear();
  for (char c : command) {
    if (!isspace((unsigned char)c)) {
      expected.push_back(c);
    }
  }
  fallback.assign(expected.size(), 0);
  for (size_t i = 1, k = 0; i < expected.size(); i++) {
    while (k > 0 && expected[i] != expected[k]) {
      k = fallback[k - 1];
    }
    if (expected[i] == expected[k]) {
      k++;
    }
    fallback[i] = k;
  }
  matched = 0;
  seen = 0;
  held.clear();
  matchedAt.clear();
  escape = ESC_NONE;
  armed = !expected.empty();
}

string HiddenEchoFilter::flush() {
  string rest;
  rest.swap(held);
  matchedAt.clear();
  armed = false;
  matched = 0;
  escape = ESC_NONE;
  return rest;
}

void HiddenEchoFilter::emit(char c, string* out) {
  if (matched > 0) {
    held.push_back(c);
  } else {
    out->push_back(c);
  }
}

void HiddenEchoFilter::release(size_t count, string* out) {
  // Drops the first `count` matched characters, and everything held before
  // the next one, from the candidate echo.
  if (count >= matched) {
    out->append(held);
    held.clear();
    matchedAt.clear();
    matched = 0;
    return;
  }
  size_t offset = matchedAt[count];
  out->append(held, 0, offset);
  held.erase(0, offset);
  matchedAt.erase(matchedAt.begin(), matchedAt.begin() + count);
  for (auto& at : matchedAt) {
    at -= offset;
  }
  matched -= count;
}

void HiddenEchoFilter::match(char c, string* out) {
  while (matched > 0 && c != expected[matched]) {
    release(matched - fallback[matched - 1], out);
  }
  if (c != expected[matched]) {
    out->push_back(c);
    return;
  }
  matchedAt.push_back(held.size());
  held.push_back(c);
  matched++;
  if (matched == expected.size()) {
    held.clear();
    matchedAt.clear();
    matched = 0;
    armed = false;
  }
}

string HiddenEchoFilter::filter(const string& chunk) {
  if (!armed) {
    return chunk;
  }
  string out;
  out.reserve(chunk.size());
  for (size_t i = 0; i < chunk.size(); i++) {
    char c = chunk[i];
    if (!armed) {
      out.append(chunk, i, string::npos);
      break;
    }
    if (++seen > window) {
      VLOG(1) << "Hidden echo window elapsed without a full match";
      out.append(flush());
      out.append(chunk, i, string::npos);
      break;
    }

    switch (escape) {
      case ESC_START:
        escape = (c == '[') ? ESC_CSI : (c == ']') ? ESC_OSC : ESC_NONE;
        emit(c, &out);
        continue;
      case ESC_CSI:
        if (c >= 0x40 && c <= 0x7e) escape = ESC_NONE;
        emit(c, &out);
        continue;
      case ESC_OSC:
        if (c == '\x07') {
          escape = ESC_NONE;
        } else if (c == '\x1b') {
          escape = ESC_OSC_END;
        }
        emit(c, &out);
        continue;
      case ESC_OSC_END:
        escape = (c == '\\') ? ESC_NONE : ESC_OSC;
        emit(c, &out);
        continue;
      case ESC_NONE:
        break;
    }

    unsigned char u = (unsigned char)c;
    if (c == '\x1b') {
      escape = ESC_START;
      emit(c, &out);
    } else if (c == '\b' || u == 0x7f) {
      if (matched > 0) {
        matched--;
        matchedAt.pop_back();
        held.push_back(c);
        if (matched == 0) {
          out.append(held);
          held.clear();
        }
      } else {
        out.push_back(c);
      }
    } else if (u < 0x20 || c == ' ') {
      emit(c, &out);
    } else {
      match(c, &out);
    }
  }
  return out;
}
}  // namespace ft
