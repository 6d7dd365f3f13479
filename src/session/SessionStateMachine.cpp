#include "SessionStateMachine.hpp"

#include "TerminalText.hpp"

namespace ft {
namespace {
const string DEFAULT_CONFIRMATION_REASON = "Agent is waiting for confirmation.";

void clearBlock(StateSnapshot* next) {
  next->set_is_blocked(false);
  next->clear_blocked_reason();
}
}  // namespace

const size_t SessionStateMachine::MAX_TAIL;

SessionStateMachine::SessionStateMachine(const string& providerHint,
                                         const string& agentCommand)
    : altScreen(false) {
  string provider = MarkerProtocol::normalizeProvider(
      providerHint.empty()
          ? MarkerProtocol::detectProviderFromCommand(agentCommand)
          : providerHint);
  state.set_mode(MODE_BOOTING);
  state.set_confidence(CONFIDENCE_LOW);
  state.set_source("init");
  state.set_seq(0);
  state.set_is_blocked(false);
  state.set_running(false);
  if (!provider.empty()) {
    state.set_provider(provider);
  }
  state.set_updated_at(nowMillis());

  // Evaluated in order; the first rule that matches decides the mode.
  classifiers = {
      {"alt_screen",
       [this](const string&, StateSnapshot* next) {
         if (!altScreen) return false;
         next->set_mode(MODE_TUI);
         next->set_confidence(CONFIDENCE_HIGH);
         clearBlock(next);
         return true;
       }},
      {"fallback_prompt",
       [this](const string& latest, StateSnapshot* next) {
         auto reason = TerminalText::extractBlockReason(latest);
         if (!reason) {
           reason = TerminalText::extractBlockReason(tail);
         }
         if (!reason) return false;
         next->set_mode(MODE_BLOCKED);
         next->set_confidence(CONFIDENCE_MEDIUM);
         next->set_is_blocked(true);
         next->set_blocked_reason(*reason);
         return true;
       }},
      {"fallback_tui",
       [this](const string&, StateSnapshot* next) {
         if (!TerminalText::looksLikeTuiChunk(tail)) return false;
         next->set_mode(MODE_TUI);
         next->set_confidence(CONFIDENCE_MEDIUM);
         clearBlock(next);
         return true;
       }},
      {"fallback_agent",
       [this](const string&, StateSnapshot* next) {
         if (!TerminalText::hasAgentSignal(tail, state.provider())) {
           return false;
         }
         next->set_mode(MODE_AGENT);
         next->set_confidence(CONFIDENCE_MEDIUM);
         clearBlock(next);
         return true;
       }},
      {"fallback_shell",
       [this](const string&, StateSnapshot* next) {
         if (!TerminalText::hasShellSignal(tail)) return false;
         next->set_mode(MODE_SHELL);
         next->set_confidence(CONFIDENCE_MEDIUM);
         clearBlock(next);
         return true;
       }},
  };
}

StateChange SessionStateMachine::start() {
  tail.clear();
  pendingMarker.clear();
  altScreen = false;
  return transition([](StateSnapshot* next) {
    next->set_mode(MODE_BOOTING);
    next->set_confidence(CONFIDENCE_LOW);
    next->set_source("session_started");
    next->set_running(true);
    clearBlock(next);
    next->clear_exit_code();
    next->clear_exit_signal();
  });
}

void SessionStateMachine::appendToTail(const string& cleaned) {
  if (cleaned.empty()) {
    return;
  }
  tail.append(cleaned);
  if (tail.size() > MAX_TAIL) {
    size_t cut = tail.size() - MAX_TAIL;
    // Do not start the tail in the middle of a UTF-8 character.
    while (cut < tail.size() && ((unsigned char)tail[cut] & 0xC0) == 0x80) {
      cut++;
    }
    tail.erase(0, cut);
  }
}

StateChange SessionStateMachine::consumeOutput(const string& data,
                                               optional<bool> altScreenHint) {
  string chunk = pendingMarker + data;
  pendingMarker.clear();
  string withoutMarkers;
  vector<Marker> markers =
      MarkerProtocol::parseMarkers(chunk, &withoutMarkers, &pendingMarker);

  string cleaned = TerminalText::cleanForTail(withoutMarkers);
  appendToTail(cleaned);

  if (altScreenHint) {
    altScreen = *altScreenHint;
  } else {
    auto toggled = TerminalText::detectAltScreen(withoutMarkers);
    if (toggled) {
      altScreen = *toggled;
    }
  }

  if (!markers.empty()) {
    StateChange lastChange = {false, state};
    for (const auto& marker : markers) {
      StateChange change = applyMarker(marker);
      if (change.changed) {
        lastChange = change;
      }
    }
    return lastChange;
  }
  return classify(cleaned);
}

StateChange SessionStateMachine::applyMarker(const Marker& marker) {
  StateChange lastChange = {false, state};
  auto field = [&marker](const string& key) {
    auto it = marker.find(key);
    return it == marker.end() ? string() : it->second;
  };

  string provider = MarkerProtocol::normalizeProvider(field("provider"));
  if (!provider.empty() && provider != state.provider()) {
    lastChange = transition(
        [&provider](StateSnapshot* next) { next->set_provider(provider); });
  }

  string type = toLower(field("type"));
  StateChange change = {false, state};
  if (type == "agent_started") {
    change = transition([](StateSnapshot* next) {
      next->set_mode(MODE_AGENT);
      next->set_confidence(CONFIDENCE_HIGH);
      next->set_source("marker");
      next->set_running(true);
      clearBlock(next);
    });
  } else if (type == "agent_exited") {
    string codeText = field("code");
    char* end = nullptr;
    long code = strtol(codeText.c_str(), &end, 10);
    bool parsed = !codeText.empty() && end != codeText.c_str();
    change = transition([parsed, code](StateSnapshot* next) {
      next->set_mode(MODE_SHELL);
      next->set_confidence(CONFIDENCE_HIGH);
      next->set_source("marker");
      clearBlock(next);
      if (parsed) {
        next->set_exit_code(int(code));
      } else {
        next->clear_exit_code();
      }
    });
  } else if (type == "awaiting_confirmation") {
    string reason = field("reason");
    if (reason.empty()) reason = field("message");
    if (reason.empty()) reason = DEFAULT_CONFIRMATION_REASON;
    reason = TerminalText::truncateCharacters(
        TerminalText::normalizeReasonText(reason),
        TerminalText::MAX_REASON_CHARS);
    change = transition([&reason](StateSnapshot* next) {
      next->set_mode(MODE_BLOCKED);
      next->set_confidence(CONFIDENCE_HIGH);
      next->set_source("marker");
      next->set_is_blocked(true);
      next->set_blocked_reason(reason);
    });
  } else if (type == "confirmation_resolved") {
    change = transition([](StateSnapshot* next) {
      next->set_mode(MODE_AGENT);
      next->set_confidence(CONFIDENCE_HIGH);
      next->set_source("marker");
      clearBlock(next);
    });
  } else {
    VLOG(1) << "Ignoring marker with unknown type: " << type;
  }
  return change.changed ? change : lastChange;
}

StateChange SessionStateMachine::consumeInput(const string& data) {
  if (data.empty()) {
    return {false, state};
  }

  // Whatever the user typed answers the prompt we saw, so the prompt text
  // must not re-block on the next chunk.
  if (state.is_blocked()) {
    tail.clear();
  }

  if (data.find('\x03') != string::npos) {
    return transition([](StateSnapshot* next) {
      next->set_mode(MODE_SHELL);
      next->set_confidence(CONFIDENCE_MEDIUM);
      next->set_source("user_interrupt");
      clearBlock(next);
    });
  }

  if (state.is_blocked()) {
    return transition([](StateSnapshot* next) {
      next->set_mode(MODE_AGENT);
      next->set_confidence(CONFIDENCE_MEDIUM);
      next->set_source("user_input");
      clearBlock(next);
    });
  }
  return {false, state};
}

StateChange SessionStateMachine::restore(const StateSnapshot& previous,
                                         const string& previousTail) {
  tail = previousTail;
  return transition([&previous](StateSnapshot* next) {
    next->set_mode(previous.mode());
    next->set_confidence(previous.confidence());
    next->set_source(previous.source());
    next->set_is_blocked(previous.is_blocked());
    if (previous.has_blocked_reason()) {
      next->set_blocked_reason(previous.blocked_reason());
    } else {
      next->clear_blocked_reason();
    }
  });
}

StateChange SessionStateMachine::consumeExit(optional<int> exitCode,
                                             optional<int> exitSignal) {
  return transition([exitCode, exitSignal](StateSnapshot* next) {
    next->set_mode(MODE_EXITED);
    next->set_confidence(CONFIDENCE_HIGH);
    next->set_source("process_exit");
    next->set_running(false);
    clearBlock(next);
    if (exitCode) {
      next->set_exit_code(*exitCode);
    } else {
      next->clear_exit_code();
    }
    if (exitSignal) {
      next->set_exit_signal(*exitSignal);
    } else {
      next->clear_exit_signal();
    }
  });
}

StateChange SessionStateMachine::updateAltScreen(bool next) {
  altScreen = next;
  return reconcile();
}

StateChange SessionStateMachine::reconcile() { return classify(""); }

StateChange SessionStateMachine::setProviderHint(const string& provider) {
  string normalized = MarkerProtocol::normalizeProvider(provider);
  if (normalized.empty()) {
    return {false, state};
  }
  return transition(
      [&normalized](StateSnapshot* next) { next->set_provider(normalized); });
}

StateChange SessionStateMachine::classify(const string& latest) {
  for (const auto& rule : classifiers) {
    StateSnapshot candidate = state;
    if (!rule.apply(latest, &candidate)) {
      continue;
    }
    candidate.set_source(rule.name);
    return transition(
        [&candidate](StateSnapshot* next) { *next = candidate; });
  }
  return {false, state};
}

StateChange SessionStateMachine::transition(const SnapshotPatch& patch) {
  StateSnapshot next = state;
  patch(&next);
  next.set_seq(state.seq());
  next.set_updated_at(state.updated_at());
  if (next.SerializeAsString() == state.SerializeAsString()) {
    return {false, state};
  }
  next.set_seq(state.seq() + 1);
  next.set_updated_at(nowMillis());
  state = next;
  VLOG(2) << "State seq " << state.seq() << " mode "
          << SessionMode_Name(state.mode()) << " source " << state.source();
  return {true, state};
}
}  // namespace ft
