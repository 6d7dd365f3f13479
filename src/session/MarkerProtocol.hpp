#ifndef __FT_MARKER_PROTOCOL_HPP__
#define __FT_MARKER_PROTOCOL_HPP__

#include "Headers.hpp"

namespace ft {
/**
 * @brief One `key=value;key=value` payload carried in a
 * `ESC ] 1337 ; FleetTermEvent=... BEL` escape sequence. Keys are lowercased.
 */
typedef map<string, string> Marker;

/**
 * @brief Encoding and decoding of the private OSC lifecycle markers that
 * wrapped agent commands print around themselves.
 */
class MarkerProtocol {
 public:
  static const string PREFIX;

  /** @brief Providers with a known banner and wrapper. */
  static const vector<string> SUPPORTED_PROVIDERS;

  /** @brief Lowercased provider name, or empty if it is not supported. */
  static string normalizeProvider(const string& value);

  /**
   * @brief Guesses the provider from the text of a command line; the first
   * provider name (in SUPPORTED_PROVIDERS order) that occurs wins.
   */
  static string detectProviderFromCommand(const string& value);

  /** @brief Parses a `key=value;key=value` payload. */
  static Marker parsePayload(const string& raw);

  /**
   * @brief Extracts every complete marker from `data`.
   *
   * @param stripped If not null, receives `data` with the complete markers
   * removed.
   * @param pending If not null, receives a trailing incomplete marker (the
   * prefix, or a prefix of the prefix, with no terminator yet). That text is
   * also left out of `stripped` so the caller can prepend it to the next
   * chunk.
   */
  static vector<Marker> parseMarkers(const string& data, string* stripped,
                                     string* pending);

  /** @brief Encodes a marker the way a wrapped command prints it. */
  static string encode(const Marker& marker);

  /**
   * @brief Wraps `command` in a shell group that prints `agent_started`
   * before it runs and `agent_exited;code=$?` after. Unsupported providers
   * and empty commands are returned unchanged.
   */
  static string buildAgentWrapperCommand(const string& command,
                                         const string& provider);
};
}  // namespace ft

#endif  // __FT_MARKER_PROTOCOL_HPP__
