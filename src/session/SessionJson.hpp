#ifndef __FT_SESSION_JSON_HPP__
#define __FT_SESSION_JSON_HPP__

#include "Headers.hpp"
#include "SessionEngine.hpp"
#include "nlohmann/json.hpp"

namespace ft {
using json = nlohmann::json;

/**
 * @brief JSON views of engine types, keyed in camelCase with lowercase enum
 * names ("shell", "medium", ...).
 */
namespace SessionJson {
string modeName(SessionMode mode);
string confidenceName(ModeConfidence confidence);
/** @brief Inverse of modeName; nullopt for unknown names. */
optional<SessionMode> parseMode(const string& name);

json toJson(const StateSnapshot& snapshot);
json toJson(const SandboxDescriptor& sandbox);
json toJson(const ResourceAssignment& assignment);
json toJson(const SessionInfo& info);
/** @brief `{"event": "<kind>", "taskId": ..., ...}` */
json toJson(const SessionEvent& event);

json toJson(const CreateResult& result);
json toJson(const AttachResult& result);
json toJson(const OperationResult& result);
json toJson(const RestartResult& result);

/** @brief Serializes one line; invalid UTF-8 is replaced, not thrown. */
string dumpLine(const json& value);
}  // namespace SessionJson
}  // namespace ft

#endif  // __FT_SESSION_JSON_HPP__
