#ifndef __FT_FAKE_SUBPROCESS_UTILS_HPP__
#define __FT_FAKE_SUBPROCESS_UTILS_HPP__

#include "SubprocessUtils.hpp"

namespace ft {
/** @brief Answers commandExists from a fixed set. */
class FakeSubprocessUtils : public SubprocessUtils {
 public:
  explicit FakeSubprocessUtils(const set<string>& _available = set<string>())
      : available(_available) {}

  virtual string SubprocessToString(const string& command,
                                    const vector<string>& args) {
    calls.push_back(command);
    return "";
  }

  virtual bool commandExists(const string& command) {
    calls.push_back(command);
    return available.count(command) > 0;
  }

  set<string> available;
  vector<string> calls;
};
}  // namespace ft

#endif  // __FT_FAKE_SUBPROCESS_UTILS_HPP__
