#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostwarden::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Rendered output checks: the failure message carries the text that was searched.
inline void require_contains(const std::string &text, const std::string &needle,
                             const std::string &message) {
  if (text.find(needle) == std::string::npos) {
    throw std::runtime_error(message + " (missing '" + needle + "' in: " + text + ")");
  }
}

} // namespace hostwarden::tests
