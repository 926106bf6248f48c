#pragma once
#include <string>

namespace lk {

struct LegendError {
  std::string code;     // e.g. "INVALID_CONFIG"
  std::string message;  // human text
};

struct LegendStatus {
  bool ok{true};
  LegendError err{};
};

inline LegendStatus legendFail(const std::string& code, const std::string& message) {
  LegendStatus s;
  s.ok = false;
  s.err.code = code;
  s.err.message = message;
  return s;
}

} // namespace lk
