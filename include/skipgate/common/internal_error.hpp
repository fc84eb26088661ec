#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace skipgate::common {

// Exception type for internal skipgate errors (library bugs, not config errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in skipgate, not in the rules file.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace skipgate::common
