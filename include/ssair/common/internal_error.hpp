#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace ssair::common {

// Exception type for malformed IR (compiler bugs, not user errors).
// Raised when an earlier pass hands this layer something it must never
// produce: an unknown variable, a misplaced terminator, an unrepresentable
// source type, an unprintable node.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal compiler error in {}: {}\n"
                "This is a bug in an earlier compiler pass.",
                context, detail)),
        context_(context),
        detail_(detail) {
  }

  [[nodiscard]] auto Context() const -> const std::string& {
    return context_;
  }

  [[nodiscard]] auto Detail() const -> const std::string& {
    return detail_;
  }

 private:
  std::string context_;
  std::string detail_;
};

}  // namespace ssair::common
