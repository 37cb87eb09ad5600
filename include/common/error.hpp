#ifndef BRIGHTCHAIN_COMMON_ERROR_HPP
#define BRIGHTCHAIN_COMMON_ERROR_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace brightchain {

// Base of every error raised by the block layer. Carries the error kind and
// the structured values needed to diagnose it without a stack trace.
class BrightChainError : public std::runtime_error {
public:
  using Context = std::map<std::string, std::string>;

  BrightChainError(const std::string& category, const std::string& reason, Context context = {})
    : std::runtime_error(format(category, reason, context))
    , category_(category)
    , reason_(reason)
    , context_(std::move(context)) {}

  const std::string& category() const { return category_; }
  const std::string& reason() const { return reason_; }
  const Context& context() const { return context_; }

private:
  std::string category_;
  std::string reason_;
  Context context_;

  static std::string format(const std::string& category, const std::string& reason,
                            const Context& context) {
    std::string message = category + ": " + reason;
    if (!context.empty()) {
      message += " [";
      bool first = true;
      for (const auto& [key, value] : context) {
        if (!first) {
          message += ", ";
        }
        message += key + "=" + value;
        first = false;
      }
      message += "]";
    }
    return message;
  }
};

} // namespace brightchain

#endif // BRIGHTCHAIN_COMMON_ERROR_HPP
