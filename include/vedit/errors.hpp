/**
 * @file errors.hpp
 * @brief Error types raised by validation and by the render pipeline
 */

#ifndef VEDIT_ERRORS_HPP
#define VEDIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vedit {

/**
 * @class ValidationError
 * @brief Malformed or missing timeline data.
 * @note Raised before any encoder invocation; a submission that fails
 *       validation creates no job.
 */
class ValidationError : public std::runtime_error {
public:
  explicit ValidationError(const std::string &msg) : std::runtime_error(msg) {}
};

/// Classification of a failed render
enum class ErrorKind {
  Validation,          //< Timeline cannot be rendered (e.g. empty)
  ExternalToolMissing, //< Encoder binary unresolvable (environment issue)
  ExternalToolError,   //< Encoder ran and failed (content/encoding issue)
  Io,                  //< Scratch or export filesystem failure
  Cancelled            //< Job cancelled while queued or running
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::ExternalToolMissing:
    return "tool-missing";
  case ErrorKind::ExternalToolError:
    return "tool-error";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

/**
 * @class RenderError
 * @brief Fatal failure of an export run; the job ends FAILED with what().
 */
class RenderError : public std::runtime_error {
public:
  RenderError(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace vedit

#endif // VEDIT_ERRORS_HPP
