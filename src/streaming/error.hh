#pragma once

#include "stow.types.h"

#include <functional>
#include <string>

namespace stow {
/**
 * @brief An error value. A default-constructed Error holds no error.
 */
class Error
{
  public:
    Error() = default;
    Error(StowStatusCode code, std::string message, int http_status = 0);

    /** @brief True if this value holds an error. */
    explicit operator bool() const { return code_ != StowStatusCode_Success; }

    StowStatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

    /** @brief HTTP status of the failed request, or 0 if not applicable. */
    int http_status() const { return http_status_; }

    /** @brief Code and message in a single line, for logging. */
    std::string to_string() const;

  private:
    StowStatusCode code_{ StowStatusCode_Success };
    std::string message_;
    int http_status_{ 0 };
};

/**
 * @brief Decides whether a failed upload should be retried with a fresh
 * upload endpoint.
 */
using RetryClassifier = std::function<bool(const Error&)>;

/**
 * @brief The default retry classifier.
 * @details Network failures, expired authorization (401), request timeouts
 * (408), throttling (429) and server errors (5xx) are retryable. Everything
 * else is permanent.
 * @param error The error to classify.
 * @return True if the error is transient.
 */
bool
is_retryable_error(const Error& error);
} // namespace stow
