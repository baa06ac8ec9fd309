#pragma once

#include "definitions.hh"
#include "error.hh"
#include "macros.hh"

#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <string_view>

namespace stow {
/**
 * @brief Exponential backoff: starts at @p initial, doubles on every call to
 * next(), and never exceeds @p max.
 */
class Backoff
{
  public:
    explicit Backoff(std::chrono::milliseconds initial = INITIAL_RETRY_DELAY,
                     std::chrono::milliseconds max = MAX_RETRY_DELAY);

    /**
     * @brief Get the delay to wait before the next retry, then double it.
     * @return The delay.
     */
    std::chrono::milliseconds next();

    std::chrono::milliseconds current() const { return delay_; }

  private:
    std::chrono::milliseconds delay_;
    const std::chrono::milliseconds max_;
};

/**
 * @brief Sleep for @p delay, waking early if @p stop_token is signalled.
 * @return True if the full delay elapsed, false if cancelled.
 */
[[nodiscard]] bool
sleep_for(std::chrono::milliseconds delay, std::stop_token stop_token);

struct RetryPolicy
{
    RetryClassifier is_retryable{ is_retryable_error };
    uint32_t max_attempts{ 0 }; // 0 means unlimited
};

/**
 * @brief Run @p attempt until it succeeds, fails permanently, runs out of
 * attempts, or is cancelled.
 * @details After each retryable failure the caller sleeps with exponential
 * backoff, then replaces @p endpoint with a freshly acquired one before
 * trying again. A failure to acquire an endpoint is not retried.
 * @param policy Classifier and attempt cap.
 * @param stop_token Cancellation signal.
 * @param what Description of the upload, for logging.
 * @param endpoint The endpoint to use for the first attempt. Replaced on
 * retry.
 * @param acquire Acquires a fresh endpoint.
 * @param attempt Performs a single upload attempt.
 * @return An empty Error on success, otherwise the final error.
 */
template<typename EndpointT>
[[nodiscard]] Error
upload_with_retries(
  const RetryPolicy& policy,
  std::stop_token stop_token,
  std::string_view what,
  std::unique_ptr<EndpointT>& endpoint,
  const std::function<Error(std::unique_ptr<EndpointT>&)>& acquire,
  const std::function<Error(EndpointT&)>& attempt)
{
    Backoff backoff;
    for (uint32_t n_attempts = 1;; ++n_attempts) {
        if (stop_token.stop_requested()) {
            return { StowStatusCode_Cancelled, "Upload cancelled" };
        }

        CHECK(endpoint);
        Error error = attempt(*endpoint);
        if (!error) {
            return {};
        }

        if (!policy.is_retryable || !policy.is_retryable(error)) {
            return error;
        }

        if (policy.max_attempts > 0 && n_attempts >= policy.max_attempts) {
            LOG_ERROR("Giving up on ",
                      what,
                      " after ",
                      n_attempts,
                      " attempts: ",
                      error.to_string());
            return error;
        }

        const auto delay = backoff.next();
        LOG_INFO("Attempt ",
                 n_attempts,
                 " of ",
                 what,
                 " failed: ",
                 error.to_string(),
                 "; retrying in ",
                 delay.count(),
                 " ms");

        if (!sleep_for(delay, stop_token)) {
            return { StowStatusCode_Cancelled, "Upload cancelled" };
        }

        endpoint.reset();
        if (Error acquire_error = acquire(endpoint); acquire_error) {
            return acquire_error;
        }
    }
}
} // namespace stow
