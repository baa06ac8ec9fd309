#pragma once

#include "error.hh"

#include <shared_mutex>
#include <stop_token>
#include <string>

namespace stow {
/**
 * @brief Holds the first error raised by any stage of an upload and the
 * cancellation signal that fires when it is set.
 * @details The error is written at most once; later errors are dropped.
 * All methods are safe to call from any thread.
 */
class ErrorSink
{
  public:
    explicit ErrorSink(std::string_view object_name);

    /**
     * @brief Store @p error if no error has been stored yet, and request
     * cancellation of all outstanding work.
     * @param error The error. Ignored if empty.
     * @return True if @p error became the terminal error.
     */
    bool set_error(const Error& error);

    /** @brief The terminal error, or an empty Error. */
    [[nodiscard]] Error get_error() const;

    /** @brief A token that is signalled once the terminal error is set. */
    [[nodiscard]] std::stop_token stop_token() const;

    /** @brief Request cancellation without recording an error. */
    void cancel();

    [[nodiscard]] bool cancelled() const;

  private:
    const std::string object_name_;

    mutable std::shared_mutex mutex_;
    Error error_;

    std::stop_source stop_source_;
};
} // namespace stow
