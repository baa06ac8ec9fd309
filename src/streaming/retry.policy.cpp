#include "retry.policy.hh"

#include <algorithm>
#include <condition_variable>
#include <mutex>

stow::Backoff::Backoff(std::chrono::milliseconds initial,
                       std::chrono::milliseconds max)
  : delay_(initial)
  , max_(max)
{
    EXPECT(initial.count() > 0, "Initial backoff must be positive");
    EXPECT(max >= initial, "Maximum backoff must be at least the initial");
}

std::chrono::milliseconds
stow::Backoff::next()
{
    const auto delay = delay_;
    delay_ = std::min(delay_ * 2, max_);

    return delay;
}

bool
stow::sleep_for(std::chrono::milliseconds delay, std::stop_token stop_token)
{
    std::mutex mutex;
    std::condition_variable_any cv;

    std::unique_lock lock(mutex);
    const bool cancelled = cv.wait_for(
      lock, stop_token, delay, [&] { return stop_token.stop_requested(); });

    return !cancelled;
}
