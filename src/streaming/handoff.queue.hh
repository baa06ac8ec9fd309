#pragma once

#include "chunk.hh"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>

namespace stow {
/**
 * @brief An unbuffered (rendezvous) queue of chunks.
 * @details push() returns only once a consumer has taken the chunk, so at
 * most one chunk per consumer is in flight. Both push() and pop() wake up
 * when their stop token is signalled.
 */
class HandoffQueue
{
  public:
    HandoffQueue() = default;

    /**
     * @brief Hand @p chunk off to a consumer.
     * @details Blocks until a consumer has taken the chunk, the queue is
     * closed, or @p stop_token is signalled. If the chunk was not taken it
     * is left in @p chunk.
     * @param chunk The chunk to hand off.
     * @param stop_token Cancellation signal.
     * @return True if a consumer took the chunk, false otherwise.
     */
    [[nodiscard]] bool push(Chunk& chunk, std::stop_token stop_token);

    /**
     * @brief Take the next chunk.
     * @details Blocks until a chunk is available, the queue is closed and
     * drained, or @p stop_token is signalled.
     * @param chunk Receives the chunk.
     * @param stop_token Cancellation signal.
     * @return True if a chunk was taken, false if the consumer should exit.
     */
    [[nodiscard]] bool pop(Chunk& chunk, std::stop_token stop_token);

    /** @brief Close the queue. Consumers exit once it is empty. */
    void close();

    bool closed() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;

    std::optional<Chunk> slot_;
    uint64_t n_taken_{ 0 };
    bool closed_{ false };
};
} // namespace stow
