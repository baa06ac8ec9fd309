#include "handoff.queue.hh"

bool
stow::HandoffQueue::push(Chunk& chunk, std::stop_token stop_token)
{
    std::unique_lock lock(mutex_);

    // wait for a previous hand-off to complete
    if (!cv_.wait(lock, stop_token, [this] { return !slot_ || closed_; }) ||
        closed_) {
        return false;
    }

    slot_ = std::move(chunk);
    const uint64_t ticket = n_taken_ + 1;
    cv_.notify_all();

    if (cv_.wait(lock, stop_token, [&] { return n_taken_ >= ticket; })) {
        return true;
    }

    // cancelled before any consumer took it; take it back
    chunk = std::move(*slot_);
    slot_.reset();
    cv_.notify_all();

    return false;
}

bool
stow::HandoffQueue::pop(Chunk& chunk, std::stop_token stop_token)
{
    std::unique_lock lock(mutex_);
    if (!cv_.wait(lock, stop_token, [this] { return slot_ || closed_; }) ||
        !slot_) {
        return false;
    }

    chunk = std::move(*slot_);
    slot_.reset();
    ++n_taken_;
    cv_.notify_all();

    return true;
}

void
stow::HandoffQueue::close()
{
    std::unique_lock lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool
stow::HandoffQueue::closed() const
{
    std::unique_lock lock(mutex_);
    return closed_;
}
