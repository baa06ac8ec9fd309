#pragma once

#include "content.hash.hh"
#include "error.sink.hh"
#include "handoff.queue.hh"
#include "object.store.hh"
#include "retry.policy.hh"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace stow {
/**
 * @brief A fixed set of threads that upload chunks taken from a hand-off
 * queue as parts of one multipart session.
 * @details Workers exit when the queue is closed and drained, or when the
 * error sink is cancelled. Failures are reported only through the error
 * sink.
 */
class UploadWorkerPool
{
  public:
    UploadWorkerPool(MultipartSession& session,
                     const SeenParts& seen_parts,
                     HandoffQueue& queue,
                     ErrorSink& error_sink,
                     RetryPolicy retry_policy,
                     ContentHasher hasher,
                     std::string_view object_name);
    UploadWorkerPool(const UploadWorkerPool&) = delete;
    UploadWorkerPool& operator=(const UploadWorkerPool&) = delete;
    ~UploadWorkerPool() noexcept;

    /**
     * @brief Start @p n_workers worker threads, at least one.
     * @note Call at most once.
     */
    void start(uint32_t n_workers);

    /** @brief Block until every worker has exited. */
    void await_stop() noexcept;

    uint32_t parts_uploaded() const { return parts_uploaded_; }
    uint32_t parts_skipped() const { return parts_skipped_; }

  private:
    MultipartSession& session_;
    const SeenParts& seen_parts_; // frozen before the workers start
    HandoffQueue& queue_;
    ErrorSink& error_sink_;
    const RetryPolicy retry_policy_;
    const ContentHasher hasher_;
    const std::string object_name_;

    std::vector<std::thread> threads_;

    std::atomic<uint32_t> parts_uploaded_{ 0 };
    std::atomic<uint32_t> parts_skipped_{ 0 };

    void process_chunks_(uint32_t worker_index);

    /**
     * @brief Upload a single chunk, or skip it if an identical part is
     * already stored.
     * @param chunk The chunk to upload.
     * @param uploader The worker's endpoint. Replaced on retry.
     * @param worker_index Index of the calling worker, for logging.
     * @return An empty Error on success.
     */
    [[nodiscard]] Error upload_chunk_(const Chunk& chunk,
                                      std::unique_ptr<PartUploader>& uploader,
                                      uint32_t worker_index);
};
} // namespace stow
