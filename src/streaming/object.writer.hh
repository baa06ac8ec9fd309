#pragma once

#include "definitions.hh"
#include "error.sink.hh"
#include "handoff.queue.hh"
#include "object.store.hh"
#include "retry.policy.hh"
#include "upload.worker.pool.hh"
#include "writer.config.hh"

#include <memory>
#include <optional>
#include <string>

namespace stow {
enum class UploadStrategy
{
    Undecided,
    Simple,
    Multipart
};

/**
 * @brief Writes a byte stream of any length as a single remote object.
 * @details Bytes are buffered into chunks of the configured size. If the
 * stream fits in one chunk it is uploaded in a single request on close().
 * Otherwise a multipart session is started the first time a chunk fills up,
 * and chunks are handed off to a pool of upload workers.
 *
 * write() and close() must be called from a single thread. The first error
 * raised anywhere becomes the terminal error: it is returned by every later
 * call, and it cancels all outstanding work.
 */
class ObjectWriter
{
  public:
    ObjectWriter(std::shared_ptr<ObjectStore> store,
                 std::string_view object_name,
                 WriterConfig config);
    ObjectWriter(const ObjectWriter&) = delete;
    ObjectWriter& operator=(const ObjectWriter&) = delete;

    /**
     * @brief Cancels outstanding uploads if close() was not called. The
     * object is not finalized.
     */
    ~ObjectWriter() noexcept;

    /**
     * @brief Append data to the object.
     * @param[in] data The data to append.
     * @param[out] bytes_accepted Number of bytes buffered or handed off.
     * @return An empty Error on success, otherwise the terminal error.
     */
    [[nodiscard]] Error write(ConstByteSpan data, size_t& bytes_accepted);

    /**
     * @brief Flush buffered data and finalize the object.
     * @details Runs once. Later calls return the same result without side
     * effects.
     * @return An empty Error if the object was stored, otherwise the
     * terminal error.
     */
    [[nodiscard]] Error close();

    /** @brief The terminal error, or an empty Error. */
    [[nodiscard]] Error error() const;

    /** @brief Descriptor of the stored object, after a successful close(). */
    const std::optional<ObjectInfo>& object() const { return object_; }

    const std::string& object_name() const { return object_name_; }
    UploadStrategy strategy() const { return strategy_; }
    uint32_t chunks_queued() const { return chunks_queued_; }
    uint64_t bytes_written() const { return bytes_written_; }
    uint64_t chunk_size() const { return chunk_size_; }

  private:
    const std::string object_name_;
    const WriterConfig config_;
    const uint64_t chunk_size_;
    const ObjectAttributes attributes_;
    const RetryPolicy retry_policy_;
    const ContentHasher hasher_;
    std::shared_ptr<ObjectStore> store_;

    ErrorSink error_sink_;

    ByteVector buffer_; // bytes not yet handed off
    uint32_t chunks_queued_{ 0 };
    uint64_t bytes_written_{ 0 };

    UploadStrategy strategy_{ UploadStrategy::Undecided };
    bool is_closed_{ false };

    std::unique_ptr<MultipartSession> session_;
    SeenParts seen_parts_;
    HandoffQueue queue_;
    std::unique_ptr<UploadWorkerPool> worker_pool_;

    std::optional<ObjectInfo> object_;

    /**
     * @brief Hand the buffer off to the upload workers as the next chunk.
     * @details Starts the multipart upload on first use. Blocks until a
     * worker takes the chunk or the upload is cancelled.
     */
    [[nodiscard]] Error send_chunk_();

    /**
     * @brief Decide on a multipart upload: reconcile with an interrupted
     * upload if requested, otherwise start a new session, then start the
     * workers.
     */
    [[nodiscard]] Error start_multipart_upload_();

    /** @brief Upload the buffer as the whole object. */
    [[nodiscard]] Error upload_simple_object_();

    /** @brief Flush the remainder, drain the workers and finish the session. */
    [[nodiscard]] Error finalize_multipart_upload_();

    /** @brief Close the queue and wait for all workers to exit. */
    void stop_workers_() noexcept;
};
} // namespace stow
