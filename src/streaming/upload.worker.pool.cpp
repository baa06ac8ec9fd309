#include "macros.hh"
#include "upload.worker.pool.hh"

#include <algorithm>

stow::UploadWorkerPool::UploadWorkerPool(MultipartSession& session,
                                         const SeenParts& seen_parts,
                                         HandoffQueue& queue,
                                         ErrorSink& error_sink,
                                         RetryPolicy retry_policy,
                                         ContentHasher hasher,
                                         std::string_view object_name)
  : session_(session)
  , seen_parts_(seen_parts)
  , queue_(queue)
  , error_sink_(error_sink)
  , retry_policy_(std::move(retry_policy))
  , hasher_(std::move(hasher))
  , object_name_(object_name)
{
    EXPECT(hasher_, "Content hasher not provided");
}

stow::UploadWorkerPool::~UploadWorkerPool() noexcept
{
    await_stop();
}

void
stow::UploadWorkerPool::start(uint32_t n_workers)
{
    EXPECT(threads_.empty(), "Upload workers already started");

    n_workers = std::max(n_workers, 1u);
    threads_.reserve(n_workers);
    for (auto i = 0u; i < n_workers; ++i) {
        threads_.emplace_back([this, i] { process_chunks_(i); });
    }

    LOG_DEBUG("Started ", n_workers, " upload workers for ", object_name_);
}

void
stow::UploadWorkerPool::await_stop() noexcept
{
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void
stow::UploadWorkerPool::process_chunks_(uint32_t worker_index)
{
    const auto stop_token = error_sink_.stop_token();

    try {
        std::unique_ptr<PartUploader> uploader;
        if (Error error = session_.get_part_uploader(uploader); error) {
            error_sink_.set_error(error);
            return;
        }

        Chunk chunk;
        while (queue_.pop(chunk, stop_token)) {
            if (Error error = upload_chunk_(chunk, uploader, worker_index);
                error) {
                error_sink_.set_error(error);
                return;
            }
            chunk = {};
        }
    } catch (const std::exception& exc) {
        error_sink_.set_error(
          { StowStatusCode_InternalError,
            "Upload worker " + std::to_string(worker_index) +
              " failed: " + exc.what() });
    }
}

stow::Error
stow::UploadWorkerPool::upload_chunk_(const Chunk& chunk,
                                      std::unique_ptr<PartUploader>& uploader,
                                      uint32_t worker_index)
{
    const std::string hash = hasher_(chunk.data);

    if (const auto it = seen_parts_.find(chunk.id); it != seen_parts_.end()) {
        if (it->second != hash) {
            return { StowStatusCode_ResumeMismatch,
                     "Resumable upload was requested, but chunk " +
                       std::to_string(chunk.id) + " of " + object_name_ +
                       " does not match the stored part" };
        }

        LOG_DEBUG("Skipping chunk ", chunk.id, " of ", object_name_);
        ++parts_skipped_;
        return {};
    }

    LOG_DEBUG("Worker ",
              worker_index,
              " handling chunk ",
              chunk.id,
              " of ",
              object_name_,
              " (",
              chunk.data.size(),
              " bytes)");

    const auto stop_token = error_sink_.stop_token();
    const std::string what =
      "part " + std::to_string(chunk.id) + " of " + object_name_;

    Error error = upload_with_retries<PartUploader>(
      retry_policy_,
      stop_token,
      what,
      uploader,
      [this](std::unique_ptr<PartUploader>& fresh) {
          return session_.get_part_uploader(fresh);
      },
      [&](PartUploader& endpoint) {
          return endpoint.upload_part(chunk.data, hash, chunk.id, stop_token);
      });

    if (!error) {
        LOG_DEBUG("Chunk ", chunk.id, " of ", object_name_, " handled");
        ++parts_uploaded_;
    }

    return error;
}
