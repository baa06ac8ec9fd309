#include "macros.hh"
#include "object.writer.hh"
#include "resume.reconciler.hh"

#include <algorithm>

namespace {
stow::RetryPolicy
make_retry_policy(const stow::WriterConfig& config)
{
    stow::RetryPolicy policy;
    if (config.retry_classifier) {
        policy.is_retryable = config.retry_classifier;
    }
    policy.max_attempts = config.max_upload_attempts;

    return policy;
}

stow::ContentHasher
make_hasher(const stow::WriterConfig& config)
{
    if (config.hasher) {
        return config.hasher;
    }
    return stow::md5_hex;
}
} // namespace

stow::ObjectWriter::ObjectWriter(std::shared_ptr<ObjectStore> store,
                                 std::string_view object_name,
                                 WriterConfig config)
  : object_name_(object_name)
  , config_(std::move(config))
  , chunk_size_(effective_chunk_size(config_))
  , attributes_(make_object_attributes(config_))
  , retry_policy_(make_retry_policy(config_))
  , hasher_(make_hasher(config_))
  , store_(std::move(store))
  , error_sink_(object_name)
{
    EXPECT(store_, "Object store not provided");
    EXPECT(!object_name_.empty(), "Object name must not be empty");

    std::string error;
    EXPECT(validate_writer_config(config_, error), error);
}

stow::ObjectWriter::~ObjectWriter() noexcept
{
    if (!is_closed_ && strategy_ == UploadStrategy::Multipart) {
        LOG_WARNING("Writer for ",
                    object_name_,
                    " destroyed before close; abandoning upload");
    }

    if (worker_pool_) {
        error_sink_.cancel();
        stop_workers_();
    }
}

stow::Error
stow::ObjectWriter::write(ConstByteSpan data, size_t& bytes_accepted)
{
    bytes_accepted = 0;

    if (Error error = error_sink_.get_error(); error) {
        return error;
    }

    if (is_closed_) {
        return { StowStatusCode_InvalidArgument,
                 "Cannot write to " + object_name_ + " after close" };
    }

    try {
        while (!data.empty()) {
            const size_t room = chunk_size_ - buffer_.size();
            if (data.size() <= room) {
                buffer_.insert(buffer_.end(), data.begin(), data.end());
                bytes_accepted += data.size();
                break;
            }

            // fill the buffer to capacity, hand it off, continue with the rest
            buffer_.insert(buffer_.end(), data.begin(), data.begin() + room);
            bytes_accepted += room;
            data = data.subspan(room);

            if (Error error = send_chunk_(); error) {
                error_sink_.set_error(error);
                break;
            }
        }
    } catch (const std::bad_alloc&) {
        error_sink_.set_error(
          { StowStatusCode_InternalError,
            "Out of memory buffering " + std::to_string(chunk_size_) +
              " bytes for " + object_name_ });
    } catch (const std::exception& exc) {
        error_sink_.set_error({ StowStatusCode_InternalError, exc.what() });
    }

    bytes_written_ += bytes_accepted;

    return error_sink_.get_error();
}

stow::Error
stow::ObjectWriter::close()
{
    if (is_closed_) {
        return error_sink_.get_error();
    }
    is_closed_ = true;

    if (error_sink_.get_error()) {
        stop_workers_();
        return error_sink_.get_error();
    }

    try {
        Error error;
        if (strategy_ == UploadStrategy::Undecided) {
            strategy_ = UploadStrategy::Simple;
            error = upload_simple_object_();
        } else {
            error = finalize_multipart_upload_();
        }
        error_sink_.set_error(error);
    } catch (const std::exception& exc) {
        error_sink_.set_error({ StowStatusCode_InternalError, exc.what() });
    }

    stop_workers_();

    return error_sink_.get_error();
}

stow::Error
stow::ObjectWriter::error() const
{
    return error_sink_.get_error();
}

stow::Error
stow::ObjectWriter::send_chunk_()
{
    if (strategy_ == UploadStrategy::Undecided) {
        if (Error error = start_multipart_upload_(); error) {
            return error;
        }
    }
    CHECK(worker_pool_);

    Chunk chunk{ .id = chunks_queued_ + 1, .data = std::move(buffer_) };
    buffer_ = ByteVector{};

    if (!queue_.push(chunk, error_sink_.stop_token())) {
        if (Error error = error_sink_.get_error(); error) {
            return error;
        }
        return { StowStatusCode_Cancelled,
                 "Upload of " + object_name_ + " was cancelled" };
    }

    ++chunks_queued_;
    return {};
}

stow::Error
stow::ObjectWriter::start_multipart_upload_()
{
    CHECK(strategy_ == UploadStrategy::Undecided);
    strategy_ = UploadStrategy::Multipart;

    if (config_.resume) {
        ResumeReconciler reconciler(
          *store_, object_name_, config_.list_parts_page_size);
        if (Error error = reconciler.reconcile(session_, seen_parts_); error) {
            return error;
        }
    }

    if (!session_) {
        if (Error error =
              store_->start_multipart(object_name_, attributes_, session_);
            error) {
            return error;
        }
        EXPECT(session_, "Object store returned a null session");
    }

    LOG_DEBUG("Writing ",
              object_name_,
              " as a multipart upload (session ",
              session_->session_id(),
              ")");

    worker_pool_ = std::make_unique<UploadWorkerPool>(*session_,
                                                      seen_parts_,
                                                      queue_,
                                                      error_sink_,
                                                      retry_policy_,
                                                      hasher_,
                                                      object_name_);
    worker_pool_->start(std::max(config_.concurrent_uploads, 1u));

    return {};
}

stow::Error
stow::ObjectWriter::upload_simple_object_()
{
    LOG_DEBUG("Writing ", object_name_, " in a single request");

    std::unique_ptr<ObjectUploader> uploader;
    if (Error error = store_->get_object_uploader(uploader); error) {
        return error;
    }

    const auto stop_token = error_sink_.stop_token();
    const std::string hash = hasher_(buffer_);

    ObjectInfo info;
    Error error = upload_with_retries<ObjectUploader>(
      retry_policy_,
      stop_token,
      "object " + object_name_,
      uploader,
      [this](std::unique_ptr<ObjectUploader>& fresh) {
          return store_->get_object_uploader(fresh);
      },
      [&](ObjectUploader& endpoint) {
          return endpoint.upload_object(
            buffer_, object_name_, attributes_, hash, stop_token, info);
      });

    if (error) {
        return error;
    }

    buffer_ = ByteVector{};
    object_ = std::move(info);

    return {};
}

stow::Error
stow::ObjectWriter::finalize_multipart_upload_()
{
    if (!buffer_.empty()) {
        if (Error error = send_chunk_(); error) {
            return error;
        }
    }

    stop_workers_();

    if (Error error = error_sink_.get_error(); error) {
        LOG_WARNING("Multipart session ",
                    session_->session_id(),
                    " of ",
                    object_name_,
                    " left unfinished; resume it by writing the same data "
                    "with resume enabled");
        return error;
    }

    LOG_DEBUG("Finishing ",
              object_name_,
              ": ",
              worker_pool_->parts_uploaded(),
              " parts uploaded, ",
              worker_pool_->parts_skipped(),
              " parts already stored");

    ObjectInfo info;
    if (Error error =
          session_->finish(chunks_queued_, error_sink_.stop_token(), info);
        error) {
        LOG_WARNING("Multipart session ",
                    session_->session_id(),
                    " of ",
                    object_name_,
                    " could not be finished");
        return error;
    }

    object_ = std::move(info);
    return {};
}

void
stow::ObjectWriter::stop_workers_() noexcept
{
    queue_.close();
    if (worker_pool_) {
        worker_pool_->await_stop();
    }
}
