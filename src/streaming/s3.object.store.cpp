#include "macros.hh"
#include "s3.object.store.hh"

#include <cctype>
#include <mutex>

namespace {
using stow::Error;

bool
looks_like_md5(std::string_view etag)
{
    if (etag.size() != 32) {
        return false;
    }
    for (char c : etag) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief A connection on loan from the pool. Returned when the lease ends,
 * or replaced if its last request failed.
 */
class ConnectionLease
{
  public:
    explicit ConnectionLease(std::shared_ptr<stow::S3ConnectionPool> pool,
                             std::stop_token stop_token = {})
      : pool_(std::move(pool))
      , connection_(pool_->get_connection(stop_token))
    {
    }

    ~ConnectionLease() noexcept
    {
        if (failed_) {
            pool_->replace_connection(std::move(connection_));
        } else {
            pool_->return_connection(std::move(connection_));
        }
    }

    explicit operator bool() const { return connection_ != nullptr; }
    stow::S3Connection* operator->() { return connection_.get(); }

    void mark_failed() { failed_ = true; }

  private:
    std::shared_ptr<stow::S3ConnectionPool> pool_;
    std::unique_ptr<stow::S3Connection> connection_;
    bool failed_{ false };
};

Error
pool_closed_error()
{
    return { StowStatusCode_InternalError, "S3 connection pool is closed" };
}

class S3ObjectUploader : public stow::ObjectUploader
{
  public:
    S3ObjectUploader(std::string_view bucket_name,
                     std::shared_ptr<stow::S3ConnectionPool> pool)
      : bucket_name_(bucket_name)
      , lease_(std::move(pool))
    {
    }

    Error upload_object(ConstByteSpan data,
                        std::string_view name,
                        const stow::ObjectAttributes& attributes,
                        std::string_view hash,
                        std::stop_token stop_token,
                        stow::ObjectInfo& object_out) override
    {
        if (!lease_) {
            return pool_closed_error();
        }
        if (stop_token.stop_requested()) {
            return { StowStatusCode_Cancelled, "Upload cancelled" };
        }

        std::string etag;
        Error error = lease_->put_object(
          bucket_name_, name, data, stow::make_s3_headers(attributes), etag);
        if (!error) {
            error = stow::check_etag(etag, hash, name);
        }
        if (error) {
            lease_.mark_failed();
            return error;
        }

        object_out = {
            .name = std::string(name),
            .id = etag,
            .size = data.size(),
            .metadata = attributes.metadata,
        };

        return {};
    }

  private:
    const std::string bucket_name_;
    ConnectionLease lease_;
};

class S3MultipartSession;

class S3PartUploader : public stow::PartUploader
{
  public:
    S3PartUploader(S3MultipartSession& session,
                   std::shared_ptr<stow::S3ConnectionPool> pool)
      : session_(session)
      , lease_(std::move(pool))
    {
    }

    Error upload_part(ConstByteSpan data,
                      std::string_view hash,
                      uint32_t part_id,
                      std::stop_token stop_token) override;

  private:
    S3MultipartSession& session_;
    ConnectionLease lease_;
};

class S3MultipartSession : public stow::MultipartSession
{
  public:
    S3MultipartSession(std::string_view bucket_name,
                       std::string_view object_name,
                       std::string_view upload_id,
                       std::shared_ptr<stow::S3ConnectionPool> pool)
      : bucket_name_(bucket_name)
      , object_name_(object_name)
      , upload_id_(upload_id)
      , pool_(std::move(pool))
    {
    }

    const std::string& session_id() const override { return upload_id_; }

    const std::string& bucket_name() const { return bucket_name_; }
    const std::string& object_name() const { return object_name_; }

    void record_part(uint32_t part_id, std::string_view etag)
    {
        std::scoped_lock lock(etags_mutex_);
        etags_[part_id] = etag;
    }

    Error get_part_uploader(
      std::unique_ptr<stow::PartUploader>& uploader_out) override
    {
        uploader_out = std::make_unique<S3PartUploader>(*this, pool_);
        return {};
    }

    Error finish(uint32_t part_count,
                 std::stop_token stop_token,
                 stow::ObjectInfo& object_out) override
    {
        if (stop_token.stop_requested()) {
            return { StowStatusCode_Cancelled, "Upload cancelled" };
        }

        std::list<minio::s3::Part> parts;
        {
            std::scoped_lock lock(etags_mutex_);
            for (auto part_id = 1u; part_id <= part_count; ++part_id) {
                auto it = etags_.find(part_id);
                if (it == etags_.end()) {
                    return { StowStatusCode_NotFound,
                             "No ETag recorded for part " +
                               std::to_string(part_id) + " of " +
                               object_name_ };
                }

                minio::s3::Part part;
                part.number = part_id;
                part.etag = it->second;
                parts.push_back(part);
            }
        }

        ConnectionLease lease(pool_, stop_token);
        if (!lease) {
            if (stop_token.stop_requested()) {
                return { StowStatusCode_Cancelled, "Upload cancelled" };
            }
            return pool_closed_error();
        }

        std::string etag;
        if (Error error = lease->complete_multipart_object(
              bucket_name_, object_name_, upload_id_, parts, etag);
            error) {
            lease.mark_failed();
            return error;
        }

        object_out = {
            .name = object_name_,
            .id = etag,
            .size = 0, // not reported by the server
            .metadata = {},
        };

        return {};
    }

  private:
    const std::string bucket_name_;
    const std::string object_name_;
    const std::string upload_id_;
    std::shared_ptr<stow::S3ConnectionPool> pool_;

    std::mutex etags_mutex_;
    std::map<uint32_t, std::string> etags_;
};

Error
S3PartUploader::upload_part(ConstByteSpan data,
                            std::string_view hash,
                            uint32_t part_id,
                            std::stop_token stop_token)
{
    if (!lease_) {
        return pool_closed_error();
    }
    if (stop_token.stop_requested()) {
        return { StowStatusCode_Cancelled, "Upload cancelled" };
    }

    std::string etag;
    Error error = lease_->upload_multipart_object_part(session_.bucket_name(),
                                                       session_.object_name(),
                                                       session_.session_id(),
                                                       data,
                                                       part_id,
                                                       etag);
    if (!error) {
        error =
          stow::check_etag(etag, hash, "part " + std::to_string(part_id));
    }
    if (error) {
        lease_.mark_failed();
        return error;
    }

    session_.record_part(part_id, etag);
    return {};
}
} // namespace

std::map<std::string, std::string>
stow::make_s3_headers(const ObjectAttributes& attributes)
{
    std::map<std::string, std::string> headers;
    if (!attributes.content_type.empty()) {
        headers["Content-Type"] = attributes.content_type;
    }
    for (const auto& [key, value] : attributes.metadata) {
        headers["x-amz-meta-" + key] = value;
    }

    return headers;
}

stow::Error
stow::check_etag(std::string_view etag,
                 std::string_view hash,
                 std::string_view what)
{
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }

    // only plain MD5 ETags are comparable; encrypted or composite objects
    // carry opaque ones
    if (hash.empty() || !looks_like_md5(etag)) {
        return {};
    }

    std::string lower(etag);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower != hash) {
        // corrupted in transit, worth another attempt
        return { StowStatusCode_NetworkError,
                 "ETag mismatch for " + std::string(what) + ": expected " +
                   std::string(hash) + ", got " + lower };
    }

    return {};
}

stow::S3ObjectStore::S3ObjectStore(
  std::string_view bucket_name,
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : bucket_name_(bucket_name)
  , connection_pool_(std::move(connection_pool))
{
    EXPECT(!bucket_name_.empty(), "S3 bucket name is empty");
    EXPECT(connection_pool_, "S3 connection pool is null");
}

stow::Error
stow::S3ObjectStore::get_object_uploader(
  std::unique_ptr<ObjectUploader>& uploader_out)
{
    uploader_out =
      std::make_unique<S3ObjectUploader>(bucket_name_, connection_pool_);
    return {};
}

stow::Error
stow::S3ObjectStore::start_multipart(
  std::string_view name,
  const ObjectAttributes& attributes,
  std::unique_ptr<MultipartSession>& session_out)
{
    ConnectionLease lease(connection_pool_);
    if (!lease) {
        return pool_closed_error();
    }

    std::string upload_id;
    if (Error error = lease->create_multipart_object(
          bucket_name_, name, make_s3_headers(attributes), upload_id);
        error) {
        lease.mark_failed();
        return error;
    }

    LOG_DEBUG("Created multipart upload ", upload_id, " of ", name);

    session_out = std::make_unique<S3MultipartSession>(
      bucket_name_, name, upload_id, connection_pool_);
    return {};
}

stow::Error
stow::S3ObjectStore::list_unfinished_uploads(std::string_view,
                                             size_t,
                                             std::vector<UnfinishedUpload>&)
{
    return { StowStatusCode_NotSupported,
             "Listing unfinished multipart uploads is not supported for S3" };
}

stow::Error
stow::S3ObjectStore::list_parts(const UnfinishedUpload&,
                                uint32_t,
                                size_t,
                                PartListing&)
{
    return { StowStatusCode_NotSupported,
             "Listing multipart upload parts is not supported for S3" };
}

stow::Error
stow::S3ObjectStore::resume_multipart(
  const UnfinishedUpload& upload,
  const SeenParts& stored_parts,
  uint64_t,
  std::unique_ptr<MultipartSession>& session_out)
{
    if (upload.session_id.empty()) {
        return { StowStatusCode_InvalidArgument, "Upload id is empty" };
    }

    auto session = std::make_unique<S3MultipartSession>(
      bucket_name_, upload.name, upload.session_id, connection_pool_);

    // stored parts were hashed with MD5, which is what S3 reports as the ETag
    for (const auto& [part_id, hash] : stored_parts) {
        session->record_part(part_id, hash);
    }

    session_out = std::move(session);
    return {};
}
