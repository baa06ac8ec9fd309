#pragma once

#include "object.store.hh"
#include "s3.connection.hh"

#include <memory>
#include <string>

namespace stow {
/**
 * @brief An object store backed by an S3 bucket.
 * @details Every upload endpoint holds one pooled connection for its
 * lifetime. The pool should hold at least one connection per upload worker,
 * plus one for the writer itself.
 *
 * Listing in-progress multipart uploads is not supported, so an interrupted
 * upload can only be resumed through resume_multipart() with a known upload
 * id.
 */
class S3ObjectStore : public ObjectStore
{
  public:
    S3ObjectStore(std::string_view bucket_name,
                  std::shared_ptr<S3ConnectionPool> connection_pool);

    Error get_object_uploader(
      std::unique_ptr<ObjectUploader>& uploader_out) override;

    Error start_multipart(
      std::string_view name,
      const ObjectAttributes& attributes,
      std::unique_ptr<MultipartSession>& session_out) override;

    Error list_unfinished_uploads(
      std::string_view start_name,
      size_t max_count,
      std::vector<UnfinishedUpload>& uploads_out) override;

    Error list_parts(const UnfinishedUpload& upload,
                     uint32_t start_part_id,
                     size_t max_count,
                     PartListing& listing_out) override;

    Error resume_multipart(
      const UnfinishedUpload& upload,
      const SeenParts& stored_parts,
      uint64_t stored_bytes,
      std::unique_ptr<MultipartSession>& session_out) override;

  private:
    const std::string bucket_name_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;
};

/**
 * @brief Request headers carrying the content type and user metadata.
 */
std::map<std::string, std::string>
make_s3_headers(const ObjectAttributes& attributes);

/**
 * @brief Compare the ETag the server reports with the locally computed hash.
 * @details Surrounding quotes and letter case are ignored. ETags that are not
 * plain MD5 digests are accepted as is.
 * @param[in] etag The ETag from the response.
 * @param[in] hash Lowercase hex MD5 of the uploaded bytes, or empty.
 * @param[in] what Names the upload in the error message.
 * @return An empty Error if the ETag matches or cannot be compared, otherwise
 * a retryable NetworkError.
 */
[[nodiscard]] Error
check_etag(std::string_view etag, std::string_view hash, std::string_view what);
} // namespace stow
