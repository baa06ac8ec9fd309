#pragma once

#include "definitions.hh"
#include "error.hh"

#include <cstdint>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace stow {
/**
 * @brief Hashes of the parts a prior attempt already stored, by part id.
 */
using SeenParts = std::map<uint32_t, std::string>;

struct ObjectAttributes
{
    std::string content_type;
    std::map<std::string, std::string> metadata;
};

/**
 * @brief Descriptor of a completed remote object.
 */
struct ObjectInfo
{
    std::string name;
    std::string id; // backend-specific identifier, e.g., an ETag
    uint64_t size{ 0 };
    std::map<std::string, std::string> metadata;
};

/**
 * @brief A part already stored in a multipart session.
 */
struct PartInfo
{
    uint32_t part_id{ 0 };
    std::string hash;
    uint64_t size{ 0 };
};

/**
 * @brief One page of a part listing.
 */
struct PartListing
{
    std::vector<PartInfo> parts;
    uint32_t next_part_id{ 0 }; // 0 if there are no more parts
};

/**
 * @brief A multipart upload that was started but never finished.
 */
struct UnfinishedUpload
{
    std::string name;
    std::string session_id;
};

/**
 * @brief An endpoint for uploading a whole object in a single request.
 * @details Each handle is used by a single thread. A failed handle is
 * discarded and a fresh one acquired from the store before retrying.
 */
class ObjectUploader
{
  public:
    virtual ~ObjectUploader() = default;

    /**
     * @brief Upload @p data as the object @p name.
     * @param[in] data The object content.
     * @param[in] name The object name.
     * @param[in] attributes Content type and user metadata.
     * @param[in] hash Digest of @p data, for integrity checking.
     * @param[in] stop_token Cancellation signal.
     * @param[out] object_out Descriptor of the stored object.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error upload_object(ConstByteSpan data,
                                              std::string_view name,
                                              const ObjectAttributes& attributes,
                                              std::string_view hash,
                                              std::stop_token stop_token,
                                              ObjectInfo& object_out) = 0;
};

/**
 * @brief An endpoint for uploading numbered parts of one multipart session.
 * @details Each handle is used by a single thread.
 */
class PartUploader
{
  public:
    virtual ~PartUploader() = default;

    /**
     * @brief Upload @p data as part @p part_id of the session.
     * @param data The part content.
     * @param hash Digest of @p data, for integrity checking.
     * @param part_id 1-based part number.
     * @param stop_token Cancellation signal.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error upload_part(ConstByteSpan data,
                                            std::string_view hash,
                                            uint32_t part_id,
                                            std::stop_token stop_token) = 0;
};

/**
 * @brief A remote upload context that accumulates parts and is finalized
 * into a single object.
 * @details get_part_uploader() may be called concurrently from several
 * threads. finish() is called once, after all parts have been uploaded.
 */
class MultipartSession
{
  public:
    virtual ~MultipartSession() = default;

    virtual const std::string& session_id() const = 0;

    /**
     * @brief Acquire a fresh part upload endpoint.
     * @param[out] uploader_out The endpoint.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error get_part_uploader(
      std::unique_ptr<PartUploader>& uploader_out) = 0;

    /**
     * @brief Assemble parts 1 through @p part_count into the final object.
     * @details Parts stored by an earlier attempt count as uploaded. Parts
     * numbered above @p part_count are discarded.
     * @param[in] part_count Number of parts in the object.
     * @param[in] stop_token Cancellation signal.
     * @param[out] object_out Descriptor of the completed object.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error finish(uint32_t part_count,
                                       std::stop_token stop_token,
                                       ObjectInfo& object_out) = 0;
};

/**
 * @brief A bucket-like container of named objects.
 */
class ObjectStore
{
  public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Acquire a fresh whole-object upload endpoint.
     * @param[out] uploader_out The endpoint.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error get_object_uploader(
      std::unique_ptr<ObjectUploader>& uploader_out) = 0;

    /**
     * @brief Start a new multipart session for the object @p name.
     * @param[in] name The object name.
     * @param[in] attributes Content type and user metadata.
     * @param[out] session_out The new session.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error start_multipart(
      std::string_view name,
      const ObjectAttributes& attributes,
      std::unique_ptr<MultipartSession>& session_out) = 0;

    /**
     * @brief List unfinished multipart uploads in name order.
     * @param[in] start_name Cursor: only uploads named @p start_name or
     * later are listed.
     * @param[in] max_count Maximum number of uploads to list.
     * @param[out] uploads_out The uploads found, possibly none.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error list_unfinished_uploads(
      std::string_view start_name,
      size_t max_count,
      std::vector<UnfinishedUpload>& uploads_out) = 0;

    /**
     * @brief List the parts stored in an unfinished upload, in part order.
     * @param[in] upload The unfinished upload.
     * @param[in] start_part_id Cursor: first part id to list.
     * @param[in] max_count Maximum number of parts to list.
     * @param[out] listing_out The page of parts and the next cursor.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error list_parts(const UnfinishedUpload& upload,
                                           uint32_t start_part_id,
                                           size_t max_count,
                                           PartListing& listing_out) = 0;

    /**
     * @brief Reopen an unfinished upload as a session.
     * @param[in] upload The unfinished upload.
     * @param[in] stored_parts The parts already stored, by id.
     * @param[in] stored_bytes Total size of @p stored_parts.
     * @param[out] session_out The reopened session.
     * @return An empty Error on success.
     */
    [[nodiscard]] virtual Error resume_multipart(
      const UnfinishedUpload& upload,
      const SeenParts& stored_parts,
      uint64_t stored_bytes,
      std::unique_ptr<MultipartSession>& session_out) = 0;
};
} // namespace stow
