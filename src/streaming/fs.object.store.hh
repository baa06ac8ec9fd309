#pragma once

#include "object.store.hh"

#include <atomic>
#include <filesystem>
#include <string>

namespace stow {
/**
 * @brief An object store backed by a local directory.
 * @details Objects are regular files under the root directory, with their
 * attributes in a JSON sidecar under `.stow/objects/`. Each multipart session
 * is a staging directory under `.stow/uploads/` holding one data file and one
 * JSON record per part. Finishing a session concatenates its parts into the
 * object and removes the staging directory.
 */
class FsObjectStore : public ObjectStore
{
  public:
    explicit FsObjectStore(const std::filesystem::path& root);

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

    /** @brief Path of the object file for @p name. */
    std::filesystem::path object_path(std::string_view name) const;

    /** @brief Path of the attribute sidecar for @p name. */
    std::filesystem::path object_metadata_path(std::string_view name) const;

    /** @brief Path of the staging directory for @p session_id. */
    std::filesystem::path session_path(std::string_view session_id) const;

  private:
    const std::filesystem::path root_;
    std::atomic<uint64_t> session_counter_{ 0 };

    [[nodiscard]] std::string make_session_id_();
};

/**
 * @brief Check that @p name can be stored under a directory root.
 * @details Names must be relative, must not contain empty, `.` or `..`
 * segments, and must not start with the reserved `.stow` segment.
 * @param[in] name The object name.
 * @param[out] error Reason the name is invalid.
 * @return True if the name is valid, false otherwise.
 */
[[nodiscard]] bool
is_valid_object_name(std::string_view name, std::string& error);
} // namespace stow
