#include "fs.object.store.hh"
#include "macros.hh"
#include "s3.object.store.hh"
#include "stow.common.hh"
#include "stow.writer.hh"

#include "stow.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
bool
is_s3_upload(const struct StowWriterSettings_s* settings)
{
    return nullptr != settings->s3_settings;
}

stow::S3Settings
make_s3_settings(const StowS3Settings* settings)
{
    stow::S3Settings s3_settings{ .endpoint = stow::trim(settings->endpoint),
                                  .bucket_name =
                                    stow::trim(settings->bucket_name) };

    if (settings->region != nullptr) {
        s3_settings.region = stow::trim(settings->region);
    }

    return s3_settings;
}

[[nodiscard]] bool
validate_filesystem_store_path(std::string_view store_path, std::string& error)
{
    fs::path path(store_path);
    if (fs::exists(path) && !fs::is_directory(path)) {
        error = "Store path '" + path.string() + "' is not a directory";
        return false;
    }

    fs::path parent_path = path.parent_path();
    if (parent_path.empty()) {
        parent_path = ".";
    }

    // parent path must exist and be a directory
    if (!fs::exists(parent_path) || !fs::is_directory(parent_path)) {
        error = "Parent path '" + parent_path.string() +
                "' does not exist or is not a directory";
        return false;
    }

    // parent path must be writable
    const auto perms = fs::status(parent_path).permissions();
    const bool is_writable =
      (perms & (fs::perms::owner_write | fs::perms::group_write |
                fs::perms::others_write)) != fs::perms::none;

    if (!is_writable) {
        error = "Parent path '" + parent_path.string() + "' is not writable";
        return false;
    }

    return true;
}

[[nodiscard]] bool
validate_metadata(const StowMetadataEntry* metadata,
                  size_t count,
                  std::string& error)
{
    if (count == 0) {
        return true;
    }

    if (metadata == nullptr) {
        error = "Null pointer: metadata";
        return false;
    }

    for (size_t i = 0; i < count; ++i) {
        if (metadata[i].key == nullptr || *metadata[i].key == '\0') {
            error = "Metadata key " + std::to_string(i) + " is empty";
            return false;
        }
        if (metadata[i].value == nullptr) {
            error = "Null pointer: value of metadata key '" +
                    std::string(metadata[i].key) + "'";
            return false;
        }
    }

    return true;
}
} // namespace

StowWriter::StowWriter_s(struct StowWriterSettings_s* settings)
  : error_()
{
    EXPECT(validate_settings_(settings), error_);

    commit_settings_(settings);

    EXPECT(create_store_(), error_);

    writer_ =
      std::make_unique<stow::ObjectWriter>(store_, object_name_, config_);
}

StowStatusCode
StowWriter_s::write(const void* data, size_t nbytes, size_t& bytes_accepted)
{
    bytes_accepted = 0;
    if (nbytes > 0) {
        EXPECT_VALID_ARGUMENT(data, "Null pointer: data");
    }

    const stow::Error error = writer_->write(
      { static_cast<const uint8_t*>(data), nbytes }, bytes_accepted);
    if (error) {
        set_error_(error);
        return error.code();
    }

    return StowStatusCode_Success;
}

StowStatusCode
StowWriter_s::close()
{
    const stow::Error error = writer_->close();
    if (error) {
        set_error_(error);
        return error.code();
    }

    if (const auto& object = writer_->object(); object) {
        LOG_DEBUG("Stored object ",
                  object->name,
                  " (id ",
                  object->id,
                  ", ",
                  writer_->bytes_written(),
                  " bytes)");
    }

    return StowStatusCode_Success;
}

bool
StowWriter_s::is_s3_upload_() const
{
    return s3_settings_.has_value();
}

bool
StowWriter_s::validate_settings_(const struct StowWriterSettings_s* settings)
{
    if (!settings) {
        error_ = "Null pointer: settings";
        return false;
    }

    if (stow::is_empty_string(settings->object_name, "Object name is empty")) {
        error_ = "Object name is empty";
        return false;
    }

    if (is_s3_upload(settings)) {
        if (settings->store_path != nullptr && *settings->store_path != '\0') {
            error_ = "Only one of store_path and s3_settings may be set";
            return false;
        }

        const stow::S3Settings s3_settings =
          make_s3_settings(settings->s3_settings);
        if (!stow::validate_s3_settings(s3_settings, error_)) {
            return false;
        }

        if (settings->resume) {
            error_ = "Resuming an upload is not supported for S3";
            return false;
        }
    } else {
        if (stow::is_empty_string(settings->store_path,
                                  "Store path is empty")) {
            error_ = "Store path is empty";
            return false;
        }

        if (!validate_filesystem_store_path(settings->store_path, error_)) {
            return false;
        }

        if (!stow::is_valid_object_name(settings->object_name, error_)) {
            return false;
        }
    }

    if (!validate_metadata(
          settings->metadata, settings->metadata_count, error_)) {
        return false;
    }

    stow::WriterConfig config;
    config.chunk_size = settings->chunk_size_bytes;
    config.concurrent_uploads = settings->concurrent_uploads;
    if (!stow::validate_writer_config(config, error_)) {
        return false;
    }

    return true;
}

void
StowWriter_s::commit_settings_(const struct StowWriterSettings_s* settings)
{
    object_name_ = stow::trim(settings->object_name);

    if (is_s3_upload(settings)) {
        s3_settings_ = make_s3_settings(settings->s3_settings);
    } else {
        store_path_ = stow::trim(settings->store_path);
    }

    config_.concurrent_uploads = settings->concurrent_uploads;
    config_.resume = settings->resume;
    config_.chunk_size = settings->chunk_size_bytes;
    config_.max_upload_attempts = settings->max_upload_attempts;

    if (settings->content_type != nullptr) {
        config_.content_type = stow::trim(settings->content_type);
    }

    for (size_t i = 0; i < settings->metadata_count; ++i) {
        const auto& entry = settings->metadata[i];
        config_.metadata[entry.key] = entry.value;
    }

    if (settings->last_modified_ms > 0) {
        config_.last_modified_ms = settings->last_modified_ms;
    }
}

bool
StowWriter_s::create_store_()
{
    if (is_s3_upload_()) {
        // one connection per upload worker, plus one for the writer
        const size_t n_connections =
          std::max<size_t>(config_.concurrent_uploads, 1) + 1;

        try {
            s3_connection_pool_ = std::make_shared<stow::S3ConnectionPool>(
              n_connections, *s3_settings_);
        } catch (const std::exception& e) {
            error_ =
              "Error creating S3 connection pool: " + std::string(e.what());
            return false;
        }

        // test the S3 connection
        auto conn = s3_connection_pool_->get_connection();
        bool bucket_exists = false;
        const stow::Error error =
          conn->bucket_exists(s3_settings_->bucket_name, bucket_exists);
        s3_connection_pool_->return_connection(std::move(conn));

        if (error) {
            error_ = "Failed to connect to S3: " + error.message();
            return false;
        }
        if (!bucket_exists) {
            error_ = "Bucket '" + s3_settings_->bucket_name +
                     "' does not exist";
            return false;
        }

        store_ = std::make_shared<stow::S3ObjectStore>(
          s3_settings_->bucket_name, s3_connection_pool_);
    } else {
        try {
            store_ = std::make_shared<stow::FsObjectStore>(store_path_);
        } catch (const std::exception& e) {
            error_ = "Error creating store at '" + store_path_ +
                     "': " + std::string(e.what());
            return false;
        }
    }

    return true;
}

void
StowWriter_s::set_error_(const stow::Error& error)
{
    error_ = error.message();
}
