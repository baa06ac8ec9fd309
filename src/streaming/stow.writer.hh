#pragma once

#include "object.store.hh"
#include "object.writer.hh"
#include "s3.connection.hh"
#include "writer.config.hh"

#include "stow.h"

#include <memory>
#include <optional>
#include <string>

struct StowWriter_s
{
  public:
    StowWriter_s(struct StowWriterSettings_s* settings);

    /**
     * @brief Append data to the object.
     * @param data The data to append.
     * @param nbytes The number of bytes to append.
     * @param bytes_accepted The number of bytes buffered or handed off.
     * @return StowStatusCode_Success on success, or an error code on failure.
     */
    StowStatusCode write(const void* data, size_t nbytes, size_t& bytes_accepted);

    /**
     * @brief Finalize the object.
     * @return StowStatusCode_Success on success, or an error code on failure.
     */
    StowStatusCode close();

    /** @brief The message of the terminal error, or an empty string. */
    const std::string& error_message() const { return error_; }

  private:
    std::string error_; // error message. If nonempty, an error occurred.

    std::string object_name_;
    std::string store_path_;
    std::optional<stow::S3Settings> s3_settings_;
    stow::WriterConfig config_;

    std::shared_ptr<stow::S3ConnectionPool> s3_connection_pool_;
    std::shared_ptr<stow::ObjectStore> store_;
    std::unique_ptr<stow::ObjectWriter> writer_;

    bool is_s3_upload_() const;

    /**
     * @brief Check that the settings are valid.
     * @note Sets the error_ member if settings are invalid.
     * @param settings Struct containing settings to validate.
     * @return true if settings are valid, false otherwise.
     */
    [[nodiscard]] bool validate_settings_(
      const struct StowWriterSettings_s* settings);

    /**
     * @brief Copy settings to the writer.
     * @param settings Struct containing settings to copy.
     */
    void commit_settings_(const struct StowWriterSettings_s* settings);

    /**
     * @brief Create the object store, connecting to S3 if needed.
     * @return True if the store was created, otherwise false.
     */
    [[nodiscard]] bool create_store_();

    void set_error_(const stow::Error& error);
};
