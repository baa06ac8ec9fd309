#ifndef H_STOW_V0
#define H_STOW_V0

#include "stow.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief The settings for a Stow writer.
     * @details Exactly one of @p store_path and @p s3_settings must be set.
     * A @p chunk_size_bytes of 0 selects the default part size of 100 MB.
     * A @p concurrent_uploads of 0 selects a single upload worker.
     */
    typedef struct StowWriterSettings_s
    {
        const char* store_path;      /**< Root directory of a filesystem store */
        StowS3Settings* s3_settings; /**< Optional S3 settings */
        const char* object_name;     /**< Name of the object to write */
        const char* content_type;    /**< Optional MIME type of the object */
        StowMetadataEntry* metadata; /**< Optional user metadata */
        size_t metadata_count;       /**< Number of metadata entries */
        uint64_t last_modified_ms;   /**< Source modification time, 0 if unset */
        uint64_t chunk_size_bytes;   /**< Size of each part in bytes */
        uint32_t concurrent_uploads; /**< Number of parallel part uploads */
        uint32_t max_upload_attempts; /**< Attempts per part, 0 is unlimited */
        bool resume; /**< Resume an interrupted multipart upload */
    } StowWriterSettings;

    typedef struct StowWriter_s StowWriter;

    /**
     * @brief Get the version of the Stow API.
     * @return The version of the Stow API.
     */
    uint32_t Stow_get_api_version();

    /**
     * @brief Set the log level for the Stow API.
     * @param level The log level.
     * @return StowStatusCode_Success on success, or an error code on failure.
     */
    StowStatusCode Stow_set_log_level(StowLogLevel level);

    /**
     * @brief Get the log level for the Stow API.
     * @return The log level for the Stow API.
     */
    StowLogLevel Stow_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param code The status code.
     * @return A human-readable status message.
     */
    const char* Stow_get_status_message(StowStatusCode code);

    /**
     * @brief Allocate an array of metadata entries in the writer settings.
     * @note Any existing metadata array is freed first.
     * @param settings The writer settings.
     * @param metadata_count The number of entries to allocate.
     * @return StowStatusCode_Success on success, or an error code on failure.
     */
    StowStatusCode StowWriterSettings_create_metadata(
      StowWriterSettings* settings,
      size_t metadata_count);

    /**
     * @brief Free the metadata array in the writer settings.
     * @param settings The writer settings.
     */
    void StowWriterSettings_destroy_metadata(StowWriterSettings* settings);

    /**
     * @brief Create a writer for a single remote object.
     * @param settings The settings for the writer.
     * @return A pointer to the writer, or NULL on failure.
     */
    StowWriter* StowWriter_create(StowWriterSettings* settings);

    /**
     * @brief Write data to the object.
     * @details Once a write fails, every subsequent call returns the same
     * error without doing any work.
     * @param[in] writer The writer.
     * @param[in] data The data to write.
     * @param[in] bytes_in The number of bytes in @p data.
     * @param[out] bytes_out The number of bytes accepted by the writer.
     * @return StowStatusCode_Success on success, or an error code on failure.
     */
    StowStatusCode StowWriter_write(StowWriter* writer,
                                    const void* data,
                                    size_t bytes_in,
                                    size_t* bytes_out);

    /**
     * @brief Flush buffered data and finalize the object.
     * @details It is critical to check the return value. Any status other
     * than StowStatusCode_Success means the object was not stored. Calling
     * this function more than once returns the first result.
     * @param writer The writer.
     * @return StowStatusCode_Success on success, or an error code on failure.
     */
    StowStatusCode StowWriter_close(StowWriter* writer);

    /**
     * @brief Get the message of the error that failed the upload, if any.
     * @param writer The writer.
     * @return The error message, or an empty string if no error occurred.
     */
    const char* StowWriter_get_error_message(const StowWriter* writer);

    /**
     * @brief Destroy a writer.
     * @details If the writer was not closed, outstanding uploads are
     * cancelled and the object is not finalized.
     * @param writer The writer to destroy.
     */
    void StowWriter_destroy(StowWriter* writer);

#ifdef __cplusplus
}
#endif

#endif // H_STOW_V0
