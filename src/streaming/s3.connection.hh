#pragma once

#include "definitions.hh"
#include "error.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <condition_variable>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace stow {
struct S3Settings
{
    std::string endpoint;
    std::string bucket_name;
    std::optional<std::string> region;
};

/**
 * @brief Check that S3 settings are complete and that credentials are
 * available in the environment.
 * @param[in] settings The settings to check.
 * @param[out] error Reason the settings are invalid.
 * @return True if the settings are valid, false otherwise.
 */
[[nodiscard]] bool
validate_s3_settings(const S3Settings& settings, std::string& error);

/**
 * @brief A single client connection to an S3-compatible server.
 * @details Each method issues one request. A failed request is reported as
 * an Error carrying the HTTP status, or NetworkError if no response was
 * received.
 */
class S3Connection
{
  public:
    explicit S3Connection(const S3Settings& settings);

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param[in] bucket_name The name of the bucket.
     * @param[out] exists True if the bucket exists.
     * @returns An empty Error if the request succeeded.
     */
    [[nodiscard]] Error bucket_exists(std::string_view bucket_name,
                                      bool& exists);

    /* Object operations */

    /**
     * @brief Put a whole object in a single request.
     * @param[in] bucket_name The name of the bucket.
     * @param[in] object_name The name of the object.
     * @param[in] data The object content.
     * @param[in] headers Content type and user metadata headers.
     * @param[out] etag The ETag of the stored object, unquoted.
     * @returns An empty Error if the object was stored.
     */
    [[nodiscard]] Error put_object(
      std::string_view bucket_name,
      std::string_view object_name,
      ConstByteSpan data,
      const std::map<std::string, std::string>& headers,
      std::string& etag);

    /* Multipart object operations */

    /// @brief Create a multipart upload and return its upload id.
    [[nodiscard]] Error create_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      const std::map<std::string, std::string>& headers,
      std::string& upload_id);

    /// @brief Upload one part of a multipart upload and return its ETag.
    [[nodiscard]] Error upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      ConstByteSpan data,
      unsigned int part_number,
      std::string& etag);

    /// @brief Assemble the parts of a multipart upload into an object.
    [[nodiscard]] Error complete_multipart_object(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::list<minio::s3::Part>& parts,
      std::string& etag);

  private:
    std::unique_ptr<minio::s3::Client> client_;
    std::unique_ptr<minio::creds::Provider> provider_;
};

/**
 * @brief A fixed-size pool of S3 connections shared by upload endpoints.
 */
class S3ConnectionPool
{
  public:
    S3ConnectionPool(size_t n_connections, const S3Settings& settings);
    ~S3ConnectionPool() noexcept;

    /**
     * @brief Take a connection from the pool, waiting until one is free.
     * @param[in] stop_token Abandons the wait when stop is requested.
     * @return The connection, or nullptr if the pool is shutting down or the
     * wait was abandoned.
     */
    std::unique_ptr<S3Connection> get_connection(
      std::stop_token stop_token = {});

    /** @brief Give a healthy connection back to the pool. */
    void return_connection(std::unique_ptr<S3Connection>&& conn);

    /**
     * @brief Give back a connection whose last request failed. A fresh
     * connection takes its place, or the old one if none can be opened.
     */
    void replace_connection(std::unique_ptr<S3Connection>&& conn);

  private:
    const S3Settings settings_;
    std::vector<std::unique_ptr<S3Connection>> connections_;
    mutable std::mutex connections_mutex_;
    std::condition_variable_any cv_;

    std::atomic<bool> is_accepting_connections_{ true };
};
} // namespace stow
