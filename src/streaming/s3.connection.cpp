#include "macros.hh"
#include "s3.connection.hh"

#include <cstdlib>

namespace {
constexpr const char* ACCESS_KEY_ID_VAR = "AWS_ACCESS_KEY_ID";
constexpr const char* SECRET_ACCESS_KEY_VAR = "AWS_SECRET_ACCESS_KEY";

std::string
get_env_or_empty(const char* name)
{
    const char* value = std::getenv(name);
    return value == nullptr ? std::string{} : std::string(value);
}

std::string
strip_quotes(std::string etag)
{
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    return etag;
}

minio::utils::Multimap
to_multimap(const std::map<std::string, std::string>& headers)
{
    minio::utils::Multimap multimap;
    for (const auto& [key, value] : headers) {
        multimap.Add(key, value);
    }
    return multimap;
}

stow::Error
to_error(const minio::s3::Response& response, std::string_view what)
{
    const std::string message =
      std::string(what) + ": " + response.Error().String();

    if (response.status_code == 0) {
        return { StowStatusCode_NetworkError, message };
    }
    if (response.status_code == 404) {
        return { StowStatusCode_NotFound, message, response.status_code };
    }

    return { StowStatusCode_IOError, message, response.status_code };
}
} // namespace

bool
stow::validate_s3_settings(const S3Settings& settings, std::string& error)
{
    if (settings.endpoint.empty()) {
        error = "S3 endpoint is empty";
        return false;
    }

    if (settings.bucket_name.size() < 3 || settings.bucket_name.size() > 63) {
        error = "Invalid length for S3 bucket name: " +
                std::to_string(settings.bucket_name.size()) +
                ". Must be between 3 and 63 characters";
        return false;
    }

    if (get_env_or_empty(ACCESS_KEY_ID_VAR).empty()) {
        error = std::string(ACCESS_KEY_ID_VAR) + " is not set";
        return false;
    }

    if (get_env_or_empty(SECRET_ACCESS_KEY_VAR).empty()) {
        error = std::string(SECRET_ACCESS_KEY_VAR) + " is not set";
        return false;
    }

    return true;
}

stow::S3Connection::S3Connection(const S3Settings& settings)
{
    std::string host = settings.endpoint;
    bool https = true;
    if (host.starts_with("https://")) {
        host = host.substr(8);
    } else if (host.starts_with("http://")) {
        host = host.substr(7);
        https = false;
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    EXPECT(!host.empty(), "S3 endpoint is empty");

    minio::s3::BaseUrl url(host, https, settings.region.value_or(""));
    EXPECT(url, "Invalid S3 endpoint: ", settings.endpoint);

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      get_env_or_empty(ACCESS_KEY_ID_VAR),
      get_env_or_empty(SECRET_ACCESS_KEY_VAR));
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());
    CHECK(client_);
}

stow::Error
stow::S3Connection::bucket_exists(std::string_view bucket_name, bool& exists)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    if (!response) {
        return to_error(response,
                        "Failed to check bucket " + std::string(bucket_name));
    }

    exists = response.exist;
    return {};
}

stow::Error
stow::S3Connection::put_object(
  std::string_view bucket_name,
  std::string_view object_name,
  ConstByteSpan data,
  const std::map<std::string, std::string>& headers,
  std::string& etag)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty");
    EXPECT(!object_name.empty(), "Object name must not be empty");

    LOG_DEBUG("Putting object ",
              object_name,
              " in bucket ",
              bucket_name,
              " (",
              data.size(),
              " bytes)");

    minio::s3::PutObjectApiArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.headers = to_multimap(headers);
    args.data = std::string_view(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    // the low-level API issues a single PUT; Client::PutObject would split
    // large bodies into parts
    auto response = client_->BaseClient::PutObject(args);
    if (!response) {
        return to_error(response,
                        "Failed to put object " + std::string(object_name));
    }

    etag = strip_quotes(response.etag);
    return {};
}

stow::Error
stow::S3Connection::create_multipart_object(
  std::string_view bucket_name,
  std::string_view object_name,
  const std::map<std::string, std::string>& headers,
  std::string& upload_id)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty");
    EXPECT(!object_name.empty(), "Object name must not be empty");

    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.headers = to_multimap(headers);

    auto response = client_->CreateMultipartUpload(args);
    if (!response) {
        return to_error(response,
                        "Failed to create multipart upload of " +
                          std::string(object_name));
    }

    EXPECT(!response.upload_id.empty(), "Upload id is empty");
    upload_id = response.upload_id;

    return {};
}

stow::Error
stow::S3Connection::upload_multipart_object_part(std::string_view bucket_name,
                                                 std::string_view object_name,
                                                 std::string_view upload_id,
                                                 ConstByteSpan data,
                                                 unsigned int part_number,
                                                 std::string& etag)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty");
    EXPECT(!object_name.empty(), "Object name must not be empty");
    EXPECT(!upload_id.empty(), "Upload id must not be empty");
    EXPECT(part_number, "Part number must be positive");

    minio::s3::UploadPartArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.part_number = part_number;
    args.upload_id = upload_id;
    args.data = std::string_view(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    auto response = client_->UploadPart(args);
    if (!response) {
        return to_error(response,
                        "Failed to upload part " + std::to_string(part_number) +
                          " of " + std::string(object_name));
    }

    etag = strip_quotes(response.etag);
    return {};
}

stow::Error
stow::S3Connection::complete_multipart_object(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  const std::list<minio::s3::Part>& parts,
  std::string& etag)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty");
    EXPECT(!object_name.empty(), "Object name must not be empty");
    EXPECT(!upload_id.empty(), "Upload id must not be empty");
    EXPECT(!parts.empty(), "Parts list must not be empty");

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;
    args.parts = parts;

    auto response = client_->CompleteMultipartUpload(args);
    if (!response) {
        return to_error(response,
                        "Failed to complete multipart upload of " +
                          std::string(object_name));
    }

    etag = strip_quotes(response.etag);
    return {};
}

stow::S3ConnectionPool::S3ConnectionPool(size_t n_connections,
                                         const S3Settings& settings)
  : settings_(settings)
{
    EXPECT(n_connections > 0, "Must have at least one connection");

    for (size_t i = 0; i < n_connections; ++i) {
        connections_.push_back(std::make_unique<S3Connection>(settings_));
    }
}

stow::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    {
        std::scoped_lock lock(connections_mutex_);
        is_accepting_connections_ = false;
    }
    cv_.notify_all();
}

std::unique_ptr<stow::S3Connection>
stow::S3ConnectionPool::get_connection(std::stop_token stop_token)
{
    std::unique_lock lock(connections_mutex_);
    if (!cv_.wait(lock, stop_token, [this] {
            return !is_accepting_connections_ || !connections_.empty();
        })) {
        return nullptr; // stop requested
    }

    if (!is_accepting_connections_) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
stow::S3ConnectionPool::return_connection(std::unique_ptr<S3Connection>&& conn)
{
    if (conn == nullptr) {
        return;
    }

    {
        std::scoped_lock lock(connections_mutex_);
        connections_.push_back(std::move(conn));
    }
    cv_.notify_one();
}

void
stow::S3ConnectionPool::replace_connection(std::unique_ptr<S3Connection>&& conn)
{
    if (conn == nullptr) {
        return;
    }

    try {
        conn = std::make_unique<S3Connection>(settings_);
    } catch (const std::exception& exc) {
        // the pool must not shrink, or waiters could starve
        LOG_WARNING("Reusing failed S3 connection: ", exc.what());
    }

    return_connection(std::move(conn));
}
