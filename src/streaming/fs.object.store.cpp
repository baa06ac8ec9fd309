#include "fs.object.store.hh"
#include "macros.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
constexpr const char* STOW_DIR = ".stow";
constexpr size_t COPY_BLOCK_SIZE = 8 << 20;

stow::Error
io_error(const std::string& message)
{
    return { StowStatusCode_IOError, message };
}

stow::Error
cancelled_error(std::string_view what)
{
    return { StowStatusCode_Cancelled,
             "Cancelled while writing " + std::string(what) };
}

std::string
part_basename(uint32_t part_id)
{
    std::string digits = std::to_string(part_id);
    if (digits.size() < 5) {
        digits.insert(0, 5 - digits.size(), '0');
    }
    return "part-" + digits;
}

[[nodiscard]] stow::Error
ensure_parent_directory(const fs::path& path)
{
    const fs::path parent_path = path.parent_path();
    if (parent_path.empty() || fs::is_directory(parent_path)) {
        return {};
    }

    std::error_code ec;
    if (!fs::create_directories(parent_path, ec) &&
        !fs::is_directory(parent_path)) {
        return io_error("Failed to create directory '" + parent_path.string() +
                        "': " + ec.message());
    }

    return {};
}

/**
 * @brief A file being written beside its final path. Removed on destruction
 * unless it was committed by renaming it into place.
 */
class PartialFile
{
  public:
    explicit PartialFile(const fs::path& target)
      : target_(target)
      , path_(target)
    {
        path_ += ".partial";
    }

    ~PartialFile() noexcept
    {
        if (!is_committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    const fs::path& path() const { return path_; }

    [[nodiscard]] stow::Error commit()
    {
        std::error_code ec;
        fs::rename(path_, target_, ec);
        if (ec) {
            return io_error("Failed to rename '" + path_.string() + "' to '" +
                            target_.string() + "': " + ec.message());
        }

        is_committed_ = true;
        return {};
    }

  private:
    const fs::path target_;
    fs::path path_;
    bool is_committed_{ false };
};

/**
 * @brief Write @p data to a temporary file beside @p path, then rename it
 * into place, so that readers never see a partially written file.
 */
[[nodiscard]] stow::Error
write_file_atomically(const fs::path& path,
                      ConstByteSpan data,
                      std::stop_token stop_token)
{
    if (stow::Error error = ensure_parent_directory(path); error) {
        return error;
    }

    PartialFile tmp(path);

    {
        std::ofstream file(tmp.path(), std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return io_error("Failed to open file '" + tmp.path().string() +
                            "' for writing");
        }

        size_t offset = 0;
        while (offset < data.size()) {
            if (stop_token.stop_requested()) {
                return cancelled_error(path.string());
            }

            const size_t n = std::min(COPY_BLOCK_SIZE, data.size() - offset);
            file.write(reinterpret_cast<const char*>(data.data() + offset),
                       static_cast<std::streamsize>(n));
            if (!file.good()) {
                return io_error("Failed to write to file '" +
                                tmp.path().string() + "'");
            }
            offset += n;
        }

        file.flush();
        if (!file.good()) {
            return io_error("Failed to flush file '" + tmp.path().string() +
                            "'");
        }
    }

    return tmp.commit();
}

[[nodiscard]] stow::Error
write_json(const fs::path& path, const nlohmann::json& json)
{
    const std::string str = json.dump(4);
    return write_file_atomically(
      path,
      { reinterpret_cast<const uint8_t*>(str.data()), str.size() },
      std::stop_token{});
}

[[nodiscard]] stow::Error
read_json(const fs::path& path, nlohmann::json& json_out)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return { StowStatusCode_NotFound,
                 "Failed to open '" + path.string() + "'" };
    }

    json_out = nlohmann::json::parse(file, nullptr, false);
    if (json_out.is_discarded()) {
        return io_error("Invalid JSON in '" + path.string() + "'");
    }

    return {};
}

nlohmann::json
attributes_to_json(const stow::ObjectAttributes& attributes)
{
    return {
        { "content_type", attributes.content_type },
        { "metadata", attributes.metadata },
    };
}

class FsObjectUploader : public stow::ObjectUploader
{
  public:
    explicit FsObjectUploader(stow::FsObjectStore& store)
      : store_(store)
    {
    }

    stow::Error upload_object(ConstByteSpan data,
                              std::string_view name,
                              const stow::ObjectAttributes& attributes,
                              std::string_view hash,
                              std::stop_token stop_token,
                              stow::ObjectInfo& object_out) override
    {
        if (std::string error; !stow::is_valid_object_name(name, error)) {
            return { StowStatusCode_InvalidArgument, error };
        }

        const fs::path path = store_.object_path(name);
        if (stow::Error error = write_file_atomically(path, data, stop_token);
            error) {
            return error;
        }

        nlohmann::json metadata = attributes_to_json(attributes);
        metadata["name"] = std::string(name);
        metadata["size"] = data.size();
        metadata["hash"] = std::string(hash);
        if (stow::Error error =
              write_json(store_.object_metadata_path(name), metadata);
            error) {
            return error;
        }

        object_out = {
            .name = std::string(name),
            .id = std::string(hash),
            .size = data.size(),
            .metadata = attributes.metadata,
        };

        return {};
    }

  private:
    stow::FsObjectStore& store_;
};

class FsPartUploader : public stow::PartUploader
{
  public:
    explicit FsPartUploader(const fs::path& session_path)
      : session_path_(session_path)
    {
    }

    stow::Error upload_part(ConstByteSpan data,
                            std::string_view hash,
                            uint32_t part_id,
                            std::stop_token stop_token) override
    {
        if (part_id == 0) {
            return { StowStatusCode_InvalidArgument,
                     "Part ids start at 1" };
        }

        if (!fs::is_directory(session_path_)) {
            return { StowStatusCode_NotFound,
                     "Upload session '" + session_path_.string() +
                       "' does not exist" };
        }

        const std::string basename = part_basename(part_id);
        if (stow::Error error = write_file_atomically(
              session_path_ / (basename + ".bin"), data, stop_token);
            error) {
            return error;
        }

        // the record marks the part as stored, so write it last
        const nlohmann::json record = {
            { "part_id", part_id },
            { "hash", std::string(hash) },
            { "size", data.size() },
        };

        return write_json(session_path_ / (basename + ".json"), record);
    }

  private:
    const fs::path session_path_;
};

class FsMultipartSession : public stow::MultipartSession
{
  public:
    FsMultipartSession(stow::FsObjectStore& store,
                       std::string_view session_id,
                       std::string_view name,
                       const stow::ObjectAttributes& attributes)
      : store_(store)
      , session_id_(session_id)
      , name_(name)
      , attributes_(attributes)
      , session_path_(store.session_path(session_id))
    {
    }

    const std::string& session_id() const override { return session_id_; }

    stow::Error get_part_uploader(
      std::unique_ptr<stow::PartUploader>& uploader_out) override
    {
        uploader_out = std::make_unique<FsPartUploader>(session_path_);
        return {};
    }

    stow::Error finish(uint32_t part_count,
                       std::stop_token stop_token,
                       stow::ObjectInfo& object_out) override
    {
        const fs::path path = store_.object_path(name_);
        if (stow::Error error = ensure_parent_directory(path); error) {
            return error;
        }

        PartialFile tmp(path);

        uint64_t size = 0;
        {
            std::ofstream out(tmp.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                return io_error("Failed to open file '" + tmp.path().string() +
                                "' for writing");
            }

            std::vector<char> block(COPY_BLOCK_SIZE);
            for (auto part_id = 1u; part_id <= part_count; ++part_id) {
                const std::string basename = part_basename(part_id);
                nlohmann::json record;
                if (stow::Error error =
                      read_json(session_path_ / (basename + ".json"), record);
                    error) {
                    return { StowStatusCode_NotFound,
                             "Part " + std::to_string(part_id) + " of " +
                               name_ + " was never stored" };
                }

                std::ifstream in(session_path_ / (basename + ".bin"),
                                 std::ios::binary);
                if (!in.is_open()) {
                    return io_error("Failed to open part " +
                                    std::to_string(part_id) + " of " + name_);
                }

                while (in.read(block.data(),
                               static_cast<std::streamsize>(block.size())) ||
                       in.gcount() > 0) {
                    if (stop_token.stop_requested()) {
                        return cancelled_error(name_);
                    }
                    out.write(block.data(), in.gcount());
                    if (!out.good()) {
                        return io_error("Failed to write to file '" +
                                        tmp.path().string() + "'");
                    }
                    size += static_cast<uint64_t>(in.gcount());
                }
            }

            out.flush();
            if (!out.good()) {
                return io_error("Failed to flush file '" +
                                tmp.path().string() + "'");
            }
        }

        if (stow::Error error = tmp.commit(); error) {
            return error;
        }

        nlohmann::json metadata = attributes_to_json(attributes_);
        metadata["name"] = name_;
        metadata["size"] = size;
        metadata["parts"] = part_count;
        metadata["session_id"] = session_id_;
        if (stow::Error error =
              write_json(store_.object_metadata_path(name_), metadata);
            error) {
            return error;
        }

        std::error_code ec;
        fs::remove_all(session_path_, ec);
        if (ec) {
            LOG_WARNING("Failed to remove upload session '",
                        session_path_.string(),
                        "': ",
                        ec.message());
        }

        object_out = {
            .name = name_,
            .id = session_id_,
            .size = size,
            .metadata = attributes_.metadata,
        };

        return {};
    }

  private:
    stow::FsObjectStore& store_;
    const std::string session_id_;
    const std::string name_;
    const stow::ObjectAttributes attributes_;
    const fs::path session_path_;
};
} // namespace

bool
stow::is_valid_object_name(std::string_view name, std::string& error)
{
    if (name.empty()) {
        error = "Object name is empty";
        return false;
    }

    if (name.front() == '/' || name.back() == '/') {
        error = "Object name '" + std::string(name) +
                "' must not start or end with '/'";
        return false;
    }

    size_t begin = 0;
    bool first = true;
    while (begin <= name.size()) {
        size_t end = name.find('/', begin);
        if (end == std::string_view::npos) {
            end = name.size();
        }

        const std::string_view segment = name.substr(begin, end - begin);
        if (segment.empty() || segment == "." || segment == "..") {
            error = "Object name '" + std::string(name) +
                    "' contains an invalid segment";
            return false;
        }
        if (first && segment == STOW_DIR) {
            error = "Object name '" + std::string(name) +
                    "' uses the reserved prefix '" + STOW_DIR + "'";
            return false;
        }

        first = false;
        begin = end + 1;
    }

    return true;
}

stow::FsObjectStore::FsObjectStore(const fs::path& root)
  : root_(root)
{
    EXPECT(!root_.empty(), "Store root must not be empty");

    std::error_code ec;
    if (!fs::is_directory(root_) && !fs::create_directories(root_, ec)) {
        EXPECT(fs::is_directory(root_),
               "Failed to create store root '",
               root_.string(),
               "': ",
               ec.message());
    }
}

fs::path
stow::FsObjectStore::object_path(std::string_view name) const
{
    return root_ / fs::path(name);
}

fs::path
stow::FsObjectStore::object_metadata_path(std::string_view name) const
{
    fs::path path = root_ / STOW_DIR / "objects" / fs::path(name);
    path += ".json";
    return path;
}

fs::path
stow::FsObjectStore::session_path(std::string_view session_id) const
{
    return root_ / STOW_DIR / "uploads" / fs::path(session_id);
}

std::string
stow::FsObjectStore::make_session_id_()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

    return std::to_string(ns) + "-" + std::to_string(++session_counter_);
}

stow::Error
stow::FsObjectStore::get_object_uploader(
  std::unique_ptr<ObjectUploader>& uploader_out)
{
    uploader_out = std::make_unique<FsObjectUploader>(*this);
    return {};
}

stow::Error
stow::FsObjectStore::start_multipart(
  std::string_view name,
  const ObjectAttributes& attributes,
  std::unique_ptr<MultipartSession>& session_out)
{
    if (std::string error; !is_valid_object_name(name, error)) {
        return { StowStatusCode_InvalidArgument, error };
    }

    const std::string session_id = make_session_id_();
    const fs::path path = session_path(session_id);

    std::error_code ec;
    if (!fs::create_directories(path, ec)) {
        return io_error("Failed to create upload session '" + path.string() +
                        "': " + ec.message());
    }

    nlohmann::json record = attributes_to_json(attributes);
    record["name"] = std::string(name);
    record["session_id"] = session_id;
    if (Error error = write_json(path / "upload.json", record); error) {
        return error;
    }

    session_out =
      std::make_unique<FsMultipartSession>(*this, session_id, name, attributes);
    return {};
}

stow::Error
stow::FsObjectStore::list_unfinished_uploads(
  std::string_view start_name,
  size_t max_count,
  std::vector<UnfinishedUpload>& uploads_out)
{
    uploads_out.clear();

    const fs::path uploads_dir = root_ / STOW_DIR / "uploads";
    if (!fs::is_directory(uploads_dir)) {
        return {};
    }

    std::vector<UnfinishedUpload> uploads;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(uploads_dir, ec)) {
        if (!entry.is_directory()) {
            continue;
        }

        nlohmann::json record;
        if (Error error = read_json(entry.path() / "upload.json", record);
            error) {
            LOG_WARNING("Skipping upload session '",
                        entry.path().string(),
                        "': ",
                        error.message());
            continue;
        }

        auto name = record.value("name", std::string{});
        if (name.empty() || name < start_name) {
            continue;
        }

        uploads.push_back({ .name = std::move(name),
                            .session_id = entry.path().filename().string() });
    }
    if (ec) {
        return io_error("Failed to list '" + uploads_dir.string() +
                        "': " + ec.message());
    }

    // by name, most recently started session first
    std::sort(uploads.begin(), uploads.end(), [](const auto& a, const auto& b) {
        if (a.name != b.name) {
            return a.name < b.name;
        }
        return a.session_id > b.session_id;
    });

    if (uploads.size() > max_count) {
        uploads.resize(max_count);
    }
    uploads_out = std::move(uploads);

    return {};
}

stow::Error
stow::FsObjectStore::list_parts(const UnfinishedUpload& upload,
                                uint32_t start_part_id,
                                size_t max_count,
                                PartListing& listing_out)
{
    listing_out = {};

    const fs::path path = session_path(upload.session_id);
    if (!fs::is_directory(path)) {
        return { StowStatusCode_NotFound,
                 "Upload session '" + upload.session_id + "' not found" };
    }

    std::vector<PartInfo> parts;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(path, ec)) {
        const std::string filename = entry.path().filename().string();
        if (!filename.starts_with("part-") || !filename.ends_with(".json")) {
            continue;
        }

        nlohmann::json record;
        if (Error error = read_json(entry.path(), record); error) {
            return error;
        }

        try {
            PartInfo part{
                .part_id = record.at("part_id").get<uint32_t>(),
                .hash = record.at("hash").get<std::string>(),
                .size = record.at("size").get<uint64_t>(),
            };
            if (part.part_id >= start_part_id) {
                parts.push_back(std::move(part));
            }
        } catch (const nlohmann::json::exception& exc) {
            return io_error("Invalid part record '" + entry.path().string() +
                            "': " + exc.what());
        }
    }
    if (ec) {
        return io_error("Failed to list '" + path.string() +
                        "': " + ec.message());
    }

    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) {
        return a.part_id < b.part_id;
    });

    if (parts.size() > max_count) {
        listing_out.next_part_id = parts[max_count].part_id;
        parts.resize(max_count);
    }
    listing_out.parts = std::move(parts);

    return {};
}

stow::Error
stow::FsObjectStore::resume_multipart(
  const UnfinishedUpload& upload,
  const SeenParts& stored_parts,
  uint64_t stored_bytes,
  std::unique_ptr<MultipartSession>& session_out)
{
    nlohmann::json record;
    if (Error error =
          read_json(session_path(upload.session_id) / "upload.json", record);
        error) {
        return error;
    }

    ObjectAttributes attributes;
    try {
        attributes.content_type = record.value("content_type", std::string{});
        if (record.contains("metadata")) {
            record.at("metadata").get_to(attributes.metadata);
        }
    } catch (const nlohmann::json::exception& exc) {
        return io_error("Invalid upload record for '" + upload.session_id +
                        "': " + exc.what());
    }

    LOG_DEBUG("Reopened upload session ",
              upload.session_id,
              " with ",
              stored_parts.size(),
              " parts (",
              stored_bytes,
              " bytes)");

    session_out = std::make_unique<FsMultipartSession>(
      *this, upload.session_id, upload.name, attributes);
    return {};
}
