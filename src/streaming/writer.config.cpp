#include "macros.hh"
#include "writer.config.hh"

bool
stow::validate_writer_config(const WriterConfig& config, std::string& error)
{
    const uint64_t chunk_size = effective_chunk_size(config);
    if (chunk_size > MAX_CHUNK_SIZE) {
        error = "Invalid chunk size: " + std::to_string(chunk_size) +
                ". Must be at most " + std::to_string(MAX_CHUNK_SIZE);
        return false;
    }

    if (chunk_size < MIN_CHUNK_SIZE) {
        LOG_WARNING("Chunk size ",
                    chunk_size,
                    " is below the minimum part size of ",
                    MIN_CHUNK_SIZE,
                    " bytes and may be rejected by the object store");
    }

    if (config.list_parts_page_size == 0) {
        error = "Part listing page size must be nonzero";
        return false;
    }

    for (const auto& [key, value] : config.metadata) {
        if (key.empty()) {
            error = "Metadata key is empty";
            return false;
        }
    }

    return true;
}

uint64_t
stow::effective_chunk_size(const WriterConfig& config)
{
    return config.chunk_size == 0 ? DEFAULT_CHUNK_SIZE : config.chunk_size;
}

stow::ObjectAttributes
stow::make_object_attributes(const WriterConfig& config)
{
    ObjectAttributes attributes{
        .content_type = config.content_type.empty() ? DEFAULT_CONTENT_TYPE
                                                    : config.content_type,
        .metadata = config.metadata,
    };

    if (config.last_modified_ms &&
        attributes.metadata.size() < MAX_METADATA_FOR_LAST_MODIFIED) {
        attributes.metadata[LAST_MODIFIED_KEY] =
          std::to_string(*config.last_modified_ms);
    }

    return attributes;
}

void
stow::to_json(nlohmann::json& j, const WriterConfig& config)
{
    j = nlohmann::json{
        { "concurrent_uploads", config.concurrent_uploads },
        { "resume", config.resume },
        { "chunk_size", config.chunk_size },
        { "content_type", config.content_type },
        { "metadata", config.metadata },
        { "max_upload_attempts", config.max_upload_attempts },
        { "list_parts_page_size", config.list_parts_page_size },
    };

    if (config.last_modified_ms) {
        j["last_modified_ms"] = *config.last_modified_ms;
    } else {
        j["last_modified_ms"] = nullptr;
    }
}

void
stow::from_json(const nlohmann::json& j, WriterConfig& config)
{
    if (j.contains("concurrent_uploads")) {
        j.at("concurrent_uploads").get_to(config.concurrent_uploads);
    }
    if (j.contains("resume")) {
        j.at("resume").get_to(config.resume);
    }
    if (j.contains("chunk_size")) {
        j.at("chunk_size").get_to(config.chunk_size);
    }
    if (j.contains("content_type")) {
        j.at("content_type").get_to(config.content_type);
    }
    if (j.contains("metadata")) {
        j.at("metadata").get_to(config.metadata);
    }
    if (j.contains("max_upload_attempts")) {
        j.at("max_upload_attempts").get_to(config.max_upload_attempts);
    }
    if (j.contains("list_parts_page_size")) {
        j.at("list_parts_page_size").get_to(config.list_parts_page_size);
    }
    if (j.contains("last_modified_ms")) {
        if (const auto& value = j.at("last_modified_ms"); value.is_null()) {
            config.last_modified_ms.reset();
        } else {
            config.last_modified_ms = value.get<uint64_t>();
        }
    }
}

bool
stow::parse_writer_config(std::string_view json,
                          WriterConfig& config_out,
                          std::string& error)
{
    auto val = nlohmann::json::parse(json,
                                     nullptr, // callback
                                     false,   // allow exceptions
                                     true     // ignore comments
    );

    if (val.is_discarded()) {
        error = "Invalid JSON: '" + std::string(json) + "'";
        return false;
    }

    if (!val.is_object()) {
        error = "Writer config must be a JSON object";
        return false;
    }

    WriterConfig config = config_out;
    try {
        from_json(val, config);
    } catch (const nlohmann::json::exception& exc) {
        error = "Invalid writer config: " + std::string(exc.what());
        return false;
    }

    config_out = std::move(config);
    return true;
}
