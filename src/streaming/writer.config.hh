#pragma once

#include "content.hash.hh"
#include "definitions.hh"
#include "error.hh"
#include "object.store.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace stow {
/**
 * @brief Settings for a single object upload. Fixed for the lifetime of the
 * writer.
 */
struct WriterConfig
{
    uint32_t concurrent_uploads{ 1 }; // values below 1 mean 1
    bool resume{ false };
    uint64_t chunk_size{ 0 }; // 0 means DEFAULT_CHUNK_SIZE
    std::string content_type;
    std::map<std::string, std::string> metadata;
    std::optional<uint64_t> last_modified_ms;
    uint32_t max_upload_attempts{ 0 }; // 0 means unlimited
    size_t list_parts_page_size{ DEFAULT_LIST_PARTS_PAGE_SIZE };

    RetryClassifier retry_classifier; // empty means is_retryable_error
    ContentHasher hasher;             // empty means md5_hex
};

/**
 * @brief Check that the config is usable.
 * @note Chunk sizes below MIN_CHUNK_SIZE are accepted with a warning, as the
 * remote store decides whether to reject them.
 * @param[in] config The config to validate.
 * @param[out] error Reason the config is invalid.
 * @return True if the config is valid, false otherwise.
 */
[[nodiscard]] bool
validate_writer_config(const WriterConfig& config, std::string& error);

/**
 * @brief The chunk size in effect for @p config.
 */
uint64_t
effective_chunk_size(const WriterConfig& config);

/**
 * @brief Build the content type and metadata attached to the object.
 * @details The content type defaults to DEFAULT_CONTENT_TYPE. If the source
 * modification time is known and there are fewer than
 * MAX_METADATA_FOR_LAST_MODIFIED metadata entries, it is recorded under
 * LAST_MODIFIED_KEY.
 */
ObjectAttributes
make_object_attributes(const WriterConfig& config);

void
to_json(nlohmann::json& j, const WriterConfig& config);

void
from_json(const nlohmann::json& j, WriterConfig& config);

/**
 * @brief Parse a JSON document into a config.
 * @details Keys absent from the document keep their values in
 * @p config_out. Unknown keys are ignored.
 * @param[in] json The JSON text.
 * @param[in,out] config_out The config to update.
 * @param[out] error Reason for failure.
 * @return True on success, false otherwise.
 */
[[nodiscard]] bool
parse_writer_config(std::string_view json,
                    WriterConfig& config_out,
                    std::string& error);
} // namespace stow
