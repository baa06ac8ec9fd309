#pragma once

#include <chrono>
#include <cstdint> // uint8_t
#include <span>
#include <vector>

using ByteVector = std::vector<uint8_t>;

using ByteSpan = std::span<uint8_t>;
using ConstByteSpan = std::span<const uint8_t>;

namespace stow {
constexpr uint64_t DEFAULT_CHUNK_SIZE = 100'000'000;
constexpr uint64_t MIN_CHUNK_SIZE = 100'000'000;
constexpr uint64_t MAX_CHUNK_SIZE = 5'000'000'000;

constexpr std::chrono::milliseconds INITIAL_RETRY_DELAY{ 15 };
constexpr std::chrono::milliseconds MAX_RETRY_DELAY{ 15'000 };

constexpr size_t MAX_METADATA_FOR_LAST_MODIFIED = 10;
constexpr size_t DEFAULT_LIST_PARTS_PAGE_SIZE = 100;

constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";
constexpr const char* LAST_MODIFIED_KEY = "src_last_modified_millis";
} // namespace stow
