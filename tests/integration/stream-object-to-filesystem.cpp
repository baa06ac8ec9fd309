#include "stow.h"
#include "test.macros.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace {
const auto test_path = (fs::temp_directory_path() / TEST).string();

constexpr uint64_t chunk_size = 1'000;
constexpr size_t object_size = 10 * chunk_size + 317;

std::vector<uint8_t>
make_data(size_t size)
{
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) % 256);
    }
    return data;
}

std::vector<uint8_t>
read_file(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    EXPECT(file.is_open(), "Failed to open ", path.string());
    return { std::istreambuf_iterator<char>(file),
             std::istreambuf_iterator<char>() };
}

StowWriter*
setup(StowWriterSettings& settings, const char* object_name)
{
    settings.store_path = test_path.c_str();
    settings.object_name = object_name;
    settings.content_type = "application/x-test";
    settings.chunk_size_bytes = chunk_size;
    settings.concurrent_uploads = 4;
    settings.last_modified_ms = 1'234;

    CHECK_OK(StowWriterSettings_create_metadata(&settings, 1));
    settings.metadata[0].key = "origin";
    settings.metadata[0].value = "integration";

    StowWriter* writer = StowWriter_create(&settings);
    StowWriterSettings_destroy_metadata(&settings);

    return writer;
}

void
stream_in_pieces(StowWriter* writer, const std::vector<uint8_t>& data)
{
    // deliberately ragged piece sizes
    const size_t piece_sizes[] = { 1, 999, 1'500, 7, 3'000, 10 };

    size_t offset = 0, i = 0;
    while (offset < data.size()) {
        const size_t n =
          std::min(piece_sizes[i++ % std::size(piece_sizes)],
                   data.size() - offset);
        size_t bytes_out = 0;
        CHECK_OK(StowWriter_write(writer, data.data() + offset, n, &bytes_out));
        EXPECT_EQ(size_t, bytes_out, n);
        offset += n;
    }
}

void
verify_object(const std::string& object_name, const std::vector<uint8_t>& data)
{
    const fs::path object_path = fs::path(test_path) / object_name;
    CHECK(fs::is_regular_file(object_path));
    CHECK(read_file(object_path) == data);

    fs::path sidecar_path =
      fs::path(test_path) / ".stow" / "objects" / object_name;
    sidecar_path += ".json";
    std::ifstream sidecar(sidecar_path);
    EXPECT(sidecar.is_open(), "Missing attributes for ", object_name);

    const auto metadata = nlohmann::json::parse(sidecar);
    EXPECT_EQ(size_t, metadata["size"].get<size_t>(), data.size());
    CHECK(metadata["content_type"] == "application/x-test");
    CHECK(metadata["metadata"]["origin"] == "integration");
    CHECK(metadata["metadata"]["src_last_modified_millis"] == "1234");
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        if (fs::exists(test_path)) {
            fs::remove_all(test_path);
        }

        // multipart
        {
            StowWriterSettings settings{};
            StowWriter* writer = setup(settings, "data/large.bin");
            CHECK(writer != nullptr);

            const auto data = make_data(object_size);
            stream_in_pieces(writer, data);
            CHECK_OK(StowWriter_close(writer));
            CHECK_OK(StowWriter_close(writer));
            EXPECT_STR_EQ(StowWriter_get_error_message(writer), "");

            // closed writers accept no more data
            size_t bytes_out = 1;
            EXPECT_EQ(int,
                      StowWriter_write(writer, data.data(), 1, &bytes_out),
                      StowStatusCode_InvalidArgument);
            EXPECT_EQ(size_t, bytes_out, 0);
            EXPECT_EQ(int,
                      StowWriter_write(writer, nullptr, 0, &bytes_out),
                      StowStatusCode_InvalidArgument);

            StowWriter_destroy(writer);

            verify_object("data/large.bin", data);
        }

        // single request
        {
            StowWriterSettings settings{};
            StowWriter* writer = setup(settings, "small.bin");
            CHECK(writer != nullptr);

            const auto data = make_data(chunk_size);
            stream_in_pieces(writer, data);
            CHECK_OK(StowWriter_close(writer));
            StowWriter_destroy(writer);

            verify_object("small.bin", data);
        }

        // nothing is left staged
        CHECK(fs::is_empty(fs::path(test_path) / ".stow" / "uploads"));

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    // cleanup
    std::error_code ec;
    fs::remove_all(test_path, ec);

    return retval;
}
