#include "stow.h"
#include "test.macros.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace {
const auto test_path = (fs::temp_directory_path() / TEST).string();
const std::string object_name = "resumed.bin";

constexpr uint64_t chunk_size = 4'096;

std::vector<uint8_t>
make_data(size_t size, uint8_t seed)
{
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i + seed) % 253);
    }
    return data;
}

StowWriter*
make_writer(bool resume, uint32_t concurrent_uploads)
{
    StowWriterSettings settings{};
    settings.store_path = test_path.c_str();
    settings.object_name = object_name.c_str();
    settings.chunk_size_bytes = chunk_size;
    settings.concurrent_uploads = concurrent_uploads;
    settings.resume = resume;

    return StowWriter_create(&settings);
}

/**
 * @brief Write @p nbytes of @p data, then drop the writer without closing it.
 * @details With a single upload worker, handing off chunk 2 waits until the
 * worker has finished chunk 1, so at least chunk 1 is stored.
 */
void
interrupt_after(const std::vector<uint8_t>& data, size_t nbytes)
{
    StowWriter* writer = make_writer(false, 1);
    CHECK(writer != nullptr);

    size_t bytes_out = 0;
    CHECK_OK(StowWriter_write(writer, data.data(), nbytes, &bytes_out));
    EXPECT_EQ(size_t, bytes_out, nbytes);

    StowWriter_destroy(writer);
    CHECK(!fs::exists(fs::path(test_path) / object_name));
}

void
resume_completes_the_object()
{
    const auto data = make_data(5 * chunk_size + 100, 1);
    interrupt_after(data, 2 * chunk_size + 10);

    StowWriter* writer = make_writer(true, 2);
    CHECK(writer != nullptr);

    size_t bytes_out = 0;
    CHECK_OK(StowWriter_write(writer, data.data(), data.size(), &bytes_out));
    EXPECT_EQ(size_t, bytes_out, data.size());
    CHECK_OK(StowWriter_close(writer));
    StowWriter_destroy(writer);

    std::ifstream file(fs::path(test_path) / object_name, std::ios::binary);
    const std::vector<uint8_t> stored{ std::istreambuf_iterator<char>(file),
                                       std::istreambuf_iterator<char>() };
    CHECK(stored == data);
    CHECK(fs::is_empty(fs::path(test_path) / ".stow" / "uploads"));
}

void
resume_with_different_data_fails()
{
    const auto data = make_data(3 * chunk_size, 2);
    interrupt_after(data, 2 * chunk_size + 10);

    const auto other = make_data(3 * chunk_size, 3);

    StowWriter* writer = make_writer(true, 1);
    CHECK(writer != nullptr);

    size_t bytes_out = 0;
    StowStatusCode status =
      StowWriter_write(writer, other.data(), other.size(), &bytes_out);
    if (status == StowStatusCode_Success) {
        status = StowWriter_close(writer);
    } else {
        EXPECT_EQ(int, StowWriter_close(writer), status);
    }

    EXPECT_EQ(int, status, StowStatusCode_ResumeMismatch);
    EXPECT(std::string(StowWriter_get_error_message(writer)).size() > 0,
           "Expected an error message");

    // empty writes still report the terminal error
    EXPECT_EQ(int,
              StowWriter_write(writer, other.data(), 0, &bytes_out),
              StowStatusCode_ResumeMismatch);
    EXPECT_EQ(int,
              StowWriter_write(writer, nullptr, 0, &bytes_out),
              StowStatusCode_ResumeMismatch);
    EXPECT_EQ(size_t, bytes_out, 0);
    StowWriter_destroy(writer);

    CHECK(!fs::exists(fs::path(test_path) / object_name));

    // the interrupted session is left for another attempt
    CHECK(!fs::is_empty(fs::path(test_path) / ".stow" / "uploads"));
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

        resume_completes_the_object();

        fs::remove_all(test_path);
        resume_with_different_data_fails();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    // cleanup
    std::error_code ec;
    fs::remove_all(test_path, ec);

    return retval;
}
