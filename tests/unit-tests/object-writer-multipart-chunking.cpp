#include "mock.object.store.hh"
#include "object.writer.hh"
#include "unit.test.macros.hh"

using namespace std::chrono_literals;

namespace {
stow::WriterConfig
make_config(uint32_t concurrent_uploads)
{
    stow::WriterConfig config;
    config.chunk_size = 100;
    config.concurrent_uploads = concurrent_uploads;
    return config;
}

/**
 * @brief Write @p data in pieces of @p piece_size bytes, then close.
 */
void
write_all(stow::ObjectWriter& writer, const ByteVector& data, size_t piece_size)
{
    ConstByteSpan remaining(data);
    while (!remaining.empty()) {
        const auto piece =
          remaining.first(std::min(piece_size, remaining.size()));
        size_t bytes_accepted = 0;
        CHECK_NO_ERROR(writer.write(piece, bytes_accepted));
        EXPECT_EQ(size_t, bytes_accepted, piece.size());
        remaining = remaining.subspan(piece.size());
    }
    CHECK_NO_ERROR(writer.close());
}

void
check_parts(const mock::ObjectStore& store,
            const std::string& name,
            const ByteVector& data,
            const std::vector<size_t>& part_sizes)
{
    const auto sessions = store.sessions();
    EXPECT_EQ(size_t, sessions.size(), 1);

    const auto& session = sessions.begin()->second;
    CHECK(session.finished);
    EXPECT_EQ(size_t, session.parts.size(), part_sizes.size());

    size_t offset = 0;
    for (auto i = 0u; i < part_sizes.size(); ++i) {
        const auto& part = session.parts.at(i + 1);
        EXPECT_EQ(size_t, part.data.size(), part_sizes[i]);
        CHECK(std::equal(part.data.begin(),
                         part.data.end(),
                         data.begin() + static_cast<ptrdiff_t>(offset)));
        EXPECT(part.hash == stow::md5_hex(part.data),
               "Wrong hash for part ",
               i + 1);
        offset += part.data.size();
    }

    CHECK(store.objects().at(name).data == data);
}

void
ragged_stream_is_split_into_parts()
{
    auto store = std::make_shared<mock::ObjectStore>();
    stow::ObjectWriter writer(store, "ragged.bin", make_config(1));

    const auto data = mock::make_data(250);
    write_all(writer, data, 250);

    CHECK(writer.strategy() == stow::UploadStrategy::Multipart);
    EXPECT_EQ(uint32_t, writer.chunks_queued(), 3);
    EXPECT_EQ(uint64_t, writer.bytes_written(), 250);
    check_parts(*store, "ragged.bin", data, { 100, 100, 50 });

    const auto& object = writer.object();
    CHECK(object.has_value());
    EXPECT_EQ(uint64_t, object->size, 250);
}

void
even_stream_has_no_empty_trailing_part()
{
    auto store = std::make_shared<mock::ObjectStore>();
    stow::ObjectWriter writer(store, "even.bin", make_config(1));

    const auto data = mock::make_data(200);
    write_all(writer, data, 200);

    CHECK(writer.strategy() == stow::UploadStrategy::Multipart);
    EXPECT_EQ(uint32_t, writer.chunks_queued(), 2);
    check_parts(*store, "even.bin", data, { 100, 100 });
}

void
small_writes_are_buffered_into_full_parts()
{
    auto store = std::make_shared<mock::ObjectStore>();
    stow::ObjectWriter writer(store, "small-writes.bin", make_config(3));

    const auto data = mock::make_data(1'013);
    write_all(writer, data, 7);

    EXPECT_EQ(uint32_t, writer.chunks_queued(), 11);
    std::vector<size_t> part_sizes(10, 100);
    part_sizes.push_back(13);
    check_parts(*store, "small-writes.bin", data, part_sizes);
}

void
parts_upload_concurrently()
{
    constexpr uint32_t n_workers = 4;

    auto store = std::make_shared<mock::ObjectStore>();
    store->set_part_delay(50ms);

    stow::ObjectWriter writer(store, "parallel.bin", make_config(n_workers));

    const auto data = mock::make_data(2'000);
    write_all(writer, data, 2'000);

    EXPECT_EQ(uint32_t, writer.chunks_queued(), 20);
    CHECK(store->objects().at("parallel.bin").data == data);

    const auto max_in_flight = store->max_concurrent_parts();
    EXPECT(max_in_flight > 1, "Parts were uploaded sequentially");
    EXPECT(max_in_flight <= n_workers,
           "More parts in flight (",
           max_in_flight,
           ") than workers (",
           n_workers,
           ")");

    // one endpoint per worker, no retries
    EXPECT_EQ(uint32_t, store->uploaders_acquired(), n_workers);
}

void
failure_to_start_is_terminal()
{
    auto store = std::make_shared<mock::ObjectStore>();
    store->fail_start_multipart({ StowStatusCode_IOError, "no bucket", 404 });

    stow::ObjectWriter writer(store, "unstarted.bin", make_config(2));

    const auto data = mock::make_data(150);
    size_t bytes_accepted = 0;
    const auto error = writer.write(data, bytes_accepted);
    CHECK(error);
    EXPECT_EQ(int, error.http_status(), 404);
    EXPECT_EQ(size_t, bytes_accepted, 100);

    // sticky
    const auto again = writer.write(data, bytes_accepted);
    EXPECT_EQ(int, again.http_status(), 404);
    EXPECT_EQ(size_t, bytes_accepted, 0);
    EXPECT_EQ(int, writer.close().http_status(), 404);
}

void
failure_to_finish_is_terminal()
{
    auto store = std::make_shared<mock::ObjectStore>();
    store->fail_finish({ StowStatusCode_IOError, "bad parts", 400 });

    stow::ObjectWriter writer(store, "unfinished.bin", make_config(2));

    const auto data = mock::make_data(250);
    size_t bytes_accepted = 0;
    CHECK_NO_ERROR(writer.write(data, bytes_accepted));

    const auto error = writer.close();
    EXPECT_EQ(int, error.http_status(), 400);
    CHECK(!writer.object().has_value());
    CHECK(store->objects().empty());

    // all parts were stored before finish was attempted
    EXPECT_EQ(size_t, store->sessions().begin()->second.parts.size(), 3);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        ragged_stream_is_split_into_parts();
        even_stream_has_no_empty_trailing_part();
        small_writes_are_buffered_into_full_parts();
        parts_upload_concurrently();
        failure_to_start_is_terminal();
        failure_to_finish_is_terminal();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
