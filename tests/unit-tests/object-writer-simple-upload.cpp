#include "mock.object.store.hh"
#include "object.writer.hh"
#include "unit.test.macros.hh"

namespace {
stow::WriterConfig
make_config()
{
    stow::WriterConfig config;
    config.chunk_size = 100;
    config.concurrent_uploads = 2;
    return config;
}

void
short_stream_is_a_single_upload()
{
    auto store = std::make_shared<mock::ObjectStore>();
    stow::ObjectWriter writer(store, "short.bin", make_config());

    const auto data = mock::make_data(42);
    size_t bytes_accepted = 0;
    CHECK_NO_ERROR(writer.write(data, bytes_accepted));
    EXPECT_EQ(size_t, bytes_accepted, 42);
    CHECK(writer.strategy() == stow::UploadStrategy::Undecided);

    CHECK_NO_ERROR(writer.close());
    CHECK(writer.strategy() == stow::UploadStrategy::Simple);
    EXPECT_EQ(uint32_t, store->sessions_started(), 0);
    EXPECT_EQ(uint32_t, store->object_attempts(), 1);

    const auto objects = store->objects();
    CHECK(objects.contains("short.bin"));
    CHECK(objects.at("short.bin").data == data);

    const auto& object = writer.object();
    CHECK(object.has_value());
    EXPECT_EQ(uint64_t, object->size, 42);
    EXPECT(object->id == stow::md5_hex(data), "Unexpected id ", object->id);
}

void
stream_of_exactly_one_chunk_is_a_single_upload()
{
    auto store = std::make_shared<mock::ObjectStore>();
    stow::ObjectWriter writer(store, "exact.bin", make_config());

    const auto data = mock::make_data(100);
    size_t bytes_accepted = 0;

    // split across two writes, filling the buffer exactly
    CHECK_NO_ERROR(writer.write(ConstByteSpan(data).first(60), bytes_accepted));
    EXPECT_EQ(size_t, bytes_accepted, 60);
    CHECK_NO_ERROR(writer.write(ConstByteSpan(data).subspan(60), bytes_accepted));
    EXPECT_EQ(size_t, bytes_accepted, 40);

    CHECK_NO_ERROR(writer.close());
    CHECK(writer.strategy() == stow::UploadStrategy::Simple);
    EXPECT_EQ(uint32_t, writer.chunks_queued(), 0);
    EXPECT_EQ(uint32_t, store->sessions_started(), 0);
    CHECK(store->objects().at("exact.bin").data == data);
}

void
empty_stream_stores_an_empty_object()
{
    auto store = std::make_shared<mock::ObjectStore>();
    stow::ObjectWriter writer(store, "empty.bin", make_config());

    CHECK_NO_ERROR(writer.close());
    CHECK(writer.strategy() == stow::UploadStrategy::Simple);

    const auto objects = store->objects();
    CHECK(objects.contains("empty.bin"));
    CHECK(objects.at("empty.bin").data.empty());
}

void
attributes_are_attached()
{
    auto store = std::make_shared<mock::ObjectStore>();

    auto config = make_config();
    config.metadata = { { "owner", "lab" } };
    config.last_modified_ms = 1'700'000'000'000ULL;

    stow::ObjectWriter writer(store, "attrs.bin", config);
    const auto data = mock::make_data(5);
    size_t bytes_accepted = 0;
    CHECK_NO_ERROR(writer.write(data, bytes_accepted));
    CHECK_NO_ERROR(writer.close());

    const auto& attributes = store->objects().at("attrs.bin").attributes;
    EXPECT(attributes.content_type == "application/octet-stream",
           "Unexpected content type ",
           attributes.content_type);
    EXPECT_EQ(size_t, attributes.metadata.size(), 2);
    CHECK(attributes.metadata.at("owner") == "lab");
    CHECK(attributes.metadata.at("src_last_modified_millis") ==
          "1700000000000");
}

void
last_modified_is_dropped_when_metadata_is_full()
{
    auto config = make_config();
    config.content_type = "text/plain";
    config.last_modified_ms = 1;
    for (auto i = 0; i < 10; ++i) {
        config.metadata["key" + std::to_string(i)] = "value";
    }

    const auto attributes = stow::make_object_attributes(config);
    CHECK(attributes.content_type == "text/plain");
    EXPECT_EQ(size_t, attributes.metadata.size(), 10);
    CHECK(!attributes.metadata.contains("src_last_modified_millis"));
}

void
transient_failures_are_retried()
{
    auto store = std::make_shared<mock::ObjectStore>();
    store->fail_object_uploads({
      { StowStatusCode_IOError, "unavailable", 503 },
      { StowStatusCode_NetworkError, "connection reset" },
    });

    stow::ObjectWriter writer(store, "retried.bin", make_config());
    const auto data = mock::make_data(10);
    size_t bytes_accepted = 0;
    CHECK_NO_ERROR(writer.write(data, bytes_accepted));
    CHECK_NO_ERROR(writer.close());

    EXPECT_EQ(uint32_t, store->object_attempts(), 3);
    // a fresh endpoint is acquired for every retry
    EXPECT_EQ(uint32_t, store->uploaders_acquired(), 3);
    CHECK(store->objects().at("retried.bin").data == data);
}

void
permanent_failure_is_terminal()
{
    auto store = std::make_shared<mock::ObjectStore>();
    store->fail_object_uploads({ { StowStatusCode_IOError, "forbidden", 403 } });

    stow::ObjectWriter writer(store, "forbidden.bin", make_config());
    const auto data = mock::make_data(10);
    size_t bytes_accepted = 0;
    CHECK_NO_ERROR(writer.write(data, bytes_accepted));

    const auto error = writer.close();
    CHECK(error);
    EXPECT_EQ(int, error.http_status(), 403);
    EXPECT_EQ(uint32_t, store->object_attempts(), 1);
    CHECK(!writer.object().has_value());
    CHECK(store->objects().empty());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        short_stream_is_a_single_upload();
        stream_of_exactly_one_chunk_is_a_single_upload();
        empty_stream_stores_an_empty_object();
        attributes_are_attached();
        last_modified_is_dropped_when_metadata_is_full();
        transient_failures_are_retried();
        permanent_failure_is_terminal();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
