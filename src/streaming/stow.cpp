#include "macros.hh"
#include "stow.common.hh"
#include "stow.writer.hh"

#include "stow.h"

#include <cstdlib> // calloc, free

#define STOW_API_VERSION 0

namespace {
LogLevel
to_log_level(StowLogLevel level)
{
    switch (level) {
        case StowLogLevel_Debug:
            return LogLevel_Debug;
        case StowLogLevel_Info:
            return LogLevel_Info;
        case StowLogLevel_Warning:
            return LogLevel_Warning;
        case StowLogLevel_Error:
            return LogLevel_Error;
        default:
            return LogLevel_None;
    }
}

StowLogLevel
to_stow_log_level(LogLevel level)
{
    switch (level) {
        case LogLevel_Debug:
            return StowLogLevel_Debug;
        case LogLevel_Info:
            return StowLogLevel_Info;
        case LogLevel_Warning:
            return StowLogLevel_Warning;
        case LogLevel_Error:
            return StowLogLevel_Error;
        default:
            return StowLogLevel_None;
    }
}
} // namespace

extern "C"
{
    uint32_t Stow_get_api_version()
    {
        return STOW_API_VERSION;
    }

    StowStatusCode Stow_set_log_level(StowLogLevel level_)
    {
        EXPECT_VALID_ARGUMENT(
          level_ < StowLogLevelCount, "Invalid log level: ", level_);

        try {
            Logger::set_log_level(to_log_level(level_));
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return StowStatusCode_InternalError;
        }
        return StowStatusCode_Success;
    }

    StowLogLevel Stow_get_log_level()
    {
        return to_stow_log_level(Logger::get_log_level());
    }

    const char* Stow_get_status_message(StowStatusCode code)
    {
        return stow::status_code_to_string(code);
    }

    StowStatusCode StowWriterSettings_create_metadata(
      StowWriterSettings* settings,
      size_t metadata_count)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");

        StowWriterSettings_destroy_metadata(settings);
        if (metadata_count == 0) {
            return StowStatusCode_Success;
        }

        auto* metadata = static_cast<StowMetadataEntry*>(
          std::calloc(metadata_count, sizeof(StowMetadataEntry)));
        if (metadata == nullptr) {
            LOG_ERROR("Failed to allocate metadata");
            return StowStatusCode_InternalError;
        }

        settings->metadata = metadata;
        settings->metadata_count = metadata_count;

        return StowStatusCode_Success;
    }

    void StowWriterSettings_destroy_metadata(StowWriterSettings* settings)
    {
        if (settings == nullptr) {
            return;
        }

        std::free(settings->metadata);
        settings->metadata = nullptr;
        settings->metadata_count = 0;
    }

    StowWriter* StowWriter_create(StowWriterSettings* settings)
    {
        StowWriter* writer = nullptr;

        try {
            writer = new StowWriter(settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for Stow writer");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating Stow writer: ", e.what());
        }

        return writer;
    }

    StowStatusCode StowWriter_write(StowWriter* writer,
                                    const void* data,
                                    size_t bytes_in,
                                    size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");
        EXPECT_VALID_ARGUMENT(bytes_out, "Null pointer: bytes_out");
        *bytes_out = 0;

        try {
            return writer->write(data, bytes_in, *bytes_out);
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing data: ", e.what());
            return StowStatusCode_InternalError;
        }
    }

    StowStatusCode StowWriter_close(StowWriter* writer)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");

        try {
            return writer->close();
        } catch (const std::exception& e) {
            LOG_ERROR("Error closing writer: ", e.what());
            return StowStatusCode_InternalError;
        }
    }

    const char* StowWriter_get_error_message(const StowWriter* writer)
    {
        if (writer == nullptr) {
            return "";
        }
        return writer->error_message().c_str();
    }

    void StowWriter_destroy(StowWriter* writer)
    {
        delete writer;
    }
}
