#pragma once

#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <sstream>
#include <string>

enum LogLevel
{
    LogLevel_Debug = 0,
    LogLevel_Info,
    LogLevel_Warning,
    LogLevel_Error,
    LogLevel_None
};

class Logger
{
  public:
    static void set_log_level(LogLevel level);
    static LogLevel get_log_level();

    /**
     * @brief Format and emit a log message.
     * @details The message is formatted even when @p level is below the
     * current log level, so that callers can reuse it (e.g., as an exception
     * message).
     * @return The formatted message.
     */
    template<typename... Args>
    static std::string log(LogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case LogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case LogLevel_Info:
                prefix = "[INFO] ";
                break;
            case LogLevel_Warning:
                prefix = "[WARNING] ";
                stream = &std::cerr;
                break;
            default:
                prefix = "[ERROR] ";
                stream = &std::cerr;
                break;
        }

        std::string filename = fs::path(file).filename().string();

        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix << filename << ":" << line
           << " " << func << ": ";
        (ss << ... << std::forward<Args>(args));

        std::string message = ss.str();

        if (current_level_ != LogLevel_None && level >= current_level_) {
            std::scoped_lock lock(log_mutex_);
            *stream << message << std::endl;
        }

        return message;
    }

  private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;

    static std::string get_timestamp_();
};
