#include "error.sink.hh"
#include "macros.hh"

#include <mutex>

stow::ErrorSink::ErrorSink(std::string_view object_name)
  : object_name_(object_name)
{
}

bool
stow::ErrorSink::set_error(const Error& error)
{
    if (!error) {
        return false;
    }

    std::unique_lock lock(mutex_);
    if (error_) {
        return false;
    }

    LOG_ERROR("Error writing ", object_name_, ": ", error.to_string());
    error_ = error;
    stop_source_.request_stop();

    return true;
}

stow::Error
stow::ErrorSink::get_error() const
{
    std::shared_lock lock(mutex_);
    return error_;
}

std::stop_token
stow::ErrorSink::stop_token() const
{
    return stop_source_.get_token();
}

void
stow::ErrorSink::cancel()
{
    stop_source_.request_stop();
}

bool
stow::ErrorSink::cancelled() const
{
    return stop_source_.stop_requested();
}
