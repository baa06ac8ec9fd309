#include "error.hh"
#include "stow.common.hh"

stow::Error::Error(StowStatusCode code, std::string message, int http_status)
  : code_(code)
  , message_(std::move(message))
  , http_status_(http_status)
{
}

std::string
stow::Error::to_string() const
{
    if (!*this) {
        return "no error";
    }

    std::string str = status_code_to_string(code_);
    if (http_status_ != 0) {
        str += " (HTTP " + std::to_string(http_status_) + ")";
    }
    if (!message_.empty()) {
        str += ": " + message_;
    }

    return str;
}

bool
stow::is_retryable_error(const Error& error)
{
    if (!error) {
        return false;
    }

    if (error.code() == StowStatusCode_NetworkError) {
        return true;
    }

    switch (const int status = error.http_status(); status) {
        case 401: // expired authorization token
        case 408:
        case 429:
            return true;
        default:
            return status >= 500 && status < 600;
    }
}
