#include "macros.hh"
#include "stow.common.hh"

#include <algorithm>
#include <cctype>

std::string
stow::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    auto is_space = [](unsigned char c) { return std::isspace(c); };

    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();

    if (begin >= end) {
        return {};
    }

    return { begin, end };
}

bool
stow::is_empty_string(const char* str, std::string_view err_on_empty)
{
    auto trimmed = trim(str == nullptr ? "" : str);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

const char*
stow::status_code_to_string(StowStatusCode code)
{
    switch (code) {
        case StowStatusCode_Success:
            return "Success";
        case StowStatusCode_InvalidArgument:
            return "Invalid argument";
        case StowStatusCode_InvalidSettings:
            return "Invalid settings";
        case StowStatusCode_InternalError:
            return "Internal error";
        case StowStatusCode_IOError:
            return "I/O error";
        case StowStatusCode_NetworkError:
            return "Network error";
        case StowStatusCode_Cancelled:
            return "Operation cancelled";
        case StowStatusCode_NotFound:
            return "Not found";
        case StowStatusCode_ResumeMismatch:
            return "Resumed data does not match previously stored data";
        case StowStatusCode_NotSupported:
            return "Not supported";
        default:
            return "Unknown error";
    }
}
