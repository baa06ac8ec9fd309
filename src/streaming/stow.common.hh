#pragma once

#include "stow.types.h"

#include <string>
#include <string_view>

namespace stow {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]] std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including a null string.
 * @param str The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(const char* str, std::string_view err_on_empty);

/**
 * @brief Get a human-readable description of a status code.
 * @param code The status code.
 * @return The description.
 */
const char*
status_code_to_string(StowStatusCode code);
} // namespace stow
