#pragma once

#include <string>

namespace agentfleet {
namespace utils {

/**
 * @brief Generates a random (version 4) UUID in canonical lowercase form.
 */
std::string generateUuid();

/**
 * @brief Checks for the canonical 8-4-4-4-12 hex form.
 */
bool isValidUuid(const std::string& text);

} // namespace utils
} // namespace agentfleet
