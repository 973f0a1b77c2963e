#pragma once

#include <string>
#include <string_view>

namespace rowcast::utils {

/**
 * @brief Normalizes a caller supplied tag for matching.
 *
 * Trims surrounding whitespace, lower-cases ASCII letters and maps '-' and ' '
 * to '_', so "Z-Score" and "z_score" compare equal.
 */
std::string normalizeTag(std::string_view tag);

} // namespace rowcast::utils
