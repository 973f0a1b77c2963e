#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rowcast::core {

using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using Milliseconds = std::chrono::duration<double, std::milli>;

/**
 * @brief Parses an ISO-8601 date or date-time.
 *
 * Accepts `YYYY-MM-DD`, optionally followed by `T` or a space and
 * `HH:MM[:SS[.fraction]]`, optionally followed by `Z` or a `+HH:MM` / `-HH:MM`
 * offset. Times without a zone designator are read as UTC.
 * @return The instant, or std::nullopt when the text is not a valid timestamp.
 */
std::optional<TimePoint> parseTimestamp(std::string_view text);

/**
 * @brief Formats an instant as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
 */
std::string formatTimestamp(const TimePoint &tp);

/// Milliseconds elapsed since the Unix epoch (fractional part preserved).
double toEpochMillis(const TimePoint &tp);

/// Largest representable distance from the epoch, +-100,000,000 days.
inline constexpr double kMaxEpochMillis = 8.64e15;

/**
 * @brief Inverse of toEpochMillis, rounded to whole milliseconds.
 * @return std::nullopt when @p millis is not finite or lies beyond kMaxEpochMillis.
 */
std::optional<TimePoint> fromEpochMillis(double millis);

} // namespace rowcast::core
