#pragma once

/// @file date.hpp
/// @brief Calendar-day helpers for record dates

#include <chrono>
#include <string>
#include <string_view>

namespace reconcile {

/// @brief Point in time attached to an invoice or transaction
///
/// Only the local calendar day of a Date takes part in scoring.
using Date = std::chrono::system_clock::time_point;

/// @brief Returns local midnight of the given calendar day
[[nodiscard]] Date make_date(int year, unsigned month, unsigned day);

/// @brief Returns the local calendar day containing the given point in time
[[nodiscard]] std::chrono::sys_days local_day(Date date);

/// @brief Absolute difference in whole calendar days between two dates
[[nodiscard]] int day_difference(Date a, Date b);

/// @brief Parses an ISO-8601 date ("YYYY-MM-DD")
///
/// A trailing time part ("T10:30:00Z", " 10:30") is accepted and ignored.
///
/// @throws ParseError if the text does not start with a valid date
[[nodiscard]] Date parse_date(std::string_view text);

/// @brief Formats the local calendar day of a date as "YYYY-MM-DD"
[[nodiscard]] std::string format_date(Date date);

}  // namespace reconcile
