#pragma once

/// @file normalization.hpp
/// @brief Text normalization utilities for reference matching

#include <string>
#include <string_view>

namespace reconcile {
namespace normalization {

/// @brief Lowercases UTF-8 text
///
/// ASCII input takes a fast path; anything else is lowercased with ICU using
/// the root locale so results do not depend on the process locale.
[[nodiscard]] std::string to_lower(std::string_view str);

/// @brief Removes leading and trailing whitespace
///
/// Covers every Unicode White_Space character, including the no-break spaces
/// (U+00A0, U+202F) common in bank statement text, and U+FEFF.
[[nodiscard]] std::string trim(std::string_view str);

/// @brief Lowercases and trims, the form used for all text comparisons
[[nodiscard]] std::string fold(std::string_view str);

/// @brief Decodes UTF-8 text into Unicode code points
///
/// Ill-formed sequences decode to U+FFFD.
[[nodiscard]] std::u32string to_code_points(std::string_view str);

/// @brief Number of Unicode code points in UTF-8 text
[[nodiscard]] std::size_t code_point_length(std::string_view str);

/// @brief Checks if a string contains non-ASCII characters
[[nodiscard]] bool has_non_ascii(std::string_view str);

}  // namespace normalization
}  // namespace reconcile
