#pragma once

/// @file similarity.hpp
/// @brief String similarity utilities using Levenshtein distance and fuzzy matching

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace reconcile {
namespace similarity {

/// @brief Set of normalized words and reference codes extracted from text
using TokenSet = std::unordered_set<std::string>;

/// @brief Levenshtein distance between two strings
///
/// The comparison is case-insensitive, ignores leading and trailing
/// whitespace, and counts Unicode code points with unit cost for insertion,
/// deletion and substitution.
///
/// @param a First string
/// @param b Second string
/// @return Minimum number of single-character edits turning a into b
[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

/// @brief Normalized edit similarity
///
/// Computes 1 - edit_distance / max(|a|, |b|), with lengths taken before
/// trimming. Two empty strings are identical (1.0).
///
/// @return Similarity score between 0 and 1
[[nodiscard]] double similarity(std::string_view a, std::string_view b);

/// @brief Scores whether all pattern characters occur in target, in order
///
/// Returns 0 when some pattern character cannot be found in order. Otherwise
/// the score blends the matched fraction with a bonus for matches that end
/// early in the target, clamped to [0.5, 1].
///
/// @param pattern The search pattern
/// @param target The string to search in
/// @return Fuzzy match score between 0 and 1
[[nodiscard]] double subsequence_score(std::string_view pattern, std::string_view target);

/// @brief Extracts reference codes and keywords from free text
///
/// Collects digit runs of three or more digits, alphanumeric codes such as
/// "INV-001" (upper-cased), and lowercased words longer than two characters
/// split on whitespace, hyphens, underscores, parentheses and commas.
[[nodiscard]] TokenSet extract_tokens(std::string_view text);

/// @brief Compares two token sets
///
/// Averages, over every token of @p lhs, its best match in @p rhs. The result
/// is directional: compare_token_sets(a, b) need not equal
/// compare_token_sets(b, a).
///
/// @return 1.0 when both sets are empty, 0.0 when exactly one is
[[nodiscard]] double compare_token_sets(const TokenSet& lhs, const TokenSet& rhs);

}  // namespace similarity
}  // namespace reconcile
