#pragma once

/// @file matcher.hpp
/// @brief Candidate generation across invoices and transactions

#include <reconcile/config.hpp>
#include <reconcile/types.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace reconcile {

/// @brief Default number of candidates kept per invoice by find_top_matches
constexpr std::size_t kDefaultTopMatches = 3;

/// @brief Lower bound of the high confidence bucket
constexpr double kHighConfidence = 0.8;
/// @brief Lower bound of the medium confidence bucket
constexpr double kMediumConfidence = 0.5;

/// @brief Scores one invoice/transaction pair
///
/// Computes the three factor scores and the composed confidence. No threshold
/// is applied.
[[nodiscard]] MatchCandidate score_pair(
    const Invoice& invoice, const Transaction& transaction, const MatchingConfig& config);

/// @brief Finds all candidate matches between invoices and transactions
///
/// Every invoice is scored against every transaction. Pairs whose confidence
/// reaches config.min_confidence_score are returned sorted by confidence,
/// highest first; equal confidences keep invoice-then-transaction input order.
///
/// @param invoices Invoices to match
/// @param transactions Transactions to match against
/// @param config Matching rules
/// @return Candidates sorted by confidence descending
/// @throws ConfigError if the configuration is invalid
[[nodiscard]] std::vector<MatchCandidate> find_matches(
    const std::vector<Invoice>& invoices,
    const std::vector<Transaction>& transactions,
    const MatchingConfig& config = default_matching_config());

/// @brief Finds the top N candidates for each invoice
///
/// Scoring and thresholding are identical to find_matches. Every invoice gets
/// an entry, possibly empty.
///
/// @return Map from invoice id to at most top_n candidates, best first
[[nodiscard]] std::unordered_map<std::string, std::vector<MatchCandidate>> find_top_matches(
    const std::vector<Invoice>& invoices,
    const std::vector<Transaction>& transactions,
    std::size_t top_n = kDefaultTopMatches,
    const MatchingConfig& config = default_matching_config());

/// @brief Confidence bucket of a candidate
enum class ConfidenceLevel {
    High,    ///< Score >= 0.8
    Medium,  ///< Score >= 0.5
    Low      ///< Score < 0.5
};

/// @brief Returns the bucket a confidence score falls into
[[nodiscard]] ConfidenceLevel confidence_level(double confidence);

/// @brief Converts ConfidenceLevel to string
[[nodiscard]] std::string to_string(ConfidenceLevel level);

/// @brief Aggregate statistics over a candidate list
struct MatchingStats {
    /// Distinct invoices appearing in the list
    std::size_t total_invoices = 0;
    /// Distinct transactions appearing in the list
    std::size_t total_transactions = 0;
    std::size_t total_candidates = 0;
    /// Mean confidence, 0 for an empty list
    double average_confidence = 0.0;
    std::size_t high_confidence = 0;
    std::size_t medium_confidence = 0;
    std::size_t low_confidence = 0;
};

/// @brief Serialization for MatchingStats
void to_json(nlohmann::json& j, const MatchingStats& s);

/// @brief Computes statistics about matching results
[[nodiscard]] MatchingStats matching_stats(const std::vector<MatchCandidate>& candidates);

}  // namespace reconcile
