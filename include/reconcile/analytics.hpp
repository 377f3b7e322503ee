#pragma once

/// @file analytics.hpp
/// @brief Derived views over a candidate list

#include <reconcile/types.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace reconcile {
namespace analytics {

/// @brief Candidates keyed by invoice or transaction id
using CandidateGroups = std::unordered_map<std::string, std::vector<MatchCandidate>>;

/// @brief Field a candidate list is grouped on
enum class GroupKey { Invoice, Transaction };

/// @brief Keeps candidates with min <= confidence <= max (max unbounded if unset)
[[nodiscard]] std::vector<MatchCandidate> filter_by_confidence(
    const std::vector<MatchCandidate>& candidates,
    double min_confidence,
    std::optional<double> max_confidence = std::nullopt);

/// @brief Groups candidates by key, each group sorted by confidence descending
[[nodiscard]] CandidateGroups group_by(const std::vector<MatchCandidate>& candidates, GroupKey key);

[[nodiscard]] inline CandidateGroups group_by_invoice(const std::vector<MatchCandidate>& candidates) {
    return group_by(candidates, GroupKey::Invoice);
}

[[nodiscard]] inline CandidateGroups group_by_transaction(
    const std::vector<MatchCandidate>& candidates) {
    return group_by(candidates, GroupKey::Transaction);
}

/// @brief Candidates whose invoice and transaction each appear exactly once
///
/// These are safe candidates for automatic reconciliation. Input order is kept.
[[nodiscard]] std::vector<MatchCandidate> find_one_to_one_matches(
    const std::vector<MatchCandidate>& candidates);

/// @brief Candidates whose invoice or transaction appears more than once
///
/// Covers split payments and competing candidates that need manual review.
/// Input order is kept.
[[nodiscard]] std::vector<MatchCandidate> find_ambiguous_matches(
    const std::vector<MatchCandidate>& candidates);

/// @brief An (invoice, transaction) pairing, used as ground truth
struct MatchPair {
    std::string invoice_id;
    std::string transaction_id;

    bool operator==(const MatchPair& other) const {
        return invoice_id == other.invoice_id && transaction_id == other.transaction_id;
    }
};

struct MatchPairHash {
    std::size_t operator()(const MatchPair& pair) const noexcept {
        const std::size_t h1 = std::hash<std::string>{}(pair.invoice_id);
        const std::size_t h2 = std::hash<std::string>{}(pair.transaction_id);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

using MatchPairSet = std::unordered_set<MatchPair, MatchPairHash>;

/// @brief Accuracy of proposed matches against known correct pairs
struct MatchingMetrics {
    /// Of proposed matches, the share that is correct
    double precision = 0.0;
    /// Of correct pairs, the share that was proposed
    double recall = 0.0;
    /// Harmonic mean of precision and recall
    double f1_score = 0.0;
    std::size_t true_positives = 0;
    std::size_t false_positives = 0;
    std::size_t false_negatives = 0;
};

/// @brief Computes precision, recall and F1 of proposed matches
///
/// Duplicate proposals of the same pair count once. Ratios with a zero
/// denominator are 0.
[[nodiscard]] MatchingMetrics calculate_metrics(
    const std::vector<MatchCandidate>& proposed, const MatchPairSet& ground_truth);

/// @brief Range and mean of one factor's scores
struct ScoreDistribution {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
};

/// @brief How much each factor contributes across a candidate list
struct ScoringAnalysis {
    /// Share of the summed scores contributed by each factor
    double amount_influence = 0.0;
    double date_influence = 0.0;
    double reference_influence = 0.0;
    ScoreDistribution amount_scores;
    ScoreDistribution date_scores;
    ScoreDistribution reference_scores;
};

/// @brief Analyzes which scoring factors drive the candidates
///
/// An empty list yields an all-zero analysis.
[[nodiscard]] ScoringAnalysis analyze_scoring_factors(const std::vector<MatchCandidate>& candidates);

/// @brief Scoring factor a suggestion refers to
enum class ScoringFactor { Amount, Date, Reference };

[[nodiscard]] std::string to_string(ScoringFactor factor);

/// @brief Advisory configuration change
struct ConfigurationSuggestion {
    ScoringFactor factor = ScoringFactor::Amount;
    std::string issue;
    std::string suggestion;
    std::string recommended_change;
};

/// @brief Suggests configuration adjustments from matching results
///
/// Purely advisory; nothing in the engine reads the suggestions.
[[nodiscard]] std::vector<ConfigurationSuggestion> suggest_configuration_adjustments(
    const std::vector<MatchCandidate>& candidates,
    std::size_t unmatched_invoices,
    std::size_t unmatched_transactions);

/// @brief Default confidence at which a match is reconciled without review
constexpr double kDefaultAutoApproveThreshold = 0.9;
/// @brief Confidence at which a match goes to manual confirmation instead of review
constexpr double kManualApproveThreshold = 0.7;

/// @brief Handling a match receives in the accounting system
enum class ReconciliationStatus { Auto, Manual, Review };

[[nodiscard]] std::string to_string(ReconciliationStatus status);

/// @brief A candidate prepared for an accounting system
struct ExportedMatch {
    std::string invoice_id;
    std::string transaction_id;
    double confidence = 0.0;
    ReconciliationStatus status = ReconciliationStatus::Review;
    /// Human readable summary of the breakdown
    std::string notes;
};

/// @brief Serialization for ExportedMatch
void to_json(nlohmann::json& j, const ExportedMatch& m);

/// @brief Classifies candidates for export, keeping input order
[[nodiscard]] std::vector<ExportedMatch> export_matches(
    const std::vector<MatchCandidate>& candidates,
    double auto_approve_threshold = kDefaultAutoApproveThreshold);

}  // namespace analytics
}  // namespace reconcile
