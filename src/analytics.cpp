#include <reconcile/analytics.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace reconcile {
namespace analytics {

namespace {

constexpr double kLowAverageScore = 0.3;
constexpr double kMinReferenceInfluence = 0.1;

// Running min/max/sum of one factor
struct FactorAccumulator {
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;

    void add(double value, bool first) {
        sum += value;
        min = first ? value : std::min(min, value);
        max = first ? value : std::max(max, value);
    }

    [[nodiscard]] ScoreDistribution distribution(std::size_t count) const {
        return ScoreDistribution{.min = min, .max = max, .avg = sum / static_cast<double>(count)};
    }
};

double share(double part, double total) {
    return total == 0.0 ? 0.0 : part / total;
}

std::string format_notes(const MatchCandidate& candidate) {
    std::ostringstream notes;
    if (candidate.breakdown.amount_match) {
        notes << "Amount match";
    } else {
        notes << "Amount diff: $" << std::fixed << std::setprecision(2)
              << candidate.breakdown.amount_difference;
    }

    notes << ", ";
    if (candidate.breakdown.date_in_window) {
        notes << "Date in window";
    } else {
        notes << "Date diff: " << candidate.breakdown.date_difference << "d";
    }

    notes << ", Reference similarity: "
          << std::lround(candidate.breakdown.reference_similarity * 100.0) << "%";
    return notes.str();
}

}  // namespace

std::vector<MatchCandidate> filter_by_confidence(
    const std::vector<MatchCandidate>& candidates,
    double min_confidence,
    std::optional<double> max_confidence) {
    std::vector<MatchCandidate> result;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(result),
                 [&](const MatchCandidate& c) {
                     const bool meets_min = c.confidence_score >= min_confidence;
                     const bool meets_max = !max_confidence || c.confidence_score <= *max_confidence;
                     return meets_min && meets_max;
                 });
    return result;
}

CandidateGroups group_by(const std::vector<MatchCandidate>& candidates, GroupKey key) {
    CandidateGroups grouped;
    for (const auto& candidate : candidates) {
        const std::string& id =
            key == GroupKey::Invoice ? candidate.invoice_id : candidate.transaction_id;
        grouped[id].push_back(candidate);
    }

    for (auto& [id, matches] : grouped) {
        std::stable_sort(matches.begin(), matches.end(),
                         [](const MatchCandidate& a, const MatchCandidate& b) {
                             return a.confidence_score > b.confidence_score;
                         });
    }
    return grouped;
}

std::vector<MatchCandidate> find_one_to_one_matches(const std::vector<MatchCandidate>& candidates) {
    const auto by_invoice = group_by_invoice(candidates);
    const auto by_transaction = group_by_transaction(candidates);

    std::vector<MatchCandidate> result;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(result),
                 [&](const MatchCandidate& c) {
                     return by_invoice.at(c.invoice_id).size() == 1 &&
                            by_transaction.at(c.transaction_id).size() == 1;
                 });
    return result;
}

std::vector<MatchCandidate> find_ambiguous_matches(const std::vector<MatchCandidate>& candidates) {
    const auto by_invoice = group_by_invoice(candidates);
    const auto by_transaction = group_by_transaction(candidates);

    std::vector<MatchCandidate> result;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(result),
                 [&](const MatchCandidate& c) {
                     return by_invoice.at(c.invoice_id).size() > 1 ||
                            by_transaction.at(c.transaction_id).size() > 1;
                 });
    return result;
}

MatchingMetrics calculate_metrics(
    const std::vector<MatchCandidate>& proposed, const MatchPairSet& ground_truth) {
    MatchPairSet proposed_pairs;
    for (const auto& candidate : proposed) {
        proposed_pairs.insert(MatchPair{candidate.invoice_id, candidate.transaction_id});
    }

    MatchingMetrics metrics;
    for (const auto& pair : proposed_pairs) {
        if (ground_truth.count(pair) > 0) {
            ++metrics.true_positives;
        } else {
            ++metrics.false_positives;
        }
    }
    for (const auto& pair : ground_truth) {
        if (proposed_pairs.count(pair) == 0) {
            ++metrics.false_negatives;
        }
    }

    const auto tp = static_cast<double>(metrics.true_positives);
    metrics.precision = share(tp, tp + static_cast<double>(metrics.false_positives));
    metrics.recall = share(tp, tp + static_cast<double>(metrics.false_negatives));
    metrics.f1_score = share(2.0 * metrics.precision * metrics.recall,
                             metrics.precision + metrics.recall);
    return metrics;
}

ScoringAnalysis analyze_scoring_factors(const std::vector<MatchCandidate>& candidates) {
    if (candidates.empty()) {
        return ScoringAnalysis{};
    }

    FactorAccumulator amount;
    FactorAccumulator date;
    FactorAccumulator reference;
    bool first = true;
    for (const auto& c : candidates) {
        amount.add(c.amount_score, first);
        date.add(c.date_score, first);
        reference.add(c.reference_score, first);
        first = false;
    }

    const double total = amount.sum + date.sum + reference.sum;
    const std::size_t count = candidates.size();

    return ScoringAnalysis{
        .amount_influence = share(amount.sum, total),
        .date_influence = share(date.sum, total),
        .reference_influence = share(reference.sum, total),
        .amount_scores = amount.distribution(count),
        .date_scores = date.distribution(count),
        .reference_scores = reference.distribution(count)};
}

std::string to_string(ScoringFactor factor) {
    switch (factor) {
    case ScoringFactor::Amount:
        return "amount";
    case ScoringFactor::Date:
        return "date";
    case ScoringFactor::Reference:
        return "reference";
    }
    return "unknown";
}

std::vector<ConfigurationSuggestion> suggest_configuration_adjustments(
    const std::vector<MatchCandidate>& candidates,
    std::size_t unmatched_invoices,
    std::size_t unmatched_transactions) {
    std::vector<ConfigurationSuggestion> suggestions;

    if (candidates.empty()) {
        suggestions.push_back({ScoringFactor::Amount, "No matches found at all",
                               "Try increasing amount tolerance or date window",
                               "Increase amount_tolerance to 0.05-0.10"});
        return suggestions;
    }

    const auto analysis = analyze_scoring_factors(candidates);

    if (analysis.amount_scores.avg < kLowAverageScore) {
        suggestions.push_back({ScoringFactor::Amount, "Low average amount scores",
                               "Consider increasing amount tolerance",
                               "Increase amount_tolerance by 1-2%"});
    }

    if (analysis.date_scores.avg < kLowAverageScore) {
        suggestions.push_back({ScoringFactor::Date, "Low average date scores",
                               "Consider increasing date window",
                               "Increase date_window_days by 10-20 days"});
    }

    if (analysis.reference_influence < kMinReferenceInfluence) {
        suggestions.push_back({ScoringFactor::Reference, "Reference matching has minimal influence",
                               "Consider increasing reference weight for better clarity",
                               "Increase reference_weight from 0.3 to 0.4+"});
    }

    if (unmatched_invoices > 0) {
        suggestions.push_back({ScoringFactor::Amount,
                               std::to_string(unmatched_invoices) + " invoices have no matches",
                               "Relax matching thresholds to find more candidates",
                               "Lower min_confidence_score from 0.5 to 0.3-0.4"});
    }

    if (unmatched_transactions > 0) {
        suggestions.push_back({ScoringFactor::Reference,
                               std::to_string(unmatched_transactions) +
                                   " transactions have no matches",
                               "Transaction descriptions may not mention the customer or invoice",
                               "Increase reference_weight or lower min_confidence_score"});
    }

    PLOG_DEBUG << "Generated " << suggestions.size() << " configuration suggestions for "
               << candidates.size() << " candidates";
    return suggestions;
}

std::string to_string(ReconciliationStatus status) {
    switch (status) {
    case ReconciliationStatus::Auto:
        return "auto";
    case ReconciliationStatus::Manual:
        return "manual";
    case ReconciliationStatus::Review:
        return "review";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const ExportedMatch& m) {
    j = nlohmann::json{
        {"invoice_id", m.invoice_id},
        {"transaction_id", m.transaction_id},
        {"confidence", m.confidence},
        {"reconciliation_status", to_string(m.status)},
        {"notes", m.notes}};
}

std::vector<ExportedMatch> export_matches(
    const std::vector<MatchCandidate>& candidates, double auto_approve_threshold) {
    std::vector<ExportedMatch> exported;
    exported.reserve(candidates.size());

    for (const auto& c : candidates) {
        ReconciliationStatus status = ReconciliationStatus::Review;
        if (c.confidence_score >= auto_approve_threshold) {
            status = ReconciliationStatus::Auto;
        } else if (c.confidence_score >= kManualApproveThreshold) {
            status = ReconciliationStatus::Manual;
        }

        exported.push_back(ExportedMatch{
            .invoice_id = c.invoice_id,
            .transaction_id = c.transaction_id,
            .confidence = c.confidence_score,
            .status = status,
            .notes = format_notes(c)});
    }
    return exported;
}

}  // namespace analytics
}  // namespace reconcile
