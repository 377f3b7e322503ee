#include <reconcile/matcher.hpp>
#include <reconcile/scoring.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <unordered_set>

namespace reconcile {

namespace {

bool by_confidence_desc(const MatchCandidate& a, const MatchCandidate& b) {
    return a.confidence_score > b.confidence_score;
}

// Candidates for a single invoice, best first
std::vector<MatchCandidate> find_candidates_for_invoice(
    const Invoice& invoice,
    const std::vector<Transaction>& transactions,
    const MatchingConfig& config) {
    std::vector<MatchCandidate> candidates;

    for (const auto& transaction : transactions) {
        MatchCandidate candidate = score_pair(invoice, transaction, config);
        if (candidate.confidence_score >= config.min_confidence_score) {
            candidates.push_back(std::move(candidate));
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), by_confidence_desc);
    return candidates;
}

}  // namespace

MatchCandidate score_pair(
    const Invoice& invoice, const Transaction& transaction, const MatchingConfig& config) {
    const auto amount = scoring::score_amount(invoice.amount, transaction.amount, config);
    const auto date = scoring::score_date(invoice.date, transaction.date, config);
    const double reference = scoring::score_reference(invoice, transaction, config);
    const double confidence =
        scoring::compose_confidence(amount.score, date.score, reference, config);

    return MatchCandidate{
        .invoice_id = invoice.id,
        .transaction_id = transaction.id,
        .confidence_score = confidence,
        .amount_score = amount.score,
        .date_score = date.score,
        .reference_score = reference,
        .breakdown = MatchBreakdown{
            .amount_difference = amount.difference,
            .date_difference = date.difference,
            .amount_match = amount.is_match,
            .date_in_window = date.in_window,
            .reference_similarity = reference}};
}

std::vector<MatchCandidate> find_matches(
    const std::vector<Invoice>& invoices,
    const std::vector<Transaction>& transactions,
    const MatchingConfig& config) {
    validate(config);

    PLOG_DEBUG << "Scoring " << invoices.size() << " invoices against " << transactions.size()
               << " transactions (min confidence " << config.min_confidence_score << ")";

    std::vector<MatchCandidate> all_candidates;
    for (const auto& invoice : invoices) {
        auto candidates = find_candidates_for_invoice(invoice, transactions, config);
        all_candidates.insert(all_candidates.end(),
                              std::make_move_iterator(candidates.begin()),
                              std::make_move_iterator(candidates.end()));
    }

    std::stable_sort(all_candidates.begin(), all_candidates.end(), by_confidence_desc);

    PLOG_DEBUG << "Kept " << all_candidates.size() << " of "
               << invoices.size() * transactions.size() << " pairs";
    return all_candidates;
}

std::unordered_map<std::string, std::vector<MatchCandidate>> find_top_matches(
    const std::vector<Invoice>& invoices,
    const std::vector<Transaction>& transactions,
    std::size_t top_n,
    const MatchingConfig& config) {
    validate(config);

    std::unordered_map<std::string, std::vector<MatchCandidate>> matches_by_invoice;
    matches_by_invoice.reserve(invoices.size());

    for (const auto& invoice : invoices) {
        auto candidates = find_candidates_for_invoice(invoice, transactions, config);
        if (candidates.size() > top_n) {
            candidates.resize(top_n);
        }
        matches_by_invoice[invoice.id] = std::move(candidates);
    }

    PLOG_DEBUG << "Collected top " << top_n << " candidates for " << matches_by_invoice.size()
               << " invoices";
    return matches_by_invoice;
}

ConfidenceLevel confidence_level(double confidence) {
    if (confidence >= kHighConfidence) return ConfidenceLevel::High;
    if (confidence >= kMediumConfidence) return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

std::string to_string(ConfidenceLevel level) {
    switch (level) {
    case ConfidenceLevel::High:
        return "high";
    case ConfidenceLevel::Medium:
        return "medium";
    case ConfidenceLevel::Low:
        return "low";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const MatchingStats& s) {
    j = nlohmann::json{
        {"total_invoices", s.total_invoices},
        {"total_transactions", s.total_transactions},
        {"total_candidates", s.total_candidates},
        {"average_confidence", s.average_confidence},
        {"confidence_distribution",
         {{"high", s.high_confidence}, {"medium", s.medium_confidence}, {"low", s.low_confidence}}}};
}

MatchingStats matching_stats(const std::vector<MatchCandidate>& candidates) {
    MatchingStats stats;
    std::unordered_set<std::string> invoice_ids;
    std::unordered_set<std::string> transaction_ids;
    double total_confidence = 0.0;

    for (const auto& candidate : candidates) {
        invoice_ids.insert(candidate.invoice_id);
        transaction_ids.insert(candidate.transaction_id);
        total_confidence += candidate.confidence_score;

        switch (confidence_level(candidate.confidence_score)) {
        case ConfidenceLevel::High:
            ++stats.high_confidence;
            break;
        case ConfidenceLevel::Medium:
            ++stats.medium_confidence;
            break;
        case ConfidenceLevel::Low:
            ++stats.low_confidence;
            break;
        }
    }

    stats.total_invoices = invoice_ids.size();
    stats.total_transactions = transaction_ids.size();
    stats.total_candidates = candidates.size();
    if (!candidates.empty()) {
        stats.average_confidence = total_confidence / static_cast<double>(candidates.size());
    }
    return stats;
}

}  // namespace reconcile
