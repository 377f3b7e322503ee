#include <reconcile/errors.hpp>
#include <reconcile/internal/similarity.hpp>
#include <reconcile/scoring.hpp>

#include <algorithm>
#include <cmath>

namespace reconcile {
namespace scoring {

AmountScore score_amount(
    double invoice_amount, double transaction_amount, const MatchingConfig& config) {
    if (invoice_amount == transaction_amount) {
        return AmountScore{.score = 1.0, .is_match = true, .difference = 0.0};
    }

    const double difference = std::abs(invoice_amount - transaction_amount);
    if (config.exact_amount_match) {
        return AmountScore{.score = 0.0, .is_match = false, .difference = difference};
    }

    const double percent_difference = difference / invoice_amount * 100.0;
    // amount_tolerance is a fraction, yet it is scaled by 1/100 again here
    const double tolerance = config.amount_tolerance * invoice_amount / 100.0;

    if (difference <= tolerance) {
        const double score = 1.0 - percent_difference / (config.amount_tolerance * 100.0);
        return AmountScore{.score = std::max(0.0, score), .is_match = true, .difference = difference};
    }

    const double score = std::max(0.0, 1.0 - percent_difference / 50.0);
    return AmountScore{.score = std::max(0.0, score * 0.5), .is_match = false, .difference = difference};
}

DateScore score_date(Date invoice_date, Date transaction_date, const MatchingConfig& config) {
    const int difference = day_difference(invoice_date, transaction_date);

    if (difference == 0) {
        return DateScore{.score = 1.0, .in_window = true, .difference = 0};
    }
    if (difference > config.date_window_days) {
        return DateScore{.score = kOutOfWindowDateScore, .in_window = false, .difference = difference};
    }

    const double score =
        1.0 - static_cast<double>(difference) / static_cast<double>(config.date_window_days);
    return DateScore{.score = std::max(0.0, score), .in_window = true, .difference = difference};
}

double score_reference(
    const Invoice& invoice, const Transaction& transaction, const MatchingConfig& /*config*/) {
    const auto invoice_tokens = similarity::extract_tokens(
        invoice.customer_name + " " + invoice.reference_id.value_or("") + " " +
        invoice.description.value_or(""));
    const auto transaction_tokens = similarity::extract_tokens(transaction.description);

    if (invoice_tokens.empty() || transaction_tokens.empty()) {
        return kNoReferenceScore;
    }

    const double token_score = similarity::compare_token_sets(invoice_tokens, transaction_tokens);
    const double customer_score =
        similarity::similarity(invoice.customer_name, transaction.description);

    return std::max(token_score, customer_score * kCustomerNameFactor);
}

double compose_confidence(
    double amount_score, double date_score, double reference_score, const MatchingConfig& config) {
    const double total_weight = config.total_weight();
    if (!(total_weight > 0.0)) {
        throw ConfigError("weights", "total weight must be greater than zero");
    }

    const double confidence = amount_score * (config.amount_weight / total_weight) +
                              date_score * (config.date_weight / total_weight) +
                              reference_score * (config.reference_weight / total_weight);

    return std::clamp(confidence, 0.0, 1.0);
}

}  // namespace scoring
}  // namespace reconcile
