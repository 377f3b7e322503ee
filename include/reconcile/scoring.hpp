#pragma once

/// @file scoring.hpp
/// @brief Per-factor scoring of an invoice/transaction pair

#include <reconcile/config.hpp>
#include <reconcile/date.hpp>
#include <reconcile/types.hpp>

namespace reconcile {
namespace scoring {

/// @brief Reference score used when either side yields no tokens
constexpr double kNoReferenceScore = 0.3;
/// @brief Date score for pairs outside the window, keeps far pairs rankable
constexpr double kOutOfWindowDateScore = 0.1;
/// @brief Scale applied to the direct customer name/description similarity
constexpr double kCustomerNameFactor = 0.8;

/// @brief Result of the amount factor
struct AmountScore {
    double score = 0.0;
    /// Amounts are equal or within tolerance
    bool is_match = false;
    /// Absolute amount difference
    double difference = 0.0;
};

/// @brief Result of the date factor
struct DateScore {
    double score = 0.0;
    bool in_window = false;
    /// Absolute difference in calendar days
    int difference = 0;
};

/// @brief Scores how close two amounts are
///
/// Equal amounts score 1. Within tolerance the score decreases linearly with
/// the percentage difference; outside it is scaled against a 50% difference
/// and halved. Both amounts are expected to be positive.
[[nodiscard]] AmountScore score_amount(
    double invoice_amount, double transaction_amount, const MatchingConfig& config);

/// @brief Scores how close two dates are, by calendar day
///
/// Same day scores 1, the score decays linearly inside the window, and any
/// pair outside the window scores kOutOfWindowDateScore.
[[nodiscard]] DateScore score_date(Date invoice_date, Date transaction_date,
                                   const MatchingConfig& config);

/// @brief Scores textual overlap between an invoice and a transaction description
///
/// The invoice's customer name, reference and description are tokenized and
/// compared against the tokens of the transaction description. A direct
/// similarity between customer name and description, scaled by
/// kCustomerNameFactor, is used when it is higher.
[[nodiscard]] double score_reference(
    const Invoice& invoice, const Transaction& transaction, const MatchingConfig& config);

/// @brief Combines the factor scores using the normalized config weights
///
/// @return Confidence clamped to [0, 1]
/// @throws ConfigError if the weights sum to zero or less
[[nodiscard]] double compose_confidence(
    double amount_score, double date_score, double reference_score, const MatchingConfig& config);

}  // namespace scoring
}  // namespace reconcile
