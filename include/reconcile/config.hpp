#pragma once

/// @file config.hpp
/// @brief Configuration types for the matching engine

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace reconcile {

/// @brief Default amount tolerance (2%)
constexpr double kDefaultAmountTolerance = 0.02;
/// @brief Default date window in days
constexpr int kDefaultDateWindowDays = 30;
/// @brief Default minimum confidence for a candidate to be surfaced
constexpr double kDefaultMinConfidence = 0.5;

/// @brief Scoring rules for one matching run
///
/// Weights need not sum to 1; they are normalized when the confidence is
/// composed.
struct MatchingConfig {
    /// Only identical amounts score on the amount factor
    bool exact_amount_match = false;
    /// Amount tolerance as a fraction (0.02 for 2%)
    double amount_tolerance = kDefaultAmountTolerance;
    /// Weight of the amount factor
    double amount_weight = 0.4;

    /// Days before/after the invoice date still considered a match
    int date_window_days = kDefaultDateWindowDays;
    /// Weight of the date factor
    double date_weight = 0.3;

    /// Minimum reference similarity considered meaningful
    double reference_similarity_threshold = 0.5;
    /// Weight of the reference factor
    double reference_weight = 0.3;

    /// Candidates below this confidence are dropped (0-1)
    double min_confidence_score = kDefaultMinConfidence;

    /// Sum of the three factor weights
    [[nodiscard]] double total_weight() const {
        return amount_weight + date_weight + reference_weight;
    }
};

/// @brief Returns the default matching configuration
[[nodiscard]] MatchingConfig default_matching_config();

/// @brief Checks that a configuration can be used for scoring
///
/// @throws ConfigError if a weight is negative, all weights are zero, or the
///         tolerance or date window is negative
void validate(const MatchingConfig& config);

/// @brief Partial configuration; unset fields keep the base value
struct MatchingConfigOverrides {
    std::optional<bool> exact_amount_match;
    std::optional<double> amount_tolerance;
    std::optional<double> amount_weight;
    std::optional<int> date_window_days;
    std::optional<double> date_weight;
    std::optional<double> reference_similarity_threshold;
    std::optional<double> reference_weight;
    std::optional<double> min_confidence_score;
};

/// @brief Merges overrides over a base configuration
[[nodiscard]] MatchingConfig merge_config(
    const MatchingConfigOverrides& overrides,
    const MatchingConfig& base = default_matching_config());

/// @brief Reads a JSON object of overrides from disk and merges it over the defaults
///
/// @throws ParseError if the file is missing, is not a JSON object, or a key
///         holds a value of the wrong type (e.g. a fractional date window)
[[nodiscard]] MatchingConfig load_config_file(const std::string& path);

/// @brief Serialization for MatchingConfig
void to_json(nlohmann::json& j, const MatchingConfig& c);
void from_json(const nlohmann::json& j, MatchingConfig& c);

/// @brief Serialization for MatchingConfigOverrides (only present keys are set)
///
/// from_json throws ParseError for wrong-typed keys.
void to_json(nlohmann::json& j, const MatchingConfigOverrides& o);
void from_json(const nlohmann::json& j, MatchingConfigOverrides& o);

/// @brief Functional option type for building a configuration
using ConfigOption = std::function<void(MatchingConfig&)>;

/// @brief Applies options over the defaults, in order
[[nodiscard]] MatchingConfig make_matching_config(std::initializer_list<ConfigOption> options);

/// @brief Requires identical amounts
[[nodiscard]] ConfigOption with_exact_amount_match(bool exact = true);

/// @brief Sets the amount tolerance fraction
[[nodiscard]] ConfigOption with_amount_tolerance(double tolerance);

/// @brief Sets all three factor weights
[[nodiscard]] ConfigOption with_weights(double amount, double date, double reference);

/// @brief Sets the date window in days
[[nodiscard]] ConfigOption with_date_window(int days);

/// @brief Sets the reference similarity threshold
[[nodiscard]] ConfigOption with_reference_threshold(double threshold);

/// @brief Sets the minimum confidence score
[[nodiscard]] ConfigOption with_min_confidence(double score);

}  // namespace reconcile
