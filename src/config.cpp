#include <reconcile/config.hpp>
#include <reconcile/errors.hpp>

#include <plog/Log.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <string>
#include <type_traits>

namespace reconcile {

namespace {

void require_non_negative(double value, const char* field) {
    if (!std::isfinite(value) || value < 0.0) {
        PLOG_ERROR << "Rejecting matching config: " << field << " = " << value;
        throw ConfigError(field, "must be a finite, non-negative number");
    }
}

bool is_whole_number(const nlohmann::json& value) {
    if (!value.is_number()) return false;
    const double number = value.get<double>();
    return std::isfinite(number) && std::floor(number) == number &&
           number >= static_cast<double>(std::numeric_limits<int>::min()) &&
           number <= static_cast<double>(std::numeric_limits<int>::max());
}

// Reads an optional key, rejecting values of the wrong JSON type
template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return;
    }

    const auto& value = j.at(key);
    const std::string subject = std::string("config key '") + key + "'";
    if constexpr (std::is_same_v<T, bool>) {
        if (!value.is_boolean()) throw ParseError(subject, "expected a boolean");
        out = value.get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        if (!is_whole_number(value)) throw ParseError(subject, "expected an integer");
        out = static_cast<T>(value.get<double>());
    } else {
        if (!value.is_number()) throw ParseError(subject, "expected a number");
        out = value.get<T>();
    }
}

}  // namespace

MatchingConfig default_matching_config() {
    return MatchingConfig{
        .exact_amount_match = false,
        .amount_tolerance = kDefaultAmountTolerance,
        .amount_weight = 0.4,
        .date_window_days = kDefaultDateWindowDays,
        .date_weight = 0.3,
        .reference_similarity_threshold = 0.5,
        .reference_weight = 0.3,
        .min_confidence_score = kDefaultMinConfidence};
}

void validate(const MatchingConfig& config) {
    require_non_negative(config.amount_weight, "amount_weight");
    require_non_negative(config.date_weight, "date_weight");
    require_non_negative(config.reference_weight, "reference_weight");
    require_non_negative(config.amount_tolerance, "amount_tolerance");

    if (config.total_weight() <= 0.0) {
        PLOG_ERROR << "Rejecting matching config: all factor weights are zero";
        throw ConfigError("weights", "total weight must be greater than zero");
    }
    if (config.date_window_days < 0) {
        PLOG_ERROR << "Rejecting matching config: date_window_days = " << config.date_window_days;
        throw ConfigError("date_window_days", "must not be negative");
    }
}

MatchingConfig merge_config(const MatchingConfigOverrides& overrides, const MatchingConfig& base) {
    MatchingConfig config = base;
    if (overrides.exact_amount_match) config.exact_amount_match = *overrides.exact_amount_match;
    if (overrides.amount_tolerance) config.amount_tolerance = *overrides.amount_tolerance;
    if (overrides.amount_weight) config.amount_weight = *overrides.amount_weight;
    if (overrides.date_window_days) config.date_window_days = *overrides.date_window_days;
    if (overrides.date_weight) config.date_weight = *overrides.date_weight;
    if (overrides.reference_similarity_threshold) {
        config.reference_similarity_threshold = *overrides.reference_similarity_threshold;
    }
    if (overrides.reference_weight) config.reference_weight = *overrides.reference_weight;
    if (overrides.min_confidence_score) config.min_confidence_score = *overrides.min_confidence_score;
    return config;
}

MatchingConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ParseError("config file '" + path + "'", "cannot open file");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError("config file '" + path + "'", e.what());
    }
    if (!j.is_object()) {
        throw ParseError("config file '" + path + "'", "expected a JSON object");
    }

    MatchingConfigOverrides overrides;
    try {
        overrides = j.get<MatchingConfigOverrides>();
    } catch (const ParseError& e) {
        PLOG_ERROR << "Rejecting config file " << path << ": " << e.what();
        throw ParseError("config file '" + path + "'", e.what());
    }

    PLOG_DEBUG << "Loaded matching config overrides from " << path;
    return merge_config(overrides);
}

// MatchingConfig serialization
void to_json(nlohmann::json& j, const MatchingConfig& c) {
    j = nlohmann::json{
        {"exact_amount_match", c.exact_amount_match},
        {"amount_tolerance", c.amount_tolerance},
        {"amount_weight", c.amount_weight},
        {"date_window_days", c.date_window_days},
        {"date_weight", c.date_weight},
        {"reference_similarity_threshold", c.reference_similarity_threshold},
        {"reference_weight", c.reference_weight},
        {"min_confidence_score", c.min_confidence_score}};
}

void from_json(const nlohmann::json& j, MatchingConfig& c) {
    c = merge_config(j.get<MatchingConfigOverrides>());
}

// MatchingConfigOverrides serialization
void to_json(nlohmann::json& j, const MatchingConfigOverrides& o) {
    j = nlohmann::json::object();
    if (o.exact_amount_match) j["exact_amount_match"] = *o.exact_amount_match;
    if (o.amount_tolerance) j["amount_tolerance"] = *o.amount_tolerance;
    if (o.amount_weight) j["amount_weight"] = *o.amount_weight;
    if (o.date_window_days) j["date_window_days"] = *o.date_window_days;
    if (o.date_weight) j["date_weight"] = *o.date_weight;
    if (o.reference_similarity_threshold) {
        j["reference_similarity_threshold"] = *o.reference_similarity_threshold;
    }
    if (o.reference_weight) j["reference_weight"] = *o.reference_weight;
    if (o.min_confidence_score) j["min_confidence_score"] = *o.min_confidence_score;
}

void from_json(const nlohmann::json& j, MatchingConfigOverrides& o) {
    read_optional(j, "exact_amount_match", o.exact_amount_match);
    read_optional(j, "amount_tolerance", o.amount_tolerance);
    read_optional(j, "amount_weight", o.amount_weight);
    read_optional(j, "date_window_days", o.date_window_days);
    read_optional(j, "date_weight", o.date_weight);
    read_optional(j, "reference_similarity_threshold", o.reference_similarity_threshold);
    read_optional(j, "reference_weight", o.reference_weight);
    read_optional(j, "min_confidence_score", o.min_confidence_score);
}

MatchingConfig make_matching_config(std::initializer_list<ConfigOption> options) {
    MatchingConfig config = default_matching_config();
    for (const auto& option : options) {
        option(config);
    }
    return config;
}

ConfigOption with_exact_amount_match(bool exact) {
    return [exact](MatchingConfig& c) { c.exact_amount_match = exact; };
}

ConfigOption with_amount_tolerance(double tolerance) {
    return [tolerance](MatchingConfig& c) { c.amount_tolerance = tolerance; };
}

ConfigOption with_weights(double amount, double date, double reference) {
    return [=](MatchingConfig& c) {
        c.amount_weight = amount;
        c.date_weight = date;
        c.reference_weight = reference;
    };
}

ConfigOption with_date_window(int days) {
    return [days](MatchingConfig& c) { c.date_window_days = days; };
}

ConfigOption with_reference_threshold(double threshold) {
    return [threshold](MatchingConfig& c) { c.reference_similarity_threshold = threshold; };
}

ConfigOption with_min_confidence(double score) {
    return [score](MatchingConfig& c) { c.min_confidence_score = score; };
}

}  // namespace reconcile
