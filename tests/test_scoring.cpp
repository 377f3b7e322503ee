// Tests for per-factor scoring
#include <gtest/gtest.h>

#include <reconcile/errors.hpp>
#include <reconcile/scoring.hpp>

#include <vector>

using namespace reconcile;
using namespace reconcile::scoring;

namespace {

Invoice make_invoice(std::string customer_name,
                     std::optional<std::string> reference_id = std::nullopt,
                     std::optional<std::string> description = std::nullopt) {
    return Invoice{
        .id = "INV-1",
        .amount = 1000.0,
        .date = make_date(2024, 1, 15),
        .customer_id = "CUST-1",
        .customer_name = std::move(customer_name),
        .reference_id = std::move(reference_id),
        .description = std::move(description)};
}

Transaction make_transaction(std::string description) {
    return Transaction{
        .id = "TXN-1",
        .amount = 1000.0,
        .date = make_date(2024, 1, 15),
        .description = std::move(description)};
}

}  // namespace

TEST(ScoreAmountTest, EqualAmounts) {
    auto result = score_amount(1000.0, 1000.0, default_matching_config());
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_TRUE(result.is_match);
    EXPECT_DOUBLE_EQ(result.difference, 0.0);
}

TEST(ScoreAmountTest, WithinTolerance) {
    auto result = score_amount(10000.0, 10001.0, default_matching_config());
    EXPECT_NEAR(result.score, 0.995, 1e-9);
    EXPECT_TRUE(result.is_match);
    EXPECT_DOUBLE_EQ(result.difference, 1.0);
}

TEST(ScoreAmountTest, OutsideToleranceIsHalved) {
    auto result = score_amount(1000.0, 1015.0, default_matching_config());
    EXPECT_NEAR(result.score, 0.485, 1e-9);
    EXPECT_FALSE(result.is_match);
    EXPECT_DOUBLE_EQ(result.difference, 15.0);
}

TEST(ScoreAmountTest, FiftyPercentOffScoresZero) {
    auto result = score_amount(1000.0, 1500.0, default_matching_config());
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_FALSE(result.is_match);

    EXPECT_DOUBLE_EQ(score_amount(1000.0, 3000.0, default_matching_config()).score, 0.0);
}

TEST(ScoreAmountTest, ExactMatchRequired) {
    auto config = make_matching_config({with_exact_amount_match()});

    auto equal = score_amount(1000.0, 1000.0, config);
    EXPECT_DOUBLE_EQ(equal.score, 1.0);
    EXPECT_TRUE(equal.is_match);

    auto close = score_amount(1000.0, 1001.0, config);
    EXPECT_DOUBLE_EQ(close.score, 0.0);
    EXPECT_FALSE(close.is_match);
    EXPECT_DOUBLE_EQ(close.difference, 1.0);
}

TEST(ScoreAmountTest, NonIncreasingWithDifference) {
    const auto config = default_matching_config();
    double previous = score_amount(1000.0, 1000.0, config).score;
    for (double amount = 1005.0; amount <= 1600.0; amount += 5.0) {
        double score = score_amount(1000.0, amount, config).score;
        EXPECT_LE(score, previous) << "amount " << amount;
        EXPECT_GE(score, 0.0);
        previous = score;
    }
}

TEST(ScoreDateTest, SameDay) {
    auto result = score_date(make_date(2024, 1, 15), make_date(2024, 1, 15), default_matching_config());
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_TRUE(result.in_window);
    EXPECT_EQ(result.difference, 0);
}

TEST(ScoreDateTest, LinearDecayInsideWindow) {
    auto result = score_date(make_date(2024, 1, 15), make_date(2024, 1, 25), default_matching_config());
    EXPECT_NEAR(result.score, 2.0 / 3.0, 1e-9);
    EXPECT_TRUE(result.in_window);
    EXPECT_EQ(result.difference, 10);

    // Order of the dates does not matter
    auto reversed = score_date(make_date(2024, 1, 25), make_date(2024, 1, 15), default_matching_config());
    EXPECT_DOUBLE_EQ(reversed.score, result.score);
}

TEST(ScoreDateTest, WindowEdge) {
    auto at_edge = score_date(make_date(2024, 1, 1), make_date(2024, 1, 31), default_matching_config());
    EXPECT_DOUBLE_EQ(at_edge.score, 0.0);
    EXPECT_TRUE(at_edge.in_window);
    EXPECT_EQ(at_edge.difference, 30);

    auto past_edge = score_date(make_date(2024, 1, 1), make_date(2024, 2, 1), default_matching_config());
    EXPECT_DOUBLE_EQ(past_edge.score, kOutOfWindowDateScore);
    EXPECT_FALSE(past_edge.in_window);
    EXPECT_EQ(past_edge.difference, 31);
}

TEST(ScoreDateTest, ZeroWindow) {
    auto config = make_matching_config({with_date_window(0)});
    EXPECT_DOUBLE_EQ(score_date(make_date(2024, 5, 1), make_date(2024, 5, 1), config).score, 1.0);

    auto next_day = score_date(make_date(2024, 5, 1), make_date(2024, 5, 2), config);
    EXPECT_DOUBLE_EQ(next_day.score, kOutOfWindowDateScore);
    EXPECT_FALSE(next_day.in_window);
}

TEST(ScoreDateTest, TimeOfDayIsIgnored) {
    const Date morning = make_date(2024, 3, 10) + std::chrono::hours(8);
    const Date evening = make_date(2024, 3, 11) + std::chrono::hours(20);
    auto result = score_date(morning, evening, default_matching_config());
    EXPECT_EQ(result.difference, 1);
}

TEST(ScoreReferenceTest, AllInvoiceTokensFound) {
    auto score = score_reference(make_invoice("Test Company"),
                                 make_transaction("Test Company REF-001 payment"),
                                 default_matching_config());
    EXPECT_DOUBLE_EQ(score, 1.0);
}

TEST(ScoreReferenceTest, NoTokensFallsBackToDefault) {
    const auto config = default_matching_config();
    EXPECT_DOUBLE_EQ(score_reference(make_invoice("ab"), make_transaction("xyz payment"), config),
                     kNoReferenceScore);
    EXPECT_DOUBLE_EQ(score_reference(make_invoice("Acme Corporation"), make_transaction(""), config),
                     kNoReferenceScore);
}

TEST(ScoreReferenceTest, ReferenceCodeInDescription) {
    auto invoice = make_invoice("Tech Solutions Inc", "INV-2024-002", "Software development services");
    auto score = score_reference(invoice, make_transaction("Tech Solutions Inc - INV-2024-002"),
                                 default_matching_config());
    EXPECT_NEAR(score, 0.7848485, 1e-6);
}

TEST(ScoreReferenceTest, UnrelatedTextScoresLow) {
    auto score = score_reference(make_invoice("Acme Corporation"),
                                 make_transaction("Globex wire transfer"), default_matching_config());
    EXPECT_GE(score, 0.0);
    EXPECT_LT(score, 0.5);
}

TEST(ComposeConfidenceTest, DefaultWeights) {
    const auto config = default_matching_config();
    EXPECT_DOUBLE_EQ(compose_confidence(1.0, 1.0, 1.0, config), 1.0);
    EXPECT_NEAR(compose_confidence(0.485, 1.0, 1.0, config), 0.794, 1e-9);
    EXPECT_NEAR(compose_confidence(1.0, 0.1, 1.0, config), 0.73, 1e-9);
    EXPECT_DOUBLE_EQ(compose_confidence(0.0, 0.0, 0.0, config), 0.0);
}

TEST(ComposeConfidenceTest, WeightsAreNormalized) {
    auto doubled = make_matching_config({with_weights(0.8, 0.6, 0.6)});
    EXPECT_NEAR(compose_confidence(0.485, 1.0, 1.0, doubled), 0.794, 1e-9);

    auto amount_only = make_matching_config({with_weights(1.0, 0.0, 0.0)});
    EXPECT_DOUBLE_EQ(compose_confidence(0.5, 1.0, 1.0, amount_only), 0.5);
}

TEST(ComposeConfidenceTest, ZeroWeightsAreRejected) {
    auto config = make_matching_config({with_weights(0.0, 0.0, 0.0)});
    EXPECT_THROW((void)compose_confidence(1.0, 1.0, 1.0, config), ConfigError);
}

TEST(ComposeConfidenceTest, NonDecreasingInEachComponent) {
    const std::vector<MatchingConfig> configs = {
        default_matching_config(),
        make_matching_config({with_weights(0.7, 0.05, 0.25)}),
        make_matching_config({with_weights(0.0, 2.0, 1.0)}),
    };
    const std::vector<double> fixed_levels = {0.0, 0.35, 1.0};
    constexpr int kSteps = 20;

    for (const auto& config : configs) {
        for (int component = 0; component < 3; ++component) {
            for (double other : fixed_levels) {
                double previous = -1.0;
                for (int step = 0; step <= kSteps; ++step) {
                    const double value = static_cast<double>(step) / kSteps;
                    double scores[3] = {other, other, other};
                    scores[component] = value;

                    const double confidence =
                        compose_confidence(scores[0], scores[1], scores[2], config);
                    EXPECT_GE(confidence, previous)
                        << "component " << component << " at " << value << ", others " << other
                        << ", weights " << config.amount_weight << "/" << config.date_weight << "/"
                        << config.reference_weight;
                    EXPECT_GE(confidence, 0.0);
                    EXPECT_LE(confidence, 1.0);
                    previous = confidence;
                }
            }
        }
    }
}
