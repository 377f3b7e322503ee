// Tests for candidate generation and matching statistics
#include <gtest/gtest.h>

#include <memory>
#include <reconcile/errors.hpp>
#include <reconcile/matcher.hpp>

#include "testutil/loader.hpp"

using namespace reconcile;
using namespace reconcile::testutil;

namespace {

Invoice make_invoice(std::string id, double amount, Date date, std::string customer_name) {
    return Invoice{
        .id = std::move(id),
        .amount = amount,
        .date = date,
        .customer_id = "CUST-1",
        .customer_name = std::move(customer_name)};
}

Transaction make_transaction(std::string id, double amount, Date date, std::string description) {
    return Transaction{
        .id = std::move(id), .amount = amount, .date = date, .description = std::move(description)};
}

}  // namespace

class MatcherTest : public ::testing::Test {
  protected:
    void SetUp() override {
        loader_ = std::make_unique<Loader>(Loader::from_compile_definition());
        auto ledger = loader_->load_json("ledger", "sample");
        invoices_ = ledger.at("invoices").get<std::vector<Invoice>>();
        transactions_ = ledger.at("transactions").get<std::vector<Transaction>>();
    }

    std::unique_ptr<Loader> loader_;
    std::vector<Invoice> invoices_;
    std::vector<Transaction> transactions_;
};

TEST_F(MatcherTest, ExactMatch) {
    std::vector<Invoice> invoices = {
        make_invoice("INV-1", 1000.0, make_date(2024, 1, 15), "Test Company")};
    std::vector<Transaction> transactions = {
        make_transaction("TXN-1", 1000.0, make_date(2024, 1, 15), "Test Company REF-001 payment")};

    auto candidates = find_matches(invoices, transactions);
    ASSERT_EQ(candidates.size(), 1u);

    const auto& c = candidates[0];
    EXPECT_EQ(c.invoice_id, "INV-1");
    EXPECT_EQ(c.transaction_id, "TXN-1");
    EXPECT_GT(c.confidence_score, 0.8);
    EXPECT_DOUBLE_EQ(c.reference_score, 1.0);
    EXPECT_TRUE(c.breakdown.amount_match);
    EXPECT_TRUE(c.breakdown.date_in_window);
    EXPECT_DOUBLE_EQ(c.breakdown.reference_similarity, c.reference_score);
}

TEST_F(MatcherTest, AmountOutsideTolerance) {
    std::vector<Invoice> invoices = {
        make_invoice("INV-1", 1000.0, make_date(2024, 1, 15), "Test Company")};
    std::vector<Transaction> transactions = {
        make_transaction("TXN-1", 1015.0, make_date(2024, 1, 15), "Test Company REF-001 payment")};

    auto candidates = find_matches(invoices, transactions, make_matching_config({with_amount_tolerance(0.02)}));
    ASSERT_EQ(candidates.size(), 1u);

    const auto& c = candidates[0];
    EXPECT_DOUBLE_EQ(c.breakdown.amount_difference, 15.0);
    EXPECT_FALSE(c.breakdown.amount_match);
    EXPECT_GT(c.amount_score, 0.0);
    EXPECT_NEAR(c.confidence_score, 0.794, 1e-9);
}

TEST_F(MatcherTest, DateOutsideWindow) {
    std::vector<Invoice> invoices = {
        make_invoice("INV-1", 1000.0, make_date(2024, 1, 15), "Test Company")};
    std::vector<Transaction> transactions = {
        make_transaction("TXN-1", 1000.0, make_date(2024, 3, 15), "Test Company REF-001 payment")};

    auto candidates = find_matches(invoices, transactions, make_matching_config({with_date_window(30)}));
    ASSERT_EQ(candidates.size(), 1u);

    const auto& c = candidates[0];
    EXPECT_FALSE(c.breakdown.date_in_window);
    EXPECT_DOUBLE_EQ(c.date_score, 0.1);
    EXPECT_EQ(c.breakdown.date_difference, 60);
    EXPECT_NEAR(c.confidence_score, 0.73, 1e-9);
}

TEST_F(MatcherTest, IdenticalPairsStatistics) {
    std::vector<Invoice> invoices = {
        make_invoice("INV-1", 1000.0, make_date(2024, 1, 15), "Alpha Industries"),
        make_invoice("INV-2", 5000.0, make_date(2024, 6, 1), "Zeta Logistics")};
    std::vector<Transaction> transactions = {
        make_transaction("TXN-1", 1000.0, make_date(2024, 1, 15), "Alpha Industries"),
        make_transaction("TXN-2", 5000.0, make_date(2024, 6, 1), "Zeta Logistics")};

    auto candidates = find_matches(invoices, transactions);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].invoice_id, "INV-1");
    EXPECT_EQ(candidates[0].transaction_id, "TXN-1");
    EXPECT_EQ(candidates[1].invoice_id, "INV-2");
    EXPECT_EQ(candidates[1].transaction_id, "TXN-2");

    auto stats = matching_stats(candidates);
    EXPECT_EQ(stats.total_candidates, 2u);
    EXPECT_EQ(stats.total_invoices, 2u);
    EXPECT_EQ(stats.total_transactions, 2u);
    EXPECT_GT(stats.average_confidence, 0.7);
    EXPECT_EQ(stats.high_confidence, 2u);
    EXPECT_EQ(stats.medium_confidence, 0u);
    EXPECT_EQ(stats.low_confidence, 0u);
}

TEST_F(MatcherTest, DissimilarPairBelowThreshold) {
    std::vector<Invoice> invoices = {
        make_invoice("INV-1", 1000.0, make_date(2024, 1, 15), "Acme Corporation")};
    std::vector<Transaction> transactions = {
        make_transaction("TXN-1", 2300.0, make_date(2024, 6, 20), "Globex wire transfer")};

    auto candidates = find_matches(invoices, transactions, make_matching_config({with_min_confidence(0.8)}));
    EXPECT_TRUE(candidates.empty());

    // Surfaces once the threshold is dropped entirely
    auto all = find_matches(invoices, transactions, make_matching_config({with_min_confidence(0.0)}));
    ASSERT_EQ(all.size(), 1u);
    EXPECT_LT(all[0].confidence_score, 0.8);
}

TEST_F(MatcherTest, EmptyInputs) {
    EXPECT_TRUE(find_matches({}, {}).empty());
    EXPECT_TRUE(find_matches(invoices_, {}).empty());
    EXPECT_TRUE(find_matches({}, transactions_).empty());
}

TEST_F(MatcherTest, InvalidConfigRejectedUpFront) {
    auto config = make_matching_config({with_weights(0.0, 0.0, 0.0)});
    EXPECT_THROW((void)find_matches({}, {}, config), ConfigError);
    EXPECT_THROW((void)find_top_matches(invoices_, transactions_, 3, config), ConfigError);

    auto negative = make_matching_config({with_weights(-0.1, 0.5, 0.5)});
    EXPECT_THROW((void)find_matches(invoices_, transactions_, negative), ConfigError);
}

TEST_F(MatcherTest, EqualConfidenceKeepsInputOrder) {
    std::vector<Invoice> invoices = {
        make_invoice("INV-1", 1000.0, make_date(2024, 1, 15), "Alpha Industries"),
        make_invoice("INV-2", 1000.0, make_date(2024, 1, 15), "Alpha Industries")};
    std::vector<Transaction> transactions = {
        make_transaction("TXN-1", 1000.0, make_date(2024, 1, 15), "Alpha Industries"),
        make_transaction("TXN-2", 1000.0, make_date(2024, 1, 15), "Alpha Industries")};

    auto candidates = find_matches(invoices, transactions);
    ASSERT_EQ(candidates.size(), 4u);
    EXPECT_EQ(candidates[0].invoice_id, "INV-1");
    EXPECT_EQ(candidates[0].transaction_id, "TXN-1");
    EXPECT_EQ(candidates[1].invoice_id, "INV-1");
    EXPECT_EQ(candidates[1].transaction_id, "TXN-2");
    EXPECT_EQ(candidates[2].invoice_id, "INV-2");
    EXPECT_EQ(candidates[2].transaction_id, "TXN-1");
    EXPECT_EQ(candidates[3].invoice_id, "INV-2");
    EXPECT_EQ(candidates[3].transaction_id, "TXN-2");
}

TEST_F(MatcherTest, SampleLedger) {
    auto candidates = find_matches(invoices_, transactions_);
    ASSERT_EQ(candidates.size(), 4u);

    EXPECT_EQ(candidates[0].invoice_id, "INV-002");
    EXPECT_EQ(candidates[0].transaction_id, "TXN-002");
    EXPECT_NEAR(candidates[0].confidence_score, 0.9254545, 1e-6);

    EXPECT_EQ(candidates[1].invoice_id, "INV-003");
    EXPECT_EQ(candidates[1].transaction_id, "TXN-003");
    EXPECT_NEAR(candidates[1].confidence_score, 0.896875, 1e-6);

    EXPECT_EQ(candidates[2].invoice_id, "INV-001");
    EXPECT_EQ(candidates[2].transaction_id, "TXN-001");
    EXPECT_NEAR(candidates[2].confidence_score, 0.7877778, 1e-6);

    EXPECT_EQ(candidates[3].invoice_id, "INV-004");
    EXPECT_EQ(candidates[3].transaction_id, "TXN-004");
    EXPECT_NEAR(candidates[3].confidence_score, 0.7583871, 1e-6);
    EXPECT_EQ(candidates[3].breakdown.date_difference, 5);

    for (size_t i = 1; i < candidates.size(); ++i) {
        EXPECT_GE(candidates[i - 1].confidence_score, candidates[i].confidence_score);
    }
}

TEST_F(MatcherTest, ThresholdIsInclusive) {
    // Lowering the threshold to an exact candidate score keeps that candidate
    auto first = find_matches(invoices_, transactions_);
    ASSERT_FALSE(first.empty());
    const double lowest = first.back().confidence_score;

    auto again = find_matches(invoices_, transactions_, make_matching_config({with_min_confidence(lowest)}));
    EXPECT_EQ(again.size(), first.size());
}

TEST_F(MatcherTest, TopMatchesPerInvoice) {
    auto config = make_matching_config({with_min_confidence(0.35)});
    auto top = find_top_matches(invoices_, transactions_, 2, config);

    ASSERT_EQ(top.size(), invoices_.size());
    ASSERT_EQ(top.at("INV-004").size(), 2u);
    EXPECT_EQ(top.at("INV-004")[0].transaction_id, "TXN-004");
    EXPECT_EQ(top.at("INV-004")[1].transaction_id, "TXN-002");
    ASSERT_EQ(top.at("INV-001").size(), 2u);
    EXPECT_EQ(top.at("INV-001")[0].transaction_id, "TXN-001");
    EXPECT_EQ(top.at("INV-001")[1].transaction_id, "TXN-002");
    ASSERT_EQ(top.at("INV-002").size(), 1u);
    ASSERT_EQ(top.at("INV-003").size(), 1u);

    auto best_only = find_top_matches(invoices_, transactions_, 1, config);
    for (const auto& [invoice_id, matches] : best_only) {
        EXPECT_LE(matches.size(), 1u) << invoice_id;
    }

    auto none = find_top_matches(invoices_, transactions_, 0, config);
    for (const auto& [invoice_id, matches] : none) {
        EXPECT_TRUE(matches.empty()) << invoice_id;
    }
}

TEST_F(MatcherTest, TopMatchesIncludesInvoicesWithoutCandidates) {
    auto invoices = invoices_;
    invoices.push_back(make_invoice("INV-999", 99999.0, make_date(2023, 6, 1), "Nobody Knows"));

    auto top = find_top_matches(invoices, transactions_);
    ASSERT_EQ(top.count("INV-999"), 1u);
    EXPECT_TRUE(top.at("INV-999").empty());
    EXPECT_LE(top.at("INV-001").size(), kDefaultTopMatches);
}

TEST_F(MatcherTest, ScorePairAppliesNoThreshold) {
    auto candidate = score_pair(invoices_[0], transactions_[5], default_matching_config());
    EXPECT_EQ(candidate.invoice_id, "INV-001");
    EXPECT_EQ(candidate.transaction_id, "TXN-006");
    EXPECT_LT(candidate.confidence_score, kDefaultMinConfidence);
    EXPECT_GE(candidate.confidence_score, 0.0);
}

TEST_F(MatcherTest, ConfidenceLevels) {
    EXPECT_EQ(confidence_level(0.95), ConfidenceLevel::High);
    EXPECT_EQ(confidence_level(0.8), ConfidenceLevel::High);
    EXPECT_EQ(confidence_level(0.79), ConfidenceLevel::Medium);
    EXPECT_EQ(confidence_level(0.5), ConfidenceLevel::Medium);
    EXPECT_EQ(confidence_level(0.49), ConfidenceLevel::Low);
    EXPECT_EQ(to_string(ConfidenceLevel::Medium), "medium");
}

TEST_F(MatcherTest, SampleLedgerStatistics) {
    auto stats = matching_stats(find_matches(invoices_, transactions_));
    EXPECT_EQ(stats.total_candidates, 4u);
    EXPECT_EQ(stats.total_invoices, 4u);
    EXPECT_EQ(stats.total_transactions, 4u);
    EXPECT_NEAR(stats.average_confidence, 0.8421236, 1e-6);
    EXPECT_EQ(stats.high_confidence, 2u);
    EXPECT_EQ(stats.medium_confidence, 2u);
    EXPECT_EQ(stats.low_confidence, 0u);

    nlohmann::json j = stats;
    EXPECT_EQ(j.at("total_candidates").get<int>(), 4);
    EXPECT_EQ(j.at("confidence_distribution").at("high").get<int>(), 2);
}

TEST_F(MatcherTest, EmptyStatistics) {
    auto stats = matching_stats({});
    EXPECT_EQ(stats.total_candidates, 0u);
    EXPECT_EQ(stats.total_invoices, 0u);
    EXPECT_DOUBLE_EQ(stats.average_confidence, 0.0);
}
