// Example: Reconcile a ledger
//
// This example matches the invoices and transactions of a JSON ledger and
// prints the candidates, summary statistics and the export for an
// accounting system.
//
// To run:
//   ./reconcile_sample testdata/ledger/sample.json [config.json]
//
// The optional config file holds a JSON object of overrides, e.g.
//   {"amount_tolerance": 0.05, "min_confidence_score": 0.4}

#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <reconcile/reconcile.hpp>
#include <unordered_set>

int main(int argc, char* argv[]) {
    using namespace reconcile;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <ledger.json> [config.json]\n";
        return 1;
    }

    logging::init_console(plog::info);

    std::vector<Invoice> invoices;
    std::vector<Transaction> transactions;
    MatchingConfig config = default_matching_config();

    try {
        std::ifstream file(argv[1]);
        if (!file.is_open()) {
            std::cerr << "Cannot open ledger " << argv[1] << "\n";
            return 1;
        }
        auto ledger = nlohmann::json::parse(file);
        invoices = ledger.at("invoices").get<std::vector<Invoice>>();
        transactions = ledger.at("transactions").get<std::vector<Transaction>>();

        if (argc > 2) {
            config = load_config_file(argv[2]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load input: " << e.what() << "\n";
        return 1;
    }

    try {
        auto candidates = find_matches(invoices, transactions, config);

        std::cout << "Found " << candidates.size() << " candidates for " << invoices.size()
                  << " invoices and " << transactions.size() << " transactions:\n\n";
        std::cout << std::fixed << std::setprecision(3);
        for (const auto& c : candidates) {
            std::cout << c.invoice_id << " <-> " << c.transaction_id << "  "
                      << c.confidence_score << " ("
                      << to_string(confidence_level(c.confidence_score)) << ")\n";
            std::cout << "   amount " << c.amount_score << ", date " << c.date_score
                      << ", reference " << c.reference_score << "\n";
        }

        // Records without any candidate
        std::unordered_set<std::string> matched_invoices;
        std::unordered_set<std::string> matched_transactions;
        for (const auto& c : candidates) {
            matched_invoices.insert(c.invoice_id);
            matched_transactions.insert(c.transaction_id);
        }
        const auto unmatched_invoices = invoices.size() - matched_invoices.size();
        const auto unmatched_transactions = transactions.size() - matched_transactions.size();

        auto one_to_one = analytics::find_one_to_one_matches(candidates);
        auto ambiguous = analytics::find_ambiguous_matches(candidates);
        std::cout << "\n" << one_to_one.size() << " one-to-one, " << ambiguous.size()
                  << " ambiguous\n";

        nlohmann::json stats = matching_stats(candidates);
        std::cout << "\nStatistics:\n" << stats.dump(2) << "\n";

        auto suggestions = analytics::suggest_configuration_adjustments(
            candidates, unmatched_invoices, unmatched_transactions);
        if (!suggestions.empty()) {
            std::cout << "\nSuggestions:\n";
            for (const auto& s : suggestions) {
                std::cout << "- [" << analytics::to_string(s.factor) << "] " << s.issue << ": "
                          << s.suggestion << " (" << s.recommended_change << ")\n";
            }
        }

        nlohmann::json exported = analytics::export_matches(candidates);
        std::cout << "\nExport:\n" << exported.dump(2) << "\n";
    } catch (const ReconcileError& e) {
        std::cerr << "Matching failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
