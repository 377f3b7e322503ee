#pragma once

/// @file types.hpp
/// @brief Core data types for the reconcile library

#include <reconcile/date.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace reconcile {

/// @brief Settlement state of an invoice in the bookkeeping system
enum class InvoiceStatus { Pending, Partial, Reconciled };

/// @brief Where a transaction was recorded
enum class TransactionSource { Bank, PaymentProcessor, Manual };

/// @brief Settlement state of a transaction
enum class TransactionStatus { Pending, Reconciled };

[[nodiscard]] std::string to_string(InvoiceStatus status);
[[nodiscard]] std::string to_string(TransactionSource source);
[[nodiscard]] std::string to_string(TransactionStatus status);

/// @brief An invoice awaiting payment
struct Invoice {
    /// Invoice identifier
    std::string id;
    /// Invoiced amount, must be positive
    double amount = 0.0;
    /// Issue date
    Date date;
    /// Payment due date
    std::optional<Date> due_date;
    /// Customer identifier
    std::string customer_id;
    /// Customer display name
    std::string customer_name;
    /// Invoice or order reference (e.g. "INV-2024-001")
    std::optional<std::string> reference_id;
    /// Free-text description of the invoiced work
    std::optional<std::string> description;
    std::optional<InvoiceStatus> status;
};

/// @brief Serialization for Invoice
///
/// from_json throws ParseError for missing or wrong-typed fields and
/// RecordError when validate() rejects the record.
void to_json(nlohmann::json& j, const Invoice& invoice);
void from_json(const nlohmann::json& j, Invoice& invoice);

/// @brief A bank or payment processor transaction
struct Transaction {
    /// Transaction identifier
    std::string id;
    /// Received amount, must be positive
    double amount = 0.0;
    /// Booking date
    Date date;
    /// Statement text as provided by the bank or processor
    std::string description;
    /// Bank-side reference (e.g. "ACH-789456")
    std::optional<std::string> reference;
    TransactionSource source = TransactionSource::Bank;
    std::optional<TransactionStatus> status;
};

/// @brief Serialization for Transaction (errors as for Invoice)
void to_json(nlohmann::json& j, const Transaction& transaction);
void from_json(const nlohmann::json& j, Transaction& transaction);

/// @brief Checks the caller-side preconditions of an invoice
///
/// @throws RecordError if the id is empty or the amount is not positive
void validate(const Invoice& invoice);

/// @brief Checks the caller-side preconditions of a transaction
///
/// @throws RecordError if the id is empty or the amount is not positive
void validate(const Transaction& transaction);

/// @brief Explains how the scores of a candidate were obtained
struct MatchBreakdown {
    /// Absolute difference between invoice and transaction amounts
    double amount_difference = 0.0;
    /// Absolute difference in calendar days
    int date_difference = 0;
    /// Amounts are equal or within tolerance
    bool amount_match = false;
    /// Dates are within the configured window
    bool date_in_window = false;
    /// Reference score, repeated for display
    double reference_similarity = 0.0;
};

/// @brief Serialization for MatchBreakdown
void to_json(nlohmann::json& j, const MatchBreakdown& b);
void from_json(const nlohmann::json& j, MatchBreakdown& b);

/// @brief A proposed pairing of an invoice with a transaction
struct MatchCandidate {
    std::string invoice_id;
    std::string transaction_id;
    /// Weighted composite of the three factor scores (0-1)
    double confidence_score = 0.0;
    /// Amount factor score (0-1)
    double amount_score = 0.0;
    /// Date factor score (0-1)
    double date_score = 0.0;
    /// Reference factor score (0-1)
    double reference_score = 0.0;
    MatchBreakdown breakdown;
};

/// @brief Serialization for MatchCandidate
void to_json(nlohmann::json& j, const MatchCandidate& c);
void from_json(const nlohmann::json& j, MatchCandidate& c);

}  // namespace reconcile
