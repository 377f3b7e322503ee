#include <reconcile/errors.hpp>
#include <reconcile/types.hpp>

#include <plog/Log.h>

#include <string>

namespace reconcile {

namespace {

InvoiceStatus parse_invoice_status(const std::string& value) {
    if (value == "pending") return InvoiceStatus::Pending;
    if (value == "partial") return InvoiceStatus::Partial;
    if (value == "reconciled") return InvoiceStatus::Reconciled;
    throw ParseError("invoice status '" + value + "'");
}

TransactionSource parse_transaction_source(const std::string& value) {
    if (value == "bank") return TransactionSource::Bank;
    if (value == "payment_processor") return TransactionSource::PaymentProcessor;
    if (value == "manual") return TransactionSource::Manual;
    throw ParseError("transaction source '" + value + "'");
}

TransactionStatus parse_transaction_status(const std::string& value) {
    if (value == "pending") return TransactionStatus::Pending;
    if (value == "reconciled") return TransactionStatus::Reconciled;
    throw ParseError("transaction status '" + value + "'");
}

Date read_date(const nlohmann::json& j, const char* key) {
    return parse_date(j.at(key).get<std::string>());
}

double read_amount(const nlohmann::json& j) {
    const auto& value = j.at("amount");
    if (!value.is_number()) {
        throw ParseError("amount", "expected a number, got " + std::string(value.type_name()));
    }
    return value.get<double>();
}

// Identifies a record in error messages
std::string record_label(const nlohmann::json& j) {
    if (j.is_object() && j.contains("id") && j.at("id").is_string()) {
        return "'" + j.at("id").get<std::string>() + "'";
    }
    return "record";
}

void read_invoice(const nlohmann::json& j, Invoice& invoice) {
    j.at("id").get_to(invoice.id);
    invoice.amount = read_amount(j);
    invoice.date = read_date(j, "date");
    if (j.contains("customer_id")) j.at("customer_id").get_to(invoice.customer_id);
    j.at("customer_name").get_to(invoice.customer_name);
    if (j.contains("due_date") && !j.at("due_date").is_null()) {
        invoice.due_date = read_date(j, "due_date");
    }
    if (j.contains("reference_id") && !j.at("reference_id").is_null()) {
        invoice.reference_id = j.at("reference_id").get<std::string>();
    }
    if (j.contains("description") && !j.at("description").is_null()) {
        invoice.description = j.at("description").get<std::string>();
    }
    if (j.contains("status") && !j.at("status").is_null()) {
        invoice.status = parse_invoice_status(j.at("status").get<std::string>());
    }
}

void read_transaction(const nlohmann::json& j, Transaction& transaction) {
    j.at("id").get_to(transaction.id);
    transaction.amount = read_amount(j);
    transaction.date = read_date(j, "date");
    j.at("description").get_to(transaction.description);
    if (j.contains("reference") && !j.at("reference").is_null()) {
        transaction.reference = j.at("reference").get<std::string>();
    }
    if (j.contains("source")) {
        transaction.source = parse_transaction_source(j.at("source").get<std::string>());
    }
    if (j.contains("status") && !j.at("status").is_null()) {
        transaction.status = parse_transaction_status(j.at("status").get<std::string>());
    }
}

}  // namespace

std::string to_string(InvoiceStatus status) {
    switch (status) {
    case InvoiceStatus::Pending:
        return "pending";
    case InvoiceStatus::Partial:
        return "partial";
    case InvoiceStatus::Reconciled:
        return "reconciled";
    }
    return "unknown";
}

std::string to_string(TransactionSource source) {
    switch (source) {
    case TransactionSource::Bank:
        return "bank";
    case TransactionSource::PaymentProcessor:
        return "payment_processor";
    case TransactionSource::Manual:
        return "manual";
    }
    return "unknown";
}

std::string to_string(TransactionStatus status) {
    switch (status) {
    case TransactionStatus::Pending:
        return "pending";
    case TransactionStatus::Reconciled:
        return "reconciled";
    }
    return "unknown";
}

void validate(const Invoice& invoice) {
    if (invoice.id.empty()) {
        PLOG_WARNING << "Rejecting invoice without an id";
        throw RecordError("", "invoice id is empty");
    }
    if (!(invoice.amount > 0.0)) {
        PLOG_WARNING << "Rejecting invoice " << invoice.id << " with amount " << invoice.amount;
        throw RecordError(invoice.id, "invoice amount must be positive");
    }
}

void validate(const Transaction& transaction) {
    if (transaction.id.empty()) {
        PLOG_WARNING << "Rejecting transaction without an id";
        throw RecordError("", "transaction id is empty");
    }
    if (!(transaction.amount > 0.0)) {
        PLOG_WARNING << "Rejecting transaction " << transaction.id << " with amount "
                     << transaction.amount;
        throw RecordError(transaction.id, "transaction amount must be positive");
    }
}

// Invoice serialization
void to_json(nlohmann::json& j, const Invoice& invoice) {
    j = nlohmann::json{
        {"id", invoice.id},
        {"amount", invoice.amount},
        {"date", format_date(invoice.date)},
        {"customer_id", invoice.customer_id},
        {"customer_name", invoice.customer_name}};
    if (invoice.due_date) j["due_date"] = format_date(*invoice.due_date);
    if (invoice.reference_id) j["reference_id"] = *invoice.reference_id;
    if (invoice.description) j["description"] = *invoice.description;
    if (invoice.status) j["status"] = to_string(*invoice.status);
}

void from_json(const nlohmann::json& j, Invoice& invoice) {
    try {
        read_invoice(j, invoice);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("invoice " + record_label(j), e.what());
    }
    validate(invoice);
}

// Transaction serialization
void to_json(nlohmann::json& j, const Transaction& transaction) {
    j = nlohmann::json{
        {"id", transaction.id},
        {"amount", transaction.amount},
        {"date", format_date(transaction.date)},
        {"description", transaction.description},
        {"source", to_string(transaction.source)}};
    if (transaction.reference) j["reference"] = *transaction.reference;
    if (transaction.status) j["status"] = to_string(*transaction.status);
}

void from_json(const nlohmann::json& j, Transaction& transaction) {
    try {
        read_transaction(j, transaction);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("transaction " + record_label(j), e.what());
    }
    validate(transaction);
}

// MatchBreakdown serialization
void to_json(nlohmann::json& j, const MatchBreakdown& b) {
    j = nlohmann::json{
        {"amount_difference", b.amount_difference},
        {"date_difference", b.date_difference},
        {"amount_match", b.amount_match},
        {"date_in_window", b.date_in_window},
        {"reference_similarity", b.reference_similarity}};
}

void from_json(const nlohmann::json& j, MatchBreakdown& b) {
    j.at("amount_difference").get_to(b.amount_difference);
    j.at("date_difference").get_to(b.date_difference);
    j.at("amount_match").get_to(b.amount_match);
    j.at("date_in_window").get_to(b.date_in_window);
    j.at("reference_similarity").get_to(b.reference_similarity);
}

// MatchCandidate serialization
void to_json(nlohmann::json& j, const MatchCandidate& c) {
    j = nlohmann::json{
        {"invoice_id", c.invoice_id},
        {"transaction_id", c.transaction_id},
        {"confidence_score", c.confidence_score},
        {"amount_score", c.amount_score},
        {"date_score", c.date_score},
        {"reference_score", c.reference_score},
        {"breakdown", c.breakdown}};
}

void from_json(const nlohmann::json& j, MatchCandidate& c) {
    try {
        j.at("invoice_id").get_to(c.invoice_id);
        j.at("transaction_id").get_to(c.transaction_id);
        j.at("confidence_score").get_to(c.confidence_score);
        j.at("amount_score").get_to(c.amount_score);
        j.at("date_score").get_to(c.date_score);
        j.at("reference_score").get_to(c.reference_score);
        j.at("breakdown").get_to(c.breakdown);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("match candidate", e.what());
    }
}

}  // namespace reconcile
