#pragma once

/// @file errors.hpp
/// @brief Error types and exception classes for the reconcile library

#include <exception>
#include <string>

namespace reconcile {

/// @brief Error codes for categorizing errors
enum class ErrorCode {
    None = 0,
    InvalidConfig,
    InvalidRecord,
    Parse
};

/// @brief Base exception class for all reconcile errors
class ReconcileError : public std::exception {
public:
    explicit ReconcileError(std::string message, ErrorCode code = ErrorCode::None)
        : message_(std::move(message)), code_(code) {}

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

protected:
    std::string message_;
    ErrorCode code_;
};

/// @brief Configuration error
///
/// Raised when a MatchingConfig cannot be used for scoring, e.g. when all
/// factor weights are zero.
class ConfigError : public ReconcileError {
public:
    ConfigError(std::string field, std::string details)
        : ReconcileError(format_message(field, details), ErrorCode::InvalidConfig),
          field_(std::move(field)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& field, const std::string& details) {
        if (!field.empty()) {
            return "invalid configuration for '" + field + "': " + details;
        }
        return "invalid configuration: " + details;
    }

    std::string field_;
    std::string details_;
};

/// @brief Invalid invoice or transaction record
class RecordError : public ReconcileError {
public:
    RecordError(std::string record_id, std::string details)
        : ReconcileError(format_message(record_id, details), ErrorCode::InvalidRecord),
          record_id_(std::move(record_id)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& record_id() const noexcept { return record_id_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& record_id, const std::string& details) {
        if (record_id.empty()) {
            return "invalid record: " + details;
        }
        return "invalid record '" + record_id + "': " + details;
    }

    std::string record_id_;
    std::string details_;
};

/// @brief Malformed input text (dates, JSON documents)
class ParseError : public ReconcileError {
public:
    ParseError(std::string what, std::string details = "")
        : ReconcileError(format_message(what, details), ErrorCode::Parse),
          subject_(std::move(what)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& what, const std::string& details) {
        std::string msg = "failed to parse " + what;
        if (!details.empty()) {
            msg += ": " + details;
        }
        return msg;
    }

    std::string subject_;
    std::string details_;
};

}  // namespace reconcile
