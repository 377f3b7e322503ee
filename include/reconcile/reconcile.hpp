#pragma once

/// @file reconcile.hpp
/// @brief Main header for the reconcile C++ library
///
/// This is the unified include for all reconcile functionality.
/// Include this single header to access the record types, configuration,
/// the matching engine and result analytics.

#include <reconcile/analytics.hpp>
#include <reconcile/config.hpp>
#include <reconcile/date.hpp>
#include <reconcile/errors.hpp>
#include <reconcile/internal/normalization.hpp>
#include <reconcile/internal/similarity.hpp>
#include <reconcile/logging.hpp>
#include <reconcile/matcher.hpp>
#include <reconcile/scoring.hpp>
#include <reconcile/types.hpp>

/// @namespace reconcile
/// @brief The reconcile library namespace
///
/// Contains the invoice and transaction types, matching configuration,
/// candidate generation, and analytics over match candidates.
namespace reconcile {

/// Library version string
constexpr const char* kVersion = "1.0.0";

/// Library version as integers
constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;

}  // namespace reconcile
