#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>

namespace lexplain::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  invalid_feature_id = 4002,
  empty_neighborhood = 4003,
  prediction_contract = 4004,
  classifier_failed = 7001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "explain.neighborhood" */
};

/** \brief Stable name of an error code ("invalid_feature_id", ...). */
constexpr const char* to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::invalid_feature_id: return "invalid_feature_id";
    case error_code::empty_neighborhood: return "empty_neighborhood";
    case error_code::prediction_contract: return "prediction_contract";
    case error_code::classifier_failed: return "classifier_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "internal";
}

} // namespace lexplain::core
