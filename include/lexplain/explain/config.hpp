#pragma once

/** \file config.hpp
 *  \brief Explainer configuration, per-call options and environment overrides.
 *
 * Environment overrides (applied by apply_env_overrides; unparseable values
 * are ignored):
 * - LEXPLAIN_KERNEL_WIDTH      float > 0
 * - LEXPLAIN_FEATURE_SELECTION forward_selection|highest_weights|lasso_path|none|auto
 * - LEXPLAIN_VERBOSE           1|0|true|false
 * - LEXPLAIN_BOW               1|0|true|false
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lexplain/error.hpp"
#include "lexplain/text/indexed_document.hpp"

namespace lexplain::explain {

/** \brief Strategy used to pick the features of a local explanation. */
enum class FeatureSelection : std::uint8_t {
    forward_selection,  /**< greedy, best weighted R^2 first */
    highest_weights,    /**< largest |coef| of a ridge fit on all features */
    lasso_path,         /**< least-regularized lasso solution within num_features */
    none,               /**< every feature */
    auto_select,        /**< forward_selection if num_features <= 6, else highest_weights */
};

auto to_string(FeatureSelection fs) noexcept -> std::string_view;
auto parse_feature_selection(std::string_view name)
    -> std::expected<FeatureSelection, core::error>;

/** \brief Explainer-wide settings. */
struct ExplainerConfig {
    double kernel_width{25.0};                 /**< Width of the exponential kernel */
    bool verbose{false};                       /**< Report local fits on stderr */
    std::vector<std::string> class_names;      /**< Empty: "0", "1", ... */
    FeatureSelection feature_selection{FeatureSelection::auto_select};
    text::IndexingMode mode{text::IndexingMode::bow};
};

/** \brief Per-call settings for explain_instance. */
struct ExplainOptions {
    std::vector<std::size_t> labels{1};        /**< Labels to explain */
    std::optional<std::size_t> top_labels;     /**< If set and > 0, overrides labels */
    std::size_t num_features{10};              /**< Max features per label */
    std::size_t num_samples{5000};             /**< Neighborhood size */
};

/** \brief Reject invalid settings (non-positive or non-finite kernel width). */
auto validate(const ExplainerConfig& config) -> std::expected<void, core::error>;

/** \brief Apply LEXPLAIN_* environment overrides in place. */
auto apply_env_overrides(ExplainerConfig& config) noexcept -> void;

} // namespace lexplain::explain
