#pragma once

/** \file neighborhood.hpp
 *  \brief Perturbed-document neighborhood around one instance.
 *
 * Row 0 is always the unperturbed instance: an all-ones mask, the raw text and
 * distance 0. Every other row deactivates a uniformly drawn number of features
 * in [1, K-1] chosen without replacement, where K = num_features().
 *
 * The prediction function is called exactly once, with all texts in row order.
 * Determinism: identical output for an identically seeded generator and a
 * deterministic prediction function.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "lexplain/error.hpp"
#include "lexplain/text/indexed_document.hpp"

namespace lexplain::explain {

/** \brief Class-probability rows, one per input document. */
using ProbabilityMatrix = std::vector<std::vector<double>>;

/** \brief Black-box classifier: documents in, one probability row per document out. */
using PredictFn = std::function<ProbabilityMatrix(const std::vector<std::string>&)>;

/** \brief Dense row-major binary matrix [rows x cols]; 1 = feature present. */
struct DesignMatrix {
    std::size_t rows{0};
    std::size_t cols{0};
    std::vector<float> values;

    auto row(std::size_t r) const -> std::span<const float> {
        return std::span<const float>(values).subspan(r * cols, cols);
    }
    auto at(std::size_t r, std::size_t c) const -> float { return values[r * cols + c]; }
};

/** \brief Sampled neighborhood; all members have num_samples() rows. */
struct Neighborhood {
    DesignMatrix data;                 /**< Feature masks [n x K] */
    std::vector<std::string> texts;    /**< Reconstructed document per row */
    ProbabilityMatrix predictions;     /**< Classifier output [n x L] */
    std::vector<double> distances;     /**< Scaled cosine distance to row 0 [n] */

    auto num_samples() const noexcept -> std::size_t { return data.rows; }
    auto num_features() const noexcept -> std::size_t { return data.cols; }
    auto num_classes() const noexcept -> std::size_t {
        return predictions.empty() ? 0 : predictions.front().size();
    }
};

/** \brief Check a prediction matrix against the batch it was produced for.
 *
 * \param predictions Classifier output
 * \param expected_rows Batch size
 * \param expected_cols Required column count, if already known
 * \return Column count, or prediction_contract
 */
auto validate_predictions(const ProbabilityMatrix& predictions,
                          std::size_t expected_rows,
                          std::optional<std::size_t> expected_cols = std::nullopt)
    -> std::expected<std::size_t, core::error>;

/** \brief Generate the neighborhood of a document.
 *
 * \param doc Indexed instance
 * \param predict Prediction function, invoked once
 * \param num_samples Rows to generate, row 0 included
 * \param rng Random source
 * \param expected_classes Required number of prediction columns, if known
 * \return Neighborhood or error
 *
 * Errors: config_invalid (num_samples == 0), empty_neighborhood
 * (num_features() < 2), classifier_failed (predict threw),
 * prediction_contract (bad output shape).
 * Complexity: O(num_samples * (K + T)) plus the prediction call
 */
auto sample_neighborhood(const text::IndexedDocument& doc,
                         const PredictFn& predict,
                         std::size_t num_samples,
                         std::mt19937_64& rng,
                         std::optional<std::size_t> expected_classes = std::nullopt)
    -> std::expected<Neighborhood, core::error>;

} // namespace lexplain::explain
