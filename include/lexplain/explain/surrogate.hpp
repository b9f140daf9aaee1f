#pragma once

/** \file surrogate.hpp
 *  \brief Locally weighted linear surrogate fitted on a neighborhood.
 *
 * SurrogateFitter is the seam between neighborhood generation and the
 * interpretable model. RidgeSurrogate is the default implementation:
 * - sample weights: exponential_kernel(distance, kernel_width)
 * - feature selection per FeatureSelection
 * - final model: weighted ridge regression (alpha = 1) with intercept on
 *   the selected features
 *
 * Thread-safety: fit() is const and keeps no state between calls.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "lexplain/error.hpp"
#include "lexplain/explain/config.hpp"
#include "lexplain/explain/neighborhood.hpp"
#include "lexplain/text/indexed_document.hpp"

namespace lexplain::explain {

/** \brief (feature id, weight) pair of a local explanation. */
using FeatureWeight = std::pair<text::feature_id, double>;

/** \brief Local linear model for one label. */
struct LocalExplanation {
    double intercept{0.0};
    std::vector<FeatureWeight> weights;   /**< Sorted by descending |weight| */
    double score{0.0};                    /**< Weighted R^2 on the neighborhood */
    double local_prediction{0.0};         /**< Model output at the original instance */
};

/** \brief Fits an interpretable model to one label of a neighborhood. */
class SurrogateFitter {
public:
    virtual ~SurrogateFitter() = default;

    /** \brief Explain one label.
     *
     * \param nb Sampled neighborhood (row 0 is the instance)
     * \param label Column of nb.predictions to explain
     * \param num_features Maximum number of weighted features returned
     * \param selection Feature selection strategy
     * \return At most num_features weighted features, or error
     */
    virtual auto fit(const Neighborhood& nb, std::size_t label,
                     std::size_t num_features, FeatureSelection selection) const
        -> std::expected<LocalExplanation, core::error> = 0;
};

/** \brief Weighted ridge surrogate with LIME-style feature selection. */
class RidgeSurrogate final : public SurrogateFitter {
public:
    explicit RidgeSurrogate(double kernel_width, bool verbose = false)
        : kernel_width_(kernel_width), verbose_(verbose) {}

    auto fit(const Neighborhood& nb, std::size_t label,
             std::size_t num_features, FeatureSelection selection) const
        -> std::expected<LocalExplanation, core::error> override;

    /** \brief Kernel weight of every sample. */
    auto sample_weights(std::span<const double> distances) const -> std::vector<double>;

    /** \brief Features a given strategy keeps, in selection order.
     *
     * Preconditions: nb has at least one row; label < nb.num_classes()
     */
    auto select_features(const Neighborhood& nb, std::size_t label,
                         std::span<const double> weights, std::size_t num_features,
                         FeatureSelection selection) const
        -> std::expected<std::vector<text::feature_id>, core::error>;

    auto kernel_width() const noexcept -> double { return kernel_width_; }

private:
    double kernel_width_;
    bool verbose_;
};

} // namespace lexplain::explain
