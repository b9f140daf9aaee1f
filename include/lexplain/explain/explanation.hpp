#pragma once

/** \file explanation.hpp
 *  \brief Result of explaining one prediction.
 */

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lexplain/error.hpp"
#include "lexplain/explain/surrogate.hpp"
#include "lexplain/text/indexed_document.hpp"

namespace lexplain::explain {

/** \brief Per-label local explanations of one document.
 *
 * Owned by the caller. The indexed document is shared so that feature ids in
 * local_exp can be mapped back to words and character offsets.
 */
struct Explanation {
    std::shared_ptr<const text::IndexedDocument> document;
    std::vector<std::string> class_names;
    std::vector<double> predict_proba;                       /**< Classifier output for the instance */
    std::optional<std::vector<std::size_t>> top_labels;      /**< Descending probability, if requested */
    std::map<std::size_t, std::vector<FeatureWeight>> local_exp;
    std::map<std::size_t, double> intercept;
    std::map<std::size_t, double> score;
    std::map<std::size_t, double> local_pred;

    /** \brief top_labels when present, otherwise the explained labels in ascending order. */
    auto available_labels() const -> std::vector<std::size_t>;

    /** \brief Explanation for a label with feature ids replaced by their words.
     *
     * \return (word, weight) pairs, or invalid_argument if label was not explained
     */
    auto as_list(std::size_t label) const
        -> std::expected<std::vector<std::pair<std::string, double>>, core::error>;
};

} // namespace lexplain::explain
