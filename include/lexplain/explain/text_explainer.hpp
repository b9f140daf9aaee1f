#pragma once

/** \file text_explainer.hpp
 *  \brief Local explanations for black-box text classifiers.
 *
 * explain_instance() indexes the document, samples a neighborhood by hiding
 * features, queries the classifier once for the whole batch and fits one
 * surrogate model per requested label.
 *
 * Thread-safety: explain_instance() is const and does not mutate the
 * explainer; concurrent calls are safe given distinct random sources and a
 * thread-safe prediction function.
 *
 * Example usage:
 * ```cpp
 * auto explainer = TextExplainer::create(ExplainerConfig{}).value();
 * std::mt19937_64 rng(42);
 * ExplainOptions opts;
 * opts.num_samples = 1000;
 * auto exp = explainer.explain_instance("This is a good movie", predict, opts, rng);
 * for (const auto& [word, weight] : exp->as_list(1).value()) {
 *     std::cout << word << ": " << weight << "\n";
 * }
 * ```
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "lexplain/error.hpp"
#include "lexplain/explain/config.hpp"
#include "lexplain/explain/explanation.hpp"
#include "lexplain/explain/neighborhood.hpp"
#include "lexplain/explain/surrogate.hpp"

namespace lexplain::explain {

class TextExplainer {
public:
    /** \brief Create an explainer with the default RidgeSurrogate.
     *
     * \param config Settings; validated
     * \return Explainer or config_invalid
     */
    static auto create(ExplainerConfig config)
        -> std::expected<TextExplainer, core::error>;

    /** \brief Create an explainer with a caller-supplied surrogate fitter. */
    static auto create(ExplainerConfig config, std::shared_ptr<const SurrogateFitter> fitter)
        -> std::expected<TextExplainer, core::error>;

    /** \brief Explain the classifier's prediction for one document.
     *
     * \param text Raw document
     * \param predict Prediction function, called once with num_samples documents
     * \param options Labels, explanation size and neighborhood size
     * \param rng Random source driving the perturbations
     * \return Explanation or error
     *
     * Errors: config_invalid, empty_neighborhood, classifier_failed,
     * prediction_contract, invalid_argument (label out of range), and any
     * error of the surrogate fitter.
     */
    auto explain_instance(std::string text, const PredictFn& predict,
                          const ExplainOptions& options, std::mt19937_64& rng) const
        -> std::expected<Explanation, core::error>;

    /** \brief As above, with a nondeterministically seeded random source. */
    auto explain_instance(std::string text, const PredictFn& predict,
                          const ExplainOptions& options = {}) const
        -> std::expected<Explanation, core::error>;

    auto config() const noexcept -> const ExplainerConfig& { return config_; }

private:
    TextExplainer(ExplainerConfig config, std::shared_ptr<const SurrogateFitter> fitter)
        : config_(std::move(config)), fitter_(std::move(fitter)) {}

    ExplainerConfig config_;
    std::shared_ptr<const SurrogateFitter> fitter_;
};

/** \brief The k labels with the highest probability, in descending order.
 *
 * Ties keep the higher label first. k is clamped to probabilities.size().
 */
auto top_k_labels(const std::vector<double>& probabilities, std::size_t k)
    -> std::vector<std::size_t>;

} // namespace lexplain::explain
