#include "lexplain/explain/text_explainer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <optional>

#include "lexplain/core/platform_utils.hpp"
#include "lexplain/text/indexed_document.hpp"

namespace lexplain::explain {

namespace {

constexpr const char* kComponent = "explain.text_explainer";

auto synthesize_class_names(std::size_t num_classes) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(num_classes);
    for (std::size_t i = 0; i < num_classes; ++i) {
        names.push_back(std::to_string(i));
    }
    return names;
}

} // anonymous namespace

auto top_k_labels(const std::vector<double>& probabilities, std::size_t k)
    -> std::vector<std::size_t> {
    std::vector<std::size_t> order(probabilities.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    // Ascending, then take the tail reversed.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return probabilities[a] < probabilities[b];
    });
    k = std::min(k, order.size());
    return std::vector<std::size_t>(order.rbegin(), order.rbegin() + static_cast<std::ptrdiff_t>(k));
}

auto TextExplainer::create(ExplainerConfig config)
    -> std::expected<TextExplainer, core::error> {
    if (auto ok = validate(config); !ok) {
        return std::unexpected(ok.error());
    }
    auto fitter = std::make_shared<const RidgeSurrogate>(config.kernel_width, config.verbose);
    return TextExplainer(std::move(config), std::move(fitter));
}

auto TextExplainer::create(ExplainerConfig config, std::shared_ptr<const SurrogateFitter> fitter)
    -> std::expected<TextExplainer, core::error> {
    if (auto ok = validate(config); !ok) {
        return std::unexpected(ok.error());
    }
    if (!fitter) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument, "surrogate fitter is null", kComponent});
    }
    return TextExplainer(std::move(config), std::move(fitter));
}

auto TextExplainer::explain_instance(std::string text, const PredictFn& predict,
                                     const ExplainOptions& options) const
    -> std::expected<Explanation, core::error> {
    std::random_device rd;
    std::mt19937_64 rng((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    return explain_instance(std::move(text), predict, options, rng);
}

auto TextExplainer::explain_instance(std::string text, const PredictFn& predict,
                                     const ExplainOptions& options,
                                     std::mt19937_64& rng) const
    -> std::expected<Explanation, core::error> {
    if (options.num_samples == 0) {
        return std::unexpected(core::error{
            core::error_code::config_invalid, "num_samples must be > 0", kComponent});
    }

    auto doc = std::make_shared<const text::IndexedDocument>(std::move(text), config_.mode);

    std::optional<std::size_t> expected_classes;
    if (!config_.class_names.empty()) {
        expected_classes = config_.class_names.size();
    }
    auto nb = sample_neighborhood(*doc, predict, options.num_samples, rng, expected_classes);
    if (!nb) {
        return std::unexpected(nb.error());
    }
    const std::size_t num_classes = nb->num_classes();

    Explanation exp;
    exp.document = doc;
    exp.class_names = config_.class_names.empty() ? synthesize_class_names(num_classes)
                                                  : config_.class_names;
    exp.predict_proba = nb->predictions.front();

    std::vector<std::size_t> labels = options.labels;
    if (options.top_labels && *options.top_labels > 0) {
        labels = top_k_labels(exp.predict_proba, *options.top_labels);
        exp.top_labels = labels;
    }

    for (std::size_t label : labels) {
        if (label >= num_classes) {
            return std::unexpected(core::error{
                core::error_code::invalid_argument,
                "label " + std::to_string(label) + " out of range (num_classes=" +
                    std::to_string(num_classes) + ")",
                kComponent});
        }
        auto local = fitter_->fit(*nb, label, options.num_features, config_.feature_selection);
        if (!local) {
            return std::unexpected(local.error());
        }
        exp.intercept[label] = local->intercept;
        exp.score[label] = local->score;
        exp.local_pred[label] = local->local_prediction;
        exp.local_exp[label] = std::move(local->weights);
    }

    if (config_.verbose || core::debug_enabled()) {
        std::cerr << "[LEXPLAIN][explain] features=" << doc->num_features()
                  << " samples=" << nb->num_samples()
                  << " classes=" << num_classes
                  << " labels=" << exp.local_exp.size() << std::endl;
    }
    return exp;
}

} // namespace lexplain::explain
