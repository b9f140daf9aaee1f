#include "lexplain/explain/neighborhood.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <numeric>
#include <utility>

#include "lexplain/core/platform_utils.hpp"
#include "lexplain/kernels/distance.hpp"

namespace lexplain::explain {

namespace {

constexpr const char* kComponent = "explain.neighborhood";

auto contract_error(std::string message) -> core::error {
    return core::error{core::error_code::prediction_contract, std::move(message), kComponent};
}

} // anonymous namespace

auto validate_predictions(const ProbabilityMatrix& predictions,
                          std::size_t expected_rows,
                          std::optional<std::size_t> expected_cols)
    -> std::expected<std::size_t, core::error> {
    if (predictions.size() != expected_rows) {
        return std::unexpected(contract_error(
            "prediction function returned " + std::to_string(predictions.size()) +
            " rows for a batch of " + std::to_string(expected_rows)));
    }
    if (predictions.empty()) {
        return std::unexpected(contract_error("prediction function returned no rows"));
    }
    const std::size_t cols = predictions.front().size();
    if (cols == 0) {
        return std::unexpected(contract_error("prediction rows have no columns"));
    }
    if (expected_cols && *expected_cols != cols) {
        return std::unexpected(contract_error(
            "prediction function returned " + std::to_string(cols) +
            " columns, expected " + std::to_string(*expected_cols)));
    }
    for (std::size_t r = 1; r < predictions.size(); ++r) {
        if (predictions[r].size() != cols) {
            return std::unexpected(contract_error(
                "prediction row " + std::to_string(r) + " has " +
                std::to_string(predictions[r].size()) + " columns, row 0 has " +
                std::to_string(cols)));
        }
    }
    return cols;
}

auto sample_neighborhood(const text::IndexedDocument& doc,
                         const PredictFn& predict,
                         std::size_t num_samples,
                         std::mt19937_64& rng,
                         std::optional<std::size_t> expected_classes)
    -> std::expected<Neighborhood, core::error> {
    if (num_samples == 0) {
        return std::unexpected(core::error{
            core::error_code::config_invalid, "num_samples must be > 0", kComponent});
    }
    const std::size_t doc_size = doc.num_features();
    if (doc_size <= 1) {
        return std::unexpected(core::error{
            core::error_code::empty_neighborhood,
            "document has " + std::to_string(doc_size) +
                " feature(s); at least 2 are needed to perturb it",
            kComponent});
    }
    if (!predict) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument, "prediction function is empty", kComponent});
    }

    const bool dbg = core::debug_enabled();
    const auto t0 = std::chrono::steady_clock::now();

    Neighborhood nb;
    nb.data.rows = num_samples;
    nb.data.cols = doc_size;
    nb.data.values.assign(num_samples * doc_size, 1.0f);
    nb.texts.reserve(num_samples);
    nb.texts.push_back(doc.raw_string());

    // Upper bound is doc_size - 1: a row never loses every feature.
    std::uniform_int_distribution<std::size_t> size_dist(1, doc_size - 1);
    std::vector<text::feature_id> features(doc_size);
    std::iota(features.begin(), features.end(), text::feature_id{0});

    for (std::size_t i = 1; i < num_samples; ++i) {
        const std::size_t size = size_dist(rng);
        // Partial Fisher-Yates: the first `size` slots become a uniform
        // sample without replacement.
        for (std::size_t k = 0; k < size; ++k) {
            std::uniform_int_distribution<std::size_t> pick(k, doc_size - 1);
            std::swap(features[k], features[pick(rng)]);
        }
        const std::span<const text::feature_id> inactive(features.data(), size);
        float* row = nb.data.values.data() + i * doc_size;
        for (text::feature_id f : inactive) {
            row[f] = 0.0f;
        }
        auto reduced = doc.remove(inactive);
        if (!reduced) {
            return std::unexpected(reduced.error());
        }
        nb.texts.push_back(std::move(*reduced));
    }

    if (dbg) {
        std::cerr << "[LEXPLAIN][sample] generated " << num_samples << " rows over "
                  << doc_size << " features; calling classifier" << std::endl;
    }

    try {
        nb.predictions = predict(nb.texts);
    } catch (const std::exception& e) {
        return std::unexpected(core::error{
            core::error_code::classifier_failed,
            std::string("prediction function threw: ") + e.what(), kComponent});
    }

    auto cols = validate_predictions(nb.predictions, num_samples, expected_classes);
    if (!cols) {
        return std::unexpected(cols.error());
    }

    nb.distances = kernels::distances_to_first_row(nb.data.values, nb.data.rows, nb.data.cols);

    if (dbg) {
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - t0);
        std::cerr << "[LEXPLAIN][sample] " << *cols << " classes; done in "
                  << elapsed.count() << " sec" << std::endl;
    }
    return nb;
}

} // namespace lexplain::explain
