/** \file surrogate_test.cpp
 *  \brief Unit tests for the weighted ridge surrogate and feature selection.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lexplain/explain/surrogate.hpp"
#include "lexplain/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace lexplain;
using namespace lexplain::explain;
using Catch::Matchers::WithinAbs;

namespace {

// Noise-free linear target: y = 0.2 + 0.5*x0 - 0.3*x2 (features 1 and 3 irrelevant).
Neighborhood make_linear_neighborhood(std::size_t n, std::uint64_t seed) {
    constexpr std::size_t k = 4;
    std::mt19937_64 rng(seed);
    std::bernoulli_distribution keep(0.5);

    Neighborhood nb;
    nb.data.rows = n;
    nb.data.cols = k;
    nb.data.values.assign(n * k, 1.0f);
    for (std::size_t i = 1; i < n; ++i) {
        std::size_t zeros = 0;
        for (std::size_t j = 0; j < k; ++j) {
            if (!keep(rng)) {
                nb.data.values[i * k + j] = 0.0f;
                ++zeros;
            }
        }
        if (zeros == 0) nb.data.values[i * k + (i % k)] = 0.0f;
        if (zeros == k) nb.data.values[i * k + (i % k)] = 1.0f;
    }
    for (std::size_t i = 0; i < n; ++i) {
        const double y = 0.2 + 0.5 * nb.data.at(i, 0) - 0.3 * nb.data.at(i, 2);
        nb.predictions.push_back({1.0 - y, y});
    }
    nb.texts.assign(n, std::string{});
    nb.distances = kernels::distances_to_first_row(nb.data.values, n, k);
    return nb;
}

bool contains(const std::vector<text::feature_id>& v, text::feature_id id) {
    return std::find(v.begin(), v.end(), id) != v.end();
}

} // namespace

TEST_CASE("Sample weights come from the exponential kernel", "[surrogate]") {
    RidgeSurrogate fitter(25.0);
    std::vector<double> d{0.0, 25.0, 50.0};
    auto w = fitter.sample_weights(d);
    REQUIRE(w.size() == 3);
    REQUIRE(w[0] == 1.0);
    REQUIRE_THAT(w[1], WithinAbs(std::sqrt(std::exp(-1.0)), 1e-12));
    REQUIRE_THAT(w[2], WithinAbs(std::exp(-2.0), 1e-12));
    REQUIRE(fitter.kernel_width() == 25.0);
}

TEST_CASE("Feature selection strategies find the relevant features", "[surrogate][selection]") {
    auto nb = make_linear_neighborhood(400, 21);
    RidgeSurrogate fitter(25.0);
    const auto w = fitter.sample_weights(nb.distances);

    SECTION("forward_selection picks the strongest feature first") {
        auto used = fitter.select_features(nb, 1, w, 2, FeatureSelection::forward_selection);
        REQUIRE(used.has_value());
        REQUIRE(*used == std::vector<text::feature_id>{0, 2});
    }

    SECTION("highest_weights keeps the largest coefficients") {
        auto used = fitter.select_features(nb, 1, w, 2, FeatureSelection::highest_weights);
        REQUIRE(used.has_value());
        REQUIRE(used->size() == 2);
        REQUIRE(contains(*used, 0));
        REQUIRE(contains(*used, 2));
    }

    SECTION("lasso_path respects the feature limit") {
        auto used = fitter.select_features(nb, 1, w, 2, FeatureSelection::lasso_path);
        REQUIRE(used.has_value());
        REQUIRE(used->size() <= 2);
        REQUIRE(contains(*used, 0));
    }

    SECTION("none keeps everything") {
        auto used = fitter.select_features(nb, 1, w, 2, FeatureSelection::none);
        REQUIRE(used.has_value());
        REQUIRE(*used == std::vector<text::feature_id>{0, 1, 2, 3});
    }

    SECTION("auto uses forward selection for small feature counts") {
        auto fwd = fitter.select_features(nb, 1, w, 2, FeatureSelection::forward_selection);
        auto aut = fitter.select_features(nb, 1, w, 2, FeatureSelection::auto_select);
        REQUIRE(aut.has_value());
        REQUIRE(*aut == *fwd);
    }

    SECTION("auto uses highest weights for large feature counts") {
        auto hw = fitter.select_features(nb, 1, w, 8, FeatureSelection::highest_weights);
        auto aut = fitter.select_features(nb, 1, w, 8, FeatureSelection::auto_select);
        REQUIRE(aut.has_value());
        REQUIRE(*aut == *hw);
        REQUIRE(aut->size() == 4);
    }

    SECTION("Bad label is rejected") {
        auto used = fitter.select_features(nb, 5, w, 2, FeatureSelection::none);
        REQUIRE_FALSE(used.has_value());
        REQUIRE(used.error().code == core::error_code::invalid_argument);
    }
}

TEST_CASE("Ridge surrogate recovers a linear target", "[surrogate][fit]") {
    auto nb = make_linear_neighborhood(400, 5);
    RidgeSurrogate fitter(25.0);

    auto exp = fitter.fit(nb, 1, 4, FeatureSelection::none);
    REQUIRE(exp.has_value());
    REQUIRE(exp->weights.size() == 4);

    // Sorted by |weight|, strongest first.
    for (std::size_t i = 1; i < exp->weights.size(); ++i) {
        REQUIRE(std::abs(exp->weights[i - 1].second) >= std::abs(exp->weights[i].second));
    }
    REQUIRE(exp->weights[0].first == 0);
    REQUIRE(exp->weights[0].second > 0.4);
    REQUIRE(exp->weights[1].first == 2);
    REQUIRE(exp->weights[1].second < -0.2);
    REQUIRE(std::abs(exp->weights[2].second) < 0.05);

    REQUIRE(exp->score > 0.95);
    REQUIRE_THAT(exp->local_prediction, WithinAbs(0.4, 0.05));

    SECTION("The complementary label mirrors the weights") {
        auto other = fitter.fit(nb, 0, 4, FeatureSelection::none);
        REQUIRE(other.has_value());
        REQUIRE(other->weights[0].first == 0);
        REQUIRE_THAT(other->weights[0].second, WithinAbs(-exp->weights[0].second, 1e-9));
        REQUIRE_THAT(other->intercept + exp->intercept, WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("Explanation size is capped", "[surrogate][fit]") {
    auto nb = make_linear_neighborhood(200, 9);
    RidgeSurrogate fitter(25.0);
    for (auto fs : {FeatureSelection::none, FeatureSelection::forward_selection,
                    FeatureSelection::highest_weights, FeatureSelection::lasso_path,
                    FeatureSelection::auto_select}) {
        auto exp = fitter.fit(nb, 1, 1, fs);
        REQUIRE(exp.has_value());
        REQUIRE(exp->weights.size() <= 1);
    }
    auto empty = fitter.fit(nb, 1, 0, FeatureSelection::forward_selection);
    REQUIRE(empty.has_value());
    REQUIRE(empty->weights.empty());
}

TEST_CASE("Constant target gives a perfect, flat fit", "[surrogate][fit]") {
    auto nb = make_linear_neighborhood(100, 13);
    for (auto& row : nb.predictions) row = {0.3, 0.7};
    RidgeSurrogate fitter(25.0);
    auto exp = fitter.fit(nb, 1, 4, FeatureSelection::none);
    REQUIRE(exp.has_value());
    REQUIRE(exp->score == 1.0);
    REQUIRE_THAT(exp->intercept, WithinAbs(0.7, 1e-9));
    for (const auto& fw : exp->weights) {
        REQUIRE_THAT(fw.second, WithinAbs(0.0, 1e-9));
    }
}

TEST_CASE("Surrogate input validation", "[surrogate][errors]") {
    auto nb = make_linear_neighborhood(50, 2);
    RidgeSurrogate fitter(25.0);

    auto bad_label = fitter.fit(nb, 2, 3, FeatureSelection::auto_select);
    REQUIRE_FALSE(bad_label.has_value());
    REQUIRE(bad_label.error().code == core::error_code::invalid_argument);

    nb.distances.pop_back();
    auto mismatch = fitter.fit(nb, 1, 3, FeatureSelection::auto_select);
    REQUIRE_FALSE(mismatch.has_value());
    REQUIRE(mismatch.error().code == core::error_code::precondition_failed);
}
