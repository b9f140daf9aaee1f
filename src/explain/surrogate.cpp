#include "lexplain/explain/surrogate.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <string>
#include <unordered_map>

#include "lexplain/core/platform_utils.hpp"
#include "lexplain/kernels/distance.hpp"

namespace lexplain::explain {

namespace {

constexpr const char* kComponent = "explain.surrogate";

constexpr double kFinalAlpha = 1.0;
constexpr double kHighestWeightsAlpha = 0.01;
// Forward selection fits are meant to be unregularized; the tiny ridge keeps
// the normal equations positive definite when two columns coincide.
constexpr double kForwardAlpha = 1e-6;
constexpr std::size_t kAutoForwardLimit = 6;
constexpr double kVarianceEps = 1e-12;

constexpr std::size_t kLassoPathSteps = 100;
constexpr double kLassoPathRatio = 1e-4;
constexpr std::size_t kLassoMaxSweeps = 1000;
constexpr double kLassoTol = 1e-7;

struct RidgeFit {
    double intercept{0.0};
    std::vector<double> coef;
};

/** Weighted first and second moments of (X, y), second moments computed lazily per column. */
class WeightedMoments {
public:
    WeightedMoments(const DesignMatrix& x, std::span<const double> y, std::span<const double> w)
        : x_(x), w_(w), mean_x_(x.cols, 0.0), sxy_(x.cols, 0.0) {
        for (std::size_t i = 0; i < x.rows; ++i) {
            sum_w_ += w[i];
        }
        if (sum_w_ <= 0.0) return;

        for (std::size_t i = 0; i < x.rows; ++i) {
            mean_y_ += w[i] * y[i];
            const auto row = x.row(i);
            for (std::size_t j = 0; j < x.cols; ++j) {
                mean_x_[j] += w[i] * row[j];
            }
        }
        mean_y_ /= sum_w_;
        for (double& m : mean_x_) m /= sum_w_;

        for (std::size_t i = 0; i < x.rows; ++i) {
            const double dy = y[i] - mean_y_;
            syy_ += w[i] * dy * dy;
            const auto row = x.row(i);
            for (std::size_t j = 0; j < x.cols; ++j) {
                const double dx = row[j] - mean_x_[j];
                sxy_[j] += w[i] * dx * dy;
            }
        }
    }

    auto sum_weights() const noexcept -> double { return sum_w_; }
    auto mean_y() const noexcept -> double { return mean_y_; }
    auto mean_x(std::size_t j) const -> double { return mean_x_[j]; }
    auto syy() const noexcept -> double { return syy_; }
    auto sxy(std::size_t j) const -> double { return sxy_[j]; }

    /** Centered weighted cross products of column j with every column. */
    auto column(std::size_t j) -> const std::vector<double>& {
        auto it = columns_.find(j);
        if (it != columns_.end()) return it->second;

        std::vector<double> col(x_.cols, 0.0);
        for (std::size_t i = 0; i < x_.rows; ++i) {
            const auto row = x_.row(i);
            const double dj = w_[i] * (row[j] - mean_x_[j]);
            if (dj == 0.0) continue;
            for (std::size_t k = 0; k < x_.cols; ++k) {
                col[k] += dj * (row[k] - mean_x_[k]);
            }
        }
        return columns_.emplace(j, std::move(col)).first->second;
    }

private:
    const DesignMatrix& x_;
    std::span<const double> w_;
    double sum_w_{0.0};
    double mean_y_{0.0};
    double syy_{0.0};
    std::vector<double> mean_x_;
    std::vector<double> sxy_;
    std::unordered_map<std::size_t, std::vector<double>> columns_;
};

// Solve A x = b in place for symmetric positive definite A (row-major p x p).
auto cholesky_solve(std::vector<double>& a, std::vector<double>& b, std::size_t p)
    -> std::expected<void, core::error> {
    for (std::size_t j = 0; j < p; ++j) {
        double d = a[j * p + j];
        for (std::size_t k = 0; k < j; ++k) d -= a[j * p + k] * a[j * p + k];
        if (!(d > 0.0) || !std::isfinite(d)) {
            return std::unexpected(core::error{
                core::error_code::internal,
                "normal equations are not positive definite", kComponent});
        }
        const double l = std::sqrt(d);
        a[j * p + j] = l;
        for (std::size_t i = j + 1; i < p; ++i) {
            double s = a[i * p + j];
            for (std::size_t k = 0; k < j; ++k) s -= a[i * p + k] * a[j * p + k];
            a[i * p + j] = s / l;
        }
    }
    for (std::size_t i = 0; i < p; ++i) {
        double s = b[i];
        for (std::size_t k = 0; k < i; ++k) s -= a[i * p + k] * b[k];
        b[i] = s / a[i * p + i];
    }
    for (std::size_t ii = p; ii-- > 0;) {
        double s = b[ii];
        for (std::size_t k = ii + 1; k < p; ++k) s -= a[k * p + ii] * b[k];
        b[ii] = s / a[ii * p + ii];
    }
    return {};
}

// Weighted ridge with intercept: min sum w_i (y_i - c - x_i b)^2 + alpha ||b||^2
auto ridge(WeightedMoments& m, std::span<const text::feature_id> cols, double alpha)
    -> std::expected<RidgeFit, core::error> {
    const std::size_t p = cols.size();
    RidgeFit fit;
    fit.intercept = m.mean_y();
    if (p == 0) return fit;

    std::vector<double> a(p * p, 0.0);
    std::vector<double> b(p, 0.0);
    for (std::size_t r = 0; r < p; ++r) {
        const auto& col = m.column(cols[r]);
        for (std::size_t c = 0; c < p; ++c) {
            a[r * p + c] = col[cols[c]];
        }
        a[r * p + r] += alpha;
        b[r] = m.sxy(cols[r]);
    }
    if (auto ok = cholesky_solve(a, b, p); !ok) {
        return std::unexpected(ok.error());
    }
    fit.coef = std::move(b);
    for (std::size_t r = 0; r < p; ++r) {
        fit.intercept -= fit.coef[r] * m.mean_x(cols[r]);
    }
    return fit;
}

// Weighted R^2 from the moments: ss_res = syy - 2 b.sxy + b' Sxx b.
auto weighted_r2(WeightedMoments& m, std::span<const text::feature_id> cols,
                 const RidgeFit& fit) -> double {
    double ss_res = m.syy();
    for (std::size_t r = 0; r < cols.size(); ++r) {
        const auto& col = m.column(cols[r]);
        ss_res -= 2.0 * fit.coef[r] * m.sxy(cols[r]);
        for (std::size_t c = 0; c < cols.size(); ++c) {
            ss_res += fit.coef[r] * fit.coef[c] * col[cols[c]];
        }
    }
    ss_res = std::max(ss_res, 0.0);
    // A target that is constant up to rounding is explained perfectly or not at all.
    const double tol = kVarianceEps * std::max(1.0, m.sum_weights());
    if (m.syy() <= tol) {
        return ss_res <= tol ? 1.0 : 0.0;
    }
    return 1.0 - ss_res / m.syy();
}

auto all_features(std::size_t k) -> std::vector<text::feature_id> {
    std::vector<text::feature_id> out(k);
    std::iota(out.begin(), out.end(), text::feature_id{0});
    return out;
}

auto forward_selection(WeightedMoments& m, std::size_t num_cols, std::size_t num_features)
    -> std::vector<text::feature_id> {
    std::vector<text::feature_id> used;
    std::vector<bool> taken(num_cols, false);
    const std::size_t steps = std::min(num_features, num_cols);
    for (std::size_t step = 0; step < steps; ++step) {
        double best_score = -std::numeric_limits<double>::infinity();
        std::size_t best = num_cols;
        for (std::size_t f = 0; f < num_cols; ++f) {
            if (taken[f]) continue;
            std::vector<text::feature_id> trial(used);
            trial.push_back(static_cast<text::feature_id>(f));
            auto fit = ridge(m, trial, kForwardAlpha);
            // A candidate collinear with the chosen set cannot improve the fit.
            if (!fit) continue;
            const double score = weighted_r2(m, trial, *fit);
            if (score > best_score) {
                best_score = score;
                best = f;
            }
        }
        if (best == num_cols) break;
        taken[best] = true;
        used.push_back(static_cast<text::feature_id>(best));
    }
    return used;
}

auto highest_weights(WeightedMoments& m, const Neighborhood& nb, std::size_t num_features)
    -> std::expected<std::vector<text::feature_id>, core::error> {
    const auto cols = all_features(nb.num_features());
    auto fit = ridge(m, cols, kHighestWeightsAlpha);
    if (!fit) return std::unexpected(fit.error());

    const auto origin = nb.data.row(0);
    std::vector<std::pair<text::feature_id, double>> scored;
    scored.reserve(cols.size());
    for (std::size_t j = 0; j < cols.size(); ++j) {
        scored.emplace_back(cols[j], std::abs(fit->coef[j] * origin[j]));
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (scored.size() > num_features) scored.resize(num_features);

    std::vector<text::feature_id> out;
    out.reserve(scored.size());
    for (const auto& s : scored) out.push_back(s.first);
    return out;
}

// Lasso by cyclic coordinate descent on the weighted, centered data along a
// geometric path of penalties; returns the support of the least-penalized
// solution with at most num_features nonzero coefficients.
auto lasso_path(WeightedMoments& m, const Neighborhood& nb, std::span<const double> y,
                std::span<const double> w, std::size_t num_features)
    -> std::vector<text::feature_id> {
    const std::size_t n = nb.num_samples();
    const std::size_t k = nb.num_features();

    // Column-major weighted, centered design.
    std::vector<double> xw(n * k);
    std::vector<double> r(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double sw = std::sqrt(w[i]);
        const auto row = nb.data.row(i);
        for (std::size_t j = 0; j < k; ++j) {
            xw[j * n + i] = (row[j] - m.mean_x(j)) * sw;
        }
        r[i] = (y[i] - m.mean_y()) * sw;
    }

    std::vector<double> z(k, 0.0);
    double lambda_max = 0.0;
    for (std::size_t j = 0; j < k; ++j) {
        double dot = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            z[j] += xw[j * n + i] * xw[j * n + i];
            dot += xw[j * n + i] * r[i];
        }
        lambda_max = std::max(lambda_max, std::abs(dot));
    }
    if (lambda_max <= 0.0) return {};

    std::vector<double> beta(k, 0.0);
    std::vector<std::vector<text::feature_id>> supports;
    supports.reserve(kLassoPathSteps);
    const double step = std::pow(kLassoPathRatio, 1.0 / static_cast<double>(kLassoPathSteps - 1));
    double lambda = lambda_max;
    for (std::size_t s = 0; s < kLassoPathSteps; ++s, lambda *= step) {
        for (std::size_t sweep = 0; sweep < kLassoMaxSweeps; ++sweep) {
            double max_delta = 0.0;
            for (std::size_t j = 0; j < k; ++j) {
                if (z[j] <= 0.0) continue;
                const double* xj = xw.data() + j * n;
                double rho = 0.0;
                for (std::size_t i = 0; i < n; ++i) rho += xj[i] * r[i];
                rho += z[j] * beta[j];
                double next = 0.0;
                if (rho > lambda) next = (rho - lambda) / z[j];
                else if (rho < -lambda) next = (rho + lambda) / z[j];
                const double delta = next - beta[j];
                if (delta != 0.0) {
                    for (std::size_t i = 0; i < n; ++i) r[i] -= delta * xj[i];
                    beta[j] = next;
                    max_delta = std::max(max_delta, std::abs(delta));
                }
            }
            if (max_delta < kLassoTol) break;
        }
        std::vector<text::feature_id> support;
        for (std::size_t j = 0; j < k; ++j) {
            if (beta[j] != 0.0) support.push_back(static_cast<text::feature_id>(j));
        }
        supports.push_back(std::move(support));
    }

    for (std::size_t s = supports.size(); s-- > 0;) {
        if (supports[s].size() <= num_features) return supports[s];
    }
    return {};
}

auto label_column(const Neighborhood& nb, std::size_t label) -> std::vector<double> {
    std::vector<double> y(nb.num_samples());
    for (std::size_t i = 0; i < y.size(); ++i) y[i] = nb.predictions[i][label];
    return y;
}

auto select_with(WeightedMoments& m, const Neighborhood& nb, std::span<const double> y,
                 std::span<const double> w, std::size_t num_features,
                 FeatureSelection selection)
    -> std::expected<std::vector<text::feature_id>, core::error> {
    switch (selection) {
        case FeatureSelection::none:
            return all_features(nb.num_features());
        case FeatureSelection::forward_selection:
            return forward_selection(m, nb.num_features(), num_features);
        case FeatureSelection::highest_weights:
            return highest_weights(m, nb, num_features);
        case FeatureSelection::lasso_path:
            return lasso_path(m, nb, y, w, num_features);
        case FeatureSelection::auto_select:
            if (num_features <= kAutoForwardLimit) {
                return forward_selection(m, nb.num_features(), num_features);
            }
            return highest_weights(m, nb, num_features);
    }
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "unknown feature selection", kComponent});
}

} // anonymous namespace

auto RidgeSurrogate::sample_weights(std::span<const double> distances) const
    -> std::vector<double> {
    std::vector<double> w(distances.size());
    for (std::size_t i = 0; i < distances.size(); ++i) {
        w[i] = kernels::exponential_kernel(distances[i], kernel_width_);
    }
    return w;
}

auto RidgeSurrogate::select_features(const Neighborhood& nb, std::size_t label,
                                     std::span<const double> weights,
                                     std::size_t num_features,
                                     FeatureSelection selection) const
    -> std::expected<std::vector<text::feature_id>, core::error> {
    if (label >= nb.num_classes() || weights.size() != nb.num_samples()) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "label or weight count does not match the neighborhood", kComponent});
    }
    const auto y = label_column(nb, label);
    WeightedMoments m(nb.data, y, weights);
    return select_with(m, nb, y, weights, num_features, selection);
}

auto RidgeSurrogate::fit(const Neighborhood& nb, std::size_t label,
                         std::size_t num_features, FeatureSelection selection) const
    -> std::expected<LocalExplanation, core::error> {
    if (nb.num_samples() == 0 || nb.predictions.size() != nb.num_samples() ||
        nb.distances.size() != nb.num_samples()) {
        return std::unexpected(core::error{
            core::error_code::precondition_failed,
            "neighborhood rows, predictions and distances disagree", kComponent});
    }
    if (label >= nb.num_classes()) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "label " + std::to_string(label) + " out of range (num_classes=" +
                std::to_string(nb.num_classes()) + ")",
            kComponent});
    }

    const auto weights = sample_weights(nb.distances);
    const auto y = label_column(nb, label);
    WeightedMoments m(nb.data, y, weights);
    if (!(m.sum_weights() > 0.0)) {
        return std::unexpected(core::error{
            core::error_code::precondition_failed,
            "all sample weights are zero; kernel_width too small", kComponent});
    }

    auto used = select_with(m, nb, y, weights, num_features, selection);
    if (!used) return std::unexpected(used.error());

    auto model = ridge(m, *used, kFinalAlpha);
    if (!model) return std::unexpected(model.error());

    LocalExplanation out;
    out.intercept = model->intercept;
    out.score = weighted_r2(m, *used, *model);
    out.local_prediction = model->intercept;
    const auto origin = nb.data.row(0);
    out.weights.reserve(used->size());
    for (std::size_t r = 0; r < used->size(); ++r) {
        out.weights.emplace_back((*used)[r], model->coef[r]);
        out.local_prediction += model->coef[r] * origin[(*used)[r]];
    }
    std::stable_sort(out.weights.begin(), out.weights.end(),
                     [](const FeatureWeight& a, const FeatureWeight& b) {
                         return std::abs(a.second) > std::abs(b.second);
                     });
    if (out.weights.size() > num_features) out.weights.resize(num_features);

    if (verbose_ || core::debug_enabled()) {
        std::cerr << "[LEXPLAIN][fit] label=" << label
                  << " selection=" << to_string(selection)
                  << " intercept=" << out.intercept
                  << " prediction_local=" << out.local_prediction
                  << " right=" << y[0]
                  << " score=" << out.score << std::endl;
    }
    return out;
}

} // namespace lexplain::explain
