#include "lexplain/explain/config.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <string>

#include "lexplain/core/platform_utils.hpp"

namespace lexplain::explain {

namespace {

constexpr const char* kComponent = "explain.config";

} // anonymous namespace

auto to_string(FeatureSelection fs) noexcept -> std::string_view {
    switch (fs) {
        case FeatureSelection::forward_selection: return "forward_selection";
        case FeatureSelection::highest_weights: return "highest_weights";
        case FeatureSelection::lasso_path: return "lasso_path";
        case FeatureSelection::none: return "none";
        case FeatureSelection::auto_select: return "auto";
    }
    return "auto";
}

auto parse_feature_selection(std::string_view name)
    -> std::expected<FeatureSelection, core::error> {
    if (name == "forward_selection") return FeatureSelection::forward_selection;
    if (name == "highest_weights") return FeatureSelection::highest_weights;
    if (name == "lasso_path") return FeatureSelection::lasso_path;
    if (name == "none") return FeatureSelection::none;
    if (name == "auto") return FeatureSelection::auto_select;
    return std::unexpected(core::error{
        core::error_code::config_invalid,
        "unknown feature selection '" + std::string(name) + "'",
        kComponent});
}

auto validate(const ExplainerConfig& config) -> std::expected<void, core::error> {
    if (!(config.kernel_width > 0.0) || !std::isfinite(config.kernel_width)) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "kernel_width must be finite and > 0", kComponent});
    }
    return {};
}

auto apply_env_overrides(ExplainerConfig& config) noexcept -> void {
    if (auto v = core::getenv_nonempty("LEXPLAIN_KERNEL_WIDTH")) {
        double w = 0.0;
        const auto* first = v->data();
        const auto* last = v->data() + v->size();
        auto [ptr, ec] = std::from_chars(first, last, w);
        if (ec == std::errc{} && ptr == last && w > 0.0 && std::isfinite(w)) {
            config.kernel_width = w;
        }
    }
    if (auto v = core::getenv_nonempty("LEXPLAIN_FEATURE_SELECTION")) {
        if (auto fs = parse_feature_selection(*v)) config.feature_selection = *fs;
    }
    if (auto v = core::getenv_nonempty("LEXPLAIN_VERBOSE")) {
        if (auto b = core::parse_bool_ci(*v)) config.verbose = *b;
    }
    if (auto v = core::getenv_nonempty("LEXPLAIN_BOW")) {
        if (auto b = core::parse_bool_ci(*v)) {
            config.mode = *b ? text::IndexingMode::bow : text::IndexingMode::positional;
        }
    }
}

} // namespace lexplain::explain
