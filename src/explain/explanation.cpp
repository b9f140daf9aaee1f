#include "lexplain/explain/explanation.hpp"

namespace lexplain::explain {

auto Explanation::available_labels() const -> std::vector<std::size_t> {
    if (top_labels) {
        return *top_labels;
    }
    std::vector<std::size_t> out;
    out.reserve(local_exp.size());
    for (const auto& entry : local_exp) {
        out.push_back(entry.first);
    }
    return out;
}

auto Explanation::as_list(std::size_t label) const
    -> std::expected<std::vector<std::pair<std::string, double>>, core::error> {
    auto it = local_exp.find(label);
    if (it == local_exp.end()) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "label " + std::to_string(label) + " was not explained",
            "explain.explanation"});
    }
    if (!document) {
        return std::unexpected(core::error{
            core::error_code::precondition_failed,
            "explanation has no document", "explain.explanation"});
    }
    std::vector<std::pair<std::string, double>> out;
    out.reserve(it->second.size());
    for (const auto& [id, weight] : it->second) {
        auto word = document->feature_text(id);
        if (!word) {
            return std::unexpected(word.error());
        }
        out.emplace_back(std::string(*word), weight);
    }
    return out;
}

} // namespace lexplain::explain
