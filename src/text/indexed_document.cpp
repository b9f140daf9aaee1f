#include "lexplain/text/indexed_document.hpp"

#include <string>
#include <utility>
#include <unordered_map>
#include <unordered_set>

#include <roaring/roaring.hh>
#include <utf8proc.h>

namespace lexplain::text {

namespace {

constexpr const char* kComponent = "text.indexed_document";

struct CodePoint {
    std::size_t length;
    bool word;
};

// Decode the code point starting at text[i]; an invalid sequence is a
// single non-word byte.
CodePoint decode_at(std::string_view text, std::size_t i) noexcept {
    utf8proc_int32_t cp = -1;
    const auto n = utf8proc_iterate(
        reinterpret_cast<const utf8proc_uint8_t*>(text.data() + i),
        static_cast<utf8proc_ssize_t>(text.size() - i), &cp);
    if (n <= 0) {
        return CodePoint{1, false};
    }
    return CodePoint{static_cast<std::size_t>(n), is_word_codepoint(cp)};
}

bool is_separator(std::string_view token) noexcept {
    return !is_word_token(token);
}

} // anonymous namespace

auto to_string(IndexingMode mode) noexcept -> std::string_view {
    switch (mode) {
        case IndexingMode::bow: return "bow";
        case IndexingMode::positional: return "positional";
    }
    return "bow";
}

auto parse_indexing_mode(std::string_view name)
    -> std::expected<IndexingMode, core::error> {
    if (name == "bow") return IndexingMode::bow;
    if (name == "positional") return IndexingMode::positional;
    return std::unexpected(core::error{
        core::error_code::config_invalid,
        "unknown indexing mode '" + std::string(name) + "' (expected bow|positional)",
        kComponent});
}

auto is_word_codepoint(std::int32_t cp) noexcept -> bool {
    if (cp == '_') {
        return true;
    }
    if (cp < 0 || cp > 0x10FFFF) {
        return false;
    }
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp))) {
        case UTF8PROC_CATEGORY_LU:
        case UTF8PROC_CATEGORY_LL:
        case UTF8PROC_CATEGORY_LT:
        case UTF8PROC_CATEGORY_LM:
        case UTF8PROC_CATEGORY_LO:
        case UTF8PROC_CATEGORY_ND:
        case UTF8PROC_CATEGORY_NL:
        case UTF8PROC_CATEGORY_NO:
            return true;
        default:
            return false;
    }
}

auto is_word_token(std::string_view token) noexcept -> bool {
    return !token.empty() && decode_at(token, 0).word;
}

auto split_tokens(std::string_view text) -> std::vector<TokenSpan> {
    std::vector<TokenSpan> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        const CodePoint first = decode_at(text, i);
        std::size_t j = i + first.length;
        while (j < text.size()) {
            const CodePoint next = decode_at(text, j);
            if (next.word != first.word) {
                break;
            }
            j += next.length;
        }
        tokens.push_back(TokenSpan{i, j - i});
        i = j;
    }
    return tokens;
}

IndexedDocument::IndexedDocument(std::string raw, IndexingMode mode)
    : raw_(std::move(raw)), mode_(mode) {
    const auto spans = split_tokens(raw_);

    string_start_.reserve(spans.size() + 1);
    std::size_t offset = 0;
    for (const auto& span : spans) {
        string_start_.push_back(offset);
        offset += span.length;
    }
    string_start_.push_back(offset);

    // Both caches key on views into raw_ and die with the constructor.
    std::unordered_map<std::string_view, feature_id> vocab;
    std::unordered_set<std::string_view> non_vocab;

    const std::string_view text(raw_);
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const auto word = text.substr(spans[i].start, spans[i].length);
        if (non_vocab.contains(word)) {
            continue;
        }
        if (is_separator(word)) {
            non_vocab.insert(word);
            continue;
        }
        const auto token_idx = static_cast<std::uint32_t>(i);
        if (mode_ == IndexingMode::bow) {
            auto [it, inserted] = vocab.try_emplace(
                word, static_cast<feature_id>(positions_.size()));
            if (inserted) {
                positions_.emplace_back();
            }
            positions_[it->second].push_back(token_idx);
        } else {
            positions_.push_back({token_idx});
        }
    }
}

auto IndexedDocument::token(std::size_t i) const -> std::string_view {
    return std::string_view(raw_).substr(string_start_[i],
                                         string_start_[i + 1] - string_start_[i]);
}

auto IndexedDocument::check_id(feature_id id) const
    -> std::expected<void, core::error> {
    if (id >= positions_.size()) {
        return std::unexpected(core::error{
            core::error_code::invalid_feature_id,
            "feature id " + std::to_string(id) + " out of range (num_features=" +
                std::to_string(positions_.size()) + ")",
            kComponent});
    }
    return {};
}

auto IndexedDocument::feature_text(feature_id id) const
    -> std::expected<std::string_view, core::error> {
    if (auto ok = check_id(id); !ok) {
        return std::unexpected(ok.error());
    }
    return token(positions_[id].front());
}

auto IndexedDocument::feature_positions(feature_id id) const
    -> std::expected<std::vector<std::size_t>, core::error> {
    if (auto ok = check_id(id); !ok) {
        return std::unexpected(ok.error());
    }
    std::vector<std::size_t> out;
    out.reserve(positions_[id].size());
    for (std::uint32_t t : positions_[id]) {
        out.push_back(string_start_[t]);
    }
    return out;
}

auto IndexedDocument::feature_tokens(feature_id id) const
    -> std::expected<std::span<const std::uint32_t>, core::error> {
    if (auto ok = check_id(id); !ok) {
        return std::unexpected(ok.error());
    }
    return std::span<const std::uint32_t>(positions_[id]);
}

auto IndexedDocument::remove(std::span<const feature_id> ids) const
    -> std::expected<std::string, core::error> {
    // Validate everything before touching the output.
    for (feature_id id : ids) {
        if (auto ok = check_id(id); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (ids.empty()) {
        return raw_;
    }

    roaring::Roaring removed;
    for (feature_id id : ids) {
        const auto& toks = positions_[id];
        removed.addMany(toks.size(), toks.data());
    }

    std::string out;
    out.reserve(raw_.size());
    const std::size_t n = num_tokens();
    for (std::size_t i = 0; i < n; ++i) {
        if (removed.contains(static_cast<std::uint32_t>(i))) {
            continue;
        }
        out.append(raw_, string_start_[i], string_start_[i + 1] - string_start_[i]);
    }
    return out;
}

auto IndexedDocument::apply_mask(std::span<const float> mask) const
    -> std::expected<std::string, core::error> {
    if (mask.size() != positions_.size()) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "mask length " + std::to_string(mask.size()) +
                " does not match num_features=" + std::to_string(positions_.size()),
            kComponent});
    }
    std::vector<feature_id> inactive;
    for (std::size_t f = 0; f < mask.size(); ++f) {
        if (mask[f] == 0.0f) {
            inactive.push_back(static_cast<feature_id>(f));
        }
    }
    return remove(inactive);
}

} // namespace lexplain::text
