#pragma once

/** \file indexed_document.hpp
 *  \brief Tokenized document with addressable, removable word features.
 *
 * A document is split into alternating runs of word and non-word characters;
 * every character of the input belongs to exactly one token, so joining all
 * tokens in order reproduces the input byte-for-byte. Word tokens are mapped
 * to dense feature ids in first-occurrence order:
 * - bow: all occurrences of an identical word share one feature id
 * - positional: every occurrence gets its own feature id
 * Separator tokens are never features.
 *
 * Thread-safety: immutable after construction; all const methods are safe for
 * concurrent calls.
 * Lifetime: string_views returned by accessors point into the document and
 * are invalidated when it is destroyed or moved from.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lexplain/error.hpp"

namespace lexplain::text {

/** \brief Dense feature identifier in [0, num_features). */
using feature_id = std::uint32_t;

/** \brief How word occurrences map onto features. */
enum class IndexingMode : std::uint8_t {
    bow,         /**< one feature per distinct word string */
    positional,  /**< one feature per word occurrence */
};

auto to_string(IndexingMode mode) noexcept -> std::string_view;
auto parse_indexing_mode(std::string_view name)
    -> std::expected<IndexingMode, core::error>;

/** \brief Character span of one token within its source text. */
struct TokenSpan {
    std::size_t start{0};
    std::size_t length{0};
};

/** \brief Word code points: Unicode letters (L*), numbers (N*) and '_'.
 *
 * Punctuation, symbols, marks and every kind of space are separators.
 */
auto is_word_codepoint(std::int32_t cp) noexcept -> bool;

/** \brief True when the token's first code point is a word code point.
 *
 * Tokens from split_tokens() are homogeneous, so the first code point
 * classifies the whole token. Invalid UTF-8 counts as a separator.
 */
auto is_word_token(std::string_view token) noexcept -> bool;

/** \brief Split UTF-8 text into maximal runs of word / non-word code points.
 *
 * Offsets and lengths are in bytes and never split a code point; an
 * invalid byte is a one-byte separator. Never drops characters and never
 * yields empty tokens; the spans tile the input exactly.
 * Complexity: O(n)
 */
auto split_tokens(std::string_view text) -> std::vector<TokenSpan>;

/** \brief Document indexed into addressable features.
 *
 * Example usage:
 * ```cpp
 * IndexedDocument doc("good movie, good plot", IndexingMode::bow);
 * doc.num_features();          // 3: good, movie, plot
 * std::vector<feature_id> ids{0};
 * doc.remove(ids).value();     // " movie,  plot"
 * ```
 */
class IndexedDocument {
public:
    explicit IndexedDocument(std::string raw, IndexingMode mode = IndexingMode::bow);

    IndexedDocument(const IndexedDocument&) = default;
    IndexedDocument& operator=(const IndexedDocument&) = default;
    IndexedDocument(IndexedDocument&&) noexcept = default;
    IndexedDocument& operator=(IndexedDocument&&) noexcept = default;

    /** \brief The original text, unmodified. */
    auto raw_string() const noexcept -> const std::string& { return raw_; }

    auto mode() const noexcept -> IndexingMode { return mode_; }

    /** \brief Number of addressable features (distinct words or word occurrences). */
    auto num_features() const noexcept -> std::size_t { return positions_.size(); }

    /** \brief Number of tokens, separators included. */
    auto num_tokens() const noexcept -> std::size_t {
        return string_start_.empty() ? 0 : string_start_.size() - 1;
    }

    /** \brief Text of token i. Precondition: i < num_tokens(). */
    auto token(std::size_t i) const -> std::string_view;

    /** \brief Character offset of token i. Precondition: i <= num_tokens(). */
    auto token_start(std::size_t i) const -> std::size_t { return string_start_[i]; }

    /** \brief Canonical word text for a feature id.
     *
     * \return View into the document, or invalid_feature_id
     */
    auto feature_text(feature_id id) const
        -> std::expected<std::string_view, core::error>;

    /** \brief Character start offsets of every occurrence of a feature.
     *
     * One offset in positional mode; one per occurrence in bow mode, ascending.
     */
    auto feature_positions(feature_id id) const
        -> std::expected<std::vector<std::size_t>, core::error>;

    /** \brief Token indices backing a feature (ascending). */
    auto feature_tokens(feature_id id) const
        -> std::expected<std::span<const std::uint32_t>, core::error>;

    /** \brief Rebuild the text with the given features deleted.
     *
     * \param ids Features to delete; duplicates are allowed
     * \return Remaining tokens joined in original order, or invalid_feature_id
     *
     * Postcondition: remove({}) == raw_string()
     * Complexity: O(T + sum of occurrence counts)
     */
    auto remove(std::span<const feature_id> ids) const
        -> std::expected<std::string, core::error>;

    /** \brief Rebuild the text from a feature mask (nonzero = keep).
     *
     * \param mask One entry per feature
     * \return Reconstructed text, or invalid_argument on a length mismatch
     */
    auto apply_mask(std::span<const float> mask) const
        -> std::expected<std::string, core::error>;

private:
    auto check_id(feature_id id) const -> std::expected<void, core::error>;

    std::string raw_;
    IndexingMode mode_{IndexingMode::bow};
    // string_start_[i] is the offset of token i; the last entry is raw_.size()
    std::vector<std::size_t> string_start_;
    // feature id -> token indices (a single entry in positional mode)
    std::vector<std::vector<std::uint32_t>> positions_;
};

} // namespace lexplain::text
