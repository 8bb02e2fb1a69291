/**
 * @file Tokenizer.hpp
 * @brief Path expression tokenizer
 *
 * A path expression is a dot-separated list of member names, each with an
 * optional trailing integer indexer: "OriginalSource.Items[0].Title".
 *
 * Tokenization never fails. Rules:
 * - Segments are split on '.', trimmed, and empty segments are dropped
 *   ("Child..Name" and " Child . Name " both equal "Child.Name")
 * - A segment ending in ']' whose bracket content (after the last '[')
 *   is a base-10 non-negative integer yields name + index
 *   ("Items[0]" -> name "Items", index 0; "[1]" -> name "", index 1)
 * - Any other segment is kept verbatim as a plain name, brackets included
 *   ("Tags[abc]", "Tags[-1]", "Tags[1.5]", "Tags[" stay unindexed)
 */

#ifndef PATHEXPR_TOKENIZER_HPP
#define PATHEXPR_TOKENIZER_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pathexpr {

/**
 * @brief One parsed path segment: member name plus optional index
 *
 * An empty name means "no member hop", only the indexer applies.
 */
struct Token {
    std::string name;
    std::optional<std::size_t> index;

    bool has_index() const noexcept { return index.has_value(); }

    friend bool operator==(const Token& lhs, const Token& rhs) {
        return lhs.name == rhs.name && lhs.index == rhs.index;
    }

    friend bool operator!=(const Token& lhs, const Token& rhs) {
        return !(lhs == rhs);
    }
};

using TokenSequence = std::vector<Token>;

/**
 * @brief Split a path expression into tokens
 *
 * @param path Path expression like "Child.Items[0].Title"
 * @return Tokens in path order
 *
 * Examples:
 * - "Child.Items[0].Title" → [Child, Items[0], Title]
 * - "  Child  .  Name  " → [Child, Name]
 * - "Tags[abc]" → [name "Tags[abc]", no index]
 * - "" → []
 */
TokenSequence tokenize_path(std::string_view path);

/**
 * @brief Render a token back to path syntax ("Items[0]")
 */
std::string to_string(const Token& token);

/**
 * @brief Render a token sequence back to a normalized path
 *
 * Examples:
 * - [Child, Items[0], Title] → "Child.Items[0].Title"
 * - [] → ""
 */
std::string join_tokens(const TokenSequence& tokens);

std::ostream& operator<<(std::ostream& os, const Token& token);

} // namespace pathexpr

#endif // PATHEXPR_TOKENIZER_HPP
