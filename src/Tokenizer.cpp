/**
 * @file Tokenizer.cpp
 * @brief Implementation of path tokenization
 */

#include "pathexpr/Tokenizer.hpp"

#include <charconv>
#include <sstream>
#include <system_error>

namespace pathexpr {

namespace {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";

    std::string_view trim(std::string_view s) {
        const auto start = s.find_first_not_of(kWhitespace);
        if (start == std::string_view::npos) return {};
        const auto end = s.find_last_not_of(kWhitespace);
        return s.substr(start, end - start + 1);
    }

    /**
     * @brief Parse bracket content as a non-negative base-10 index
     * @return The index, or std::nullopt for empty, signed, fractional,
     *         non-numeric or overflowing content
     */
    std::optional<std::size_t> parse_index(std::string_view content) {
        content = trim(content);
        if (content.empty()) return std::nullopt;

        const char* first = content.data();
        const char* last = first + content.size();
        std::size_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value, 10);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    Token make_token(std::string_view segment) {
        Token token{std::string(segment), std::nullopt};

        if (segment.size() < 2 || segment.back() != ']') {
            return token;
        }
        const auto open = segment.rfind('[');
        if (open == std::string_view::npos) {
            return token;
        }

        auto index = parse_index(segment.substr(open + 1, segment.size() - open - 2));
        if (!index) {
            // Malformed indexer folds back into the name
            return token;
        }

        token.name = std::string(segment.substr(0, open));
        token.index = index;
        return token;
    }
}

TokenSequence tokenize_path(std::string_view path) {
    TokenSequence tokens;
    std::size_t start = 0;

    while (start <= path.size()) {
        auto end = path.find('.', start);
        if (end == std::string_view::npos) end = path.size();

        const auto segment = trim(path.substr(start, end - start));
        if (!segment.empty()) {
            tokens.push_back(make_token(segment));
        }
        start = end + 1;
    }

    return tokens;
}

std::string to_string(const Token& token) {
    if (!token.has_index()) {
        return token.name;
    }
    return token.name + "[" + std::to_string(*token.index) + "]";
}

std::string join_tokens(const TokenSequence& tokens) {
    std::ostringstream oss;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) oss << '.';
        oss << to_string(tokens[i]);
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Token& token) {
    return os << to_string(token);
}

} // namespace pathexpr
