// Parses RFC 2254 filter strings, including LDAP v2 style escapes (\*, \(, \), \\)
// and the extensible match forms of RFC 4515 (attr:dn:rule:=value).

#ifndef LDAPWIRE_FILTER_PARSER_HPP
#define LDAPWIRE_FILTER_PARSER_HPP

#include "filter_tokenizer.hpp"

#include <spdlog/spdlog.h>

namespace LdapWire::Filter {

    struct ParseOptions {
        std::string_view default_filter = LDAPWIRE_DEFAULT_FILTER;
        size_t max_depth = LDAPWIRE_MAX_DEPTH;
    };

    inline FilterError invalid_escape(std::string reason) {
        return {FilterError::Kind::InvalidEscape, std::move(reason)};
    }

    inline int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline std::string hex_escape(uint8_t octet) {
        return fmt::format("\\{:02x}", octet);
    }

    // Length of the UTF-8 sequence starting at `text[i]`, or 0 when it is malformed.
    inline size_t utf8_sequence_length(std::string_view text, size_t i) {
        auto lead = uint8_t(text[i]);
        auto length = size_t{0};
        if (lead >= 0xc2 && lead <= 0xdf) {
            length = 2;
        } else if (lead >= 0xe0 && lead <= 0xef) {
            length = 3;
        } else if (lead >= 0xf0 && lead <= 0xf4) {
            length = 4;
        } else {
            return 0;
        }
        if (i + length > text.size()) return 0;
        for (auto k = size_t{1}; k < length; ++k) {
            if ((uint8_t(text[i + k]) & 0b11000000) != 0b10000000) return 0;
        }
        return length;
    }

    // Replaces \xx escapes with the octets they stand for. Characters that must
    // be escaped in a filter value are rejected.
    inline Result<Bytes::Octets> unescape(std::string_view text) {
        auto octets = Bytes::Octets();
        octets.reserve(text.size());

        auto escape = false;
        auto escape_start = false;
        auto escaped = 0;

        for (auto i = size_t{0}; i < text.size(); ++i) {
            auto c = text[i];
            auto octet = uint8_t(c);

            if (escape) {
                auto nibble = hex_value(c);
                EXP_REQUIRE(nibble >= 0, invalid_escape(fmt::format("Invalid value in escape sequence \"{}\"", c)));
                if (escape_start) {
                    escaped = nibble << 4;
                    escape_start = false;
                } else {
                    octets.push_back(char(escaped | nibble));
                    escape = false;
                }
            } else if (c == '\\') {
                escape = escape_start = true;
            } else if ((octet >= 0x01 && octet <= 0x27) || (octet >= 0x2b && octet <= 0x5b) || (octet >= 0x5d && octet <= 0x7f)) {
                octets.push_back(c);
            } else if (octet >= 0x80) {
                auto length = utf8_sequence_length(text, i);
                EXP_REQUIRE(length != 0,
                            invalid_escape(fmt::format("The invalid octet 0x{:02x} needs to be escaped as \"{}\"",
                                                       octet, hex_escape(octet))));
                octets.append(text.substr(i, length));
                i += length - 1;
            } else {
                return std::unexpected(invalid_escape(
                    fmt::format("The invalid character \"{}\" needs to be escaped as \"{}\"", c, hex_escape(octet))));
            }
        }

        EXP_REQUIRE(!escape, invalid_escape("Incomplete escape sequence"));
        return octets;
    }

    namespace detail {

        // \*, \(, \) and \\ become \2a, \28, \29 and \5c
        inline std::string convert_v2_escapes(std::string_view text) {
            auto result = std::string();
            result.reserve(text.size());
            for (auto i = size_t{0}; i < text.size(); ++i) {
                auto c = text[i];
                if (c == '\\' && i + 1 < text.size()) {
                    auto next = text[i + 1];
                    if (next == '*' || next == '(' || next == ')' || next == '\\') {
                        result += hex_escape(uint8_t(next));
                        ++i;
                        continue;
                    }
                }
                result.push_back(c);
            }
            return result;
        }

        inline Result<void> check_parentheses(std::string_view text) {
            EXP_REQUIRE(text.front() == '(', FilterError(FilterError::Kind::MissingLeftParen, "Missing left parenthesis"));
            EXP_REQUIRE(text.back() == ')', FilterError(FilterError::Kind::MissingRightParen, "Missing right parenthesis"));

            auto balance = 0;
            for (auto c : text) {
                if (c == '(') ++balance;
                if (c == ')') --balance;
            }
            EXP_REQUIRE(balance <= 0, FilterError(FilterError::Kind::MissingRightParen, "Missing right parenthesis"));
            EXP_REQUIRE(balance >= 0, FilterError(FilterError::Kind::MissingLeftParen, "Missing left parenthesis"));
            return {};
        }

        // Splits on '*' and keeps every '*' as a token of its own.
        inline std::vector<std::string_view> split_stars(std::string_view value) {
            auto tokens = std::vector<std::string_view>();
            auto start = size_t{0};
            for (auto i = size_t{0}; i < value.size(); ++i) {
                if (value[i] != '*') continue;
                if (i > start) tokens.push_back(value.substr(start, i - start));
                tokens.push_back(value.substr(i, 1));
                start = i + 1;
            }
            if (start < value.size()) tokens.push_back(value.substr(start));
            return tokens;
        }

        inline Result<Node> parse_substrings(std::string attribute, std::string_view value) {
            auto result = Substrings{std::move(attribute), std::nullopt, {}, std::nullopt};

            auto tokens = split_stars(value);
            auto last = std::string_view();
            for (auto count = size_t{1}; auto token : tokens) {
                if (token == "*") {
                    // "**": an empty 'any' between the two stars
                    if (last == "*") {
                        result.any.emplace_back();
                    }
                } else if (count == 1) {
                    result.initial = EXP_TRY(unescape(token));
                } else if (count < tokens.size()) {
                    result.any.push_back(EXP_TRY(unescape(token)));
                } else {
                    result.final = EXP_TRY(unescape(token));
                }
                last = token;
                ++count;
            }
            return Node{std::move(result)};
        }

        inline Node parse_extensible(std::string_view item, Bytes::Octets value) {
            auto result = ExtensibleMatch{std::nullopt, std::nullopt, std::move(value), false};

            auto first = item.front() != ':';
            while (!item.empty()) {
                auto colon = item.find(':');
                auto part = item.substr(0, colon);
                item = colon == std::string_view::npos ? std::string_view() : item.substr(colon + 1);
                if (part.empty()) {
                    first = false;
                    continue;
                }

                if (first) {
                    result.type = std::string(part);
                } else if (part == "dn") {
                    result.dn_attributes = true;
                } else {
                    result.matching_rule = std::string(part);
                }
                first = false;
            }
            return Node{std::move(result)};
        }

        class Parser {

            Tokenizer tokenizer;
            size_t max_depth;

            Result<Node> filter(size_t depth) {
                EXP_REQUIRE(depth < max_depth,
                            FilterError(FilterError::Kind::TooDeep, fmt::format("Filter nested deeper than {} levels", max_depth)));
                EXP_CHECK(tokenizer.left_paren());
                auto node = EXP_TRY(component(depth));
                EXP_CHECK(tokenizer.right_paren());
                return node;
            }

            Result<std::vector<Node>> filter_list(size_t depth) {
                auto children = std::vector<Node>();
                children.push_back(EXP_TRY(filter(depth + 1)));
                while (true) {
                    auto next = EXP_TRY(tokenizer.peek());
                    if (next != '(') break;
                    children.push_back(EXP_TRY(filter(depth + 1)));
                }
                return children;
            }

            Result<Node> component(size_t depth) {
                auto operator_or_attribute = EXP_TRY(tokenizer.operator_or_attribute());

                if (auto* tag = std::get_if<Tag>(&operator_or_attribute)) {
                    switch (*tag) {
                        case Tag::And:
                            return and_of(EXP_TRY(filter_list(depth)));
                        case Tag::Or:
                            return or_of(EXP_TRY(filter_list(depth)));
                        default:
                            return not_of(EXP_TRY(filter(depth + 1)));
                    }
                }

                auto attribute = std::get<std::string>(std::move(operator_or_attribute));
                auto type = EXP_TRY(tokenizer.filter_type());
                auto value = EXP_TRY(tokenizer.value());

                switch (type) {
                    case Tag::GreaterOrEqual:
                        return greater_or_equal(std::move(attribute), EXP_TRY(unescape(value)));
                    case Tag::LessOrEqual:
                        return less_or_equal(std::move(attribute), EXP_TRY(unescape(value)));
                    case Tag::ApproxMatch:
                        return approx(std::move(attribute), EXP_TRY(unescape(value)));
                    case Tag::ExtensibleMatch:
                        return parse_extensible(attribute, EXP_TRY(unescape(value)));
                    default:
                        break;
                }

                if (value == "*") {
                    return present(std::move(attribute));
                }
                if (value.find('*') != std::string_view::npos) {
                    return parse_substrings(std::move(attribute), value);
                }
                return equality(std::move(attribute), EXP_TRY(unescape(value)));
            }

        public:

            Parser(std::string_view text, size_t max_depth): tokenizer(text), max_depth(max_depth) {}

            Result<Node> parse() {
                auto node = EXP_TRY(filter(0));
                EXP_REQUIRE(tokenizer.at_end(),
                            FilterError(FilterError::Kind::TrailingCharacters,
                                        fmt::format("Unexpected characters after the filter at offset {}", tokenizer.position())));
                return node;
            }

        };

        inline Result<Node> parse(std::string_view text, ParseOptions const& options) {
            if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
                text = options.default_filter;
            }

            auto filter = convert_v2_escapes(text);
            EXP_REQUIRE(!filter.empty(), FilterError(FilterError::Kind::MissingLeftParen, "Missing left parenthesis"));

            // bare V2 filter: add the outer parentheses
            if (filter.front() != '(' && filter.back() != ')') {
                filter = "(" + filter + ")";
            }

            EXP_CHECK(check_parentheses(filter));
            return Parser(filter, options.max_depth).parse();
        }

    }

    inline Result<Node> parse(std::string_view text, ParseOptions const& options = {}) {
        auto result = detail::parse(text, options);
        if (!result) {
            spdlog::debug("filter \"{}\" rejected: {}", text, result.error().reason);
        }
        return result;
    }

}

#endif //LDAPWIRE_FILTER_PARSER_HPP
