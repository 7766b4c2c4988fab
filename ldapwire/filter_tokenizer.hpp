#ifndef LDAPWIRE_FILTER_TOKENIZER_HPP
#define LDAPWIRE_FILTER_TOKENIZER_HPP

#include "filter.hpp"

#include <fmt/format.h>

#include <string_view>
#include <variant>

namespace LdapWire::Filter {

    inline FilterError unexpected_end() {
        return {FilterError::Kind::UnexpectedEnd, "Unexpected end of filter"};
    }

    inline FilterError invalid_attribute(std::string reason) {
        return {FilterError::Kind::InvalidAttributeDescription, std::move(reason)};
    }

    inline bool is_ascii_alnum(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    }

    // AttributeDescription: letters, digits, '-', '.', options after ';',
    // and ':' for the extensible match forms.
    inline Result<void> validate_attribute_description(std::string_view attribute) {
        EXP_REQUIRE(!attribute.empty() && attribute.front() != ';',
                    invalid_attribute("Missing attribute description"));

        for (auto c : attribute) {
            if (is_ascii_alnum(c) || c == '-' || c == '.' || c == ';' || c == ':') continue;
            EXP_REQUIRE(c != '\\', invalid_attribute("Escape sequence not allowed in attribute description"));
            return std::unexpected(invalid_attribute(fmt::format("Invalid character \"{}\" in attribute description", c)));
        }

        EXP_REQUIRE(attribute.back() != ';',
                    invalid_attribute("Semicolon present, but no option specified"));
        return {};
    }

    // And, Or or Not when an operator comes next, the attribute description otherwise.
    using OperatorOrAttribute = std::variant<Tag, std::string>;

    class Tokenizer {

        std::string_view filter;
        size_t offset = 0;

        std::string_view rest() const {
            return filter.substr(offset);
        }

    public:

        explicit Tokenizer(std::string_view filter): filter(filter) {}

        bool at_end() const {
            return offset >= filter.size();
        }

        size_t position() const {
            return offset;
        }

        Result<char> peek() const {
            EXP_REQUIRE(!at_end(), unexpected_end());
            return filter[offset];
        }

        Result<void> left_paren() {
            EXP_REQUIRE(!at_end(), unexpected_end());
            EXP_REQUIRE(filter[offset] == '(',
                        FilterError(FilterError::Kind::MissingLeftParen,
                                    fmt::format("Expecting left parenthesis, found \"{}\"", filter[offset])));
            ++offset;
            return {};
        }

        Result<void> right_paren() {
            EXP_REQUIRE(!at_end(), unexpected_end());
            EXP_REQUIRE(filter[offset] == ')',
                        FilterError(FilterError::Kind::MissingRightParen,
                                    fmt::format("Expecting right parenthesis, found \"{}\"", filter[offset])));
            ++offset;
            return {};
        }

        Result<OperatorOrAttribute> operator_or_attribute() {
            EXP_REQUIRE(!at_end(), unexpected_end());

            switch (filter[offset]) {
                case '&':
                    ++offset;
                    return Tag::And;
                case '|':
                    ++offset;
                    return Tag::Or;
                case '!':
                    ++offset;
                    return Tag::Not;
                default:
                    break;
            }

            EXP_REQUIRE(!rest().starts_with(":="), invalid_attribute("Missing matching rule"));
            EXP_REQUIRE(!rest().starts_with("::=") && !rest().starts_with(":::="),
                        invalid_attribute("DN and matching rule not specified"));

            // attribute, or attribute with :dn and :matchingrule parts
            constexpr auto delimiters = std::string_view("=~<>()");
            auto start = offset;
            while (true) {
                EXP_REQUIRE(!at_end(), unexpected_end());
                if (delimiters.find(filter[offset]) != std::string_view::npos || rest().starts_with(":=")) break;
                ++offset;
            }

            auto attribute = filter.substr(start, offset - start);
            auto first = attribute.find_first_not_of(" \t");
            auto last = attribute.find_last_not_of(" \t");
            attribute = first == std::string_view::npos ? std::string_view() : attribute.substr(first, last - first + 1);

            EXP_CHECK(validate_attribute_description(attribute));
            return std::string(attribute);
        }

        // One of EqualityMatch, GreaterOrEqual, LessOrEqual, ApproxMatch, ExtensibleMatch.
        Result<Tag> filter_type() {
            EXP_REQUIRE(!at_end(), unexpected_end());

            constexpr std::pair<std::string_view, Tag> operators[] = {
                {">=", Tag::GreaterOrEqual},
                {"<=", Tag::LessOrEqual},
                {"~=", Tag::ApproxMatch},
                {":=", Tag::ExtensibleMatch},
                {"=", Tag::EqualityMatch},
            };
            for (auto const& [text, tag] : operators) {
                if (rest().starts_with(text)) {
                    offset += text.size();
                    return tag;
                }
            }
            return std::unexpected(FilterError(FilterError::Kind::InvalidComparisonOperator, "Invalid comparison operator"));
        }

        // Raw, still escaped, text up to the next ')'.
        Result<std::string_view> value() {
            EXP_REQUIRE(!at_end(), unexpected_end());

            auto end = filter.find(')', offset);
            if (end == std::string_view::npos) {
                end = filter.size();
            }
            auto result = filter.substr(offset, end - offset);
            offset = end;
            return result;
        }

    };

}

#endif //LDAPWIRE_FILTER_TOKENIZER_HPP
