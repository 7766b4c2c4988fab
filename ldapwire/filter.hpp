// Lightweight Directory Access Protocol (LDAP): String Representation of Search Filters
// https://datatracker.ietf.org/doc/html/rfc2254

// Filter ::= CHOICE {
//     and             [0] SET SIZE (1..MAX) OF filter Filter,
//     or              [1] SET SIZE (1..MAX) OF filter Filter,
//     not             [2] Filter,
//     equalityMatch   [3] AttributeValueAssertion,
//     substrings      [4] SubstringFilter,
//     greaterOrEqual  [5] AttributeValueAssertion,
//     lessOrEqual     [6] AttributeValueAssertion,
//     present         [7] AttributeDescription,
//     approxMatch     [8] AttributeValueAssertion,
//     extensibleMatch [9] MatchingRuleAssertion,
//     ... }

#ifndef LDAPWIRE_FILTER_HPP
#define LDAPWIRE_FILTER_HPP

#include "bytes.hpp"
#include "config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace LdapWire::Filter {

    enum class Tag {
        And = 0,
        Or = 1,
        Not = 2,
        EqualityMatch = 3,
        Substrings = 4,
        GreaterOrEqual = 5,
        LessOrEqual = 6,
        Present = 7,
        ApproxMatch = 8,
        ExtensibleMatch = 9,
    };

    enum class SubstringTag {
        Initial = 0,
        Any = 1,
        Final = 2,
    };

    struct FilterError {

        enum class Kind {
            UnexpectedEnd,
            MissingLeftParen,
            MissingRightParen,
            InvalidAttributeDescription,
            InvalidComparisonOperator,
            InvalidEscape,
            BuilderProtocolViolation,
            TrailingCharacters,
            TooDeep,
        };

        Kind kind;
        std::string reason;

        bool operator==(FilterError const&) const = default;

    };

    template<typename T>
    using Result = std::expected<T, FilterError>;

    struct Node;

    template<Tag tag>
    struct Nested {
        std::vector<Node> children;
        bool operator==(Nested const&) const;
    };

    using And = Nested<Tag::And>;
    using Or = Nested<Tag::Or>;

    struct Not {
        std::unique_ptr<Node> child;

        explicit Not(Node child);
        Not(Not const& that);
        Not(Not&&) noexcept = default;
        Not& operator=(Not const& that);
        Not& operator=(Not&&) noexcept = default;

        bool operator==(Not const& that) const;
    };

    template<Tag tag>
    struct AttributeValueAssertion {
        std::string attribute;
        Bytes::Octets value;
        bool operator==(AttributeValueAssertion const&) const = default;
    };

    using EqualityMatch = AttributeValueAssertion<Tag::EqualityMatch>;
    using GreaterOrEqual = AttributeValueAssertion<Tag::GreaterOrEqual>;
    using LessOrEqual = AttributeValueAssertion<Tag::LessOrEqual>;
    using ApproxMatch = AttributeValueAssertion<Tag::ApproxMatch>;

    struct Present {
        std::string attribute;
        bool operator==(Present const&) const = default;
    };

    struct Substrings {
        std::string attribute;
        std::optional<Bytes::Octets> initial;
        std::vector<Bytes::Octets> any;
        std::optional<Bytes::Octets> final;
        bool operator==(Substrings const&) const = default;
    };

    struct ExtensibleMatch {
        std::optional<std::string> matching_rule;
        std::optional<std::string> type;
        Bytes::Octets value;
        bool dn_attributes = false;
        bool operator==(ExtensibleMatch const&) const = default;
    };

    struct Node {

        // alternatives are listed in CHOICE tag order
        using Variant = std::variant<And, Or, Not, EqualityMatch, Substrings, GreaterOrEqual,
                                     LessOrEqual, Present, ApproxMatch, ExtensibleMatch>;

        Variant value;

        Tag tag() const {
            return Tag(value.index());
        }

        template<typename T>
        bool is() const {
            return std::holds_alternative<T>(value);
        }

        template<typename T>
        T const& as() const {
            return std::get<T>(value);
        }

        bool operator==(Node const&) const = default;

    };

    template<Tag tag>
    bool Nested<tag>::operator==(Nested const& that) const {
        return children == that.children;
    }

    inline Not::Not(Node child):
        child(std::make_unique<Node>(std::move(child))) {}

    inline Not::Not(Not const& that):
        child(std::make_unique<Node>(*that.child)) {}

    inline Not& Not::operator=(Not const& that) {
        child = std::make_unique<Node>(*that.child);
        return *this;
    }

    inline bool Not::operator==(Not const& that) const {
        return *child == *that.child;
    }

    inline Node and_of(std::vector<Node> children) {
        return Node{And{std::move(children)}};
    }

    inline Node or_of(std::vector<Node> children) {
        return Node{Or{std::move(children)}};
    }

    inline Node not_of(Node child) {
        return Node{Not(std::move(child))};
    }

    inline Node equality(std::string attribute, Bytes::Octets value) {
        return Node{EqualityMatch{std::move(attribute), std::move(value)}};
    }

    inline Node greater_or_equal(std::string attribute, Bytes::Octets value) {
        return Node{GreaterOrEqual{std::move(attribute), std::move(value)}};
    }

    inline Node less_or_equal(std::string attribute, Bytes::Octets value) {
        return Node{LessOrEqual{std::move(attribute), std::move(value)}};
    }

    inline Node approx(std::string attribute, Bytes::Octets value) {
        return Node{ApproxMatch{std::move(attribute), std::move(value)}};
    }

    inline Node present(std::string attribute) {
        return Node{Present{std::move(attribute)}};
    }

    inline Node substrings(std::string attribute, std::optional<Bytes::Octets> initial,
                           std::vector<Bytes::Octets> any, std::optional<Bytes::Octets> final) {
        return Node{Substrings{std::move(attribute), std::move(initial), std::move(any), std::move(final)}};
    }

    inline Node extensible(std::optional<std::string> matching_rule, std::optional<std::string> type,
                           Bytes::Octets value, bool dn_attributes = false) {
        return Node{ExtensibleMatch{std::move(matching_rule), std::move(type), std::move(value), dn_attributes}};
    }

}

#endif //LDAPWIRE_FILTER_HPP
