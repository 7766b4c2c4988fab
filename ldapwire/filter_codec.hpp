// Lightweight Directory Access Protocol (LDAP): The Protocol, section 4.5.1
// https://datatracker.ietf.org/doc/html/rfc4511#section-4.5.1

// SubstringFilter ::= SEQUENCE {
//     type           AttributeDescription,
//     substrings     SEQUENCE SIZE (1..MAX) OF substring CHOICE {
//         initial [0] AssertionValue,  -- can occur at most once
//         any     [1] AssertionValue,
//         final   [2] AssertionValue } -- can occur at most once
//     }
//
// MatchingRuleAssertion ::= SEQUENCE {
//     matchingRule    [1] MatchingRuleId OPTIONAL,
//     type            [2] AttributeDescription OPTIONAL,
//     matchValue      [3] AssertionValue,
//     dnAttributes    [4] BOOLEAN DEFAULT FALSE }

#ifndef LDAPWIRE_FILTER_CODEC_HPP
#define LDAPWIRE_FILTER_CODEC_HPP

#include "asn1.hpp"
#include "filter.hpp"

#include <spdlog/spdlog.h>

namespace LdapWire::Filter {

    inline BER::Value to_asn1(Node const& node) {
        using namespace BER;

        auto tag = context_specific(to_int(node.tag()));
        auto children = [](std::vector<Node> const& nodes) {
            auto elements = std::vector<Value>();
            elements.reserve(nodes.size());
            for (auto const& child : nodes) {
                elements.push_back(to_asn1(child));
            }
            return elements;
        };

        return std::visit([&](auto const& value) -> Value {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, And> || std::is_same_v<T, Or>) {
                return implicit_tag(tag, set_of(children(value.children)));
            } else if constexpr (std::is_same_v<T, Not>) {
                return explicit_tag(tag, to_asn1(*value.child));
            } else if constexpr (std::is_same_v<T, Present>) {
                return implicit_tag(tag, octet_string(value.attribute));
            } else if constexpr (std::is_same_v<T, Substrings>) {
                auto parts = std::vector<Value>();
                if (value.initial) {
                    parts.push_back(implicit_tag(context_specific(to_int(SubstringTag::Initial)), octet_string(*value.initial)));
                }
                for (auto const& any : value.any) {
                    parts.push_back(implicit_tag(context_specific(to_int(SubstringTag::Any)), octet_string(any)));
                }
                if (value.final) {
                    parts.push_back(implicit_tag(context_specific(to_int(SubstringTag::Final)), octet_string(*value.final)));
                }
                return implicit_tag(tag, sequence({octet_string(value.attribute), sequence(std::move(parts))}));
            } else if constexpr (std::is_same_v<T, ExtensibleMatch>) {
                auto elements = std::vector<Value>();
                if (value.matching_rule) {
                    elements.push_back(implicit_tag(context_specific(1), octet_string(*value.matching_rule)));
                }
                if (value.type) {
                    elements.push_back(implicit_tag(context_specific(2), octet_string(*value.type)));
                }
                elements.push_back(implicit_tag(context_specific(3), octet_string(value.value)));
                if (value.dn_attributes) {
                    elements.push_back(implicit_tag(context_specific(4), boolean(true)));
                }
                return implicit_tag(tag, sequence(std::move(elements)));
            } else {
                // AttributeValueAssertion
                return implicit_tag(tag, sequence({octet_string(value.attribute), octet_string(value.value)}));
            }
        }, node.value);
    }

    namespace detail {

        inline BER::DecodeError unexpected_tag(BER::Identifier const& identifier, std::string_view where) {
            static constexpr char const* class_names[] = {"UNIVERSAL", "APPLICATION", "CONTEXT", "PRIVATE"};
            return {BER::DecodeError::Kind::UnexpectedTag,
                    fmt::format("{}: unexpected tag [{} {}]", where,
                                class_names[BER::to_int(identifier.tag_class)], identifier.tag_number)};
        }

        // AttributeDescription and AssertionValue are plain OCTET STRINGs.
        inline BER::Result<Bytes::Octets> string_of(BER::Value const& value, std::string_view where) {
            EXP_REQUIRE(value.identifier == BER::universal(BER::UniversalTag::OctetString),
                        unexpected_tag(value.identifier, where));
            return BER::octets_of(value);
        }

        inline BER::Result<Node> from_asn1(BER::Value const& value, size_t depth, size_t max_depth);

        inline BER::Result<std::vector<Node>> children_from_asn1(BER::Value const& value, size_t depth, size_t max_depth) {
            auto elements = EXP_TRY(BER::elements_of(value));
            EXP_REQUIRE(!elements.empty(), BER::invalid_content("filter: empty and/or"));

            auto children = std::vector<Node>();
            children.reserve(elements.size());
            for (auto const& element : elements) {
                children.push_back(EXP_TRY(from_asn1(element, depth + 1, max_depth)));
            }
            return children;
        }

        inline BER::Result<Node> substrings_from_asn1(BER::Value const& value) {
            auto elements = EXP_TRY(BER::elements_of(value));
            EXP_REQUIRE(elements.size() == 2, BER::invalid_content("substrings: expected type and substrings"));

            auto result = Substrings{EXP_TRY(string_of(elements[0], "substrings")), std::nullopt, {}, std::nullopt};

            EXP_REQUIRE(elements[1].identifier == BER::universal(BER::UniversalTag::Sequence, BER::Encoding::Constructed),
                        unexpected_tag(elements[1].identifier, "substrings"));
            auto parts = EXP_TRY(BER::elements_of(elements[1]));
            EXP_REQUIRE(!parts.empty(), BER::invalid_content("substrings: no substring"));

            for (auto i = size_t{0}; i < parts.size(); ++i) {
                auto const& identifier = parts[i].identifier;
                EXP_REQUIRE(identifier.tag_class == BER::TagClass::ContextSpecific && identifier.tag_number <= 2,
                            unexpected_tag(identifier, "substrings"));
                auto octets = EXP_TRY(BER::octets_of(parts[i]));

                switch (SubstringTag(identifier.tag_number)) {
                    case SubstringTag::Initial:
                        EXP_REQUIRE(i == 0, BER::invalid_content("substrings: initial is not the first substring"));
                        result.initial = std::move(octets);
                        break;
                    case SubstringTag::Any:
                        result.any.push_back(std::move(octets));
                        break;
                    case SubstringTag::Final:
                        EXP_REQUIRE(i + 1 == parts.size(), BER::invalid_content("substrings: final is not the last substring"));
                        result.final = std::move(octets);
                        break;
                }
            }
            return Node{std::move(result)};
        }

        inline BER::Result<Node> extensible_from_asn1(BER::Value const& value) {
            auto elements = EXP_TRY(BER::elements_of(value));
            auto result = ExtensibleMatch{std::nullopt, std::nullopt, {}, false};

            auto last = uint64_t{0};
            auto has_value = false;
            for (auto const& element : elements) {
                auto const& identifier = element.identifier;
                EXP_REQUIRE(identifier.tag_class == BER::TagClass::ContextSpecific &&
                            identifier.tag_number > last && identifier.tag_number <= 4,
                            unexpected_tag(identifier, "extensibleMatch"));
                last = identifier.tag_number;

                switch (identifier.tag_number) {
                    case 1:
                        result.matching_rule = EXP_TRY(BER::octets_of(element));
                        break;
                    case 2:
                        result.type = EXP_TRY(BER::octets_of(element));
                        break;
                    case 3:
                        result.value = EXP_TRY(BER::octets_of(element));
                        has_value = true;
                        break;
                    default:
                        result.dn_attributes = EXP_TRY(BER::boolean_of(element));
                        break;
                }
            }
            EXP_REQUIRE(has_value, BER::invalid_content("extensibleMatch: missing matchValue"));
            return Node{std::move(result)};
        }

        inline BER::Result<Node> assertion_from_asn1(Tag tag, BER::Value const& value) {
            auto elements = EXP_TRY(BER::elements_of(value));
            EXP_REQUIRE(elements.size() == 2, BER::invalid_content("AttributeValueAssertion: expected two values"));
            auto attribute = EXP_TRY(string_of(elements[0], "AttributeValueAssertion"));
            auto assertion = EXP_TRY(string_of(elements[1], "AttributeValueAssertion"));

            switch (tag) {
                case Tag::EqualityMatch:
                    return equality(std::move(attribute), std::move(assertion));
                case Tag::GreaterOrEqual:
                    return greater_or_equal(std::move(attribute), std::move(assertion));
                case Tag::LessOrEqual:
                    return less_or_equal(std::move(attribute), std::move(assertion));
                default:
                    return approx(std::move(attribute), std::move(assertion));
            }
        }

        inline BER::Result<Node> from_asn1(BER::Value const& value, size_t depth, size_t max_depth) {
            EXP_REQUIRE(depth < max_depth,
                        BER::DecodeError(BER::DecodeError::Kind::TooDeep,
                                         fmt::format("filter nested deeper than {} levels", max_depth)));

            auto const& identifier = value.identifier;
            EXP_REQUIRE(identifier.tag_class == BER::TagClass::ContextSpecific &&
                        identifier.tag_number <= BER::to_int(Tag::ExtensibleMatch),
                        unexpected_tag(identifier, "filter"));

            auto tag = Tag(identifier.tag_number);
            switch (tag) {
                case Tag::And:
                    return and_of(EXP_TRY(children_from_asn1(value, depth, max_depth)));
                case Tag::Or:
                    return or_of(EXP_TRY(children_from_asn1(value, depth, max_depth)));
                case Tag::Not: {
                    auto elements = EXP_TRY(BER::elements_of(value));
                    EXP_REQUIRE(elements.size() == 1,
                                BER::invalid_content(fmt::format("filter: not with {} filters", elements.size())));
                    return not_of(EXP_TRY(from_asn1(elements.front(), depth + 1, max_depth)));
                }
                case Tag::Substrings:
                    return substrings_from_asn1(value);
                case Tag::Present:
                    return present(EXP_TRY(BER::octets_of(value)));
                case Tag::ExtensibleMatch:
                    return extensible_from_asn1(value);
                default:
                    return assertion_from_asn1(tag, value);
            }
        }

    }

    // Filter nesting is limited to `max_depth` levels, the same limit the
    // parser and the builder apply.
    inline BER::Result<Node> from_asn1(BER::Value const& value, size_t max_depth = LDAPWIRE_MAX_DEPTH) {
        return detail::from_asn1(value, 0, max_depth);
    }

    // BER levels below the deepest filter: a substrings filter holds a
    // SEQUENCE of tagged strings.
    constexpr size_t leaf_levels = 2;

    // Decode options for the BER value holding a filter `options.max_depth`
    // levels deep, `envelope` levels below the outermost value.
    inline BER::DecodeOptions wire_options(BER::DecodeOptions options, size_t envelope = 0) {
        options.max_depth += envelope + leaf_levels;
        return options;
    }

    inline std::string encode(Node const& node) {
        auto bytes = BER::encode(to_asn1(node));
        spdlog::trace("filter encoded into {} octets", bytes.size());
        return bytes;
    }

    // `options.max_depth` limits filter nesting, as in ParseOptions.
    inline BER::Result<Node> decode(std::string_view bytes, BER::DecodeOptions const& options = {}) {
        auto value = EXP_TRY(BER::decode(bytes, wire_options(options)));
        return from_asn1(value, options.max_depth);
    }

    // The content octets of a Filter CHOICE whose identifier was already read.
    inline BER::Result<Node> decode_filter_content(BER::Identifier const& identifier, std::string_view content,
                                                   BER::DecodeOptions const& options = {}) {
        auto value = EXP_TRY(BER::decode_content(identifier, content, wire_options(options)));
        return from_asn1(value, options.max_depth);
    }

}

#endif //LDAPWIRE_FILTER_CODEC_HPP
