// Programmatic construction of a filter, one component at a time, in the same
// order the components appear in the string form:
//
//     builder.start_nested(Tag::And);
//     builder.add_attribute_assertion(Tag::EqualityMatch, "objectClass", "person");
//     builder.start_substrings("cn");
//     builder.add_substring(SubstringTag::Initial, "Jo");
//     builder.end_substrings();
//     builder.end_nested(Tag::And);
//     auto filter = std::move(builder).build();    // (&(objectClass=person)(cn=Jo*))

#ifndef LDAPWIRE_FILTER_BUILDER_HPP
#define LDAPWIRE_FILTER_BUILDER_HPP

#include "filter_tokenizer.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace LdapWire::Filter {

    inline FilterError protocol_violation(std::string reason) {
        return {FilterError::Kind::BuilderProtocolViolation, std::move(reason)};
    }

    class Builder {

        struct NestedFrame {
            Tag kind;
            std::vector<Node> children;
        };

        struct SubstringFrame {
            Substrings substrings;
            size_t count = 0;
            bool final_found = false;
        };

        using Frame = std::variant<NestedFrame, SubstringFrame>;

        std::vector<Frame> stack;
        std::optional<Node> root;
        size_t max_depth;

        bool in_substrings() const {
            return !stack.empty() && std::holds_alternative<SubstringFrame>(stack.back());
        }

        // Checks that a new component fits at the current position: below the
        // depth limit, and not a second child of a 'not' or a second top-level filter.
        Result<void> check_slot() const {
            EXP_REQUIRE(stack.size() < max_depth,
                        FilterError(FilterError::Kind::TooDeep, fmt::format("Filter nested deeper than {} levels", max_depth)));
            if (stack.empty()) {
                EXP_REQUIRE(!root, protocol_violation("Filter is already complete"));
                return {};
            }
            auto const& parent = std::get<NestedFrame>(stack.back());
            EXP_REQUIRE(parent.kind != Tag::Not || parent.children.empty(),
                        protocol_violation("Attempt to create more than one 'not' sub-filter"));
            return {};
        }

        // Callers have already ruled out an open substring filter.
        Result<void> add(Node node) {
            EXP_CHECK(check_slot());
            if (stack.empty()) {
                root = std::move(node);
            } else {
                std::get<NestedFrame>(stack.back()).children.push_back(std::move(node));
            }
            return {};
        }

    public:

        // `max_depth` limits filter nesting, as in ParseOptions.
        explicit Builder(size_t max_depth = LDAPWIRE_MAX_DEPTH): max_depth(max_depth) {}

        Result<void> start_nested(Tag kind) {
            EXP_REQUIRE(kind == Tag::And || kind == Tag::Or || kind == Tag::Not,
                        protocol_violation("Attempt to create a nested filter other than AND, OR or NOT"));
            EXP_REQUIRE(!in_substrings(), protocol_violation("Cannot start a nested filter in a substring"));
            EXP_CHECK(check_slot());
            stack.push_back(NestedFrame{kind, {}});
            return {};
        }

        Result<void> end_nested(Tag kind) {
            auto* nested = stack.empty() ? nullptr : std::get_if<NestedFrame>(&stack.back());
            EXP_REQUIRE(nested && nested->kind == kind, protocol_violation("Mismatched ending of nested filter"));
            EXP_REQUIRE(!nested->children.empty(), protocol_violation("Empty nested filter"));

            auto frame = std::move(*nested);
            stack.pop_back();
            switch (frame.kind) {
                case Tag::And:
                    return add(and_of(std::move(frame.children)));
                case Tag::Or:
                    return add(or_of(std::move(frame.children)));
                default:
                    return add(not_of(std::move(frame.children.front())));
            }
        }

        Result<void> start_substrings(std::string attribute) {
            EXP_REQUIRE(!in_substrings(), protocol_violation("Cannot start a substring filter in a substring"));
            EXP_CHECK(check_slot());
            EXP_CHECK(validate_attribute_description(attribute));
            stack.push_back(SubstringFrame{Substrings{std::move(attribute), std::nullopt, {}, std::nullopt}});
            return {};
        }

        // A substring filter holds at most one Initial, which must come first,
        // any number of Any, and at most one Final, which must come last.
        Result<void> add_substring(SubstringTag type, Bytes::Octets value) {
            EXP_REQUIRE(in_substrings(), protocol_violation("Substring added outside of a substring filter"));
            auto& frame = std::get<SubstringFrame>(stack.back());

            EXP_REQUIRE(type != SubstringTag::Initial || frame.count == 0,
                        protocol_violation("Attempt to add an initial substring match after the first substring"));
            EXP_REQUIRE(!frame.final_found,
                        protocol_violation("Attempt to add a substring match after a final substring match"));

            switch (type) {
                case SubstringTag::Initial:
                    frame.substrings.initial = std::move(value);
                    break;
                case SubstringTag::Any:
                    frame.substrings.any.push_back(std::move(value));
                    break;
                case SubstringTag::Final:
                    frame.substrings.final = std::move(value);
                    frame.final_found = true;
                    break;
            }
            ++frame.count;
            return {};
        }

        Result<void> end_substrings() {
            EXP_REQUIRE(in_substrings(), protocol_violation("Mismatched ending of substrings"));
            auto& frame = std::get<SubstringFrame>(stack.back());
            EXP_REQUIRE(frame.count != 0, protocol_violation("Empty substring filter"));

            auto substrings = std::move(frame.substrings);
            stack.pop_back();
            return add(Node{std::move(substrings)});
        }

        Result<void> add_attribute_assertion(Tag type, std::string attribute, Bytes::Octets value) {
            EXP_REQUIRE(!in_substrings(), protocol_violation("Cannot insert an attribute assertion in a substring"));
            EXP_CHECK(validate_attribute_description(attribute));

            switch (type) {
                case Tag::EqualityMatch:
                    return add(equality(std::move(attribute), std::move(value)));
                case Tag::GreaterOrEqual:
                    return add(greater_or_equal(std::move(attribute), std::move(value)));
                case Tag::LessOrEqual:
                    return add(less_or_equal(std::move(attribute), std::move(value)));
                case Tag::ApproxMatch:
                    return add(approx(std::move(attribute), std::move(value)));
                default:
                    return std::unexpected(protocol_violation("Invalid filter type for AttributeValueAssertion"));
            }
        }

        Result<void> add_present(std::string attribute) {
            EXP_REQUIRE(!in_substrings(), protocol_violation("Cannot insert a present match in a substring"));
            EXP_CHECK(validate_attribute_description(attribute));
            return add(present(std::move(attribute)));
        }

        Result<void> add_extensible_match(std::optional<std::string> matching_rule, std::optional<std::string> type,
                                          Bytes::Octets value, bool dn_attributes = false) {
            EXP_REQUIRE(!in_substrings(), protocol_violation("Cannot insert an extensible match in a substring"));
            EXP_REQUIRE(matching_rule || type, protocol_violation("Extensible match needs a matching rule or a type"));
            if (type) {
                EXP_CHECK(validate_attribute_description(*type));
            }
            return add(extensible(std::move(matching_rule), std::move(type), std::move(value), dn_attributes));
        }

        bool complete() const {
            return stack.empty() && root.has_value();
        }

        Result<Node> build() && {
            EXP_REQUIRE(complete(), protocol_violation("Filter is not complete"));
            return std::move(*root);
        }

    };

}

#endif //LDAPWIRE_FILTER_BUILDER_HPP
