// Turns a filter tree back into its RFC 2254 string form. The output is not
// necessarily the text the tree was parsed from, but parses to an equal tree.

#ifndef LDAPWIRE_FILTER_RENDERER_HPP
#define LDAPWIRE_FILTER_RENDERER_HPP

#include "filter_parser.hpp"

#include <ostream>
#include <vector>

namespace LdapWire::Filter {

    // Escapes everything `unescape` would refuse to take literally.
    inline std::string escape(std::string_view value) {
        auto result = std::string();
        result.reserve(value.size());
        for (auto i = size_t{0}; i < value.size(); ++i) {
            auto octet = uint8_t(value[i]);
            if (octet >= 0x80) {
                auto length = utf8_sequence_length(value, i);
                if (length == 0) {
                    result += hex_escape(octet);
                } else {
                    result.append(value.substr(i, length));
                    i += length - 1;
                }
                continue;
            }
            switch (octet) {
                case 0x00:
                case '(':
                case ')':
                case '*':
                case '\\':
                    result += hex_escape(octet);
                    break;
                default:
                    result.push_back(char(octet));
            }
        }
        return result;
    }

    namespace detail {

        inline std::string_view operator_text(Tag tag) {
            switch (tag) {
                case Tag::GreaterOrEqual: return ">=";
                case Tag::LessOrEqual: return "<=";
                case Tag::ApproxMatch: return "~=";
                case Tag::ExtensibleMatch: return ":=";
                default: return "=";
            }
        }

        inline std::string render_substrings(Substrings const& node) {
            auto result = node.attribute + "=";
            auto star = false;
            if (node.initial) {
                result += escape(*node.initial) + "*";
                star = true;
            }
            for (auto const& any : node.any) {
                if (!star) result += "*";
                result += escape(any) + "*";
                star = true;
            }
            if (node.final) {
                if (!star) result += "*";
                result += escape(*node.final);
            }
            return result;
        }

        inline std::string render_extensible(ExtensibleMatch const& node) {
            auto result = node.type.value_or("");
            if (node.dn_attributes) result += ":dn";
            if (node.matching_rule) result += ":" + *node.matching_rule;
            return result + ":=" + escape(node.value);
        }

    }

    // Depth-first walk over a tree, handing out the rendered text one piece at
    // a time. A Traversal is consumed by reading it; it cannot be restarted.
    class Traversal {

        // Either a node still to expand or text ready to hand out.
        using Item = std::variant<Node const*, std::string_view>;

        std::vector<Item> pending;

        void expand_children(std::string_view open, std::vector<Node> const& children) {
            pending.emplace_back(std::string_view(")"));
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.emplace_back(&*it);
            }
            pending.emplace_back(open);
        }

        std::string leaf(Node const& node) const {
            return std::visit([&](auto const& value) -> std::string {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, Present>) {
                    return "(" + value.attribute + "=*)";
                } else if constexpr (std::is_same_v<T, Substrings>) {
                    return "(" + detail::render_substrings(value) + ")";
                } else if constexpr (std::is_same_v<T, ExtensibleMatch>) {
                    return "(" + detail::render_extensible(value) + ")";
                } else if constexpr (std::is_same_v<T, EqualityMatch> || std::is_same_v<T, GreaterOrEqual> ||
                                     std::is_same_v<T, LessOrEqual> || std::is_same_v<T, ApproxMatch>) {
                    return fmt::format("({}{}{})", value.attribute, detail::operator_text(node.tag()), escape(value.value));
                } else {
                    return {};
                }
            }, node.value);
        }

    public:

        explicit Traversal(Node const& root) {
            pending.emplace_back(&root);
        }

        std::optional<std::string> next() {
            while (!pending.empty()) {
                auto item = pending.back();
                pending.pop_back();

                if (auto* text = std::get_if<std::string_view>(&item)) {
                    return std::string(*text);
                }

                auto const& node = *std::get<Node const*>(item);
                switch (node.tag()) {
                    case Tag::And:
                        expand_children("(&", node.as<And>().children);
                        break;
                    case Tag::Or:
                        expand_children("(|", node.as<Or>().children);
                        break;
                    case Tag::Not:
                        pending.emplace_back(std::string_view(")"));
                        pending.emplace_back(node.as<Not>().child.get());
                        pending.emplace_back(std::string_view("(!"));
                        break;
                    default:
                        return leaf(node);
                }
            }
            return std::nullopt;
        }

    };

    inline std::string render(Node const& node) {
        auto result = std::string();
        auto traversal = Traversal(node);
        while (auto piece = traversal.next()) {
            result += *piece;
        }
        return result;
    }

    inline std::ostream& operator<<(std::ostream& stream, Node const& node) {
        return stream << render(node);
    }

}

#endif //LDAPWIRE_FILTER_RENDERER_HPP
