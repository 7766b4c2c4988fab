// Constructed values on top of the primitive BER codec: SEQUENCE, SET OF and
// explicitly/implicitly tagged values, encoded and decoded as one value tree.

#ifndef LDAPWIRE_ASN1_HPP
#define LDAPWIRE_ASN1_HPP

#include "ber.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <ostream>
#include <variant>
#include <vector>

namespace LdapWire::BER {

    struct Value;

    struct Boolean {
        bool value;
        bool operator==(Boolean const&) const = default;
    };

    // INTEGER and ENUMERATED; the identifier tells them apart
    struct Integer {
        int64_t value;
        bool operator==(Integer const&) const = default;
    };

    struct Null {
        bool operator==(Null const&) const = default;
    };

    struct OctetString {
        Bytes::Octets value;
        bool operator==(OctetString const&) const = default;
    };

    struct Sequence {
        std::vector<Value> elements;
        bool operator==(Sequence const&) const;
    };

    // Insertion order is kept on the wire but carries no meaning.
    struct SetOf {
        std::vector<Value> elements;
        bool operator==(SetOf const&) const;
    };

    struct Tagged {
        std::unique_ptr<Value> inner;
        bool explicit_;

        Tagged(Value inner, bool explicit_);
        Tagged(Tagged const& that);
        Tagged(Tagged&&) noexcept = default;
        Tagged& operator=(Tagged const& that);
        Tagged& operator=(Tagged&&) noexcept = default;

        bool operator==(Tagged const& that) const;
    };

    struct Value {

        using Node = std::variant<Boolean, Integer, Null, OctetString, Sequence, SetOf, Tagged>;

        Identifier identifier;
        Node node;

        bool constructed() const {
            return identifier.constructed();
        }

        template<typename T>
        bool is() const {
            return std::holds_alternative<T>(node);
        }

        template<typename T>
        T const& as() const {
            return std::get<T>(node);
        }

        bool operator==(Value const&) const = default;

    };

    inline bool Sequence::operator==(Sequence const& that) const {
        return elements == that.elements;
    }

    inline bool SetOf::operator==(SetOf const& that) const {
        return elements == that.elements;
    }

    inline Tagged::Tagged(Value inner, bool explicit_):
        inner(std::make_unique<Value>(std::move(inner))),
        explicit_(explicit_) {}

    inline Tagged::Tagged(Tagged const& that):
        inner(std::make_unique<Value>(*that.inner)),
        explicit_(that.explicit_) {}

    inline Tagged& Tagged::operator=(Tagged const& that) {
        inner = std::make_unique<Value>(*that.inner);
        explicit_ = that.explicit_;
        return *this;
    }

    inline bool Tagged::operator==(Tagged const& that) const {
        return explicit_ == that.explicit_ && *inner == *that.inner;
    }

    inline Value boolean(bool value) {
        return Value{universal(UniversalTag::Boolean), Boolean{value}};
    }

    inline Value integer(int64_t value) {
        return Value{universal(UniversalTag::Integer), Integer{value}};
    }

    inline Value enumerated(int64_t value) {
        return Value{universal(UniversalTag::Enumerated), Integer{value}};
    }

    inline Value null() {
        return Value{universal(UniversalTag::Null), Null{}};
    }

    inline Value octet_string(Bytes::Octets value) {
        return Value{universal(UniversalTag::OctetString), OctetString{std::move(value)}};
    }

    inline Value sequence(std::vector<Value> elements) {
        return Value{universal(UniversalTag::Sequence, Encoding::Constructed), Sequence{std::move(elements)}};
    }

    inline Value set_of(std::vector<Value> elements) {
        return Value{universal(UniversalTag::Set, Encoding::Constructed), SetOf{std::move(elements)}};
    }

    // Wraps the complete encoding of `inner` under a new, constructed identifier.
    inline Value explicit_tag(Identifier identifier, Value inner) {
        return Value{identifier.with_encoding(Encoding::Constructed), Tagged(std::move(inner), true)};
    }

    // Replaces the identifier of `inner`; the primitive/constructed form stays the inner one.
    inline Value implicit_tag(Identifier identifier, Value inner) {
        auto encoding = inner.identifier.encoding;
        return Value{identifier.with_encoding(encoding), Tagged(std::move(inner), false)};
    }

    namespace detail {

        inline void write_content(Bytes::StringWriter& writer, Value const& value);

        inline void write_value(Bytes::StringWriter& writer, Identifier const& identifier, Value const& value) {
            // children are encoded first so the length is known up front
            auto content = Bytes::StringWriter();
            write_content(content, value);
            write_header(writer, identifier, content.string.size());
            writer.write(content.string);
        }

        inline void write_content(Bytes::StringWriter& writer, Value const& value) {
            std::visit([&](auto const& node) {
                using Node = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<Node, Boolean>) {
                    write_boolean(writer, node.value);
                } else if constexpr (std::is_same_v<Node, Integer>) {
                    write_integer(writer, node.value);
                } else if constexpr (std::is_same_v<Node, Null>) {
                    // nothing to write
                } else if constexpr (std::is_same_v<Node, OctetString>) {
                    writer.write(node.value);
                } else if constexpr (std::is_same_v<Node, Sequence> || std::is_same_v<Node, SetOf>) {
                    for (auto const& element : node.elements) {
                        write_value(writer, element.identifier, element);
                    }
                } else if constexpr (std::is_same_v<Node, Tagged>) {
                    if (node.explicit_) {
                        write_value(writer, node.inner->identifier, *node.inner);
                    } else {
                        write_content(writer, *node.inner);
                    }
                }
            }, value.node);
        }

    }

    inline void write(Bytes::StringWriter& writer, Value const& value) {
        detail::write_value(writer, value.identifier, value);
    }

    inline std::string encode(Value const& value) {
        auto writer = Bytes::StringWriter();
        write(writer, value);
        return std::move(writer.string);
    }

    namespace detail {

        inline Result<Value> read_value(Bytes::StringViewReader& reader, DecodeOptions const& options, size_t depth);

        inline Result<std::vector<Value>> read_elements(Bytes::StringViewReader& content, DecodeOptions const& options, size_t depth) {
            auto elements = std::vector<Value>();
            while (!content.empty()) {
                elements.push_back(EXP_TRY(read_value(content, options, depth + 1)));
            }
            return elements;
        }

        inline Result<Value> read_content(Identifier const& identifier, Bytes::StringViewReader& content,
                                          DecodeOptions const& options, size_t depth) {
            EXP_REQUIRE(depth < options.max_depth,
                        DecodeError(DecodeError::Kind::TooDeep,
                                    fmt::format("nesting deeper than {} values", options.max_depth)));

            if (!identifier.universal()) {
                // The schema decides what an implicit tag hides; keep the raw shape.
                if (identifier.constructed()) {
                    auto elements = EXP_TRY(read_elements(content, options, depth));
                    auto inner = Value{universal(UniversalTag::Sequence, Encoding::Constructed), Sequence{std::move(elements)}};
                    return Value{identifier, Tagged(std::move(inner), false)};
                }
                auto inner = octet_string(Bytes::Octets(content.string));
                return Value{identifier, Tagged(std::move(inner), false)};
            }

            auto tag = identifier.tag_number;
            auto form = (tag == UniversalTag::Sequence || tag == UniversalTag::Set) ? Encoding::Constructed : Encoding::Primitive;
            // LDAP only allows the primitive form for OCTET STRING as well
            EXP_REQUIRE(identifier.encoding == form,
                        invalid_content(fmt::format("universal tag {} in {} form", tag,
                                                    identifier.constructed() ? "constructed" : "primitive")));

            switch (tag) {
                case UniversalTag::Boolean:
                    return Value{identifier, Boolean{EXP_TRY(read_boolean(content))}};
                case UniversalTag::Integer:
                case UniversalTag::Enumerated:
                    return Value{identifier, Integer{EXP_TRY(read_integer(content))}};
                case UniversalTag::Null:
                    EXP_REQUIRE(content.empty(), invalid_content(fmt::format("NULL: {} content octets", content.size())));
                    return null();
                case UniversalTag::OctetString:
                    return octet_string(Bytes::Octets(content.string));
                case UniversalTag::Sequence:
                    return sequence(EXP_TRY(read_elements(content, options, depth)));
                case UniversalTag::Set:
                    return set_of(EXP_TRY(read_elements(content, options, depth)));
                default:
                    return std::unexpected(invalid_content(fmt::format("unsupported universal tag {}", tag)));
            }
        }

        inline Result<Value> read_value(Bytes::StringViewReader& reader, DecodeOptions const& options, size_t depth) {
            auto [identifier, content] = EXP_TRY(read_header(reader, options));
            return read_content(identifier, content, options, depth);
        }

    }

    // One complete value from the front of `bytes`, with the octets it used.
    inline Result<Decoded<Value>> decode_prefix(std::string_view bytes, DecodeOptions const& options = {}) {
        auto reader = Bytes::StringViewReader{bytes};
        auto value = detail::read_value(reader, options, 0);
        if (!value) {
            spdlog::debug("BER decode failed: {}", value.error().reason);
            return std::unexpected(std::move(value).error());
        }
        return Decoded<Value>{std::move(*value), bytes.size() - reader.size()};
    }

    inline Result<Value> decode(std::string_view bytes, DecodeOptions const& options = {}) {
        auto decoded = EXP_TRY(decode_prefix(bytes, options));
        EXP_REQUIRE(decoded.consumed == bytes.size(),
                    invalid_content(fmt::format("{} trailing octets after value", bytes.size() - decoded.consumed)));
        return std::move(decoded.value);
    }

    // Content octets whose identifier was already taken off by the caller.
    inline Result<Value> decode_content(Identifier const& identifier, std::string_view content, DecodeOptions const& options = {}) {
        auto reader = Bytes::StringViewReader{content};
        auto value = detail::read_content(identifier, reader, options, 0);
        if (!value) {
            spdlog::debug("BER decode failed: {}", value.error().reason);
        }
        return value;
    }

    // Readers for schema-aware layers. A value may come straight from the
    // factories above or from `decode`, which keeps implicitly tagged children
    // as a SEQUENCE and implicitly tagged primitives as raw content octets.
    inline Result<std::vector<Value>> elements_of(Value const& value) {
        EXP_REQUIRE(value.constructed(), invalid_content("expected a constructed value"));
        if (value.is<Sequence>()) return value.as<Sequence>().elements;
        if (value.is<SetOf>()) return value.as<SetOf>().elements;
        EXP_REQUIRE(value.is<Tagged>(), invalid_content("expected a constructed value"));

        auto const& tagged = value.as<Tagged>();
        if (tagged.explicit_) {
            return std::vector<Value>{*tagged.inner};
        }
        return elements_of(*tagged.inner);
    }

    inline Result<Bytes::Octets> octets_of(Value const& value) {
        EXP_REQUIRE(!value.constructed(), invalid_content("expected a primitive value"));
        if (value.is<OctetString>()) return value.as<OctetString>().value;
        EXP_REQUIRE(value.is<Tagged>() && !value.as<Tagged>().explicit_,
                    invalid_content("expected an OCTET STRING"));
        return octets_of(*value.as<Tagged>().inner);
    }

    inline Result<bool> boolean_of(Value const& value) {
        if (value.is<Boolean>()) return value.as<Boolean>().value;
        if (value.is<Tagged>() && value.as<Tagged>().inner->is<Boolean>()) {
            return value.as<Tagged>().inner->as<Boolean>().value;
        }
        // received from the wire: the content octets were kept as they are
        auto octets = EXP_TRY(octets_of(value));
        auto reader = Bytes::StringViewReader{octets};
        return read_boolean(reader);
    }

    // INTEGER or ENUMERATED, whichever universal `tag` names.
    inline Result<int64_t> integer_of(Value const& value, uint64_t tag = UniversalTag::Integer) {
        EXP_REQUIRE(value.identifier == universal(tag) && value.is<Integer>(),
                    DecodeError(DecodeError::Kind::UnexpectedTag,
                                fmt::format("expected universal tag {}, found {}", tag, value.identifier.tag_number)));
        return value.as<Integer>().value;
    }

    inline std::ostream& operator<<(std::ostream& stream, Value const& value) {
        static constexpr char const* class_names[] = {"[UNIVERSAL ", "[APPLICATION ", "[CONTEXT ", "[PRIVATE "};
        stream << class_names[to_int(value.identifier.tag_class)] << value.identifier.tag_number << "] ";

        auto elements = [&](char const* name, std::vector<Value> const& elements) {
            stream << name << ": { ";
            for (auto i = size_t{0}; i < elements.size(); ++i) {
                if (i) stream << ", ";
                stream << elements[i];
            }
            stream << " }";
        };

        std::visit([&](auto const& node) {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, Boolean>) {
                stream << "BOOLEAN: " << (node.value ? "true" : "false");
            } else if constexpr (std::is_same_v<Node, Integer>) {
                stream << (value.identifier.tag_number == UniversalTag::Enumerated ? "ENUMERATED: " : "INTEGER: ") << node.value;
            } else if constexpr (std::is_same_v<Node, Null>) {
                stream << "NULL: \"\"";
            } else if constexpr (std::is_same_v<Node, OctetString>) {
                stream << "OCTET STRING: " << node.value;
            } else if constexpr (std::is_same_v<Node, Sequence>) {
                elements("SEQUENCE", node.elements);
            } else if constexpr (std::is_same_v<Node, SetOf>) {
                elements("SET OF", node.elements);
            } else if constexpr (std::is_same_v<Node, Tagged>) {
                stream << *node.inner;
            }
        }, value.node);
        return stream;
    }

}

#endif //LDAPWIRE_ASN1_HPP
