// ISO/IEC 8825-1:2015
// ASN.1 encoding rules: Specification of Basic Encoding Rules (BER),
// Canonical Encoding Rules (CER) and Distinguished Encoding Rules (DER)
// https://www.iso.org/standard/68345.html

// A Layman's Guide to a Subset of ASN.1, BER, and DER
// http://luca.ntop.org/Teaching/Appunti/asn1.html

// LDAPv3 Wire Protocol Reference: The ASN.1 Basic Encoding Rules
// https://ldap.com/ldapv3-wire-protocol-reference-asn1-ber/

#ifndef LDAPWIRE_BER_HPP
#define LDAPWIRE_BER_HPP

#include "bytes.hpp"
#include "config.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <variant>

namespace LdapWire::BER {

    struct DecodeError {

        enum class Kind {
            Truncated,
            LengthExceedsInput,
            NonCanonicalLength,
            InvalidContent,
            UnexpectedTag,
            TooDeep,
        };

        Kind kind;
        std::string reason;

        bool operator==(DecodeError const&) const = default;

    };

    template<typename T>
    using Result = std::expected<T, DecodeError>;

    inline DecodeError truncated(std::string_view what) {
        return {DecodeError::Kind::Truncated, fmt::format("{}: decode error: EOF", what)};
    }

    inline DecodeError invalid_content(std::string reason) {
        return {DecodeError::Kind::InvalidContent, std::move(reason)};
    }

    struct DecodeOptions {
        size_t max_depth = LDAPWIRE_MAX_DEPTH;
        bool canonical_lengths = LDAPWIRE_CANONICAL_LENGTHS != 0;
        bool canonical_identifiers = LDAPWIRE_CANONICAL_IDENTIFIERS != 0;
    };

    template<typename T>
    struct Decoded {
        T value;
        size_t consumed;

        bool operator==(Decoded const&) const = default;
    };

    constexpr auto to_int(auto value) {
        using T = decltype(value);
        if constexpr (std::is_enum_v<T>) {
            return std::underlying_type_t<T>(value);
        } else {
            return value;
        }
    }

    enum class TagClass {
        Universal = 0b00,
        Application = 0b01,
        ContextSpecific = 0b10,
        Private = 0b11,
    };

    enum class Encoding {
        Primitive = 0b0,
        Constructed = 0b1,
    };

    namespace UniversalTag {
        constexpr uint64_t Boolean = 0x01;
        constexpr uint64_t Integer = 0x02;
        constexpr uint64_t OctetString = 0x04;
        constexpr uint64_t Null = 0x05;
        constexpr uint64_t Enumerated = 0x0a;
        constexpr uint64_t Sequence = 0x10;
        constexpr uint64_t Set = 0x11;
    }

    template<typename T>
    uint8_t count_bits(T value) {
        if (value < 0) value = ~value;

        auto bits = uint8_t{0};
        while (value) {
            ++bits;
            value >>= 1;
        }
        return bits;
    }

    struct Identifier {

        static constexpr uint8_t extended_type = 0x1F;
        // Tags from here on use the high-tag-number form.
        static constexpr uint64_t first_extended = 30;

        TagClass tag_class;
        Encoding encoding;
        uint64_t tag_number;

        constexpr Identifier(TagClass tag_class, Encoding encoding, uint64_t tag_number):
            tag_class(tag_class),
            encoding(encoding),
            tag_number(tag_number) {}

        constexpr bool constructed() const {
            return encoding == Encoding::Constructed;
        }

        constexpr bool universal() const {
            return tag_class == TagClass::Universal;
        }

        constexpr Identifier with_encoding(Encoding encoding) const {
            return Identifier(tag_class, encoding, tag_number);
        }

        void write(auto& writer) const {
            auto tag_class = to_int(this->tag_class);
            auto encoding = to_int(this->encoding);

            auto write0 = [&](uint8_t tag_bits) {
                writer.write(uint8_t((tag_class << 6) | (encoding << 5) | tag_bits));
            };
            if (tag_number < first_extended) {
                write0(uint8_t(tag_number));
            } else {
                write0(extended_type);
                auto shifts = (count_bits(tag_number) - 1) / 7;
                for (auto shift = shifts * 7; shift; shift -= 7) {
                    writer.write(uint8_t(0b10000000 | ((tag_number >> shift) & 0b01111111)));
                }
                writer.write(uint8_t(tag_number & 0b01111111));
            }
        }

        // With `canonical`, only tags from 30 on may use the high-tag-number
        // form, and their first group may not be zero.
        static Result<Identifier> read(auto& reader, bool canonical = LDAPWIRE_CANONICAL_IDENTIFIERS != 0) {
            auto byte = reader.read();
            EXP_REQUIRE(byte, truncated("identifier"));
            auto tag_class = TagClass((*byte & 0b11000000) >> 6);
            auto encoding = Encoding((*byte & 0b00100000) >> 5);
            auto tag_number = uint64_t(*byte & 0b00011111);

            if (tag_number == extended_type) {
                tag_number = 0;
                auto first = true;
                do {
                    byte = reader.read();
                    EXP_REQUIRE(byte, truncated("identifier"));
                    EXP_REQUIRE(!canonical || !first || *byte != 0b10000000,
                                invalid_content("identifier: leading zero group in tag number"));
                    EXP_REQUIRE(tag_number <= (std::numeric_limits<uint64_t>::max() >> 7),
                                invalid_content("identifier: tag number overflow"));
                    tag_number = (tag_number << 7) | (*byte & 0b01111111);
                    first = false;
                } while (*byte & 0b10000000);

                EXP_REQUIRE(!canonical || tag_number >= first_extended,
                            invalid_content(fmt::format("identifier: tag {} in the high-tag-number form", tag_number)));
            }

            return Identifier(tag_class, encoding, tag_number);
        }

        bool operator==(Identifier const&) const = default;

    };

    constexpr Identifier universal(uint64_t tag_number, Encoding encoding = Encoding::Primitive) {
        return Identifier(TagClass::Universal, encoding, tag_number);
    }

    constexpr Identifier application(uint64_t tag_number, Encoding encoding = Encoding::Constructed) {
        return Identifier(TagClass::Application, encoding, tag_number);
    }

    constexpr Identifier context_specific(uint64_t tag_number, Encoding encoding = Encoding::Primitive) {
        return Identifier(TagClass::ContextSpecific, encoding, tag_number);
    }

    struct Length {

        enum class Form {
            Short = 0b0,
            Long = 0b1,
        };

        static constexpr uint8_t Indefinite = 0b0000000;
        static constexpr uint8_t Reserved = 0b1111111;

        size_t length;
        explicit constexpr Length(size_t length): length(length) {}

        void write(auto& writer) const {
            auto write_length = [&](Form form, uint8_t length) {
                writer.write(uint8_t((to_int(form) << 7) | length));
            };

            if (length <= 0b01111111) {
                write_length(Form::Short, uint8_t(length));
                return;
            }

            auto shifts = (count_bits(length) - 1) / 8;
            auto length_length = shifts + 1;
            write_length(Form::Long, uint8_t(length_length));
            for (auto shift = shifts * 8; shift; shift -= 8) {
                writer.write(uint8_t((length >> shift) & 0b11111111));
            }
            writer.write(uint8_t(length & 0b11111111));
        }

        static Result<Length> read(auto& reader, bool canonical = LDAPWIRE_CANONICAL_LENGTHS != 0) {
            auto byte = reader.read();
            EXP_REQUIRE(byte, truncated("length"));

            auto form = Form((*byte & 0b10000000) >> 7);
            if (form == Form::Short) {
                return Length(*byte);
            }

            auto count = uint8_t(*byte & 0b01111111);
            EXP_REQUIRE(count != Indefinite,
                        DecodeError(DecodeError::Kind::NonCanonicalLength, "length: indefinite form is not allowed"));
            EXP_REQUIRE(count != Reserved,
                        DecodeError(DecodeError::Kind::NonCanonicalLength, "length: reserved length-of-length"));
            // a length that does not fit size_t cannot describe bytes we hold
            EXP_REQUIRE(count <= sizeof(size_t),
                        DecodeError(DecodeError::Kind::LengthExceedsInput,
                                    fmt::format("length: {} length octets", count)));

            auto length = size_t{0};
            for (auto i = 0u; i < count; ++i) {
                byte = reader.read();
                EXP_REQUIRE(byte, truncated("length"));
                EXP_REQUIRE(!canonical || i != 0 || *byte != 0,
                            DecodeError(DecodeError::Kind::NonCanonicalLength, "length: leading zero octet"));
                length = (length << 8) | *byte;
            }
            EXP_REQUIRE(!canonical || length > 0b01111111,
                        DecodeError(DecodeError::Kind::NonCanonicalLength,
                                    fmt::format("length: {} encoded in long form", length)));
            return Length(length);
        }

    };

    // Content octets of the primitive types, without identifier and length.

    inline void write_boolean(auto& writer, bool value) {
        writer.write(uint8_t(value ? 0xff : 0x00));
    }

    inline void write_integer(auto& writer, int64_t value) {
        auto shifts = count_bits(value) / 8;
        for (auto shift = shifts * 8; shift; shift -= 8) {
            writer.write(uint8_t((value >> shift) & 0b11111111));
        }
        writer.write(uint8_t(value & 0b11111111));
    }

    inline Result<bool> read_boolean(auto& reader) {
        EXP_REQUIRE(reader.size() == 1,
                    invalid_content(fmt::format("BOOLEAN: {} content octets", reader.size())));
        return *reader.read() != 0x00;
    }

    inline Result<int64_t> read_integer(auto& reader) {
        auto length = reader.size();
        EXP_REQUIRE(length != 0, invalid_content("INTEGER: empty content"));
        EXP_REQUIRE(length <= sizeof(int64_t),
                    invalid_content(fmt::format("INTEGER: {} content octets", length)));

        // sign-extend from the first octet, then shift in the rest
        auto value = uint64_t(int64_t(int8_t(*reader.read())));
        for (auto shifts = length - 1; shifts; --shifts) {
            value = (value << 8) | *reader.read();
        }
        return int64_t(value);
    }

    // Identifier and length for `content_length` octets of content.
    inline void write_header(auto& writer, Identifier const& identifier, size_t content_length) {
        identifier.write(writer);
        Length(content_length).write(writer);
    }

    // Reads identifier and length, then hands back a reader bounded to the content.
    inline Result<std::pair<Identifier, Bytes::StringViewReader>> read_header(auto& reader, DecodeOptions const& options) {
        auto identifier = EXP_TRY(Identifier::read(reader, options.canonical_identifiers));
        auto length = EXP_TRY(Length::read(reader, options.canonical_lengths));
        auto content = reader.read(length.length);
        EXP_REQUIRE(content, DecodeError(DecodeError::Kind::LengthExceedsInput,
                                         fmt::format("length {} exceeds the {} remaining octets",
                                                     length.length, reader.size())));
        return std::pair(identifier, Bytes::StringViewReader{*content});
    }

    inline std::string encode_identifier(Identifier const& identifier) {
        auto writer = Bytes::StringWriter();
        identifier.write(writer);
        return std::move(writer.string);
    }

    inline std::string encode_length(size_t length) {
        auto writer = Bytes::StringWriter();
        Length(length).write(writer);
        return std::move(writer.string);
    }

    inline std::string encode_boolean(bool value, Identifier identifier = universal(UniversalTag::Boolean)) {
        auto writer = Bytes::StringWriter();
        write_header(writer, identifier, 1);
        write_boolean(writer, value);
        return std::move(writer.string);
    }

    inline std::string encode_integer(int64_t value, Identifier identifier = universal(UniversalTag::Integer)) {
        auto counter = Bytes::CounterWriter();
        write_integer(counter, value);

        auto writer = Bytes::StringWriter();
        write_header(writer, identifier, counter.count);
        write_integer(writer, value);
        return std::move(writer.string);
    }

    inline std::string encode_enumerated(int64_t value) {
        return encode_integer(value, universal(UniversalTag::Enumerated));
    }

    inline std::string encode_null(Identifier identifier = universal(UniversalTag::Null)) {
        auto writer = Bytes::StringWriter();
        write_header(writer, identifier, 0);
        return std::move(writer.string);
    }

    inline std::string encode_octet_string(std::string_view value, Identifier identifier = universal(UniversalTag::OctetString)) {
        auto writer = Bytes::StringWriter();
        write_header(writer, identifier, value.size());
        writer.write(value);
        return std::move(writer.string);
    }

    inline Result<Decoded<Identifier>> decode_identifier(std::string_view bytes,
                                                         bool canonical = LDAPWIRE_CANONICAL_IDENTIFIERS != 0) {
        auto reader = Bytes::StringViewReader{bytes};
        auto identifier = EXP_TRY(Identifier::read(reader, canonical));
        return Decoded<Identifier>{identifier, bytes.size() - reader.size()};
    }

    inline Result<Decoded<size_t>> decode_length(std::string_view bytes, bool canonical = LDAPWIRE_CANONICAL_LENGTHS != 0) {
        auto reader = Bytes::StringViewReader{bytes};
        auto length = EXP_TRY(Length::read(reader, canonical));
        return Decoded<size_t>{length.length, bytes.size() - reader.size()};
    }

    namespace detail {

        inline Result<Decoded<std::string_view>> decode_primitive(std::string_view bytes, uint64_t tag, std::string_view what) {
            auto reader = Bytes::StringViewReader{bytes};
            auto [identifier, content] = EXP_TRY(read_header(reader, DecodeOptions()));
            EXP_REQUIRE(identifier == universal(tag),
                        DecodeError(DecodeError::Kind::UnexpectedTag,
                                    fmt::format("{}: unexpected tag {}", what, identifier.tag_number)));
            return Decoded<std::string_view>{content.string, bytes.size() - reader.size()};
        }

    }

    inline Result<Decoded<bool>> decode_boolean(std::string_view bytes) {
        auto [content, consumed] = EXP_TRY(detail::decode_primitive(bytes, UniversalTag::Boolean, "BOOLEAN"));
        auto reader = Bytes::StringViewReader{content};
        return Decoded<bool>{EXP_TRY(read_boolean(reader)), consumed};
    }

    inline Result<Decoded<int64_t>> decode_integer(std::string_view bytes) {
        auto [content, consumed] = EXP_TRY(detail::decode_primitive(bytes, UniversalTag::Integer, "INTEGER"));
        auto reader = Bytes::StringViewReader{content};
        return Decoded<int64_t>{EXP_TRY(read_integer(reader)), consumed};
    }

    inline Result<Decoded<int64_t>> decode_enumerated(std::string_view bytes) {
        auto [content, consumed] = EXP_TRY(detail::decode_primitive(bytes, UniversalTag::Enumerated, "ENUMERATED"));
        auto reader = Bytes::StringViewReader{content};
        return Decoded<int64_t>{EXP_TRY(read_integer(reader)), consumed};
    }

    inline Result<Decoded<std::monostate>> decode_null(std::string_view bytes) {
        auto [content, consumed] = EXP_TRY(detail::decode_primitive(bytes, UniversalTag::Null, "NULL"));
        EXP_REQUIRE(content.empty(), invalid_content(fmt::format("NULL: {} content octets", content.size())));
        return Decoded<std::monostate>{{}, consumed};
    }

    inline Result<Decoded<std::string>> decode_octet_string(std::string_view bytes) {
        auto [content, consumed] = EXP_TRY(detail::decode_primitive(bytes, UniversalTag::OctetString, "OCTET STRING"));
        return Decoded<std::string>{std::string(content), consumed};
    }

}

#endif //LDAPWIRE_BER_HPP
