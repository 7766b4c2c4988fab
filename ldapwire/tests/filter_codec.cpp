#include "../filter_builder.hpp"
#include "../filter_codec.hpp"
#include "../filter_renderer.hpp"

#include "tools.hpp"

using namespace std::literals::string_literals;
using namespace std::literals::string_view_literals;
using namespace LdapWire;
using namespace LdapWire::Filter;

static void filter_write_read(Node const& tree, std::string_view bytes) {
    check_bytes(encode(tree), bytes);
    CHECK(TRY(decode(bytes)) == tree);
}

static void round_trip(Node const& tree) {
    INFO(render(tree));
    CHECK(TRY(decode(encode(tree))) == tree);
    CHECK(TRY(from_asn1(to_asn1(tree))) == tree);
}

TEST_CASE("filter encoding") {

    SECTION("and of equality matches") {
        // https://ldap.com/ldapv3-wire-protocol-reference-search/
        filter_write_read(TRY(parse("(&(objectClass=person)(uid=jdoe))")),
                          "\xa0\x24\xa3\x15\x04\x0bobjectClass\x04\x06person\xa3\x0b\x04\x03uid\x04\x04jdoe"sv);
    }

    SECTION("or") {
        filter_write_read(or_of({present("mail")}), "\xa1\x06\x87\x04mail"sv);
    }

    SECTION("not") {
        filter_write_read(not_of(present("mail")), "\xa2\x06\x87\x04mail"sv);
    }

    SECTION("present") {
        filter_write_read(present("objectClass"), "\x87\x0bobjectClass"sv);
    }

    SECTION("attribute value assertions") {
        filter_write_read(greater_or_equal("age", "21"), "\xa5\x09\x04\x03" "age" "\x04\x02" "21"sv);
        filter_write_read(less_or_equal("age", "65"), "\xa6\x09\x04\x03" "age" "\x04\x02" "65"sv);
        filter_write_read(approx("sn", "Smyth"), "\xa8\x0b\x04\x02sn\x04\x05Smyth"sv);
        filter_write_read(equality("bin", "\0\xff"s), "\xa3\x09\x04\x03" "bin" "\x04\x02\x00\xff"sv);
    }

    SECTION("substrings") {
        filter_write_read(TRY(parse("(cn=Jo*n*th)")),
                          "\xa4\x11\x04\x02" "cn" "\x30\x0b\x80\x02Jo\x81\x01n\x82\x02th"sv);
        filter_write_read(TRY(parse("(cn=*th)")), "\xa4\x0a\x04\x02" "cn" "\x30\x04\x82\x02th"sv);
        filter_write_read(TRY(parse("(cn=Jo**n)")),
                          "\xa4\x0f\x04\x02" "cn" "\x30\x09\x80\x02Jo\x81\x00\x82\x01n"sv);
    }

    SECTION("extensible match") {
        filter_write_read(TRY(parse("(cn:dn:caseExactMatch:=John)")),
                          "\xa9\x1d\x81\x0e" "caseExactMatch" "\x82\x02" "cn" "\x83\x04John\x84\x01\xff"sv);
        // dnAttributes is left out when false
        filter_write_read(TRY(parse("(cn:caseExactMatch:=John)")),
                          "\xa9\x1a\x81\x0e" "caseExactMatch" "\x82\x02" "cn" "\x83\x04John"sv);
        filter_write_read(TRY(parse("(:2.5.13.5:=x)")), "\xa9\x0d\x81\x08" "2.5.13.5" "\x83\x01x"sv);
    }

}

TEST_CASE("filter round trip") {

    for (auto text : {"(cn=John Smith)", "(&(objectClass=person)(|(sn=Smith)(sn=Jones)))", "(!(cn=Tim Howes))",
                      "(cn=Jo*n*th)", "(cn=*a*b*)", "(cn=**)", "(age>=21)", "(age<=65)", "(sn~=Smyth)",
                      "(o:dn:=Ace Industry)", "(:dn:2.4.6.8.10:=Dino)", "(bin=\\00\\ff)",
                      "(|(!(a=1))(&(b=2)(c>=3)(d=*)))"}) {
        round_trip(TRY(parse(text)));
    }

    SECTION("built") {
        auto builder = Builder();
        REQUIRE(builder.start_nested(Tag::And).has_value());
        REQUIRE(builder.start_nested(Tag::Not).has_value());
        REQUIRE(builder.start_substrings("cn").has_value());
        REQUIRE(builder.add_substring(SubstringTag::Any, "x").has_value());
        REQUIRE(builder.add_substring(SubstringTag::Final, "").has_value());
        REQUIRE(builder.end_substrings().has_value());
        REQUIRE(builder.end_nested(Tag::Not).has_value());
        REQUIRE(builder.add_extensible_match(std::nullopt, "sn", "Doe").has_value());
        REQUIRE(builder.end_nested(Tag::And).has_value());
        round_trip(TRY(std::move(builder).build()));
    }

}

TEST_CASE("filter decode errors") {

    auto fail = [](std::string_view bytes, BER::DecodeError::Kind kind) {
        auto result = decode(bytes);
        REQUIRE(!result);
        CHECK(result.error().kind == kind);
    };

    SECTION("structure") {
        fail("\xa0\x00"sv, BER::DecodeError::Kind::InvalidContent);
        fail("\xa1\x00"sv, BER::DecodeError::Kind::InvalidContent);
        fail("\xa2\x00"sv, BER::DecodeError::Kind::InvalidContent);
        fail("\xa2\x0c\x87\x04mail\x87\x04mail"sv, BER::DecodeError::Kind::InvalidContent);
        fail("\x87\x00\x00"sv, BER::DecodeError::Kind::InvalidContent);
        fail("\xa7\x00"sv, BER::DecodeError::Kind::InvalidContent);
    }

    SECTION("tags") {
        fail("\x8a\x00"sv, BER::DecodeError::Kind::UnexpectedTag);
        fail("\x04\x00"sv, BER::DecodeError::Kind::UnexpectedTag);
        fail("\x47\x04mail"sv, BER::DecodeError::Kind::UnexpectedTag);
        fail("\xa0\x02\x04\x00"sv, BER::DecodeError::Kind::UnexpectedTag);
    }

    SECTION("attribute value assertion") {
        fail("\xa3\x04\x04\x02" "cn"sv, BER::DecodeError::Kind::InvalidContent);
        fail("\xa3\x07\x04\x02" "cn" "\x02\x01\x01"sv, BER::DecodeError::Kind::UnexpectedTag);
    }

    SECTION("substrings") {
        // initial after any
        fail("\xa4\x0b\x04\x02" "cn" "\x30\x05\x81\x01x\x80\x00"sv, BER::DecodeError::Kind::InvalidContent);
        // final before any
        fail("\xa4\x0b\x04\x02" "cn" "\x30\x05\x82\x01x\x81\x00"sv, BER::DecodeError::Kind::InvalidContent);
        // no substring at all
        fail("\xa4\x06\x04\x02" "cn" "\x30\x00"sv, BER::DecodeError::Kind::InvalidContent);
        // unknown substring choice
        fail("\xa4\x09\x04\x02" "cn" "\x30\x03\x83\x01x"sv, BER::DecodeError::Kind::UnexpectedTag);
        // substrings not in a SEQUENCE
        fail("\xa4\x09\x04\x02" "cn" "\x31\x03\x80\x01x"sv, BER::DecodeError::Kind::UnexpectedTag);
    }

    SECTION("extensible match") {
        // no matchValue
        fail("\xa9\x04\x81\x02" "id"sv, BER::DecodeError::Kind::InvalidContent);
        // type before matching rule
        fail("\xa9\x0b\x82\x02" "cn" "\x81\x02" "id" "\x83\x01x"sv, BER::DecodeError::Kind::UnexpectedTag);
        // dnAttributes is not a boolean
        fail("\xa9\x07\x83\x01x\x84\x02\x00\x00"sv, BER::DecodeError::Kind::InvalidContent);
    }

    SECTION("bytes") {
        fail(""sv, BER::DecodeError::Kind::Truncated);
        fail("\x87\x04ma"sv, BER::DecodeError::Kind::LengthExceedsInput);
        fail("\x87\x04mail\x00"sv, BER::DecodeError::Kind::InvalidContent);
    }

    SECTION("nesting") {
        auto tree = present("cn");
        for (auto i = 0; i < 100; ++i) {
            tree = not_of(std::move(tree));
        }
        fail(encode(tree), BER::DecodeError::Kind::TooDeep);
    }

}

static std::string nested_nots(std::string_view leaf, size_t levels) {
    auto text = std::string();
    for (size_t i = 0; i < levels; ++i) {
        text += "(!";
    }
    text += leaf;
    text += std::string(levels, ')');
    return text;
}

TEST_CASE("filter nesting limit") {

    SECTION("deepest parsable filters decode") {
        for (auto leaf : {"(cn=x)"sv, "(cn=a*b*c)"sv, "(cn:dn:caseExactMatch:=x)"sv, "(cn=*)"sv}) {
            auto tree = TRY(parse(nested_nots(leaf, LDAPWIRE_MAX_DEPTH - 1)));
            round_trip(tree);
        }
    }

    SECTION("one level past the parser limit") {
        auto tree = present("cn");
        for (auto i = 0; i < LDAPWIRE_MAX_DEPTH; ++i) {
            tree = not_of(std::move(tree));
        }
        auto decoded = decode(encode(tree));
        REQUIRE(!decoded);
        CHECK(decoded.error().kind == BER::DecodeError::Kind::TooDeep);

        auto converted = from_asn1(to_asn1(tree));
        REQUIRE(!converted);
        CHECK(converted.error().kind == BER::DecodeError::Kind::TooDeep);
    }

    SECTION("limit from the options") {
        auto tree = TRY(parse(nested_nots("(cn=a*b)", 3)));
        auto bytes = encode(tree);
        CHECK(TRY(Filter::decode(bytes, BER::DecodeOptions{.max_depth = 4})) == tree);
        CHECK(parse(nested_nots("(cn=a*b)", 3), ParseOptions{.max_depth = 4}).has_value());

        auto result = Filter::decode(bytes, BER::DecodeOptions{.max_depth = 3});
        REQUIRE(!result);
        CHECK(result.error().kind == BER::DecodeError::Kind::TooDeep);
        CHECK(!parse(nested_nots("(cn=a*b)", 3), ParseOptions{.max_depth = 3}));
    }

}

TEST_CASE("filter decode content") {

    // the connection layer already took the [0] identifier off
    auto content = "\xa3\x15\x04\x0bobjectClass\x04\x06person\xa3\x0b\x04\x03uid\x04\x04jdoe"sv;
    auto tree = TRY(decode_filter_content(BER::context_specific(0, BER::Encoding::Constructed), content));
    CHECK(tree == TRY(parse("(&(objectClass=person)(uid=jdoe))")));

    CHECK(TRY(decode_filter_content(BER::context_specific(7), "mail"sv)) == present("mail"));
    CHECK(!decode_filter_content(BER::context_specific(0, BER::Encoding::Constructed), ""sv));

}
