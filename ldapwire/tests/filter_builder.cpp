#include "../filter_builder.hpp"
#include "../filter_codec.hpp"
#include "../filter_parser.hpp"
#include "../filter_renderer.hpp"

#include "tools.hpp"

using namespace LdapWire;
using namespace LdapWire::Filter;

#define STEP(call) REQUIRE((call).has_value())

static void check_violation(Result<void> const& result, std::string_view reason) {
    REQUIRE(!result);
    CHECK(result.error().kind == FilterError::Kind::BuilderProtocolViolation);
    CHECK(result.error().reason == reason);
}

TEST_CASE("build") {

    auto builder = Builder();

    SECTION("single leaf") {
        STEP(builder.add_attribute_assertion(Tag::EqualityMatch, "cn", "John Smith"));
        CHECK(builder.complete());
        CHECK(TRY(std::move(builder).build()) == equality("cn", "John Smith"));
    }

    SECTION("present") {
        STEP(builder.add_present("objectClass"));
        CHECK(TRY(std::move(builder).build()) == present("objectClass"));
    }

    SECTION("nested") {
        STEP(builder.start_nested(Tag::And));
        STEP(builder.add_attribute_assertion(Tag::EqualityMatch, "objectClass", "person"));
        STEP(builder.start_nested(Tag::Or));
        STEP(builder.add_attribute_assertion(Tag::EqualityMatch, "sn", "Smith"));
        STEP(builder.add_attribute_assertion(Tag::EqualityMatch, "sn", "Jones"));
        STEP(builder.end_nested(Tag::Or));
        CHECK(!builder.complete());
        STEP(builder.end_nested(Tag::And));
        CHECK(builder.complete());

        CHECK(TRY(std::move(builder).build()) ==
              TRY(parse("(&(objectClass=person)(|(sn=Smith)(sn=Jones)))")));
    }

    SECTION("comparisons") {
        STEP(builder.start_nested(Tag::Or));
        STEP(builder.add_attribute_assertion(Tag::GreaterOrEqual, "age", "21"));
        STEP(builder.add_attribute_assertion(Tag::LessOrEqual, "age", "65"));
        STEP(builder.add_attribute_assertion(Tag::ApproxMatch, "sn", "Smyth"));
        STEP(builder.end_nested(Tag::Or));
        CHECK(TRY(std::move(builder).build()) == TRY(parse("(|(age>=21)(age<=65)(sn~=Smyth))")));
    }

    SECTION("not") {
        STEP(builder.start_nested(Tag::Not));
        STEP(builder.add_present("mail"));
        STEP(builder.end_nested(Tag::Not));
        CHECK(TRY(std::move(builder).build()) == not_of(present("mail")));
    }

    SECTION("substrings") {
        STEP(builder.start_substrings("cn"));
        STEP(builder.add_substring(SubstringTag::Initial, "Jo"));
        STEP(builder.add_substring(SubstringTag::Any, "n"));
        STEP(builder.add_substring(SubstringTag::Final, "th"));
        STEP(builder.end_substrings());
        CHECK(TRY(std::move(builder).build()) == TRY(parse("(cn=Jo*n*th)")));
    }

    SECTION("substrings in a nested filter") {
        STEP(builder.start_nested(Tag::And));
        STEP(builder.add_attribute_assertion(Tag::EqualityMatch, "objectClass", "person"));
        STEP(builder.start_substrings("cn"));
        STEP(builder.add_substring(SubstringTag::Initial, "Jo"));
        STEP(builder.end_substrings());
        STEP(builder.end_nested(Tag::And));
        CHECK(TRY(std::move(builder).build()) == TRY(parse("(&(objectClass=person)(cn=Jo*))")));
    }

    SECTION("extensible match") {
        STEP(builder.add_extensible_match("caseExactMatch", "cn", "John", true));
        CHECK(TRY(std::move(builder).build()) == TRY(parse("(cn:dn:caseExactMatch:=John)")));
    }

    SECTION("raw octets are kept") {
        STEP(builder.add_attribute_assertion(Tag::EqualityMatch, "bin", std::string("(\0*)", 4)));
        CHECK(TRY(std::move(builder).build()) == equality("bin", std::string("(\0*)", 4)));
    }

}

TEST_CASE("substring placement") {

    auto builder = Builder();
    STEP(builder.start_substrings("cn"));

    SECTION("initial after another substring") {
        STEP(builder.add_substring(SubstringTag::Any, "a"));
        check_violation(builder.add_substring(SubstringTag::Initial, "b"),
                        "Attempt to add an initial substring match after the first substring");
    }

    SECTION("second initial") {
        STEP(builder.add_substring(SubstringTag::Initial, "a"));
        check_violation(builder.add_substring(SubstringTag::Initial, "b"),
                        "Attempt to add an initial substring match after the first substring");
    }

    SECTION("anything after final") {
        STEP(builder.add_substring(SubstringTag::Final, "z"));
        check_violation(builder.add_substring(SubstringTag::Any, "a"),
                        "Attempt to add a substring match after a final substring match");
        check_violation(builder.add_substring(SubstringTag::Final, "a"),
                        "Attempt to add a substring match after a final substring match");
    }

    SECTION("empty substrings") {
        check_violation(builder.end_substrings(), "Empty substring filter");
    }

    SECTION("other components inside substrings") {
        check_violation(builder.add_attribute_assertion(Tag::EqualityMatch, "cn", "x"),
                        "Cannot insert an attribute assertion in a substring");
        check_violation(builder.add_present("cn"), "Cannot insert a present match in a substring");
        check_violation(builder.start_nested(Tag::And), "Cannot start a nested filter in a substring");
        check_violation(builder.start_substrings("sn"), "Cannot start a substring filter in a substring");
        check_violation(builder.end_nested(Tag::And), "Mismatched ending of nested filter");
    }

}

TEST_CASE("builder protocol") {

    auto builder = Builder();

    SECTION("substring without substrings block") {
        check_violation(builder.add_substring(SubstringTag::Any, "a"), "Substring added outside of a substring filter");
        check_violation(builder.end_substrings(), "Mismatched ending of substrings");
    }

    SECTION("mismatched end") {
        STEP(builder.start_nested(Tag::And));
        STEP(builder.add_present("cn"));
        check_violation(builder.end_nested(Tag::Or), "Mismatched ending of nested filter");
        STEP(builder.end_nested(Tag::And));
        check_violation(builder.end_nested(Tag::And), "Mismatched ending of nested filter");
    }

    SECTION("second child of not") {
        STEP(builder.start_nested(Tag::Not));
        STEP(builder.add_present("cn"));
        check_violation(builder.add_present("sn"), "Attempt to create more than one 'not' sub-filter");
        check_violation(builder.start_nested(Tag::And), "Attempt to create more than one 'not' sub-filter");
        check_violation(builder.start_substrings("sn"), "Attempt to create more than one 'not' sub-filter");

        STEP(builder.end_nested(Tag::Not));
        CHECK(TRY(std::move(builder).build()) == not_of(present("cn")));
    }

    SECTION("empty nested filter") {
        STEP(builder.start_nested(Tag::Or));
        check_violation(builder.end_nested(Tag::Or), "Empty nested filter");
    }

    SECTION("not a nested kind") {
        check_violation(builder.start_nested(Tag::Present),
                        "Attempt to create a nested filter other than AND, OR or NOT");
    }

    SECTION("not an assertion kind") {
        check_violation(builder.add_attribute_assertion(Tag::Substrings, "cn", "x"),
                        "Invalid filter type for AttributeValueAssertion");
    }

    SECTION("second top-level filter") {
        STEP(builder.add_present("cn"));
        check_violation(builder.add_present("sn"), "Filter is already complete");
        check_violation(builder.start_nested(Tag::And), "Filter is already complete");
        check_violation(builder.start_substrings("sn"), "Filter is already complete");
    }

    SECTION("incomplete") {
        STEP(builder.start_nested(Tag::And));
        STEP(builder.add_present("cn"));
        auto result = std::move(builder).build();
        REQUIRE(!result);
        CHECK(result.error().kind == FilterError::Kind::BuilderProtocolViolation);
    }

    SECTION("nothing built") {
        CHECK(!builder.complete());
        CHECK(!std::move(builder).build());
    }

    SECTION("extensible match without rule or type") {
        check_violation(builder.add_extensible_match(std::nullopt, std::nullopt, "x"),
                        "Extensible match needs a matching rule or a type");
    }

}

TEST_CASE("builder nesting limit") {

    auto too_deep = [](Result<void> const& result) {
        REQUIRE(!result);
        CHECK(result.error().kind == FilterError::Kind::TooDeep);
    };

    SECTION("explicit limit") {
        auto builder = Builder(4);
        for (auto i = 0; i < 3; ++i) {
            STEP(builder.start_nested(Tag::And));
        }
        STEP(builder.add_present("cn"));
        STEP(builder.start_nested(Tag::Or));
        too_deep(builder.add_present("sn"));
        too_deep(builder.start_nested(Tag::Not));
        too_deep(builder.start_substrings("sn"));
        too_deep(builder.add_attribute_assertion(Tag::EqualityMatch, "sn", "x"));
    }

    SECTION("deepest filter matches the other layers") {
        auto builder = Builder();
        for (auto i = 0; i < LDAPWIRE_MAX_DEPTH - 1; ++i) {
            STEP(builder.start_nested(Tag::And));
        }
        STEP(builder.start_substrings("cn"));
        STEP(builder.add_substring(SubstringTag::Initial, "a"));
        STEP(builder.add_substring(SubstringTag::Any, "b"));
        STEP(builder.end_substrings());
        for (auto i = 0; i < LDAPWIRE_MAX_DEPTH - 1; ++i) {
            STEP(builder.end_nested(Tag::And));
        }
        auto tree = TRY(std::move(builder).build());

        CHECK(TRY(parse(render(tree))) == tree);
        CHECK(TRY(decode(encode(tree))) == tree);
        CHECK(TRY(from_asn1(to_asn1(tree))) == tree);
    }

}

TEST_CASE("builder attribute descriptions") {

    auto builder = Builder();

    auto check_invalid = [](Result<void> const& result) {
        REQUIRE(!result);
        CHECK(result.error().kind == FilterError::Kind::InvalidAttributeDescription);
    };
    check_invalid(builder.add_present(""));
    check_invalid(builder.add_attribute_assertion(Tag::EqualityMatch, "cn;", "x"));
    check_invalid(builder.start_substrings("c n"));
    check_invalid(builder.add_extensible_match("rule", "c\\6e", "x"));
    CHECK(!builder.complete());

}
