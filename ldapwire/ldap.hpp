// Lightweight Directory Access Protocol (LDAP): The Protocol
// https://datatracker.ietf.org/doc/html/rfc4511

// LDAPv3 Wire Protocol Reference
// https://ldap.com/ldapv3-wire-protocol-reference/

#ifndef LDAPWIRE_LDAP_HPP
#define LDAPWIRE_LDAP_HPP

#include "filter_codec.hpp"
#include "filter_parser.hpp"

#include <optional>
#include <string>
#include <vector>

namespace LdapWire::LDAP {

    enum class ProtocolOp {
        BindRequest = 0,
        BindResponse = 1,
        UnbindRequest = 2,
        SearchRequest = 3,
        SearchResultEntry = 4,
        SearchResultDone = 5,
        SearchResultReference = 19,
        ModifyRequest = 6,
        ModifyResponse = 7,
        AddRequest = 8,
        AddResponse = 9,
        DelRequest = 10,
        DelResponse = 11,
        ModifyDNRequest = 12,
        ModifyDNResponse = 13,
        CompareRequest = 14,
        CompareResponse = 15,
        AbandonRequest = 16,
        ExtendedRequest = 23,
        ExtendedResponse = 24,
        IntermediateResponse = 25
    };

    enum class SearchRequestScope {
        BaseObject = 0,
        SingleLevel = 1,
        WholeSubtree = 2,
    };

    enum class SearchRequestDerefAliases {
        NeverDerefAliases = 0,
        DerefInSearching = 1,
        DerefFindingBaseObj = 2,
        DerefAlways = 3,
    };

    // SearchRequest ::= [APPLICATION 3] SEQUENCE {
    //     baseObject      LDAPDN,
    //     scope           ENUMERATED,
    //     derefAliases    ENUMERATED,
    //     sizeLimit       INTEGER (0 ..  maxInt),
    //     timeLimit       INTEGER (0 ..  maxInt),
    //     typesOnly       BOOLEAN,
    //     filter          Filter,
    //     attributes      AttributeSelection }
    struct SearchRequest {

        std::string base_object;
        SearchRequestScope scope = SearchRequestScope::BaseObject;
        SearchRequestDerefAliases deref_aliases = SearchRequestDerefAliases::NeverDerefAliases;
        int64_t size_limit = 0;
        int64_t time_limit = 0;
        bool types_only = false;
        Filter::Node filter = Filter::present("objectClass");
        std::vector<std::string> attributes;

        // The filter given as RFC 2254 text.
        static Filter::Result<SearchRequest> make(std::string base_object, SearchRequestScope scope,
                                                  std::string_view filter, std::vector<std::string> attributes = {}) {
            auto result = SearchRequest();
            result.base_object = std::move(base_object);
            result.scope = scope;
            result.filter = EXP_TRY(Filter::parse(filter));
            result.attributes = std::move(attributes);
            return result;
        }

        BER::Value to_asn1() const {
            auto selection = std::vector<BER::Value>();
            for (auto const& attribute : attributes) {
                selection.push_back(BER::octet_string(attribute));
            }

            return BER::implicit_tag(BER::application(BER::to_int(ProtocolOp::SearchRequest)), BER::sequence({
                BER::octet_string(base_object),
                BER::enumerated(BER::to_int(scope)),
                BER::enumerated(BER::to_int(deref_aliases)),
                BER::integer(size_limit),
                BER::integer(time_limit),
                BER::boolean(types_only),
                Filter::to_asn1(filter),
                BER::sequence(std::move(selection)),
            }));
        }

        static BER::Result<SearchRequest> from_asn1(BER::Value const& value, size_t max_depth = LDAPWIRE_MAX_DEPTH) {
            EXP_REQUIRE(value.identifier == BER::application(BER::to_int(ProtocolOp::SearchRequest)),
                        BER::DecodeError(BER::DecodeError::Kind::UnexpectedTag, "SearchRequest: unexpected tag"));
            auto elements = EXP_TRY(BER::elements_of(value));
            EXP_REQUIRE(elements.size() == 8,
                        BER::invalid_content(fmt::format("SearchRequest: {} elements", elements.size())));

            auto result = SearchRequest();
            result.base_object = EXP_TRY(BER::octets_of(elements[0]));

            auto scope = EXP_TRY(BER::integer_of(elements[1], BER::UniversalTag::Enumerated));
            EXP_REQUIRE(scope >= 0 && scope <= 2, BER::invalid_content(fmt::format("SearchRequest: scope {}", scope)));
            result.scope = SearchRequestScope(scope);

            auto deref_aliases = EXP_TRY(BER::integer_of(elements[2], BER::UniversalTag::Enumerated));
            EXP_REQUIRE(deref_aliases >= 0 && deref_aliases <= 3,
                        BER::invalid_content(fmt::format("SearchRequest: derefAliases {}", deref_aliases)));
            result.deref_aliases = SearchRequestDerefAliases(deref_aliases);

            result.size_limit = EXP_TRY(BER::integer_of(elements[3]));
            result.time_limit = EXP_TRY(BER::integer_of(elements[4]));
            EXP_REQUIRE(elements[5].is<BER::Boolean>(), BER::invalid_content("SearchRequest: typesOnly is not a BOOLEAN"));
            result.types_only = elements[5].as<BER::Boolean>().value;
            result.filter = EXP_TRY(Filter::from_asn1(elements[6], max_depth));

            auto selection = EXP_TRY(BER::elements_of(elements[7]));
            for (auto const& attribute : selection) {
                result.attributes.push_back(EXP_TRY(BER::octets_of(attribute)));
            }
            return result;
        }

        bool operator==(SearchRequest const&) const = default;

    };

    // LDAPMessage ::= SEQUENCE {
    //     messageID       MessageID,
    //     protocolOp      CHOICE { ... },
    //     controls        [0] Controls OPTIONAL }
    struct Message {
        int64_t message_id;
        BER::Value protocol_op;
        std::optional<BER::Value> controls;
    };

    inline BER::Value message(int64_t message_id, BER::Value protocol_op, std::optional<BER::Value> controls = std::nullopt) {
        auto elements = std::vector<BER::Value>();
        elements.push_back(BER::integer(message_id));
        elements.push_back(std::move(protocol_op));
        if (controls) {
            elements.push_back(std::move(*controls));
        }
        return BER::sequence(std::move(elements));
    }

    // LDAPMessage and protocolOp wrap a SearchRequest filter.
    constexpr size_t filter_envelope = 2;

    // `options.max_depth` limits the nesting of a filter carried in the message.
    inline BER::Result<Message> read_message(std::string_view bytes, BER::DecodeOptions const& options = {}) {
        auto value = EXP_TRY(BER::decode(bytes, Filter::wire_options(options, filter_envelope)));
        EXP_REQUIRE(value.identifier == BER::universal(BER::UniversalTag::Sequence, BER::Encoding::Constructed),
                    BER::DecodeError(BER::DecodeError::Kind::UnexpectedTag, "LDAPMessage: not a SEQUENCE"));

        auto elements = EXP_TRY(BER::elements_of(value));
        EXP_REQUIRE(elements.size() == 2 || elements.size() == 3,
                    BER::invalid_content(fmt::format("LDAPMessage: {} elements", elements.size())));

        auto message_id = EXP_TRY(BER::integer_of(elements[0]));
        EXP_REQUIRE(elements[1].identifier.tag_class == BER::TagClass::Application,
                    BER::DecodeError(BER::DecodeError::Kind::UnexpectedTag, "LDAPMessage: protocolOp is not an application tag"));

        auto controls = std::optional<BER::Value>();
        if (elements.size() == 3) {
            EXP_REQUIRE(elements[2].identifier == BER::context_specific(0, BER::Encoding::Constructed),
                        BER::DecodeError(BER::DecodeError::Kind::UnexpectedTag, "LDAPMessage: unexpected element after protocolOp"));
            controls = std::move(elements[2]);
        }
        return Message{message_id, std::move(elements[1]), std::move(controls)};
    }

}

#endif //LDAPWIRE_LDAP_HPP
