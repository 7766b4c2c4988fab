#ifndef LDAPWIRE_BYTES_HPP
#define LDAPWIRE_BYTES_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#define EXP_REQUIRE(condition, error) if (!(condition)) return std::unexpected(error)
#define EXP_TRY(expected) ({ auto ref = (expected); if (!ref) return std::unexpected(std::move(ref).error()); *std::move(ref); })
#define EXP_CHECK(expected) if (auto ref = (expected); !ref) return std::unexpected(std::move(ref).error())

namespace LdapWire::Bytes {

    // Octet strings travel as std::string; nothing here assumes text.
    using Octets = std::string;

    struct StringViewReader {

        std::string_view string;

        size_t size() const {
            return string.size();
        }

        bool empty() const {
            return string.empty();
        }

        std::optional<uint8_t> read() {
            if (empty()) return std::nullopt;
            auto result = uint8_t(string.front());
            string.remove_prefix(1);
            return result;
        }

        std::optional<std::string_view> read(size_t length) {
            if (length > string.size()) return std::nullopt;
            auto result = string.substr(0, length);
            string.remove_prefix(length);
            return result;
        }

    };

    struct StringWriter {

        Octets string;

        void write(uint8_t byte) {
            string.push_back(char(byte));
        }

        void write(std::string_view bytes) {
            string += bytes;
        }

    };

    struct CounterWriter {

        size_t count = 0;

        void write(uint8_t) {
            ++count;
        }

        void write(std::string_view bytes) {
            count += bytes.size();
        }

    };

}

#endif //LDAPWIRE_BYTES_HPP
