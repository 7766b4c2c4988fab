#ifndef LDAPWIRE_CONFIG_HPP
#define LDAPWIRE_CONFIG_HPP

// Build-time defaults. Define any of these before including ldapwire headers
// (or on the compiler command line) to override them.

// Deepest nesting accepted for filters and for BER constructed values.
#ifndef LDAPWIRE_MAX_DEPTH
#define LDAPWIRE_MAX_DEPTH 64
#endif

// Filter used in place of an empty or blank filter string.
#ifndef LDAPWIRE_DEFAULT_FILTER
#define LDAPWIRE_DEFAULT_FILTER "(objectclass=*)"
#endif

// When non-zero, decoding rejects long-form lengths that fit a shorter form.
#ifndef LDAPWIRE_CANONICAL_LENGTHS
#define LDAPWIRE_CANONICAL_LENGTHS 0
#endif

// When non-zero, decoding rejects tag numbers below 30 in the high-tag-number
// form and high tag numbers with a leading zero group.
#ifndef LDAPWIRE_CANONICAL_IDENTIFIERS
#define LDAPWIRE_CANONICAL_IDENTIFIERS 0
#endif

#endif //LDAPWIRE_CONFIG_HPP
