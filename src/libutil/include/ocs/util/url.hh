#pragma once
///@file

#include "ocs/util/error.hh"
#include "ocs/util/types.hh"

#include <cstdint>
#include <optional>

namespace ocs {

/**
 * An absolute RFC3986 URI, split into its components. Every field
 * holds decoded text; `to_string()` puts the escapes back.
 */
struct ParsedURL
{
    /**
     * `[user[:password]@]host[:port]`.
     */
    struct Authority
    {
        enum class HostType {
            /**
             * A registered name, possibly empty.
             */
            Name,
            IPv4,
            IPv6,
            IPvFuture,
        };

        HostType hostType = HostType::Name;

        /**
         * IP literals are stored without their brackets.
         */
        std::string host;

        std::optional<std::string> user;

        std::optional<std::string> password;

        /**
         * Only set if the URI spells out a port.
         */
        std::optional<uint16_t> port;

        /**
         * @param encodedAuthority The authority as it appears in a URI,
         * escapes included.
         *
         * @throws BadURL
         */
        static Authority parse(std::string_view encodedAuthority);

        std::string to_string() const;

        auto operator<=>(const Authority &) const = default;
    };

    std::string scheme;

    /**
     * Present iff the URI has `//` after the scheme. `ocs:install`
     * has none; `ocs://?url=...` has one with an empty host.
     */
    std::optional<Authority> authority;

    /**
     * The path cut at each `/`. An absolute path therefore starts with
     * an empty segment and a trailing `/` adds one at the end:
     * `https://a.org` has `{""}`, `https://a.org/x/` has `{"", "x", ""}`.
     */
    std::vector<std::string> path;

    /**
     * See `decodeQuery()`.
     */
    StringMap query;

    std::string fragment;

    /**
     * Everything between `scheme:` and `?`, leaving out the `//` that
     * introduces the authority.
     *
     * @throws BadURL if `path` cannot be told apart from the authority
     * (only possible for hand-built values).
     */
    std::string renderAuthorityAndPath() const;

    std::string to_string() const;

    /**
     * The last non-empty path segment, which usually names the file,
     * e.g. `Breeze.tar.gz` for `https://a.org/themes/Breeze.tar.gz/`.
     */
    std::optional<std::string> lastPathSegment() const;

    auto operator<=>(const ParsedURL &) const = default;
};

std::ostream & operator<<(std::ostream & os, const ParsedURL & url);

MakeError(BadURL, Error);

/**
 * A well-formed relative reference (the empty string is one) where an
 * absolute URI was needed.
 */
MakeError(RelativeURLWithoutBase, BadURL);

/**
 * Parse an absolute URI.
 *
 * With `lenient` set, characters that RFC3986 does not allow anywhere
 * but that are harmless to the URI's structure are escaped before
 * parsing rather than rejected: the space, `"<>\^{|}` and the
 * backquote, bytes from 0x80 up, and `%` when no two hex digits
 * follow. Control characters stay fatal.
 *
 * @throws RelativeURLWithoutBase
 * @throws BadURL for anything else that is not a URI.
 */
ParsedURL parseURL(std::string_view url, bool lenient = false);

/**
 * @throws BadURL on `%` not followed by two hex digits.
 */
std::string percentDecode(std::string_view in);

/**
 * Escape every byte except `A-Z a-z 0-9 - . _ ~` and those in `keep`.
 */
std::string percentEncode(std::string_view s, std::string_view keep = "");

/**
 * Turn an escaped query string (`a=1&b=%2F`) into decoded key/value
 * pairs. A repeated key keeps its last value. Items without `=`
 * carry no value and are dropped.
 *
 * @throws BadURL
 */
StringMap decodeQuery(std::string_view query);

std::string encodeQuery(const StringMap & query);

} // namespace ocs
