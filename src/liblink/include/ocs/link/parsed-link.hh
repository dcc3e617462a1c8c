#pragma once
///@file

#include "ocs/util/url.hh"
#include "ocs/util/std-hash.hh"

#include <optional>

namespace ocs {

/**
 * `ocs` is the only scheme in use; `ocss` is reserved for a secure
 * variant of the protocol.
 */
enum struct OcsScheme {
    Insecure,
    Secure,
};

/**
 * What the link asks the client to do. Carried in the host part of
 * the link, e.g. `ocs://install?...`.
 */
enum struct OcsCommand {
    Download,
    Install,
};

std::string_view showOcsScheme(OcsScheme scheme);

/**
 * Case-insensitive.
 */
std::optional<OcsScheme> parseOcsScheme(std::string_view s);

std::string_view showOcsCommand(OcsCommand command);

/**
 * Case-insensitive.
 */
std::optional<OcsCommand> parseOcsCommand(std::string_view s);

std::ostream & operator<<(std::ostream & str, OcsScheme scheme);
std::ostream & operator<<(std::ostream & str, OcsCommand command);

/**
 * A validated OCS link, as produced by `parseLink()`.
 */
struct ParsedLink
{
    /**
     * The whole link after percent decoding. Only kept for
     * diagnostics; query parameters we don't model are still
     * reachable through `rawUri.query`. Not part of equality or
     * hashing.
     */
    ParsedURL rawUri;

    OcsScheme scheme;

    OcsCommand command;

    /**
     * The `url` query parameter. Always absolute.
     */
    ParsedURL downloadUrl;

    /**
     * The `type` query parameter, verbatim. It is not checked against
     * the install type registry here; see `checkInstallType()`.
     */
    std::string installType;

    /**
     * The `filename` query parameter, verbatim. May be present but
     * empty.
     */
    std::optional<std::string> filename;

    /**
     * Render the canonical form of the link:
     *
     * ```
     * {scheme}://{command}?url={percent encoded download URL}&type={installType}[&filename={filename}]
     * ```
     *
     * The filename is appended as-is.
     */
    std::string to_string() const;

    /**
     * The name to store the download under: `filename` if it is
     * present and non-empty, otherwise the last non-empty path segment
     * of the download URL.
     */
    std::optional<std::string> targetFileName() const;

    bool operator==(const ParsedLink & other) const;
};

std::ostream & operator<<(std::ostream & str, const ParsedLink & link);

} // namespace ocs

template<>
struct std::hash<ocs::ParsedLink>
{
    std::size_t operator()(const ocs::ParsedLink & link) const noexcept;
};
