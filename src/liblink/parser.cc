#include "ocs/link/parser.hh"
#include "ocs/util/util.hh"

namespace ocs {

/**
 * Whether `s` is well-formed UTF-8 (no overlong forms, no surrogates,
 * nothing above U+10FFFF).
 */
static bool isValidUtf8(std::string_view s)
{
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = s[i];
        size_t len;
        unsigned char lo = 0x80, hi = 0xbf;
        if (c < 0x80)
            len = 1;
        else if (c >= 0xc2 && c <= 0xdf)
            len = 2;
        else if (c >= 0xe0 && c <= 0xef) {
            len = 3;
            if (c == 0xe0)
                lo = 0xa0;
            else if (c == 0xed)
                hi = 0x9f;
        } else if (c >= 0xf0 && c <= 0xf4) {
            len = 4;
            if (c == 0xf0)
                lo = 0x90;
            else if (c == 0xf4)
                hi = 0x8f;
        } else
            return false;

        if (s.size() - i < len)
            return false;

        for (size_t j = 1; j < len; ++j) {
            unsigned char cc = s[i + j];
            if (j == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xbf))
                return false;
        }

        i += len;
    }
    return true;
}

/**
 * `parseURL()`, with its failures translated into `UriSyntaxError`.
 *
 * Parsing is lenient: decoding the link may well have produced spaces
 * or non-ASCII text (in a file name, say), which only need escaping
 * again to form a valid URI.
 */
static ParsedURL parseUri(std::string_view s)
{
    try {
        return parseURL(s, /*lenient=*/true);
    } catch (RelativeURLWithoutBase & e) {
        throw UriSyntaxError(UriSyntaxError::Reason::RelativeWithoutBase, e.message());
    } catch (BadURL & e) {
        throw UriSyntaxError(UriSyntaxError::Reason::Malformed, e.message());
    }
}

ParsedLink parseLink(std::string_view link)
{
    std::string decoded;
    try {
        decoded = percentDecode(link);
    } catch (BadURL & e) {
        throw DecodeError("cannot percent-decode the link: %s", Uncolored(e.message()));
    }
    if (!isValidUtf8(decoded))
        throw DecodeError("the link does not decode to valid UTF-8");

    auto rawUri = parseUri(decoded);

    auto scheme = parseOcsScheme(rawUri.scheme);
    if (!scheme)
        throw UnrecognizedScheme(rawUri.scheme);

    if (!rawUri.authority)
        throw MissingCommand("no OCS command was provided; try a link like 'ocs://install?...'");

    if (rawUri.authority->host.empty())
        throw UriSyntaxError(UriSyntaxError::Reason::EmptyHost, "");

    auto command = parseOcsCommand(rawUri.authority->host);
    if (!command)
        throw UnrecognizedCommand(rawUri.authority->host);

    auto & query = rawUri.query;

    /* Query values are decoded a second time, which can produce bytes
       the first pass never saw. */
    for (auto key : {"url", "type", "filename"})
        if (auto value = get(query, key); value && !isValidUtf8(*value))
            throw DecodeError("the value of the '%s' parameter does not decode to valid UTF-8", key);

    auto url = get(query, "url");
    if (!url)
        throw MissingDownloadUrl("the link has no download URL ('url' parameter)");

    ParsedURL downloadUrl;
    try {
        downloadUrl = parseUri(*url);
    } catch (UriSyntaxError & e) {
        e.addTrace("while parsing the download URL '%s'", *url);
        throw;
    }

    auto installType = get(query, "type");
    if (!installType)
        throw MissingInstallType("the link has no install type ('type' parameter)");

    std::optional<std::string> filename;
    if (auto f = get(query, "filename"))
        filename = *f;

    return ParsedLink{
        .rawUri = rawUri,
        .scheme = *scheme,
        .command = *command,
        .downloadUrl = std::move(downloadUrl),
        .installType = *installType,
        .filename = std::move(filename),
    };
}

InstallType checkInstallType(const ParsedLink & link)
{
    try {
        return resolveInstallType(link.installType);
    } catch (NoMatchingInstallType & e) {
        throw UnknownInstallType(link.installType, e.info().suggestions);
    }
}

} // namespace ocs
