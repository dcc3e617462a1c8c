#include <exception> // Needed by rapidcheck on Darwin

#include <rapidcheck/gen/Arbitrary.h>
#include <rapidcheck.h>

#include "ocs/link/tests/parsed-link.hh"
#include "ocs/util/strings.hh"

namespace ocs {

void showValue(const ParsedLink & link, std::ostream & os)
{
    os << link.to_string();
}

void showValue(const InstallType & installType, std::ostream & os)
{
    os << installType;
}

} // namespace ocs

namespace rc {
using namespace ocs;

/**
 * The RFC3986 unreserved characters.
 */
static Gen<char> unreservedChar()
{
    return gen::apply(
        [](uint8_t i) -> char {
            if (i < 10)
                return '0' + i;
            if (i < 36)
                return 'A' + (i - 10);
            if (i < 62)
                return 'a' + (i - 36);
            return std::string_view("-._~")[i - 62];
        },
        gen::inRange<uint8_t>(0, 10 + 2 * 26 + 4));
}

/**
 * Text the canonical form carries through unchanged: unreserved
 * characters, spaces and non-ASCII UTF-8, plus whatever `extra` adds.
 * Never produces `%`, `&`, `#`, `+` or `=`.
 */
static Gen<std::string> linkText(std::string_view extra)
{
    auto piece = gen::oneOf(
        gen::map(unreservedChar(), [](char c) { return std::string(1, c); }),
        gen::just(std::string(" ")),
        gen::elementOf(std::vector<std::string>{"é", "ß", "円", "🎵"}),
        gen::map(gen::elementOf(std::vector<char>(extra.begin(), extra.end())), [](char c) {
            return std::string(1, c);
        }));
    return gen::map(gen::container<std::vector<std::string>>(piece), [](std::vector<std::string> pieces) {
        return concatStringsSep("", pieces);
    });
}

static Gen<std::string> hostLabel()
{
    return gen::nonEmpty(gen::container<std::string>(gen::inRange('a', static_cast<char>('z' + 1))));
}

static Gen<ParsedURL> downloadUrl()
{
    return gen::apply(
        [](std::string scheme, std::vector<std::string> labels, std::vector<std::string> segments) {
            ParsedURL url{
                .scheme = std::move(scheme),
                .authority = ParsedURL::Authority{.host = concatStringsSep(".", labels)},
                .path = {""},
            };
            for (auto & s : segments)
                url.path.push_back(std::move(s));
            return url;
        },
        gen::elementOf(std::vector<std::string>{"https", "http", "ftp"}),
        gen::resize(4, gen::nonEmpty(gen::container<std::vector<std::string>>(hostLabel()))),
        gen::resize(
            8,
            gen::container<std::vector<std::string>>(gen::nonEmpty(linkText(":@!$'()*,;")))));
}

static Gen<std::string> installTypeToken()
{
    return gen::oneOf(
        gen::map(gen::arbitrary<InstallType>(), [](InstallType t) { return std::string(showInstallType(t)); }),
        gen::nonEmpty(gen::container<std::string>(
            gen::oneOf(gen::inRange('a', static_cast<char>('z' + 1)), gen::just('_')))));
}

static Gen<std::optional<std::string>> filename()
{
    return gen::oneOf(
        gen::just(std::optional<std::string>{}),
        gen::map(linkText("!$'()*,;:@/?"), [](std::string s) {
            return std::optional<std::string>(std::move(s));
        }));
}

Gen<ParsedLink> Arbitrary<ParsedLink>::arbitrary()
{
    return gen::apply(
        [](OcsScheme scheme, OcsCommand command, ParsedURL url, std::string installType, std::optional<std::string> f) {
            return ParsedLink{
                .scheme = scheme,
                .command = command,
                .downloadUrl = std::move(url),
                .installType = std::move(installType),
                .filename = std::move(f),
            };
        },
        gen::element(OcsScheme::Insecure, OcsScheme::Secure),
        gen::element(OcsCommand::Download, OcsCommand::Install),
        downloadUrl(),
        installTypeToken(),
        filename());
}

Gen<InstallType> Arbitrary<InstallType>::arbitrary()
{
    return gen::map(gen::elementOf(allInstallTypeNames()), [](const std::string & token) {
        return resolveInstallType(token);
    });
}

} // namespace rc
