#include "ocs/link/parsed-link.hh"
#include "ocs/util/strings.hh"

namespace ocs {

std::string_view showOcsScheme(OcsScheme scheme)
{
    switch (scheme) {
    case OcsScheme::Insecure:
        return "ocs";
    case OcsScheme::Secure:
        return "ocss";
    }
    unreachable();
}

std::optional<OcsScheme> parseOcsScheme(std::string_view s)
{
    auto lower = toLower(std::string(s));
    if (lower == "ocs")
        return OcsScheme::Insecure;
    if (lower == "ocss")
        return OcsScheme::Secure;
    return std::nullopt;
}

std::string_view showOcsCommand(OcsCommand command)
{
    switch (command) {
    case OcsCommand::Download:
        return "download";
    case OcsCommand::Install:
        return "install";
    }
    unreachable();
}

std::optional<OcsCommand> parseOcsCommand(std::string_view s)
{
    auto lower = toLower(std::string(s));
    if (lower == "download")
        return OcsCommand::Download;
    if (lower == "install")
        return OcsCommand::Install;
    return std::nullopt;
}

std::ostream & operator<<(std::ostream & str, OcsScheme scheme)
{
    return str << showOcsScheme(scheme);
}

std::ostream & operator<<(std::ostream & str, OcsCommand command)
{
    return str << showOcsCommand(command);
}

std::string ParsedLink::to_string() const
{
    std::string res;
    res += showOcsScheme(scheme);
    res += "://";
    res += showOcsCommand(command);
    res += "?url=";
    res += percentEncode(downloadUrl.to_string());
    res += "&type=";
    res += installType;
    if (filename) {
        res += "&filename=";
        res += *filename;
    }
    return res;
}

std::optional<std::string> ParsedLink::targetFileName() const
{
    if (filename && !filename->empty())
        return filename;
    return downloadUrl.lastPathSegment();
}

bool ParsedLink::operator==(const ParsedLink & other) const
{
    return scheme == other.scheme && command == other.command && downloadUrl == other.downloadUrl
           && installType == other.installType && filename == other.filename;
}

std::ostream & operator<<(std::ostream & str, const ParsedLink & link)
{
    return str << link.to_string();
}

} // namespace ocs

std::size_t std::hash<ocs::ParsedLink>::operator()(const ocs::ParsedLink & link) const noexcept
{
    std::size_t seed = 0;
    ocs::hash_combine(
        seed,
        link.scheme,
        link.command,
        link.downloadUrl.scheme,
        ocs::concatStringsSep("/", link.downloadUrl.path),
        link.downloadUrl.fragment,
        link.installType,
        link.filename);
    return seed;
}
