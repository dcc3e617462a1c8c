#include "ocs/link/tests/link-parts.hh"
#include "ocs/util/url.hh"

namespace ocs::testing {

std::string newLink(LinkParts part, std::string_view value)
{
    auto pick = [&](LinkParts p, std::string_view def) { return std::string(part == p ? value : def); };

    return pick(LinkParts::Scheme, DefaultLinkParts::scheme) + "://" + pick(LinkParts::Command, DefaultLinkParts::command)
           + "?url=" + percentEncode(pick(LinkParts::DownloadUrl, DefaultLinkParts::downloadUrl))
           + "&type=" + pick(LinkParts::InstallType, DefaultLinkParts::installType)
           + "&filename=" + percentEncode(pick(LinkParts::Filename, DefaultLinkParts::filename));
}

std::string defaultLink()
{
    return newLink(LinkParts::NoChange, "");
}

} // namespace ocs::testing
