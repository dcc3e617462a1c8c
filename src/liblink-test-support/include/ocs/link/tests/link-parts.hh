#pragma once
///@file

#include <string>
#include <string_view>

namespace ocs::testing {

/**
 * One part of a link built by `newLink()`.
 */
enum class LinkParts {
    Scheme,
    Command,
    DownloadUrl,
    InstallType,
    Filename,
    NoChange,
};

/**
 * The parts `newLink()` uses when it is not told otherwise.
 */
struct DefaultLinkParts
{
    static constexpr std::string_view scheme = "ocs";
    static constexpr std::string_view command = "install";
    static constexpr std::string_view downloadUrl = "https://fake.download/location.png";
    static constexpr std::string_view installType = "plasma_look_and_feel";
    static constexpr std::string_view filename = "location55.png";
};

/**
 * Build `{scheme}://{command}?url={url}&type={type}&filename={filename}`
 * from the defaults, with `part` replaced by `value`.
 *
 * The download URL and the filename are percent encoded (everything but
 * the unreserved characters), the other parts are inserted verbatim.
 */
std::string newLink(LinkParts part, std::string_view value);

/**
 * `newLink(LinkParts::NoChange, "")`.
 */
std::string defaultLink();

} // namespace ocs::testing
