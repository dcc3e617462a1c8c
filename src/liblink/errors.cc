#include "ocs/link/errors.hh"

namespace ocs {

UriSyntaxError::UriSyntaxError(Reason reason, std::string cause)
    : LinkError(
          cause.empty() ? HintFmt("invalid URI: %s", showUriSyntaxErrorReason(reason))
                        : HintFmt("invalid URI: %s: %s", showUriSyntaxErrorReason(reason), Uncolored(cause)))
    , reason(reason)
    , cause(std::move(cause))
{
}

std::string_view showUriSyntaxErrorReason(UriSyntaxError::Reason reason)
{
    switch (reason) {
    case UriSyntaxError::Reason::Malformed:
        return "malformed URI";
    case UriSyntaxError::Reason::RelativeWithoutBase:
        return "relative URL without a base";
    case UriSyntaxError::Reason::EmptyHost:
        return "empty host";
    }
    unreachable();
}

std::ostream & operator<<(std::ostream & str, UriSyntaxError::Reason reason)
{
    return str << showUriSyntaxErrorReason(reason);
}

UnrecognizedScheme::UnrecognizedScheme(std::string scheme)
    : LinkError("an unexpected OCS scheme was provided: '%s'; use 'ocs://...' instead", scheme)
    , scheme(std::move(scheme))
{
}

UnrecognizedCommand::UnrecognizedCommand(std::string command)
    : LinkError(
          "an unexpected OCS command was provided: '%s'; ask for either an 'install' or a 'download'", command)
    , command(std::move(command))
{
}

UnknownInstallType::UnknownInstallType(std::string installType, const Suggestions & suggestions)
    : LinkError(suggestions, "an unknown install type was given: '%s'", installType)
    , installType(std::move(installType))
{
}

} // namespace ocs
