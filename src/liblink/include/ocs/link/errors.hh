#pragma once
///@file

#include "ocs/util/error.hh"

namespace ocs {

/**
 * The common ancestor of everything `parseLink()` and
 * `checkInstallType()` throw.
 */
MakeError(LinkError, Error);

/**
 * The link contains a malformed percent escape, or the escapes decode
 * to bytes that are not UTF-8.
 */
MakeError(DecodeError, LinkError);

/**
 * The link, or the download URL inside it, is not a URI we can use.
 */
class UriSyntaxError : public LinkError
{
public:
    enum class Reason {
        /**
         * Not an RFC3986 URI reference at all.
         */
        Malformed,
        /**
         * A valid relative reference, where an absolute URI was
         * required. The empty string is one.
         */
        RelativeWithoutBase,
        /**
         * There is an authority component (`//`), but its host is
         * empty, as in `ocs://?url=...`.
         */
        EmptyHost,
    };

    Reason reason;

    /**
     * Message of the underlying URL error, or empty.
     */
    std::string cause;

    UriSyntaxError(Reason reason, std::string cause);
};

std::string_view showUriSyntaxErrorReason(UriSyntaxError::Reason reason);

std::ostream & operator<<(std::ostream & str, UriSyntaxError::Reason reason);

/**
 * Kept for API completeness. A scheme-less input is reported as
 * `UriSyntaxError` with `Reason::RelativeWithoutBase`, so this is
 * never thrown.
 */
MakeError(MissingScheme, LinkError);

class UnrecognizedScheme : public LinkError
{
public:
    /**
     * The scheme as written in the link, not case folded.
     */
    std::string scheme;

    UnrecognizedScheme(std::string scheme);
};

MakeError(MissingCommand, LinkError);

class UnrecognizedCommand : public LinkError
{
public:
    /**
     * The host as written in the link, not case folded.
     */
    std::string command;

    UnrecognizedCommand(std::string command);
};

MakeError(MissingDownloadUrl, LinkError);

MakeError(MissingInstallType, LinkError);

class UnknownInstallType : public LinkError
{
public:
    std::string installType;

    UnknownInstallType(std::string installType, const Suggestions & suggestions = {});
};

} // namespace ocs
