#pragma once
///@file

#include "ocs/link/errors.hh"
#include "ocs/link/install-type.hh"
#include "ocs/link/parsed-link.hh"

namespace ocs {

/**
 * Parse and validate an `ocs://` or `ocss://` link.
 *
 * The whole input is percent decoded once before it is parsed as a
 * URI, so the `url` parameter may be given either encoded
 * (`url=https%3A%2F%2F...`) or plain. Spaces, non-ASCII text and
 * similar characters that the decoding brings out are accepted, both
 * in the link and in the download URL. Scheme and command are matched
 * case-insensitively; query keys are case-sensitive. When a key is
 * repeated, the last value wins.
 *
 * The install type is not looked up; see `checkInstallType()`.
 *
 * @throws LinkError (one of its subclasses) when the link is not
 * usable.
 */
ParsedLink parseLink(std::string_view link);

/**
 * Resolve the install type of an already parsed link against the
 * registry.
 *
 * @throws UnknownInstallType if no family knows the token.
 */
InstallType checkInstallType(const ParsedLink & link);

} // namespace ocs
