#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "ocs/link/install-type.hh"
#include "ocs/link/parsed-link.hh"

namespace ocs {

// For rapidcheck
void showValue(const ParsedLink & link, std::ostream & os);
void showValue(const InstallType & installType, std::ostream & os);

} // namespace ocs

namespace rc {
using namespace ocs;

/**
 * Only generates links whose canonical form parses back to an equal
 * link: absolute `http`, `https` or `ftp` download URLs without query
 * or fragment, install types made of `[a-z_]`, and path segments and
 * filenames that may hold spaces and non-ASCII text but never `%`,
 * `&`, `#`, `+` or `=`.
 */
template<>
struct Arbitrary<ParsedLink>
{
    static Gen<ParsedLink> arbitrary();
};

template<>
struct Arbitrary<InstallType>
{
    static Gen<InstallType> arbitrary();
};

} // namespace rc
