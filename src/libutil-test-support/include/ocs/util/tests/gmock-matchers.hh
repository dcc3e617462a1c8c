#pragma once
///@file

#include "ocs/util/terminal.hh"

#include <gmock/gmock.h>

namespace ocs::testing {

/**
 * Matches a string (or `const char *`, such as `what()`) that contains
 * `substring` once colour escapes are stripped, so expectations need
 * not care whether `OCS_COLOR` is on.
 */
MATCHER_P(
    HasSubstrIgnoreANSIMatcher,
    substring,
    std::string(negation ? "has no substring " : "has substring ") + ::testing::PrintToString(substring))
{
    return filterANSIEscapes(arg, /*filterAll=*/true).find(substring) != std::string::npos;
}

/**
 * Matches a callable that throws `E` with such a message.
 */
template<typename E>
auto ThrowsMessageIgnoreANSI(const std::string & substring)
{
    return ::testing::ThrowsMessage<E>(HasSubstrIgnoreANSIMatcher(substring));
}

} // namespace ocs::testing
