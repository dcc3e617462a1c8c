#pragma once
///@file

#include <limits>
#include <string>
#include <string_view>

namespace ocs {

/**
 * Whether stderr is an interactive terminal that should get colours.
 * `TERM=dumb`, `NO_COLOR` and `NOCOLOR` all say no. Computed once.
 */
bool isTTY();

/**
 * Cut `s` down to `width` visible characters (UTF-8 sequences count as
 * one) with tabs expanded to spaces. SGR sequences (`ESC [ ... m`) are
 * passed through unless `filterAll` is set; other escape sequences are
 * always dropped.
 */
std::string filterANSIEscapes(
    std::string_view s, bool filterAll = false, unsigned int width = std::numeric_limits<unsigned int>::max());

} // namespace ocs
