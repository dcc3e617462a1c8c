#pragma once
///@file

#include "ocs/util/types.hh"

#include <string_view>

namespace ocs {

/**
 * Cut `s` at every character that occurs in `separators`. Empty
 * pieces are kept, so `splitString("/a/", "/")` is `{"", "a", ""}` and
 * the result always has at least one element.
 */
template<typename C>
C splitString(std::string_view s, std::string_view separators);

extern template std::vector<std::string> splitString(std::string_view, std::string_view);
extern template std::vector<std::string_view> splitString(std::string_view, std::string_view);

/**
 * Join `ss` with `sep` between neighbouring elements.
 */
template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss);

extern template std::string concatStringsSep(std::string_view, const std::vector<std::string> &);
extern template std::string concatStringsSep(std::string_view, const StringSet &);

bool hasPrefix(std::string_view s, std::string_view prefix);

/**
 * ASCII only; bytes outside `A-Z` are left alone.
 */
std::string toLower(std::string s);

/**
 * Strip trailing spaces, tabs and line breaks.
 */
std::string chomp(std::string_view s);

} // namespace ocs
