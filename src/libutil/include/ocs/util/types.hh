#pragma once
///@file

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ocs {

typedef std::list<std::string> Strings;

/**
 * Both containers compare with `std::less<>`, so a `std::string_view`
 * key can be looked up without building a `std::string` first.
 */
typedef std::map<std::string, std::string, std::less<>> StringMap;
typedef std::set<std::string, std::less<>> StringSet;

} // namespace ocs
