#pragma once
///@file

#include <optional>
#include <string>

namespace ocs {

/**
 * @return the value of the variable `name` in the process environment,
 * or `std::nullopt` if it is unset. A variable set to the empty string
 * is returned as such.
 */
std::optional<std::string> getEnv(const std::string & name);

} // namespace ocs
