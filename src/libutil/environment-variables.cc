#include "ocs/util/environment-variables.hh"

#include <cstdlib>

namespace ocs {

std::optional<std::string> getEnv(const std::string & name)
{
    if (auto value = std::getenv(name.c_str()))
        return value;
    return std::nullopt;
}

} // namespace ocs
