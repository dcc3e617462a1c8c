#pragma once
///@file

#include <functional>

namespace ocs {

/**
 * Fold the `std::hash` of every argument into `seed`, mixing the bits
 * the way `boost::hash_combine` does. Argument order matters.
 */
template<typename... Ts>
inline void hash_combine(std::size_t & seed, const Ts &... values)
{
    auto mix = [&](std::size_t h) { seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2); };
    (mix(std::hash<Ts>{}(values)), ...);
}

} // namespace ocs
