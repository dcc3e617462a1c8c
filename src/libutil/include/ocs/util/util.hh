#pragma once
///@file

namespace ocs {

/**
 * Look `key` up in `map`.
 *
 * @return a pointer to the mapped value, or `nullptr` when the key is
 * absent. The pointer is only good as long as `map` is.
 */
template<class M, typename K>
const typename M::mapped_type * get(const M & map, const K & key)
{
    auto i = map.find(key);
    return i == map.end() ? nullptr : &i->second;
}

template<class M, typename K>
typename M::mapped_type * get(M & map, const K & key)
{
    auto i = map.find(key);
    return i == map.end() ? nullptr : &i->second;
}

/* A temporary map would leave the result dangling. */
template<class M, typename K>
typename M::mapped_type * get(M && map, const K & key) = delete;

} // namespace ocs
