#pragma once
///@file

#include "ocs/util/types.hh"

#include <string_view>

namespace ocs {

/**
 * Minimum number of single-character insertions, deletions and
 * substitutions needed to turn `a` into `b`. Works on bytes.
 */
int levenshteinDistance(std::string_view a, std::string_view b);

/**
 * A candidate for what the user meant to type.
 */
struct Suggestion
{
    int distance;
    std::string suggestion;

    std::string to_string() const;

    auto operator<=>(const Suggestion &) const = default;
};

/**
 * Candidates ordered by distance, nearest first, then alphabetically.
 */
struct Suggestions
{
    std::set<Suggestion> suggestions;

    /**
     * Rank every element of `candidates` by its distance to `query`.
     */
    static Suggestions bestMatches(const StringSet & candidates, std::string_view query);

    /**
     * Keep at most `limit` candidates, all strictly closer than
     * `maxDistance`. With the defaults only near misses survive.
     */
    Suggestions trim(int limit = 5, int maxDistance = 2) const;

    /**
     * `x`, or `one of x, y or z`; empty if there is nothing to suggest.
     */
    std::string to_string() const;
};

std::ostream & operator<<(std::ostream & str, const Suggestions & suggestions);

} // namespace ocs
