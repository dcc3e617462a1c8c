#include "ocs/util/suggestions.hh"
#include "ocs/util/ansicolor.hh"
#include "ocs/util/terminal.hh"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <vector>

namespace ocs {

int levenshteinDistance(std::string_view a, std::string_view b)
{
    /* `row[j]` is the distance between the prefix of `a` seen so far
       and the first `j` bytes of `b`. */
    std::vector<int> row(b.size() + 1);
    std::iota(row.begin(), row.end(), 0);

    for (size_t i = 0; i < a.size(); ++i) {
        int diagonal = row[0];
        row[0] = i + 1;
        for (size_t j = 0; j < b.size(); ++j) {
            int above = row[j + 1];
            row[j + 1] = std::min({above + 1, row[j] + 1, diagonal + (a[i] == b[j] ? 0 : 1)});
            diagonal = above;
        }
    }

    return row.back();
}

Suggestions Suggestions::bestMatches(const StringSet & candidates, std::string_view query)
{
    Suggestions res;
    for (auto & candidate : candidates)
        res.suggestions.insert({levenshteinDistance(query, candidate), candidate});
    return res;
}

Suggestions Suggestions::trim(int limit, int maxDistance) const
{
    Suggestions res;
    for (auto & s : suggestions) {
        if ((int) res.suggestions.size() >= limit || s.distance >= maxDistance)
            break;
        res.suggestions.insert(s);
    }
    return res;
}

std::string Suggestion::to_string() const
{
    return ANSI_WARNING + filterANSIEscapes(suggestion, true) + ANSI_NORMAL;
}

std::string Suggestions::to_string() const
{
    std::string res;
    size_t n = 0;
    for (auto & s : suggestions) {
        ++n;
        if (n == 1)
            res += suggestions.size() > 1 ? "one of " : "";
        else
            res += n == suggestions.size() ? " or " : ", ";
        res += s.to_string();
    }
    return res;
}

std::ostream & operator<<(std::ostream & str, const Suggestions & suggestions)
{
    return str << suggestions.to_string();
}

} // namespace ocs
