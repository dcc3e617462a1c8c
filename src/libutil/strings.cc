#include "ocs/util/strings.hh"

namespace ocs {

template<typename C>
C splitString(std::string_view s, std::string_view separators)
{
    C pieces;
    while (true) {
        auto end = s.find_first_of(separators);
        pieces.emplace_back(s.substr(0, end));
        if (end == s.npos)
            return pieces;
        s.remove_prefix(end + 1);
    }
}

template std::vector<std::string> splitString(std::string_view, std::string_view);
template std::vector<std::string_view> splitString(std::string_view, std::string_view);

template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss)
{
    std::string res;
    for (auto i = ss.begin(); i != ss.end(); ++i) {
        if (i != ss.begin())
            res += sep;
        res += *i;
    }
    return res;
}

template std::string concatStringsSep(std::string_view, const std::vector<std::string> &);
template std::string concatStringsSep(std::string_view, const StringSet &);

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

std::string toLower(std::string s)
{
    for (auto & c : s)
        if (c >= 'A' && c <= 'Z')
            c = c - 'A' + 'a';
    return s;
}

std::string chomp(std::string_view s)
{
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(end == s.npos ? std::string_view{} : s.substr(0, end + 1));
}

} // namespace ocs
