#include "ocs/util/url.hh"
#include "ocs/util/strings.hh"

#include <boost/url.hpp>

#include <ranges>

namespace ocs {

ParsedURL::Authority ParsedURL::Authority::parse(std::string_view encodedAuthority)
{
    auto parsed = boost::urls::parse_authority(encodedAuthority);
    if (!parsed)
        throw BadURL("invalid URL authority '%s': %s", encodedAuthority, parsed.error().message());

    Authority res;

    switch (parsed->host_type()) {
    case boost::urls::host_type::none:
    case boost::urls::host_type::name:
        res.hostType = HostType::Name;
        break;
    case boost::urls::host_type::ipv4:
        res.hostType = HostType::IPv4;
        break;
    case boost::urls::host_type::ipv6:
        res.hostType = HostType::IPv6;
        break;
    case boost::urls::host_type::ipvfuture:
        res.hostType = HostType::IPvFuture;
        break;
    }

    res.host = parsed->host_address();
    if (parsed->has_userinfo())
        res.user = parsed->user();
    if (parsed->has_password())
        res.password = parsed->password();

    /* `host:` has an empty port, which is the same as none. */
    if (parsed->has_port() && !parsed->port().empty()) {
        res.port = parsed->port_number();
        if (res.port == 0)
            throw BadURL("port '%s' in '%s' is invalid", parsed->port(), encodedAuthority);
    }

    return res;
}

std::string ParsedURL::Authority::to_string() const
{
    std::string res;

    if (user) {
        res += percentEncode(*user);
        if (password)
            res += ":" + percentEncode(*password);
        res += "@";
    }

    switch (hostType) {
    case HostType::Name:
        res += percentEncode(host);
        break;
    case HostType::IPv4:
        res += host;
        break;
    case HostType::IPv6:
    case HostType::IPvFuture:
        /* A zone ID (`fe80::1%eth0`) needs its `%` escaped. */
        res += "[" + percentEncode(host, ":") + "]";
        break;
    }

    if (port)
        res += ":" + std::to_string(*port);

    return res;
}

static bool isHexDigit(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/**
 * Escape what `parseURL(..., true)` promises to tolerate. None of it
 * can delimit a URI component, so the structure is unchanged.
 */
static std::string escapeTolerated(std::string_view url)
{
    static constexpr std::string_view tolerated = " \"<>\\^`{|}";

    std::string res;
    res.reserve(url.size());

    for (size_t i = 0; i < url.size(); ++i) {
        char c = url[i];
        bool strayPercent = c == '%' && !(i + 2 < url.size() && isHexDigit(url[i + 1]) && isHexDigit(url[i + 2]));
        if (strayPercent || tolerated.find(c) != tolerated.npos || static_cast<unsigned char>(c) >= 0x80)
            res += percentEncode(url.substr(i, 1));
        else
            res += c;
    }

    return res;
}

static ParsedURL fromBoostUrlView(boost::urls::url_view view)
{
    if (!view.has_scheme())
        throw RelativeURLWithoutBase("'%s' is a relative URL without a base", view.buffer());

    ParsedURL res;

    res.scheme = view.scheme();

    if (view.has_authority())
        res.authority = ParsedURL::Authority::parse(view.authority().buffer());

    boost::core::string_view encodedPath = view.encoded_path();
    for (auto segment : splitString<std::vector<std::string_view>>(encodedPath, "/"))
        res.path.push_back(percentDecode(segment));

    res.query = decodeQuery(std::string_view(view.encoded_query()));

    res.fragment = view.fragment();

    return res;
}

ParsedURL parseURL(std::string_view url, bool lenient)
{
    std::string escaped;
    if (lenient)
        escaped = escapeTolerated(url);

    try {
        return fromBoostUrlView(boost::urls::url_view(lenient ? std::string_view(escaped) : url));
    } catch (boost::system::system_error & e) {
        throw BadURL("'%s' is not a valid URL: %s", url, e.code().message());
    }
}

std::string percentDecode(std::string_view in)
{
    auto view = boost::urls::make_pct_string_view(in);
    if (!view)
        throw BadURL("invalid percent encoding in '%s': %s", in, view.error().message());
    return view->decode();
}

std::string percentEncode(std::string_view s, std::string_view keep)
{
    return boost::urls::encode(
        s, [keep](char c) { return boost::urls::unreserved_chars(c) || keep.find(c) != keep.npos; });
}

StringMap decodeQuery(std::string_view query)
{
    StringMap res;

    try {
        for (auto && param : boost::urls::params_encoded_view(query))
            if (param.has_value)
                res.insert_or_assign(param.key.decode(), param.value.decode());
    } catch (boost::system::system_error & e) {
        throw BadURL("invalid URI query '%s': %s", query, e.code().message());
    }

    return res;
}

/* Sub-delimiters such as `&` and `=` are structural in a query and
   get escaped; these may stay. */
static constexpr std::string_view keptInQuery = ":@/?";
static constexpr std::string_view keptInPath = ":@";

std::string encodeQuery(const StringMap & query)
{
    std::vector<std::string> items;
    for (auto & [key, value] : query)
        items.push_back(percentEncode(key, keptInQuery) + "=" + percentEncode(value, keptInQuery));
    return concatStringsSep("&", items);
}

std::string ParsedURL::renderAuthorityAndPath() const
{
    /* RFC3986 section 3.3: with an authority the path is empty or
       absolute; without one, it must not start with `//`. */
    if (authority && !path.empty() && !path.front().empty())
        throw BadURL("path '%s' of a URL with an authority does not start with '/'", concatStringsSep("/", path));
    if (!authority && path.size() >= 3 && path[0].empty() && path[1].empty())
        throw BadURL("path '%s' of a URL without an authority starts with '//'", concatStringsSep("/", path));

    std::vector<std::string> segments;
    for (auto & segment : path)
        segments.push_back(percentEncode(segment, keptInPath));

    return (authority ? authority->to_string() : "") + concatStringsSep("/", segments);
}

std::string ParsedURL::to_string() const
{
    auto res = scheme + ":" + (authority ? "//" : "") + renderAuthorityAndPath();
    if (!query.empty())
        res += "?" + encodeQuery(query);
    if (!fragment.empty())
        res += "#" + percentEncode(fragment);
    return res;
}

std::ostream & operator<<(std::ostream & os, const ParsedURL & url)
{
    return os << url.to_string();
}

std::optional<std::string> ParsedURL::lastPathSegment() const
{
    for (auto & segment : std::views::reverse(path))
        if (!segment.empty())
            return segment;
    return std::nullopt;
}

} // namespace ocs
