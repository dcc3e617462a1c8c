#include "ocs/util/terminal.hh"
#include "ocs/util/environment-variables.hh"

#include <algorithm>
#include <unistd.h>

namespace ocs {

bool isTTY()
{
    static const bool tty = isatty(STDERR_FILENO) && getEnv("TERM").value_or("dumb") != "dumb"
                            && !(getEnv("NO_COLOR").has_value() || getEnv("NOCOLOR").has_value());

    return tty;
}

/**
 * Number of bytes in the UTF-8 sequence starting with `c`. Invalid lead
 * bytes count as a single byte.
 */
static size_t utf8SequenceLength(unsigned char c)
{
    if (c >= 0xf0 && c <= 0xf4)
        return 4;
    if (c >= 0xe0)
        return 3;
    if (c >= 0xc2)
        return 2;
    return 1;
}

/**
 * Length of the escape sequence at the start of `s`, which begins with
 * ESC. Sets `isColour` for SGR sequences (`ESC [ ... m`).
 */
static size_t escapeLength(std::string_view s, bool & isColour)
{
    isColour = false;
    size_t n = 1;

    if (n < s.size() && s[n] == '[') {
        ++n;
        while (n < s.size() && s[n] >= 0x30 && s[n] <= 0x3f)
            ++n;
        while (n < s.size() && s[n] >= 0x20 && s[n] <= 0x2f)
            ++n;
        if (n < s.size() && s[n] >= 0x40 && s[n] <= 0x7e)
            isColour = s[n++] == 'm';
    } else if (n < s.size() && s[n] >= 0x40 && s[n] <= 0x5f)
        ++n;

    return n;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll, unsigned int width)
{
    std::string res;
    size_t column = 0;

    while (!s.empty()) {
        size_t n;

        switch (s[0]) {
        case '\x1b': {
            bool isColour;
            n = escapeLength(s, isColour);
            if (isColour && !filterAll)
                res.append(s.substr(0, n));
            break;
        }

        case '\t':
            n = 1;
            do {
                if (++column > width)
                    return res;
                res += ' ';
            } while (column % 8);
            break;

        case '\r':
        case '\a':
            n = 1;
            break;

        default:
            n = std::min(utf8SequenceLength(s[0]), s.size());
            if (++column > width)
                return res;
            res.append(s.substr(0, n));
        }

        s.remove_prefix(n);
    }

    return res;
}

} // namespace ocs
