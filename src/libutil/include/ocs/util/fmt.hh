#pragma once
///@file

#include "ocs/util/ansicolor.hh"

#include <boost/format.hpp>
#include <string>
#include <string_view>

namespace ocs {

/**
 * Surplus or missing arguments are tolerated; everything else
 * `boost::format` complains about (a bad format string, mostly) throws.
 */
inline void setExceptions(boost::format & fmt)
{
    fmt.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * `fmt(fs, a, b)` is `(boost::format(fs) % a % b).str()`.
 *
 * A lone argument is returned as is and never read as a format
 * string. Links routinely contain `%`, so pass them as arguments.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

inline std::string fmt(const std::string & s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    return (f % ... % args).str();
}

/**
 * Prints `value` highlighted. `HintFmt` wraps its arguments in this.
 */
template<class T>
struct Magenta
{
    const T & value;

    Magenta(const T & value)
        : value(value)
    {
    }
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & m)
{
    return out << ANSI_WARNING << m.value << ANSI_NORMAL;
}

/**
 * Opts an argument of `HintFmt` out of highlighting.
 */
template<class T>
struct Uncolored
{
    const T & value;

    Uncolored(const T & value)
        : value(value)
    {
    }
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & u)
{
    return out << ANSI_NORMAL << u.value;
}

/**
 * The message of an error or trace line: a `boost::format` whose
 * interpolated values are highlighted unless wrapped in `Uncolored`.
 */
class HintFmt
{
    boost::format fmt;

public:

    /**
     * A message without placeholders. `literal` is printed verbatim,
     * `%` included.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : fmt(format)
    {
        setExceptions(fmt);
        (*this % ... % args);
    }

    HintFmt(const HintFmt &) = default;
    HintFmt & operator=(const HintFmt &) = default;

    template<class T>
    HintFmt & operator%(const T & value)
    {
        fmt % Magenta(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        fmt % value.value;
        return *this;
    }

    std::string str() const
    {
        return fmt.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace ocs
