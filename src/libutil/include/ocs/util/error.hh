#pragma once
/**
 * @file
 *
 * Every exception we throw derives from `BaseError` and carries an
 * `ErrorInfo`: the message, some context lines and, where they make
 * sense, suggestions. Rendering to text happens late, in `what()` or
 * in the logger, so callers can still add context on the way up.
 */

#include "ocs/util/fmt.hh"
#include "ocs/util/suggestions.hh"

#include <list>
#include <optional>
#include <source_location>

namespace ocs {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

/**
 * One line of context, printed above the message as `… <hint>`.
 */
struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;

    /**
     * Innermost context first.
     */
    std::list<Trace> traces;

    /**
     * What `handleExceptions()` makes the process exit with.
     */
    unsigned int status = 1;

    Suggestions suggestions;

    /**
     * Name of the running program, set by `handleExceptions()`.
     */
    static std::optional<std::string> programName;
};

/**
 * Render `einfo` the way it is shown to users: traces, then
 * `error: <msg>`, then `Did you mean ...?`. Beyond a handful of
 * traces, the rest is only printed if `showTrace` is set.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * Catch `Error` rather than this.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    /**
     * Like the above, with a non-default exit status.
     */
    template<typename... Args>
    BaseError(unsigned int status, const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...), .status = status}
    {
    }

    template<typename... Args>
    BaseError(const Suggestions & sug, const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...), .suggestions = sug}
    {
    }

    BaseError(HintFmt hint)
        : err{.level = lvlError, .msg = std::move(hint)}
    {
    }

    /**
     * The bare message, without the `error:` prefix or any trace.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    /**
     * Record what was being done when the error happened. The newest
     * trace is printed first.
     */
    template<typename... Args>
    void addTrace(const std::string & fs, const Args &... args)
    {
        addTrace(HintFmt(fs, args...));
    }

    void addTrace(HintFmt hint);
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);

/**
 * The command line was wrong. `handleExceptions()` points the user at
 * `--help`.
 */
MakeError(UsageError, Error);

/**
 * Report a broken internal invariant on stderr and terminate.
 */
[[gnu::noinline, gnu::cold, noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace ocs
