#pragma once
///@file

#include "ocs/util/error.hh"

#include <memory>

namespace ocs {

/**
 * Messages above this level are dropped. Starts at `lvlInfo`.
 */
extern Verbosity verbosity;

/**
 * Render all traces of an error instead of the first few
 * (`--show-trace`).
 */
extern bool showTrace;

/**
 * Where diagnostics go. Program output proper goes through `cout()`
 * so that it can be told apart from them.
 */
class Logger
{
public:

    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    /**
     * Log an error or warning in the format of `showErrorInfo()`.
     */
    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    /**
     * Write one line of program output to stdout.
     */
    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    void cout(const std::string & fs, const Args &... args)
    {
        writeToStdout(fmt(fs, args...));
    }
};

extern std::unique_ptr<Logger> logger;

/**
 * A logger that prints to stderr, stripping colours unless stderr is
 * a terminal.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/* These are macros so that the arguments are only evaluated when the
   message is actually printed. */

#define logErrorInfo(level, errorInfo...)               \
    do {                                                \
        if ((level) <= ocs::verbosity)                  \
            ocs::logger->logEI((level), errorInfo);     \
    } while (0)

#define logError(errorInfo...) logErrorInfo(ocs::lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(ocs::lvlWarn, errorInfo)

#define printMsg(level, args...)                        \
    do {                                                \
        auto __lvl = (level);                           \
        if (__lvl <= ocs::verbosity)                    \
            ocs::logger->log(__lvl, ocs::fmt(args));    \
    } while (0)

#define printError(args...) printMsg(ocs::lvlError, args)
#define printInfo(args...) printMsg(ocs::lvlInfo, args)
#define debug(args...) printMsg(ocs::lvlDebug, args)

/**
 * Print `warning: <message>` if warnings are not silenced.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

/**
 * Write `s` to stderr as is, bypassing the logger.
 */
void writeToStderr(std::string_view s);

} // namespace ocs
