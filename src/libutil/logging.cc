#include "ocs/util/logging.hh"
#include "ocs/util/terminal.hh"

#include <cerrno>
#include <sstream>
#include <unistd.h>

namespace ocs {

Verbosity verbosity = lvlInfo;

bool showTrace = false;

std::unique_ptr<Logger> logger = makeSimpleLogger();

/**
 * Write all of `s` to `fd`, retrying after signals. Other failures
 * are dropped: the streams we write to are our only way to report
 * them.
 */
static void writeAll(int fd, std::string_view s)
{
    while (!s.empty()) {
        auto n = ::write(fd, s.data(), s.size());
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return;
        }
        s.remove_prefix(n);
    }
}

void writeToStderr(std::string_view s)
{
    writeAll(STDERR_FILENO, s);
}

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    writeAll(STDOUT_FILENO, std::string(s) + "\n");
}

class SimpleLogger : public Logger
{
    bool tty = isTTY();

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl <= verbosity)
            writeToStderr(filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, showTrace);
        log(ei.level, oss.str());
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

} // namespace ocs
