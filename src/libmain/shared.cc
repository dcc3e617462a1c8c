#include "ocs/main/shared.hh"
#include "ocs/util/logging.hh"
#include "ocs/util/strings.hh"

#include <algorithm>
#include <iostream>

namespace ocs {

const std::string ocsVersion = OCS_VERSION;

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

static std::string baseNameOf(std::string_view path)
{
    auto pos = path.rfind('/');
    return std::string(pos == path.npos ? path : path.substr(pos + 1));
}

/**
 * Handle one of the flags shared by all programs. Returns false if
 * `arg` is not one of them.
 */
static bool processCommonFlag(const std::string & arg)
{
    if (arg == "--verbose" || arg == "-v")
        verbosity = (Verbosity) std::min<std::underlying_type_t<Verbosity>>(verbosity + 1, lvlVomit);
    else if (arg == "--quiet")
        verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
    else if (arg == "--debug")
        verbosity = lvlDebug;
    else if (arg == "--show-trace")
        showTrace = true;
    else
        return false;
    return true;
}

void parseCmdLine(
    int argc, char ** argv, std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg)
{
    Strings args;
    for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);
    parseCmdLine(baseNameOf(argv[0]), args, parseArg);
}

void parseCmdLine(
    const std::string & programName,
    const Strings & _args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg)
{
    Strings args(_args);
    bool dashDash = false;

    for (auto pos = args.begin(); pos != args.end(); ++pos) {
        if (!dashDash && *pos == "--") {
            dashDash = true;
            continue;
        }

        if (!dashDash && processCommonFlag(*pos))
            continue;

        auto arg = *pos;
        if (!parseArg(pos, args.end())) {
            if (hasPrefix(arg, "-"))
                throw UsageError("unrecognised flag '%1%'", arg);
            throw UsageError("unexpected argument '%1%'", arg);
        }
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% %2%", programName, ocsVersion) << std::endl;
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = baseNameOf(programName);

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace ocs
