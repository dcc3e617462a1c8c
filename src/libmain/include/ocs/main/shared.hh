#pragma once
///@file

#include "ocs/util/error.hh"
#include "ocs/util/exit.hh"
#include "ocs/util/types.hh"

#include <functional>

namespace ocs {

extern const std::string ocsVersion;

/**
 * Run `fun`, turning whatever it throws into a message on stderr and
 * an exit status.
 */
int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * Parse the command line. `--verbose`, `--quiet`, `--debug` and
 * `--show-trace` are handled here and apply to every program. The
 * rest goes to `parseArg`, which returns false for arguments it does
 * not know. After `--`, everything goes to `parseArg`.
 *
 * @throws UsageError for unknown flags.
 */
void parseCmdLine(
    int argc, char ** argv, std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg);

void parseCmdLine(
    const std::string & programName,
    const Strings & args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg);

/**
 * Print the program version and throw `Exit`.
 */
[[noreturn]]
void printVersion(const std::string & programName);

/**
 * Return the argument that follows the flag `opt`, advancing `i`.
 *
 * @throws UsageError if there is none.
 */
std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

} // namespace ocs
