#include "ocs/link/parser.hh"
#include "ocs/main/shared.hh"
#include "ocs/util/logging.hh"

#include <iostream>

using namespace ocs;

static void showHelp()
{
    std::cout << R"(Usage: ocs-custodian [options] <link>...

Parse and validate ocs:// and ocss:// links.

Options:
  --help                    print this help and exit
  --version                 print the version and exit
  -v, --verbose             increase the logging verbosity (repeatable)
  --quiet                   decrease the logging verbosity
  --debug                   set the logging verbosity to 'debug'
  --show-trace              always print the full trace of errors
  --canonical               print only the canonical form of each link
  --check-install-type      reject links whose install type is unknown
  --no-install-path         do not print the install path of each link
)";
    throw Exit();
}

static void showLink(const ParsedLink & link, bool printInstallPath)
{
    logger->cout("link: %s", link.to_string());
    logger->cout("scheme: %s", showOcsScheme(link.scheme));
    logger->cout("command: %s", showOcsCommand(link.command));
    logger->cout("download URL: %s", link.downloadUrl.to_string());
    logger->cout("install type: %s", link.installType);
    if (link.filename)
        logger->cout("filename: %s", *link.filename);
    if (auto target = link.targetFileName())
        logger->cout("target file name: %s", *target);

    if (printInstallPath) {
        try {
            logger->cout("install path: %s", installPath(resolveInstallType(link.installType)));
        } catch (NoMatchingInstallType & e) {
            logWarning(e.info());
        }
    }
}

int main(int argc, char ** argv)
{
    bool canonical = false;
    bool checkType = false;
    bool printInstallPath = true;
    Strings links;

    return handleExceptions(argv[0], [&]() {
        parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
            if (*arg == "--help")
                showHelp();
            else if (*arg == "--version")
                printVersion("ocs-custodian");
            else if (*arg == "--canonical")
                canonical = true;
            else if (*arg == "--check-install-type")
                checkType = true;
            else if (*arg == "--no-install-path")
                printInstallPath = false;
            else if (*arg != "" && arg->at(0) == '-')
                return false;
            else
                links.push_back(*arg);
            return true;
        });

        if (links.empty())
            throw UsageError("no links given");

        for (auto & s : links) {
            auto link = parseLink(s);

            if (checkType)
                checkInstallType(link);

            if (canonical)
                logger->cout("%s", link.to_string());
            else
                showLink(link, printInstallPath);
        }
    });
}
