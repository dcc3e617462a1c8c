#include "ocs/util/error.hh"
#include "ocs/util/logging.hh"
#include "ocs/util/strings.hh"
#include "ocs/util/terminal.hh"

#include <sstream>

namespace ocs {

std::optional<std::string> ErrorInfo::programName = std::nullopt;

/**
 * Traces printed even without `--show-trace`. A link error has at
 * most a couple.
 */
constexpr size_t defaultTraceLimit = 3;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = std::move(hint)});
    what_.reset();
}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err, showTrace);
        what_ = oss.str();
    }
    return *what_;
}

static std::string_view levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error";
    case lvlWarn:
        return ANSI_WARNING "warning";
    case lvlNotice:
        return ANSI_RED "note";
    case lvlInfo:
        return ANSI_GREEN "info";
    case lvlTalkative:
    case lvlChatty:
        return ANSI_GREEN "talk";
    case lvlDebug:
        return ANSI_WARNING "debug";
    case lvlVomit:
        return ANSI_GREEN "vomit";
    }
    unreachable();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix(levelPrefix(einfo.level));
    if (einfo.programName && einfo.programName != ErrorInfo::programName)
        prefix += fmt(" [%s]", *einfo.programName);
    prefix += ":" ANSI_NORMAL " ";

    std::ostringstream body;

    if (!einfo.traces.empty()) {
        size_t shown = 0;
        for (auto & trace : einfo.traces) {
            auto line = trace.hint.str();
            if (line.empty())
                continue;
            if (!showTrace && shown > defaultTraceLimit) {
                body << "\n" ANSI_WARNING "(stack trace truncated; use '--show-trace' to show the full trace)" ANSI_NORMAL "\n";
                break;
            }
            body << "\n… " << line << "\n";
            ++shown;
        }
        body << "\n" << prefix;
    }

    body << einfo.msg << "\n";

    if (auto close = einfo.suggestions.trim(); !close.suggestions.empty())
        body << "Did you mean " << close << "?\n";

    /* The first line starts with the prefix; continuation lines are
       lined up under the message. */
    auto text = chomp(body.str());
    auto lines = splitString<std::vector<std::string_view>>(text, "\n");
    std::string pad(filterANSIEscapes(prefix, true).size(), ' ');
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0)
            out << "\n";
        out << chomp((i == 0 ? prefix : pad) + std::string(lines[i]));
    }

    return out;
}

void unreachable(std::source_location loc)
{
    writeToStderr(
        fmt("\n" ANSI_RED "internal error:" ANSI_NORMAL " unexpected condition in %s at %s:%s\n",
            loc.function_name(),
            loc.file_name(),
            loc.line()));
    std::terminate();
}

} // namespace ocs
