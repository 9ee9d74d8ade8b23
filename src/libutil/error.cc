#include "artcache/util/error.hh"
#include "artcache/util/logging.hh"

#include <sstream>

namespace artcache {

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream str;
        showErrorInfo(str, err);
        what_ = str.str();
    }
    return *what_;
}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

static std::string_view levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return "error";
    case lvlWarn:
        return "warning";
    case lvlNotice:
        return "note";
    case lvlInfo:
        return "info";
    case lvlTalkative:
        return "talk";
    case lvlChatty:
        return "chat";
    case lvlDebug:
        return "debug";
    case lvlVomit:
        return "vomit";
    }
    unreachable();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    out << levelPrefix(einfo.level) << ": " << einfo.msg.str();

    for (auto i = einfo.traces.rbegin(); i != einfo.traces.rend(); ++i)
        out << "\n       … " << i->str();

    return out;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        throw;
    } catch (std::exception & e) {
        printMsg(lvl, "error (ignored): %1%", e.what());
    }
}

void panic(std::string_view msg)
{
    writeToStderr(fmt("\nartcache: internal error: %s\n", msg));
    std::terminate();
}

void unreachable(const char * file, int line)
{
    panic(fmt("unexpected code path reached at %s:%d", file, line));
}

} // namespace artcache
