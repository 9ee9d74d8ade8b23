#include "artcache/util/logging.hh"
#include "artcache/util/ansicolor.hh"
#include "artcache/util/file-descriptor.hh"

#include <atomic>
#include <sstream>
#include <unistd.h>

namespace artcache {

static thread_local ActivityId curActivity = 0;

ActivityId getCurActivity()
{
    return curActivity;
}

void setCurActivity(const ActivityId activityId)
{
    curActivity = activityId;
}

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    Descriptor standard_out = getStandardOutput();
    writeFull(standard_out, s);
    writeFull(standard_out, "\n");
}

/**
 * Remove SGR escape sequences (`ESC [ ... m`), for output that is not
 * going to a terminal.
 */
static std::string stripColours(std::string_view s)
{
    std::string res;
    res.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\e' && i + 1 < s.size() && s[i + 1] == '[') {
            auto end = s.find('m', i + 2);
            if (end != s.npos) {
                i = end;
                continue;
            }
        }
        res += s[i];
    }
    return res;
}

class SimpleLogger : public Logger
{
public:

    bool tty;

    SimpleLogger()
    {
        tty = isatty(STDERR_FILENO);
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        writeToStderr((tty ? std::string(s) : stripColours(s)) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);

        log(ei.level, oss.str());
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        if (lvl <= verbosity && !s.empty())
            log(lvl, s + "...");
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::atomic<uint64_t> nextId{0};

Activity::Activity(
    Logger & logger,
    Verbosity lvl,
    ActivityType type,
    const std::string & s,
    const Logger::Fields & fields,
    ActivityId parent)
    : logger(logger)
    , id(nextId++ + (((uint64_t) getpid()) << 32))
{
    logger.startActivity(id, lvl, type, s, fields, parent);
}

Activity::~Activity()
{
    try {
        logger.stopActivity(id);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s);
    } catch (SystemError & e) {
        /* Ignore failing writes to stderr.  We need to ignore write
           errors to ensure that cleanup code that logs to stderr runs
           to completion if the other side of stderr has been closed
           unexpectedly. */
    }
}

} // namespace artcache
