#pragma once
///@file

#include "artcache/util/error.hh"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace artcache {

enum class ActivityType {
    Unknown = 0,
    CacheFetch = 100,
    CacheStore = 101,
};

enum class ResultType {
    CacheFetchResult = 100,
    CacheStoreResult = 101,
};

typedef uint64_t ActivityId;

class Logger
{
    friend struct Activity;

public:

    struct Field
    {
        enum class Type { Int = 0, String = 1 };
        Type type;

        uint64_t i = 0;
        std::string s;

        Field(const std::string & s)
            : type(Type::String)
            , s(s)
        {
        }

        Field(const char * s)
            : type(Type::String)
            , s(s)
        {
        }

        Field(const uint64_t & i)
            : type(Type::Int)
            , i(i)
        {
        }

        Field(const ActivityType & a)
            : type(Type::Int)
            , i(static_cast<uint64_t>(a))
        {
        }
    };

    typedef std::vector<Field> Fields;

    virtual ~Logger() {}

    virtual void stop() {};

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void log(std::string_view s)
    {
        log(lvlInfo, s);
    }

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    virtual void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) {};

    virtual void stopActivity(ActivityId act) {};

    virtual void result(ActivityId act, ResultType type, const Fields & fields) {};

    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    inline void cout(const Args &... args)
    {
        writeToStdout(fmt(args...));
    }
};

/**
 * A variadic template that does nothing.
 *
 * Useful to call a function with each argument in a parameter pack.
 */
struct nop
{
    template<typename... T>
    nop(T...)
    {
    }
};

ActivityId getCurActivity();
void setCurActivity(const ActivityId activityId);

/**
 * Something the logger is told about as a whole: it starts when the
 * `Activity` is constructed and stops when it is destroyed, and may
 * report results in between. Activities started while another one is
 * pushed on the same thread become its children.
 */
struct Activity
{
    Logger & logger;

    const ActivityId id;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        const Logger::Fields & fields = {},
        ActivityId parent = getCurActivity());

    Activity(const Activity & act) = delete;

    ~Activity();

    template<typename... Args>
    void result(ResultType type, const Args &... args) const
    {
        Logger::Fields fields;
        nop{(fields.emplace_back(Logger::Field(args)), 1)...};
        result(type, fields);
    }

    void result(ResultType type, const Logger::Fields & fields) const
    {
        logger.result(id, type, fields);
    }

    friend class Logger;
};

struct PushActivity
{
    const ActivityId prevAct;

    PushActivity(ActivityId act)
        : prevAct(getCurActivity())
    {
        setCurActivity(act);
    }

    ~PushActivity()
    {
        setCurActivity(prevAct);
    }
};

extern std::unique_ptr<Logger> logger;

/**
 * The default logger: writes to stderr, one line per message.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)                  \
    do {                                                   \
        if ((level) <= artcache::verbosity) {              \
            artcache::logger->logEI((level), errorInfo);   \
        }                                                  \
    } while (0)

#define logError(errorInfo...) logErrorInfo(artcache::lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(artcache::lvlWarn, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...)          \
    do {                                                    \
        auto __lvl = level;                                 \
        if (__lvl <= artcache::verbosity) {                 \
            loggerParam->log(__lvl, artcache::fmt(args));   \
        }                                                   \
    } while (0)
#define printMsg(level, args...) printMsgUsing(artcache::logger, level, args)

#define printError(args...) printMsg(artcache::lvlError, args)
#define notice(args...) printMsg(artcache::lvlNotice, args)
#define printInfo(args...) printMsg(artcache::lvlInfo, args)
#define printTalkative(args...) printMsg(artcache::lvlTalkative, args)
#define debug(args...) printMsg(artcache::lvlDebug, args)
#define vomit(args...) printMsg(artcache::lvlVomit, args)

/**
 * if verbosity >= lvlWarn, print a message with a 'warning:' prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    logger->warn(f.str());
}

void writeToStderr(std::string_view s);

} // namespace artcache
