#pragma once
///@file

#include "artcache/util/logging.hh"
#include "artcache/util/sync.hh"

#include <vector>

namespace artcache {

/**
 * An activity as seen by a `CapturingLogger`. String fields are kept
 * as strings and integer fields as their decimal representation.
 */
struct CapturedActivity
{
    ActivityId id;
    ActivityType type;
    std::string text;
    std::vector<std::string> fields;
    ActivityId parent;
    bool stopped = false;
    std::vector<std::pair<ResultType, std::vector<std::string>>> results;
};

/**
 * A logger that keeps what it is given.
 */
class CapturingLogger : public Logger
{
    Sync<std::vector<std::pair<Verbosity, std::string>>> messages;

    Sync<std::vector<CapturedActivity>> activities;

public:

    void log(Verbosity lvl, std::string_view s) override;

    void logEI(const ErrorInfo & ei) override;

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override;

    void stopActivity(ActivityId act) override;

    void result(ActivityId act, ResultType type, const Fields & fields) override;

    /**
     * The activities started so far of type `type`, in the order they
     * were started.
     */
    std::vector<CapturedActivity> getActivities(ActivityType type);

    std::vector<std::string> getMessages(Verbosity maxLevel = lvlVomit);

    /**
     * Whether any message at or below `maxLevel` contains `needle`.
     */
    bool contains(std::string_view needle, Verbosity maxLevel = lvlVomit);
};

/**
 * Replaces the global logger by a CapturingLogger for the lifetime of
 * this object.
 */
class CaptureLogs
{
    std::unique_ptr<Logger> previous;
    CapturingLogger * capturing;

public:

    CaptureLogs();

    ~CaptureLogs();

    CapturingLogger & operator*() const
    {
        return *capturing;
    }

    CapturingLogger * operator->() const
    {
        return capturing;
    }
};

} // namespace artcache
