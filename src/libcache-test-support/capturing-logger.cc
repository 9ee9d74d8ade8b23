#include "artcache/cache/tests/capturing-logger.hh"

#include <sstream>
#include <string>

namespace artcache {

void CapturingLogger::log(Verbosity lvl, std::string_view s)
{
    messages.lock()->emplace_back(lvl, std::string(s));
}

void CapturingLogger::logEI(const ErrorInfo & ei)
{
    std::ostringstream oss;
    showErrorInfo(oss, ei);
    log(ei.level, oss.str());
}

static std::vector<std::string> showFields(const Logger::Fields & fields)
{
    std::vector<std::string> res;
    for (auto & field : fields)
        res.push_back(field.type == Logger::Field::Type::String ? field.s : std::to_string(field.i));
    return res;
}

void CapturingLogger::startActivity(
    ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, const Fields & fields, ActivityId parent)
{
    activities.lock()->push_back(CapturedActivity{
        .id = act,
        .type = type,
        .text = s,
        .fields = showFields(fields),
        .parent = parent,
    });
}

void CapturingLogger::stopActivity(ActivityId act)
{
    auto as(activities.lock());
    for (auto & a : *as)
        if (a.id == act)
            a.stopped = true;
}

void CapturingLogger::result(ActivityId act, ResultType type, const Fields & fields)
{
    auto as(activities.lock());
    for (auto & a : *as)
        if (a.id == act)
            a.results.emplace_back(type, showFields(fields));
}

std::vector<CapturedActivity> CapturingLogger::getActivities(ActivityType type)
{
    std::vector<CapturedActivity> res;
    auto as(activities.lock());
    for (auto & a : *as)
        if (a.type == type)
            res.push_back(a);
    return res;
}

std::vector<std::string> CapturingLogger::getMessages(Verbosity maxLevel)
{
    std::vector<std::string> res;
    auto ms(messages.lock());
    for (auto & [lvl, msg] : *ms)
        if (lvl <= maxLevel)
            res.push_back(msg);
    return res;
}

bool CapturingLogger::contains(std::string_view needle, Verbosity maxLevel)
{
    for (auto & msg : getMessages(maxLevel))
        if (msg.find(needle) != std::string::npos)
            return true;
    return false;
}

CaptureLogs::CaptureLogs()
{
    auto l = std::make_unique<CapturingLogger>();
    capturing = l.get();
    previous = std::exchange(logger, std::move(l));
}

CaptureLogs::~CaptureLogs()
{
    logger = std::move(previous);
}

} // namespace artcache
