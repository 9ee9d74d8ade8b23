#pragma once
/**
 * @file
 *
 * Every exception thrown by artcache derives from `BaseError`, which
 * holds an `ErrorInfo`: a severity, a message and the context lines
 * added while the error propagated. The text returned by `what()` is
 * rendered from it on first use.
 *
 * New error types are declared with `MakeError`, and should derive
 * from `Error` or one of its descendants.
 */

#include "artcache/util/fmt.hh"

#include <cerrno>
#include <cstring>
#include <exception>
#include <list>
#include <optional>
#include <string>

namespace artcache {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;

    /**
     * Innermost first.
     */
    std::list<HintFmt> traces;

    /**
     * Exit status of a program that dies of this error.
     */
    unsigned int status = 1;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:
    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.level = lvlError, .msg = hint}
    {
    }

    /**
     * The message alone, without severity prefix or traces.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const ErrorInfo & info() const
    {
        calcWhat();
        return err;
    }

    /**
     * Record what was being done when the error passed through, before
     * rethrowing it.
     */
    template<typename... Args>
    void addTrace(const std::string & fs, const Args &... args)
    {
        err.traces.push_back(HintFmt(fs, args...));
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);
MakeError(EndOfFile, Error);
MakeError(SystemError, Error);

/**
 * A failed system call. The message is followed by `strerror(errNo)`.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError("")
        , errNo(errNo)
    {
        err.msg = HintFmt("%1%: %2%", HintFmt(args...).str(), strerror(errNo));
    }

    /**
     * Takes the error number from `errno`, so nothing may clobber it
     * between the failing call and this constructor.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Log the exception being handled. Only for `catch (...)` blocks in
 * destructors, where nothing can be thrown.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

[[noreturn]]
void panic(std::string_view msg);

[[gnu::noinline, gnu::cold, noreturn]] void unreachable(const char * file = __builtin_FILE(), int line = __builtin_LINE());

} // namespace artcache
