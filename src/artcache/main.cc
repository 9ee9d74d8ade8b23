#include "artcache/cache/artifact-cache-factory.hh"
#include "artcache/cache/cache-settings.hh"
#include "artcache/util/ansicolor.hh"
#include "artcache/util/file-system.hh"
#include "artcache/util/logging.hh"
#include "artcache/util/strings.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <optional>

using namespace artcache;

static const std::string programName = "artcache";

static void showHelp()
{
    logger->writeToStdout("Usage: " + programName + R"( [options] <command> [args...]

Commands:
  fetch <rule-key> <output>         Fetch an artifact into <output>.
  store [--key <rule-key>]...       Store the file <path> under the given keys.
        [--metadata <name>=<value>]...
        [--borrow] <path>
  show-config                       Print the effective configuration as JSON.

Options:
  --option <name> <value>           Override a configuration setting.
  --json                            Print results as JSON.
  -v, --verbose                     Increase verbosity (may be repeated).
  --help                            Show this help.
  --version                         Show the version.)");
}

static std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

static int handleExceptions(std::function<int()> fun)
{
    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        return fun();
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
}

static int runFetch(ArtifactCache & cache, const Strings & args, bool json)
{
    if (args.size() != 2)
        throw UsageError("'fetch' takes a rule key and an output path");

    auto key = RuleKey::parse(args.front());
    auto output = LazyPath::ofPath(std::filesystem::absolute(args.back()));

    auto result = cache.fetch(key, output);

    if (json)
        logger->cout("%s", nlohmann::json(result).dump());
    else if (result.isSuccess())
        printInfo(ANSI_GREEN "%s" ANSI_NORMAL, result.to_string());
    else
        printInfo("%s", result.to_string());

    return result.isSuccess() ? 0 : 1;
}

static int runStore(ArtifactCache & cache, Strings args, bool json)
{
    std::vector<RuleKey> keys;
    StringMap metadata;
    bool borrow = false;
    std::optional<std::filesystem::path> path;

    for (auto i = args.begin(); i != args.end(); ++i) {
        if (*i == "--key")
            keys.push_back(RuleKey::parse(getArg(*i, i, args.end())));
        else if (*i == "--metadata") {
            auto s = getArg(*i, i, args.end());
            auto eq = s.find('=');
            if (eq == std::string::npos || eq == 0)
                throw UsageError("'--metadata' expects 'NAME=VALUE', got '%1%'", s);
            metadata.insert_or_assign(s.substr(0, eq), s.substr(eq + 1));
        } else if (*i == "--borrow")
            borrow = true;
        else if (hasPrefix(*i, "-"))
            throw UsageError("unknown flag '%1%' for 'store'", *i);
        else if (path)
            throw UsageError("'store' takes a single path");
        else
            path = std::filesystem::absolute(*i);
    }

    if (!path)
        throw UsageError("'store' requires a path");
    if (keys.empty())
        throw UsageError("'store' requires at least one '--key'");
    if (!pathExists(*path))
        throw Error("file '%s' does not exist", path->string());

    ArtifactInfo info(keys, std::move(metadata));
    auto output = borrow ? BorrowablePath::borrowable(*path) : BorrowablePath::notBorrowable(*path);

    auto result = cache.store(info, output).get();

    if (json)
        logger->cout("%s", nlohmann::json{{"artifactSizeBytes", result.artifactSizeBytes}}.dump());
    else
        printInfo("stored '%s' (%d bytes)", info.ruleKeys().front(), result.artifactSizeBytes);

    return 0;
}

int main(int argc, char ** argv)
{
    return handleExceptions([&]() {
        Strings args;
        for (int n = 1; n < argc; ++n)
            args.push_back(argv[n]);

        std::vector<std::pair<std::string, std::string>> options;
        bool json = false;
        std::string command;
        Strings commandArgs;

        for (auto i = args.begin(); i != args.end(); ++i) {
            if (!command.empty())
                commandArgs.push_back(*i);
            else if (*i == "--help") {
                showHelp();
                return 0;
            } else if (*i == "--version") {
                logger->cout("%s %s", programName, ARTCACHE_VERSION);
                return 0;
            } else if (*i == "--verbose" || *i == "-v")
                verbosity = (Verbosity) (verbosity + 1);
            else if (*i == "--json")
                json = true;
            else if (*i == "--option") {
                auto name = getArg(*i, i, args.end());
                auto value = getArg("--option", i, args.end());
                options.emplace_back(name, value);
            } else if (hasPrefix(*i, "-"))
                throw UsageError("unrecognised flag '%1%'", *i);
            else
                command = *i;
        }

        if (command.empty())
            throw UsageError("no command given");

        CacheSettings settings;
        loadConfFile(settings);
        for (auto & [name, value] : options)
            if (!settings.set(name, value))
                throw UsageError("unknown setting '%1%'", name);
        settings.warnUnknownSettings();

        if (command == "show-config") {
            logger->cout("%s", settings.toJSON().dump(json ? -1 : 2));
            return 0;
        }

        auto cache = createArtifactCache(settings);

        int status;
        if (command == "fetch")
            status = runFetch(*cache, commandArgs, json);
        else if (command == "store")
            status = runStore(*cache, commandArgs, json);
        else
            throw UsageError("unknown command '%1%'", command);

        cache->close();
        return status;
    });
}
