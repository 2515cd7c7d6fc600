// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// options-and-output.cpp
//
#include "options-and-output.hpp"

#include "str-util.hpp"
#include "util.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace replicator
{

    OptionsAndOutput::OptionsAndOutput(const std::vector<std::string> & args)
        : m_options()
        , m_output(findLogBase(args))
        , m_pendingSource()
        , m_pendingName()
    {
        setOptions(args);

        printJobSummary(args);
        printConflictingOptionsWarnings();
        printOptionsSummary();
    }

    std::wstring OptionsAndOutput::findLogBase(const std::vector<std::string> & args)
    {
        std::wstring logBase{ Options::default_log_base };

        for (std::size_t i{ 0 }; i < args.size(); ++i)
        {
            if (args[i] == "--no-log")
            {
                return L"";
            }
            else if ((args[i] == "--log") && ((i + 1) < args.size()))
            {
                logBase = strutil::toWideString(args[i + 1]);
            }
        }

        return logBase;
    }

    void OptionsAndOutput::printUsage()
    {
        std::wostringstream ss;

        ss << L"\nUsage:\n";
        ss << L"   replicator <options> [--name <name>] <source_dir> <destination_dir> ...\n";
        ss << L"    -";
        printLine(ss.str());

        printLine(
            L"    Note: Each source/destination pair is replicated in order, one after the other.",
            Color::Yellow);

        // clang-format off
    ss.str(L"");
    ss << L"    -\n";
    ss << L"    --name <text>           Names the source/destination pair that follows.\n";
    ss << L"    --max-size <size>       Largest chunk before a directory is split.      (default 10G)\n";
    ss << L"    --max-files <n>         Most files in a chunk before a directory is split. (default 50000)\n";
    ss << L"    --max-depth <n>         Directories are never split below this depth.   (default 5)\n";
    ss << L"    --min-size <size>       Directories smaller than this are never split.  (default 100M)\n";
    ss << L"    -\n";
    ss << L"    --jobs <n>              Chunks copied at the same time, 1-64.           (default 8)\n";
    ss << L"    --retries <n>           Retries for a chunk that fails.                 (default 3)\n";
    ss << L"    --fatal-retries <n>     Retries for a chunk that fails fatally.         (default 1)\n";
    ss << L"    --retry-delay-ms <n>    Wait before a failed chunk is retried.          (default 0)\n";
    ss << L"    --retry-backoff <x>     Multiplies the retry delay after each retry.    (default 1.0)\n";
    ss << L"    --job-timeout-ms <n>    Kills and retries chunks that take longer.      (default 0=never)\n";
    ss << L"    --breaker-threshold <n> Pause new chunks after more failures in a row.  (default 5, 0=never)\n";
    ss << L"    --breaker-window-ms <n> ...than this, all within this time.             (default 60000)\n";
    ss << L"    --breaker-cooldown-ms <n> How long new chunks are paused for.           (default 120000)\n";
    ss << L"    --tick-ms <n>           How often running chunks are checked on.        (default 250)\n";
    ss << L"    --eta-window-ms <n>     How far back the time remaining looks.          (default 30000)\n";
    ss << L"    -\n";
    ss << L"    --help                  Shows this, but does nothing else.\n";
    ss << L"    --dry-run               Shows the chunks that WOULD have been copied, but copies nothing.\n";
    ss << L"    --verbose               Shows extra info. (i.e. every chunk start, skipped links).\n";
    ss << L"    --quiet                 Shows only errors and the final result.\n";
    ss << L"    --log <name>            Logfiles are named <name>--<date>--<time>--<n>.log (default replicator)\n";
    ss << L"    --no-log                Writes no logfile.\n";
        // clang-format on

        ss << L"    --color-on              Enables colored console output.";
        if (Options::isColorEnabledByDefault())
        {
            ss << L"  (default)";
        }
        ss << L"\n";

        ss << L"    --color-off             Disables colored console output.";
        if (!Options::isColorEnabledByDefault())
        {
            ss << L" (default)";
        }

        printLine(ss.str());
    }

    void OptionsAndOutput::printJobSummary(const std::vector<std::string> & args)
    {
        std::wostringstream ss;

        // put the whole call with all the command line arguments in the logfile
        ss << L"replicator";
        for (const auto & arg : args)
        {
            ss << L" " << strutil::toWideString(arg);
        }
        ss << L"\n";

        ss << ((m_options.dry_run) ? L"Planning" : L"Replicating") << L"...";

        for (const Profile & profile : m_options.profiles)
        {
            ss << L"\n   " << profile.name << L":  " << profile.source.wstring() << L"  ->  "
               << profile.destination.wstring();
        }

        printLine(ss.str());
    }

    void OptionsAndOutput::printOptionsSummary()
    {
        std::wstring str;

        auto appendFlagIf = [&](const bool is, const std::wstring & name) {
            if (is)
            {
                if (!str.empty())
                {
                    str += L", ";
                }

                str += name;
            }
        };

        appendFlagIf(m_options.dry_run, L"dry_run");
        appendFlagIf(m_options.verbose, L"verbose");

        // only show the color option if it is not set to the default value
        if (Options::isColorEnabledByDefault() != m_output.color())
        {
            appendFlagIf(m_output.color(), L"color_on");
            appendFlagIf(!m_output.color(), L"color_off");
        }

        if (m_options.verbose)
        {
            const PlanThresholds & plan{ m_options.thresholds };
            const OrchestratorSettings & orch{ m_options.orchestrator };

            std::wostringstream ss;
            ss << L"max_size=" << fileSizeToString(plan.max_size_bytes);
            ss << L", max_files=" << plan.max_files;
            ss << L", max_depth=" << plan.max_depth;
            ss << L", min_size=" << fileSizeToString(plan.min_size_bytes);
            ss << L", jobs=" << orch.max_concurrent_jobs;
            ss << L", retries=" << orch.max_retries;
            ss << L", fatal_retries=" << orch.max_fatal_retries;
            ss << L", retry_delay=" << orch.retry_delay.count() << L"ms";
            ss << L", retry_backoff=" << orch.retry_backoff;
            ss << L", job_timeout=" << orch.job_timeout.count() << L"ms";
            ss << L", breaker=" << orch.breaker.failure_threshold << L"/"
               << orch.breaker.window.count() << L"ms/" << orch.breaker.cooldown.count() << L"ms";
            ss << L", tick=" << m_options.tick_period.count() << L"ms";

            appendFlagIf(true, ss.str());
        }

        if (!str.empty())
        {
            str = (L"   (" + str + L")");
            printLine(str);
        }
    }

    void OptionsAndOutput::printConflictingOptionsWarnings()
    {
        if (m_options.quiet && m_options.verbose)
        {
            m_options.quiet = false;
            printLine(
                L"Warning:  The --quiet option disabled by the --verbose option.", Color::Yellow);
        }

        if ((m_options.orchestrator.max_fatal_retries > m_options.orchestrator.max_retries))
        {
            printLine(
                L"Warning:  The --fatal-retries option is limited by the --retries option.",
                Color::Yellow);
        }
    }

    void OptionsAndOutput::printLine(std::wstring_view str, const Color color)
    {
        if (m_options.quiet && (Color::Red != color))
        {
            return;
        }

        m_output.print(str, color);
    }

    void OptionsAndOutput::printLineToConsoleOnly(std::wstring_view str, const Color color)
    {
        if (m_options.quiet && (Color::Red != color))
        {
            return;
        }

        m_output.printToConsoleOnly(str, color);
    }

    void OptionsAndOutput::setOptions(const std::vector<std::string> & args)
    {
        m_output.color(Options::isColorEnabledByDefault());
        m_options.log_base = findLogBase(args);
        setOptions_FromCommandLineArgs(args);
        setOptions_Profiles();
    }

    void OptionsAndOutput::setOptions_Profiles()
    {
        if (!m_pendingSource.empty())
        {
            printAndThrow(L"No destination directory for source: \"" + m_pendingSource + L"\"");
        }

        if (!m_pendingName.empty())
        {
            printAndThrow(L"The --name \"" + m_pendingName + L"\" was not followed by any paths.");
        }

        if (m_options.profiles.empty())
        {
            printAndThrow(L"No source directory.");
        }
    }

    void OptionsAndOutput::setOptions_FromCommandLineArgs(const std::vector<std::string> & args)
    {
        if (args.empty())
        {
            printUsage();
        }

        for (std::size_t i{ 0 }; i < args.size(); ++i)
        {
            // if not an option string, then the arg must be one of the source/destination paths
            if (!setOptions_IfFlagString(args[i]) && !setOptions_IfValueOption(args, i))
            {
                setOptions_addPath(args[i]);
            }
        }
    }

    bool OptionsAndOutput::setOptions_IfFlagString(const std::string & arg)
    {
        if (arg == "--dry-run")
        {
            m_options.dry_run = true;
        }
        else if (arg == "--verbose")
        {
            m_options.verbose = true;
        }
        else if (arg == "--quiet")
        {
            m_options.quiet = true;
        }
        else if (arg == "--no-log")
        {
            // see findLogBase()
        }
        else if (
            (arg == "--show-color") || (arg == "--show-colors") || (arg == "--color") ||
            (arg == "--colors") || (arg == "--color-on") || (arg == "--colors-on"))
        {
            m_output.color(true);
        }
        else if (
            (arg == "--hide-color") || (arg == "--hide-colors") || (arg == "--no-color") ||
            (arg == "--no-colors") || (arg == "--color-off") || (arg == "--colors-off"))
        {
            m_output.color(false);
        }
        else if ((arg == "--help") || (arg == "-h") || (arg == "/?"))
        {
            printUsage();
            throw silent_runtime_error();
        }
        else
        {
            return false;
        }

        return true;
    }

    bool OptionsAndOutput::setOptions_IfValueOption(
        const std::vector<std::string> & args, std::size_t & argIndex)
    {
        const std::string & name{ args.at(argIndex) };

        // clang-format off
        static const std::vector<std::string> valueOptionNames{
            "--name", "--log", "--max-size", "--max-files", "--max-depth", "--min-size", "--jobs",
            "--retries", "--fatal-retries", "--retry-delay-ms", "--retry-backoff",
            "--job-timeout-ms", "--breaker-threshold", "--breaker-window-ms",
            "--breaker-cooldown-ms", "--tick-ms", "--eta-window-ms" };
        // clang-format on

        if (std::find(std::begin(valueOptionNames), std::end(valueOptionNames), name) ==
            std::end(valueOptionNames))
        {
            return false;
        }

        if ((argIndex + 1) >= args.size())
        {
            printAndThrow(L"The " + strutil::toWideString(name) + L" option needs a value.");
        }

        const std::string & value{ args.at(++argIndex) };

        constexpr std::uint64_t unlimited{ std::numeric_limits<std::uint64_t>::max() };
        PlanThresholds & plan{ m_options.thresholds };
        OrchestratorSettings & orch{ m_options.orchestrator };

        if (name == "--name")
        {
            std::string nameStr{ value };
            strutil::trimIf(nameStr, [](const char ch) { return strutil::isWhitespace(ch); });

            if (nameStr.empty())
            {
                printAndThrow(L"The --name value is empty.");
            }

            m_pendingName = strutil::toWideString(nameStr);
        }
        else if (name == "--log")
        {
            // nothing to do, findLogBase() already took it before the logfile was opened
        }
        else if ((name == "--max-size") || (name == "--min-size"))
        {
            const auto size{ strutil::parseByteSize(value) };
            if (!size)
            {
                printAndThrow(
                    L"The " + strutil::toWideString(name) + L" value \"" +
                    strutil::toWideString(value) + L"\" is not a size.  (i.e. 500M, 10G, 1T)");
            }

            ((name == "--max-size") ? plan.max_size_bytes : plan.min_size_bytes) = size.value();
        }
        else if (name == "--max-files")
        {
            plan.max_files = setOptions_ParseCount(name, value, 1, unlimited);
        }
        else if (name == "--max-depth")
        {
            plan.max_depth = static_cast<std::size_t>(setOptions_ParseCount(name, value, 0, 1000));
        }
        else if (name == "--jobs")
        {
            orch.max_concurrent_jobs = static_cast<std::size_t>(setOptions_ParseCount(
                name, value, 1, OrchestratorSettings::max_concurrent_jobs_limit));
        }
        else if (name == "--retries")
        {
            orch.max_retries =
                static_cast<std::size_t>(setOptions_ParseCount(name, value, 0, 1000));
        }
        else if (name == "--fatal-retries")
        {
            orch.max_fatal_retries =
                static_cast<std::size_t>(setOptions_ParseCount(name, value, 0, 1000));
        }
        else if (name == "--retry-delay-ms")
        {
            orch.retry_delay = setOptions_ParseMs(name, value);
        }
        else if (name == "--retry-backoff")
        {
            const auto backoff{ strutil::parsePositiveDecimal(value) };
            if (!backoff || (backoff.value() < 1.0) || (backoff.value() > 100.0))
            {
                printAndThrow(
                    L"The --retry-backoff value \"" + strutil::toWideString(value) +
                    L"\" is not a number from 1.0 to 100.0");
            }

            orch.retry_backoff = backoff.value();
        }
        else if (name == "--job-timeout-ms")
        {
            orch.job_timeout = setOptions_ParseMs(name, value);
        }
        else if (name == "--breaker-threshold")
        {
            orch.breaker.failure_threshold =
                static_cast<std::size_t>(setOptions_ParseCount(name, value, 0, 1'000'000));
        }
        else if (name == "--breaker-window-ms")
        {
            orch.breaker.window = setOptions_ParseMs(name, value);
        }
        else if (name == "--breaker-cooldown-ms")
        {
            orch.breaker.cooldown = setOptions_ParseMs(name, value);
        }
        else if (name == "--tick-ms")
        {
            m_options.tick_period = Duration_t(setOptions_ParseCount(name, value, 1, 60'000));
        }
        else // --eta-window-ms
        {
            orch.eta_window = Duration_t(setOptions_ParseCount(name, value, 1, 86'400'000));
        }

        return true;
    }

    std::uint64_t OptionsAndOutput::setOptions_ParseCount(
        const std::string & name,
        const std::string & value,
        const std::uint64_t min,
        const std::uint64_t max)
    {
        const auto number{ strutil::parseUnsigned(value) };
        if (!number || (number.value() < min) || (number.value() > max))
        {
            std::wostringstream ss;
            ss << L"The " << strutil::toWideString(name) << L" value \""
               << strutil::toWideString(value) << L"\" is not a whole number from " << min;

            if (max < std::numeric_limits<std::uint64_t>::max())
            {
                ss << L" to " << max;
            }
            else
            {
                ss << L" or more";
            }

            printAndThrow(ss.str());
        }

        return number.value();
    }

    Duration_t
        OptionsAndOutput::setOptions_ParseMs(const std::string & name, const std::string & value)
    {
        // one week
        const std::uint64_t maxMs{ 7_u64 * 24 * 60 * 60 * 1000 };

        return Duration_t(
            static_cast<Duration_t::rep>(setOptions_ParseCount(name, value, 0, maxMs)));
    }

    std::wstring OptionsAndOutput::setOptions_MakePathString(const std::string & arg)
    {
        std::string pathStr{ arg };

        // remove wrapping quotes
        strutil::trimIf(
            pathStr, [](const auto ch) { return (strutil::isWhitespace(ch) || (ch == '\"')); });

        // windows drive letters don't work without the trailing slash, so add it here
        if ((pathStr.size() == 2) && strutil::isAlpha(pathStr.at(0)) && (pathStr.at(1) == ':'))
        {
            pathStr += static_cast<char>(fs::path::preferred_separator);
        }

        return strutil::toWideString(pathStr);
    }

    void OptionsAndOutput::setOptions_addPath(const std::string & arg)
    {
        if ((arg.size() > 2) && (arg.substr(0, 2) == "--"))
        {
            printAndThrow(L"Unknown option: \"" + strutil::toWideString(arg) + L"\"");
        }

        const std::wstring pathStr{ setOptions_MakePathString(arg) };

        if (m_pendingSource.empty())
        {
            printAndThrowIf(pathStr.empty(), pathStr, L"Path is empty");
            m_pendingSource = pathStr;
            return;
        }

        Profile profile;
        profile.source      = setOptions_MakeSourcePath(m_pendingSource);
        profile.destination = setOptions_MakeDestinationPath(pathStr);

        profile.name = m_pendingName;
        if (profile.name.empty())
        {
            profile.name = profile.source.filename().wstring();
        }

        if (profile.name.empty())
        {
            profile.name = profile.source.wstring();
        }

        m_options.profiles.push_back(profile);
        m_pendingSource.clear();
        m_pendingName.clear();
    }

    fs::path OptionsAndOutput::setOptions_MakeSourcePath(const std::wstring & pathStrOrig)
    {
        printAndThrowIf(pathStrOrig.empty(), pathStrOrig, L"Path is empty");

        ErrorCode_t errorCode;
        fs::path pathObj{ fs::absolute(fs::path(pathStrOrig), errorCode) };
        printAndThrowIfErrorCode(errorCode, pathStrOrig, L"Path could not be made absolute");

        // "C:\dir\" and "C:\dir" should both name "dir"
        if (!pathObj.has_filename() && pathObj.has_relative_path())
        {
            pathObj = pathObj.parent_path();
        }

        const bool doesExist{ fs::exists(pathObj, errorCode) };
        printAndThrowIfErrorCode(errorCode, pathObj.wstring(), L"Source path does not exist");

        printAndThrowIf(
            !doesExist,
            pathObj.wstring(),
            L"Source path does not exist (after cleanup and making absolute)");

        const fs::file_status status{ fs::symlink_status(pathObj, errorCode) };
        printAndThrowIfErrorCode(errorCode, pathObj.wstring(), L"Path failed symlink_status()");

        printAndThrowIf(
            !fs::is_directory(status),
            pathObj.wstring(),
            (std::wstring(L"Source path is a ") + toString(status.type()) +
             L", which is not a kind of supported directory on this operating system."));

        return pathObj;
    }

    fs::path OptionsAndOutput::setOptions_MakeDestinationPath(const std::wstring & pathStrOrig)
    {
        printAndThrowIf(pathStrOrig.empty(), pathStrOrig, L"Path is empty");

        ErrorCode_t errorCode;
        fs::path pathObj{ fs::absolute(fs::path(pathStrOrig), errorCode) };
        printAndThrowIfErrorCode(errorCode, pathStrOrig, L"Path could not be made absolute");

        if (!pathObj.has_filename() && pathObj.has_relative_path())
        {
            pathObj = pathObj.parent_path();
        }

        // a missing destination is fine, the copy will create it
        const fs::file_status status{ fs::symlink_status(pathObj, errorCode) };
        if (!errorCode && fs::exists(status))
        {
            printAndThrowIf(
                !fs::is_directory(status),
                pathObj.wstring(),
                (std::wstring(L"Destination path is a ") + toString(status.type()) +
                 L", not a directory."));
        }

        return pathObj;
    }

    void OptionsAndOutput::printAndThrow(const std::wstring & errorMessage)
    {
        printLine(L"Error: " + errorMessage + L" (consider trying --help)", Color::Red);
        throw silent_runtime_error();
    }

    void OptionsAndOutput::printAndThrowIf(
        const bool isError, const std::wstring & path, const std::wstring & error)
    {
        if (!isError)
        {
            return;
        }

        printAndThrow(error + L":  \"" + path + L"\"");
    }

    void OptionsAndOutput::printAndThrowIfErrorCode(
        const ErrorCode_t & errorCode, const std::wstring & path, const std::wstring & error)
    {
        if (!errorCode)
        {
            return;
        }

        printAndThrow(error + L":  \"" + path + L"\"  " + toString(errorCode));
    }

} // namespace replicator
