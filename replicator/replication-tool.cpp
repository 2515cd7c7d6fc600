// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// replication-tool.cpp
//
#include "replication-tool.hpp"

#include "filesystem-copy-executor.hpp"
#include "str-util.hpp"
#include "util.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <sstream>

namespace replicator
{

    namespace
    {
        // signal handlers may only touch lock free atomics, so the stop is only noticed (and sent
        // to the tick thread) by the status loop on the main thread
        std::atomic<bool> wasStopSignalReceived{ false };

        void handleStopSignal(int)
        {
            wasStopSignalReceived = true;
        }

    } // namespace

    ReplicationTool::ReplicationTool(const std::vector<std::string> & args)
        : OptionsAndOutput(args)
        , m_filesystemProfiler()
        , m_profiler(m_filesystemProfiler)
        , m_eventSink(output(), options().verbose, options().quiet)
        , m_counters()
        , m_statusPeriodMs(5000)
        , m_wasStopped(false)
        , m_startTime(Clock_t::now()) // intentionally start time after all the option parsing
    {}

    int ReplicationTool::run()
    {
        bool wasExceptionError{ true };

        wasStopSignalReceived = false;
        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        try
        {
            runAllProfiles();
            wasExceptionError = false;
        }
        catch (const std::exception & ex)
        {
            printLine(
                (L"Fatal Exception: \"" + strutil::toWideString(ex.what()) + L"\""), Color::Red);
        }

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

        return printFinalResults(wasExceptionError);
    }

    void ReplicationTool::runAllProfiles()
    {
        for (const Profile & profile : options().profiles)
        {
            if (!runProfile(profile))
            {
                break;
            }
        }
    }

    bool ReplicationTool::runProfile(const Profile & profile)
    {
        printLine(
            L"Profile \"" + profile.name + L"\":  " + profile.source.wstring() + L"  ->  " +
            profile.destination.wstring());

        if (options().dry_run)
        {
            const PlanResult plan{ planProfile(profile) };
            printPlanProblems(plan);
            printDryRunChunks(plan);
            return true;
        }

        FilesystemCopyExecutor executor;

        JobOrchestrator orchestrator(executor, options().orchestrator, m_eventSink);
        orchestrator.beginScanning(profile.name);

        const PlanResult plan{ planProfile(profile) };
        printPlanProblems(plan);

        if (wasStopSignalReceived)
        {
            m_wasStopped = true;
            return false;
        }

        orchestrator.load(plan.chunks);
        replicate(orchestrator);

        m_counters.addProfile(orchestrator.state());
        printProfileResults(orchestrator);

        return (Phase::Stopped != orchestrator.state().phase);
    }

    PlanResult ReplicationTool::planProfile(const Profile & profile)
    {
        const Clock_t::time_point planStartTime{ Clock_t::now() };

        ChunkPlanner planner(m_profiler, options().thresholds);
        const PlanResult plan{ planner.plan(profile.source, profile.destination) };

        std::wostringstream ss;
        ss << L"   planned " << plan.chunks.size() << L" chunks, "
           << fileSizeToString(plan.totalEstimatedBytes()) << L" in "
           << plan.totalEstimatedFiles() << L" files, after "
           << prettyTimeDurationString(planStartTime);

        printLine(ss.str());
        return plan;
    }

    void ReplicationTool::printPlanProblems(const PlanResult & plan)
    {
        for (const SkippedPath & skipped : plan.skipped)
        {
            std::wostringstream ss;
            ss.width(12);
            ss << std::left << L"Skipped";
            ss.width(10);
            ss << std::left << toString(skipped.error);
            ss << skipped.path.wstring() << L"   {" << skipped.reason << L"}";
            printLine(ss.str(), Color::Red);
        }

        for (const fs::path & path : plan.depth_limited)
        {
            std::wostringstream ss;
            ss.width(12);
            ss << std::left << L"Warning";
            ss.width(10);
            ss << std::left << L"DepthLimit";
            ss << path.wstring()
               << L"   {over the size or file limit, but copied whole because it is too deep}";
            printLine(ss.str(), Color::Yellow);
        }

        if (options().verbose)
        {
            for (const fs::path & path : plan.reparse_points)
            {
                std::wostringstream ss;
                ss.width(12);
                ss << std::left << L"Warning";
                ss.width(10);
                ss << std::left << L"Link";
                ss << path.wstring() << L"   {not followed and not copied}";
                printLine(ss.str(), Color::Gray);
            }
        }
    }

    void ReplicationTool::printDryRunChunks(const PlanResult & plan)
    {
        for (const Chunk & chunk : plan.chunks)
        {
            std::wostringstream ss;
            ss << L"   #" << std::setw(5) << std::left << chunk.id;
            ss << std::setw(10) << std::right << fileSizeToString(chunk.estimated_size_bytes);
            ss << std::setw(9) << std::right << chunk.estimated_file_count << L" files  ";
            ss << (chunk.is_files_only ? L"f " : L"d ");
            ss << chunk.source_path.wstring() << L" -> " << chunk.destination_path.wstring();

            if (options().verbose)
            {
                ss << L"   {depth=" << chunk.depth << L", "
                   << copyOptionsToString(chunk.copy_options) << L"}";
            }

            printLine(ss.str());
        }
    }

    void ReplicationTool::replicate(JobOrchestrator & orchestrator)
    {
        TickDriver driver(orchestrator, options().tick_period);
        driver.start();

        auto statusUpdate = [&]() {
            checkForStopSignal(driver);
            printStatusUpdateIfTime(orchestrator);
        };

        try
        {
            driver.waitUntilFinished(statusUpdate);
        }
        catch (const std::exception &)
        {
            printLine(driver.exceptions().makeSummaryString(), Color::Red);
            throw;
        }
    }

    void ReplicationTool::checkForStopSignal(TickDriver & driver)
    {
        if (!wasStopSignalReceived || m_wasStopped)
        {
            return;
        }

        m_wasStopped = true;
        printLine(L"Stopping...  (killing every running chunk)", Color::Yellow);
        driver.stop();
    }

    void ReplicationTool::printStatusUpdateIfTime(const JobOrchestrator & orchestrator)
    {
        if ((elapsedCountMs(m_startTime) < m_statusPeriodMs) ||
            (elapsedCountMs(lastPrintTime()) < m_statusPeriodMs))
        {
            return;
        }

        // wait three seconds longer between consecutive status prints
        m_statusPeriodMs = std::clamp((m_statusPeriodMs + 3000_st), 5000_st, 20'000_st);

        const OrchestratorSnapshot snapshot{ orchestrator.snapshot() };

        if (isTerminal(snapshot.phase))
        {
            return;
        }

        // finished profiles plus the live one
        const std::uint64_t bytesComplete{ m_counters.bytesComplete() + snapshot.bytes_complete };
        const std::uint64_t bytesTotal{ m_counters.bytesTotal() + snapshot.bytes_total };

        std::wostringstream ss;
        ss << std::setw(6) << std::right << prettyTimeDurationString(m_startTime);
        ss << L"  " << snapshot.profile_name << L" " << toString(snapshot.phase);
        ss << L"  " << snapshot.percent << L"%";
        ss << L"  " << fileSizeToString(snapshot.bytes_complete) << L" of "
           << fileSizeToString(snapshot.bytes_total);

        ss << L"  chunks=" << snapshot.chunks_complete << L"/" << snapshot.chunks_total;

        if (snapshot.chunks_failed > 0)
        {
            ss << L" (failed=" << snapshot.chunks_failed << L")";
        }

        ss << L"  active=" << snapshot.jobs_active << L"  queued=" << snapshot.jobs_queued;

        if (snapshot.eta)
        {
            ss << L"  eta=" << prettyTimeDurationString(snapshot.eta.value());
        }

        if (snapshot.is_circuit_open)
        {
            ss << L"  (paused by failures for "
               << prettyTimeDurationString(snapshot.circuit_remaining) << L")";
        }

        if (m_counters.profileCount() > 0)
        {
            ss << L"  overall=" << calcPercentString(bytesComplete, bytesTotal);
        }

        printLineToConsoleOnly(ss.str(), Color::Gray);
    }

    void ReplicationTool::printProfileResults(const JobOrchestrator & orchestrator)
    {
        const OrchestrationState & state{ orchestrator.state() };

        for (const Chunk & chunk : state.failed_chunks)
        {
            printLine(
                L"   failed #" + std::to_wstring(chunk.id) + L"  " + chunk.source_path.wstring() +
                    L"   {" + chunk.last_error + L"}",
                Color::Red);
        }

        std::wostringstream ss;
        ss << L"Profile \"" << state.profile_name << L"\" " << toString(state.phase);
        ss << L":  " << toString(orchestrator.outcome());
        ss << L"  (complete=" << state.completed_chunks.size();
        ss << L", failed=" << state.failed_chunks.size();
        ss << L", retries=" << state.retries_total;

        if (state.abandoned_chunks > 0)
        {
            ss << L", not_finished=" << state.abandoned_chunks;
        }

        ss << L")";

        printLine(ss.str(), (state.failed_chunks.empty() ? Color::Default : Color::Yellow));
    }

    int ReplicationTool::printFinalResults(const bool didAbortEarly)
    {
        // capture the run time before spending lots of time formatting the counter strings
        const std::wstring timeElapsedStr{ prettyTimeDurationString(m_startTime) };

        if (!options().dry_run && (m_counters.profileCount() > 0))
        {
            for (const std::wstring & line : m_counters.makeSummaryStrings())
            {
                printLine(line);
            }
        }

        Color resultColor{ Color::Default };
        std::wstring resultStr;
        int exitStatus{ exit_status::success };

        const RunOutcome outcome{ m_counters.outcome() };

        if (didAbortEarly)
        {
            resultStr   = L"ERROR (something caused the run to abort)";
            resultColor = Color::Red;
            exitStatus  = exit_status::usage_error;
        }
        else if (RunOutcome::Success == outcome)
        {
            resultStr   = L"Success";
            resultColor = Color::Green;
            exitStatus  = exit_status::success;
        }
        else if (RunOutcome::PartialFailure == outcome)
        {
            resultStr   = L"PartialFailure";
            resultColor = Color::Yellow;
            exitStatus  = exit_status::partial_failure;
        }
        else
        {
            resultStr   = L"TotalFailure";
            resultColor = Color::Red;
            exitStatus  = exit_status::total_failure;
        }

        if (m_wasStopped && !didAbortEarly)
        {
            resultStr += L" (stopped)";
            resultColor = Color::Yellow;
            exitStatus  = exit_status::stopped;
        }

        if (options().dry_run)
        {
            resultStr += L" (dryrun)";
        }

        if (output().badCharacterCount() > 0)
        {
            printLine(
                (L"Warning:  " + std::to_wstring(output().badCharacterCount()) +
                 L" characters could not be printed and were replaced with '?'"),
                Color::Yellow);
        }

        if (options().quiet)
        {
            disableQuietOptionToPrintFinalResults();
            printLine(resultStr, resultColor);
        }
        else
        {
            printLine(resultStr, resultColor);
            printLine(timeElapsedStr);

            const fs::path logfilePath{ output().logfilePath() };
            if (!logfilePath.empty())
            {
                printLineToConsoleOnly(L"Logfile: " + logfilePath.wstring(), Color::Gray);
            }
        }

        return exitStatus;
    }

} // namespace replicator
