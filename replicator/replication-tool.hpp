#ifndef REPLICATOR_REPLICATION_TOOL_HPP_INCLUDED
#define REPLICATOR_REPLICATION_TOOL_HPP_INCLUDED
//
// replication-tool.hpp
//
#include "chunk-planner.hpp"
#include "counters.hpp"
#include "directory-profiler.hpp"
#include "events.hpp"
#include "options-and-output.hpp"
#include "orchestrator.hpp"
#include "tick-driver.hpp"

#include <string>
#include <vector>

namespace replicator
{

    // process exit status
    namespace exit_status
    {
        constexpr int success         = 0;
        constexpr int usage_error     = 1;
        constexpr int partial_failure = 2;
        constexpr int total_failure   = 3;
        constexpr int stopped         = 4;
    } // namespace exit_status

    class ReplicationTool : public OptionsAndOutput
    {
      public:
        explicit ReplicationTool(const std::vector<std::string> & args);
        virtual ~ReplicationTool() = default;

        // returns one of the exit_status values
        int run();

      private:
        void runAllProfiles();

        // returns false if the run was stopped
        bool runProfile(const Profile & profile);

        PlanResult planProfile(const Profile & profile);
        void printPlanProblems(const PlanResult & plan);
        void printDryRunChunks(const PlanResult & plan);

        void replicate(JobOrchestrator & orchestrator);
        void checkForStopSignal(TickDriver & driver);

        void printStatusUpdateIfTime(const JobOrchestrator & orchestrator);
        void printProfileResults(const JobOrchestrator & orchestrator);
        int printFinalResults(const bool didAbortEarly);

      private:
        FilesystemProfiler m_filesystemProfiler;
        CachingProfiler m_profiler;
        LogEventSink m_eventSink;
        RunCounters m_counters;
        std::size_t m_statusPeriodMs;
        bool m_wasStopped;
        const Clock_t::time_point m_startTime;
    };

} // namespace replicator

#endif // REPLICATOR_REPLICATION_TOOL_HPP_INCLUDED
