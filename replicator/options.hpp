#ifndef REPLICATOR_OPTIONS_HPP_INCLUDED
#define REPLICATOR_OPTIONS_HPP_INCLUDED
//
// options.hpp
//
#include "chunk-planner.hpp"
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "orchestrator.hpp"
#include "tick-driver.hpp"

#include <string>
#include <vector>

namespace replicator
{

    // one source tree replicated into one destination tree
    struct Profile
    {
        std::wstring name;
        fs::path source;
        fs::path destination;
    };

    struct Options
    {
        static inline const std::wstring default_log_base{ L"replicator" };

        std::vector<Profile> profiles;

        PlanThresholds thresholds;
        OrchestratorSettings orchestrator;
        Duration_t tick_period = TickDriver::default_tick_period;

        bool dry_run = false;
        bool verbose = false;
        bool quiet   = false;

        // empty means no logfile
        std::wstring log_base = default_log_base;

        // disable color by default on windows because it rarely ever works
        static bool isColorEnabledByDefault() { return !is_running_on_windows; }
    };

} // namespace replicator

#endif // REPLICATOR_OPTIONS_HPP_INCLUDED
