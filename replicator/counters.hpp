#ifndef REPLICATOR_COUNTERS_HPP_INCLUDED
#define REPLICATOR_COUNTERS_HPP_INCLUDED
//
// counters.hpp
//
#include "enums.hpp"
#include "orchestrator.hpp"
#include "util.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace replicator
{

    struct StatusTally
    {
        std::size_t count   = 0;
        std::uint64_t bytes = 0; // estimated, from the planner
    };

    // Chunk outcomes of every profile in a run, by final chunk status and estimated size.
    class RunCounters
    {
      public:
        RunCounters();

        // only call once the orchestrator's phase is Complete or Stopped
        void addProfile(const OrchestrationState & state);

        inline std::size_t profileCount() const noexcept { return m_profileCount; }
        inline std::size_t retryCount() const noexcept { return m_retryCount; }
        inline std::size_t abandonedCount() const noexcept { return m_abandonedCount; }

        std::size_t succeededCount() const;
        std::size_t failedCount() const { return tally(ChunkStatus::Failed).count; }
        std::size_t warningCount() const { return tally(ChunkStatus::CompleteWithWarnings).count; }

        inline std::uint64_t bytesComplete() const noexcept { return m_bytesComplete; }
        inline std::uint64_t bytesTotal() const noexcept { return m_bytesTotal; }
        inline std::size_t chunksTotal() const noexcept { return m_chunksTotal; }

        const StatusTally & tally(const ChunkStatus status) const;

        RunOutcome outcome() const { return classifyRun(succeededCount(), failedCount()); }

        // a title line, then one justified line per status that was ever counted
        std::vector<std::wstring> makeSummaryStrings() const;

      private:
        void add(const Chunk & chunk);

      private:
        // one per ChunkStatus
        static constexpr std::size_t status_count{ 5 };

        std::array<StatusTally, status_count> m_tallies;
        std::size_t m_profileCount;
        std::size_t m_retryCount;
        std::size_t m_abandonedCount;
        std::size_t m_chunksTotal;
        std::uint64_t m_bytesComplete;
        std::uint64_t m_bytesTotal;
    };

} // namespace replicator

#endif // REPLICATOR_COUNTERS_HPP_INCLUDED
