#ifndef REPLICATOR_ORCHESTRATOR_HPP_INCLUDED
#define REPLICATOR_ORCHESTRATOR_HPP_INCLUDED
//
// orchestrator.hpp
//
#include "chunk.hpp"
#include "circuit-breaker.hpp"
#include "copy-executor.hpp"
#include "enums.hpp"
#include "events.hpp"
#include "exit-code.hpp"
#include "throughput.hpp"
#include "util.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace replicator
{

    struct OrchestratorSettings
    {
        static constexpr std::size_t default_max_concurrent_jobs{ 8 };
        static constexpr std::size_t max_concurrent_jobs_limit{ 64 };
        static constexpr std::size_t default_max_retries{ 3 };
        static constexpr std::size_t default_max_fatal_retries{ 1 };
        static inline const Duration_t default_retry_delay{ 0 };
        static constexpr double default_retry_backoff{ 1.0 };
        static inline const Duration_t default_job_timeout{ 0 };

        std::size_t max_concurrent_jobs = default_max_concurrent_jobs;

        // retries per chunk in total, and how many of those may follow a Fatal attempt
        std::size_t max_retries       = default_max_retries;
        std::size_t max_fatal_retries = default_max_fatal_retries;

        // the n'th retry waits retry_delay * retry_backoff^(n-1) before it may start again
        Duration_t retry_delay = default_retry_delay;
        double retry_backoff   = default_retry_backoff;

        // zero means jobs can run forever
        Duration_t job_timeout = default_job_timeout;

        CircuitBreakerSettings breaker;
        Duration_t eta_window = ThroughputWindow::default_window;
    };

    struct ActiveJob
    {
        Chunk chunk;
        Clock_t::time_point start_time{};

        // from the executor's progress channel, refreshed every tick
        std::uint64_t live_bytes = 0;
        std::wstring current_item;
    };

    // Only tick() and the setup functions ever change this, all on the same thread.
    struct OrchestrationState
    {
        Phase phase = Phase::Idle;
        std::wstring profile_name;

        std::deque<Chunk> chunk_queue;
        std::map<JobHandle_t, ActiveJob> active_jobs;
        ChunkVec_t completed_chunks;
        ChunkVec_t failed_chunks;

        std::size_t total_chunks     = 0;
        std::uint64_t bytes_complete = 0;
        std::uint64_t bytes_total    = 0;

        // queued or running when a stop was carried out, these were never finished
        std::size_t abandoned_chunks = 0;
        std::size_t retries_total    = 0;

        std::size_t consecutive_failure_count = 0;
        std::optional<Clock_t::time_point> circuit_open_until;

        bool stop_requested  = false;
        bool pause_requested = false;

        Clock_t::time_point start_time{};
    };

    // An immutable copy of what a status display needs, published at the end of every tick.
    struct OrchestratorSnapshot
    {
        Phase phase = Phase::Idle;
        std::wstring profile_name;

        std::size_t chunks_total    = 0;
        std::size_t chunks_complete = 0;
        std::size_t chunks_failed   = 0;
        std::size_t jobs_active     = 0;
        std::size_t jobs_queued     = 0;

        std::uint64_t bytes_complete = 0;
        std::uint64_t bytes_total    = 0;
        std::size_t percent          = 0;

        Clock_t::duration elapsed{};
        std::optional<Clock_t::duration> eta;

        std::size_t consecutive_failures = 0;
        bool is_circuit_open             = false;
        Clock_t::duration circuit_remaining{};
    };

    enum class Command
    {
        Stop,
        Pause,
        Resume
    };

    [[nodiscard]] constexpr auto toString(const Command command) noexcept
    {
        // clang-format off
        switch (command)
        {
            case Command::Stop:   return L"Stop";
            case Command::Pause:  return L"Pause";
            case Command::Resume: return L"Resume";
            default:              return L"UNKNOWN_COMMAND_ENUM_ERROR";
        }
        // clang-format on
    }

    // Schedules the chunks of one profile onto a copy executor.  All scheduling work happens in
    // tick(), which must only ever be called from one thread and never blocks.  The request
    // functions and snapshot() are the only things safe to call from other threads.  Requests are
    // queued and only take effect at the start of the next tick.
    //
    // A tick does the following, in order:
    //  - takes any queued Stop/Pause/Resume requests
    //  - on stop, kills every active job, drops the queue, and ends in Phase::Stopped
    //  - polls every active job, and classifies the finished or timed out ones into completed,
    //    retried (back of the queue), or failed
    //  - releases the circuit breaker once its cool-down is over
    //  - unless paused or the breaker is open, starts queued chunks up to max_concurrent_jobs
    //  - ends in Phase::Complete once nothing is queued or running
    //  - recomputes progress and the ETA, then publishes a new snapshot
    class JobOrchestrator
    {
      public:
        JobOrchestrator(
            ICopyExecutor & executor,
            const OrchestratorSettings & settings,
            IEventSink & eventSink,
            NowFunc_t nowFunc = realClock());

        // Idle -> Scanning, only changes what the snapshot shows while the planner runs
        void beginScanning(const std::wstring & profileName);

        // Idle/Scanning -> Replicating, throws std::logic_error from any other phase
        void load(const ChunkVec_t & chunks);

        void tick();

        void requestStop() { pushCommand(Command::Stop); }
        void requestPause() { pushCommand(Command::Pause); }
        void requestResume() { pushCommand(Command::Resume); }

        OrchestratorSnapshot snapshot() const;

        // only safe on the thread that calls tick()
        inline const OrchestrationState & state() const noexcept { return m_state; }
        inline const OrchestratorSettings & settings() const noexcept { return m_settings; }
        RunOutcome outcome() const;

      private:
        void pushCommand(const Command command);
        void takeCommands();

        void stopNow();

        void reapJobs(const Clock_t::time_point & now);
        bool isTimedOut(const ActiveJob & job, const Clock_t::time_point & now) const;

        void finishAttempt(
            Chunk chunk,
            const ExitOutcome & outcome,
            const JobResult & result,
            const Clock_t::time_point & now);

        bool willRetry(const Chunk & chunk, const Severity severity) const noexcept;
        Duration_t retryDelay(const std::size_t retryCount) const;

        void releaseBreakerIfCooledDown(const Clock_t::time_point & now);
        void startJobs(const Clock_t::time_point & now);
        void finishProfileIfDone();

        void updateProgress(const Clock_t::time_point & now);
        void publishSnapshot(const Clock_t::time_point & now);

        void emitChunkEvent(
            const EventKind kind,
            const Chunk & chunk,
            const Severity severity = Severity::Success,
            const JobResult & result = JobResult());

        void emitProfileEvent(
            const EventKind kind, const Severity severity, const std::wstring & detail);

      private:
        ICopyExecutor & m_executor;
        OrchestratorSettings m_settings;
        IEventSink & m_eventSink;
        NowFunc_t m_nowFunc;

        OrchestrationState m_state;
        CircuitBreaker m_breaker;
        ThroughputWindow m_throughput;
        std::uint64_t m_completedBytes;
        std::optional<Clock_t::duration> m_eta;

        mutable std::mutex m_inboxMutex;
        std::vector<Command> m_inbox;

        mutable std::mutex m_snapshotMutex;
        OrchestratorSnapshot m_snapshot;
    };

} // namespace replicator

#endif // REPLICATOR_ORCHESTRATOR_HPP_INCLUDED
