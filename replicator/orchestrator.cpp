// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// orchestrator.cpp
//
#include "orchestrator.hpp"

#include "str-util.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace replicator
{

    JobOrchestrator::JobOrchestrator(
        ICopyExecutor & executor,
        const OrchestratorSettings & settings,
        IEventSink & eventSink,
        NowFunc_t nowFunc)
        : m_executor(executor)
        , m_settings(settings)
        , m_eventSink(eventSink)
        , m_nowFunc(std::move(nowFunc))
        , m_state()
        , m_breaker(settings.breaker)
        , m_throughput(settings.eta_window)
        , m_completedBytes(0)
        , m_eta()
        , m_inboxMutex()
        , m_inbox()
        , m_snapshotMutex()
        , m_snapshot()
    {
        if (0 == m_settings.max_concurrent_jobs)
        {
            throw std::invalid_argument("JobOrchestrator max_concurrent_jobs must not be zero");
        }

        if (m_settings.retry_backoff < 1.0)
        {
            throw std::invalid_argument("JobOrchestrator retry_backoff must not be less than one");
        }

        m_state.start_time = m_nowFunc();
    }

    void JobOrchestrator::beginScanning(const std::wstring & profileName)
    {
        if (Phase::Idle != m_state.phase)
        {
            throw std::logic_error(
                "JobOrchestrator::beginScanning() called in phase " +
                strutil::toNarrowString(toString(m_state.phase)));
        }

        const Clock_t::time_point now{ m_nowFunc() };
        m_state.profile_name = profileName;
        m_state.phase        = Phase::Scanning;
        m_state.start_time   = now;
        publishSnapshot(now);
    }

    void JobOrchestrator::load(const ChunkVec_t & chunks)
    {
        if ((Phase::Idle != m_state.phase) && (Phase::Scanning != m_state.phase))
        {
            throw std::logic_error(
                "JobOrchestrator::load() called in phase " +
                strutil::toNarrowString(toString(m_state.phase)));
        }

        const Clock_t::time_point now{ m_nowFunc() };

        if (Phase::Idle == m_state.phase)
        {
            m_state.start_time = now;
        }

        m_state.chunk_queue.clear();
        m_state.active_jobs.clear();
        m_state.completed_chunks.clear();
        m_state.failed_chunks.clear();
        m_state.bytes_complete            = 0;
        m_state.bytes_total               = 0;
        m_state.abandoned_chunks          = 0;
        m_state.retries_total             = 0;
        m_state.consecutive_failure_count = 0;
        m_state.circuit_open_until.reset();
        m_completedBytes = 0;
        m_throughput.reset();
        m_eta.reset();

        for (const Chunk & chunk : chunks)
        {
            Chunk & queued{ m_state.chunk_queue.emplace_back(chunk) };
            queued.status      = ChunkStatus::Pending;
            queued.retry_count = 0;
            queued.not_before  = Clock_t::time_point{};
            queued.last_error.clear();

            m_state.bytes_total += chunk.estimated_size_bytes;
        }

        m_state.total_chunks = chunks.size();
        m_state.phase        = Phase::Replicating;
        publishSnapshot(now);
    }

    void JobOrchestrator::tick()
    {
        const Clock_t::time_point now{ m_nowFunc() };

        takeCommands();

        if (isTerminal(m_state.phase))
        {
            return;
        }

        if (m_state.stop_requested)
        {
            stopNow();
            publishSnapshot(now);
            return;
        }

        if ((Phase::Idle == m_state.phase) || (Phase::Scanning == m_state.phase))
        {
            return;
        }

        reapJobs(now);
        releaseBreakerIfCooledDown(now);

        if (m_state.pause_requested || m_breaker.isOpen(now))
        {
            m_state.phase = Phase::Paused;
        }
        else
        {
            m_state.phase = Phase::Replicating;
            startJobs(now);
        }

        finishProfileIfDone();
        updateProgress(now);
        publishSnapshot(now);
    }

    OrchestratorSnapshot JobOrchestrator::snapshot() const
    {
        std::scoped_lock scopedLock(m_snapshotMutex);
        return m_snapshot;
    }

    RunOutcome JobOrchestrator::outcome() const
    {
        return classifyRun(m_state.completed_chunks.size(), m_state.failed_chunks.size());
    }

    void JobOrchestrator::pushCommand(const Command command)
    {
        std::scoped_lock scopedLock(m_inboxMutex);
        m_inbox.push_back(command);
    }

    void JobOrchestrator::takeCommands()
    {
        std::vector<Command> commands;

        {
            std::scoped_lock scopedLock(m_inboxMutex);
            commands.swap(m_inbox);
        }

        for (const Command command : commands)
        {
            if (Command::Stop == command)
            {
                m_state.stop_requested = true;
            }
            else if (Command::Pause == command)
            {
                m_state.pause_requested = true;
            }
            else
            {
                m_state.pause_requested = false;

                // an operator resume also overrides a tripped breaker
                const bool wasOpen{ m_state.circuit_open_until.has_value() };
                m_breaker.forceClose();
                m_state.circuit_open_until.reset();
                m_state.consecutive_failure_count = 0;

                if (wasOpen && !isTerminal(m_state.phase))
                {
                    emitProfileEvent(EventKind::CircuitClosed, Severity::Success, L"resumed");
                }
            }
        }
    }

    void JobOrchestrator::stopNow()
    {
        m_state.phase = Phase::Stopping;

        for (const auto & [handle, job] : m_state.active_jobs)
        {
            m_executor.kill(handle);
        }

        m_state.abandoned_chunks += (m_state.active_jobs.size() + m_state.chunk_queue.size());
        m_state.active_jobs.clear();
        m_state.chunk_queue.clear();

        m_state.bytes_complete = m_completedBytes;
        m_eta.reset();
        m_state.phase = Phase::Stopped;

        emitProfileEvent(
            EventKind::ProfileCompleted,
            (m_state.failed_chunks.empty() ? Severity::Warning : Severity::Error),
            (L"stopped, " + std::to_wstring(m_state.abandoned_chunks) + L" chunks not finished"));
    }

    void JobOrchestrator::reapJobs(const Clock_t::time_point & now)
    {
        auto iter{ std::begin(m_state.active_jobs) };
        while (iter != std::end(m_state.active_jobs))
        {
            const JobHandle_t handle{ iter->first };
            ActiveJob & job{ iter->second };

            const JobPoll poll{ m_executor.poll(handle) };
            job.live_bytes   = poll.bytes_copied_so_far;
            job.current_item = poll.current_item;

            if (poll.is_complete)
            {
                const JobResult result{ m_executor.awaitResult(handle) };
                Chunk chunk{ std::move(job.chunk) };
                iter = m_state.active_jobs.erase(iter);

                finishAttempt(std::move(chunk), decodeExitCode(result.exit_code), result, now);
            }
            else if (isTimedOut(job, now))
            {
                m_executor.kill(handle);

                JobResult result;
                result.exit_code    = exit_bit::some_failed;
                result.bytes_copied = job.live_bytes;
                result.duration_ms =
                    static_cast<std::int64_t>(elapsedCountMs(job.start_time, now));

                result.detail =
                    (L"timed out after " + prettyTimeDurationString(now - job.start_time));

                Chunk chunk{ std::move(job.chunk) };
                iter = m_state.active_jobs.erase(iter);

                finishAttempt(std::move(chunk), decodeExitCode(result.exit_code), result, now);
            }
            else
            {
                ++iter;
            }
        }
    }

    bool JobOrchestrator::isTimedOut(const ActiveJob & job, const Clock_t::time_point & now) const
    {
        return (
            (m_settings.job_timeout.count() > 0) &&
            ((now - job.start_time) >= m_settings.job_timeout));
    }

    void JobOrchestrator::finishAttempt(
        Chunk chunk,
        const ExitOutcome & outcome,
        const JobResult & result,
        const Clock_t::time_point & now)
    {
        if (!isFailure(outcome.severity))
        {
            chunk.status =
                ((Severity::Warning == outcome.severity) ? ChunkStatus::CompleteWithWarnings
                                                         : ChunkStatus::Complete);

            m_breaker.recordSuccess();
            m_state.consecutive_failure_count = 0;
            m_completedBytes += chunk.estimated_size_bytes;

            emitChunkEvent(EventKind::ChunkCompleted, chunk, outcome.severity, result);
            m_state.completed_chunks.push_back(std::move(chunk));
            return;
        }

        chunk.last_error = (result.detail.empty() ? outcome.toString() : result.detail);

        if (m_breaker.recordFailure(now))
        {
            m_state.circuit_open_until = m_breaker.openUntil();

            emitProfileEvent(
                EventKind::CircuitOpened,
                Severity::Error,
                (std::to_wstring(m_breaker.consecutiveFailures()) +
                 L" failures in a row, pausing for " +
                 prettyTimeDurationString(m_breaker.settings().cooldown)));
        }

        m_state.consecutive_failure_count = m_breaker.consecutiveFailures();

        if (willRetry(chunk, outcome.severity))
        {
            ++chunk.retry_count;
            ++m_state.retries_total;

            if (Severity::Fatal == outcome.severity)
            {
                ++chunk.fatal_retry_count;
            }

            chunk.status     = ChunkStatus::Pending;
            chunk.not_before = (now + retryDelay(chunk.retry_count));

            emitChunkEvent(EventKind::ChunkRetried, chunk, outcome.severity, result);
            m_state.chunk_queue.push_back(std::move(chunk));
        }
        else
        {
            chunk.status = ChunkStatus::Failed;

            emitChunkEvent(EventKind::ChunkFailed, chunk, outcome.severity, result);
            m_state.failed_chunks.push_back(std::move(chunk));
        }
    }

    bool JobOrchestrator::willRetry(const Chunk & chunk, const Severity severity) const noexcept
    {
        if (chunk.retry_count >= m_settings.max_retries)
        {
            return false;
        }

        // Fatal attempts have their own smaller budget, whatever the Error attempts used
        if (Severity::Fatal == severity)
        {
            return (chunk.fatal_retry_count < m_settings.max_fatal_retries);
        }

        return true;
    }

    Duration_t JobOrchestrator::retryDelay(const std::size_t retryCount) const
    {
        if ((m_settings.retry_delay.count() <= 0) || (retryCount == 0))
        {
            return Duration_t(0);
        }

        const double multiplier{ std::pow(
            m_settings.retry_backoff, static_cast<double>(retryCount - 1)) };

        const double delayMs{ static_cast<double>(m_settings.retry_delay.count()) * multiplier };

        // a runaway backoff is capped at one day
        const double maxDelayMs{ 24.0 * 60.0 * 60.0 * 1000.0 };
        return Duration_t(static_cast<Duration_t::rep>(std::min(delayMs, maxDelayMs)));
    }

    void JobOrchestrator::releaseBreakerIfCooledDown(const Clock_t::time_point & now)
    {
        if (m_breaker.closeIfCooledDown(now))
        {
            m_state.circuit_open_until.reset();
            emitProfileEvent(EventKind::CircuitClosed, Severity::Success, L"cool-down finished");
        }
    }

    void JobOrchestrator::startJobs(const Clock_t::time_point & now)
    {
        while (m_state.active_jobs.size() < m_settings.max_concurrent_jobs)
        {
            // FIFO, except that a retry still waiting out its delay lets the chunks behind it go
            const auto iter{ std::find_if(
                std::begin(m_state.chunk_queue),
                std::end(m_state.chunk_queue),
                [&](const Chunk & chunk) { return (chunk.not_before <= now); }) };

            if (iter == std::end(m_state.chunk_queue))
            {
                break;
            }

            Chunk chunk{ std::move(*iter) };
            m_state.chunk_queue.erase(iter);

            JobHandle_t handle{ 0 };

            try
            {
                handle = m_executor.start(
                    chunk.source_path, chunk.destination_path, chunk.copy_options);
            }
            catch (const std::exception & ex)
            {
                JobResult result;
                result.exit_code = exit_bit::fatal;
                result.detail    = (L"failed to start: " + strutil::toWideString(ex.what()));

                finishAttempt(std::move(chunk), decodeExitCode(result.exit_code), result, now);

                // whatever broke will probably break the next start too, so wait for the next tick
                break;
            }

            if (m_state.active_jobs.count(handle) > 0)
            {
                throw std::logic_error(
                    "JobOrchestrator::startJobs() the executor returned a handle already in use: " +
                    std::to_string(handle));
            }

            chunk.status = ChunkStatus::Running;
            emitChunkEvent(EventKind::ChunkStarted, chunk);

            ActiveJob job;
            job.chunk      = std::move(chunk);
            job.start_time = now;
            m_state.active_jobs.emplace(handle, std::move(job));
        }
    }

    void JobOrchestrator::finishProfileIfDone()
    {
        if (!m_state.chunk_queue.empty() || !m_state.active_jobs.empty())
        {
            return;
        }

        m_state.phase = Phase::Complete;

        const bool hasWarnings{ std::any_of(
            std::begin(m_state.completed_chunks),
            std::end(m_state.completed_chunks),
            [](const Chunk & chunk) {
                return (ChunkStatus::CompleteWithWarnings == chunk.status);
            }) };

        Severity severity{ Severity::Success };
        if (!m_state.failed_chunks.empty())
        {
            severity = Severity::Error;
        }
        else if (hasWarnings)
        {
            severity = Severity::Warning;
        }

        std::wstring detail{ toString(outcome()) };
        detail += L", complete=";
        detail += std::to_wstring(m_state.completed_chunks.size());
        detail += L", failed=";
        detail += std::to_wstring(m_state.failed_chunks.size());
        detail += L", retries=";
        detail += std::to_wstring(m_state.retries_total);

        emitProfileEvent(EventKind::ProfileCompleted, severity, detail);
    }

    void JobOrchestrator::updateProgress(const Clock_t::time_point & now)
    {
        std::uint64_t liveBytes{ 0 };
        for (const auto & [handle, job] : m_state.active_jobs)
        {
            // estimates are advisory, so a job that copies more than expected is not over counted
            liveBytes += std::min(job.live_bytes, job.chunk.estimated_size_bytes);
        }

        m_state.bytes_complete = (m_completedBytes + liveBytes);

        if (Phase::Complete == m_state.phase)
        {
            m_eta = Clock_t::duration(0);
            return;
        }

        m_throughput.addSample(now, m_state.bytes_complete);

        const std::uint64_t remainingBytes{
            (m_state.bytes_total > m_state.bytes_complete)
                ? (m_state.bytes_total - m_state.bytes_complete)
                : 0
        };

        m_eta = m_throughput.estimateRemaining(remainingBytes);
    }

    void JobOrchestrator::publishSnapshot(const Clock_t::time_point & now)
    {
        OrchestratorSnapshot snapshot;
        snapshot.phase           = m_state.phase;
        snapshot.profile_name    = m_state.profile_name;
        snapshot.chunks_total    = m_state.total_chunks;
        snapshot.chunks_complete = m_state.completed_chunks.size();
        snapshot.chunks_failed   = m_state.failed_chunks.size();
        snapshot.jobs_active     = m_state.active_jobs.size();
        snapshot.jobs_queued     = m_state.chunk_queue.size();
        snapshot.bytes_complete  = m_state.bytes_complete;
        snapshot.bytes_total     = m_state.bytes_total;

        if (m_state.bytes_total > 0)
        {
            snapshot.percent = std::min(
                100_st,
                calcPercent<std::uint64_t, std::uint64_t, std::size_t>(
                    m_state.bytes_complete, m_state.bytes_total));
        }
        else if (m_state.total_chunks > 0)
        {
            snapshot.percent = calcPercent(
                (snapshot.chunks_complete + snapshot.chunks_failed), m_state.total_chunks);
        }
        else if (Phase::Complete == m_state.phase)
        {
            snapshot.percent = 100;
        }

        snapshot.elapsed              = (now - m_state.start_time);
        snapshot.eta                  = m_eta;
        snapshot.consecutive_failures = m_state.consecutive_failure_count;
        snapshot.is_circuit_open      = m_breaker.isOpen(now);

        if (snapshot.is_circuit_open && m_state.circuit_open_until)
        {
            snapshot.circuit_remaining = (m_state.circuit_open_until.value() - now);
        }

        std::scoped_lock scopedLock(m_snapshotMutex);
        m_snapshot = std::move(snapshot);
    }

    void JobOrchestrator::emitChunkEvent(
        const EventKind kind,
        const Chunk & chunk,
        const Severity severity,
        const JobResult & result)
    {
        ReplicationEvent event;
        event.kind             = kind;
        event.profile_name     = m_state.profile_name;
        event.chunk_id         = chunk.id;
        event.source_path      = chunk.source_path;
        event.destination_path = chunk.destination_path;
        event.severity         = severity;
        event.exit_code        = result.exit_code;
        event.files_copied     = result.files_copied;
        event.bytes_copied     = result.bytes_copied;
        event.duration_ms      = result.duration_ms;
        event.retry_count      = chunk.retry_count;
        event.detail           = result.detail;

        m_eventSink.onEvent(event);
    }

    void JobOrchestrator::emitProfileEvent(
        const EventKind kind, const Severity severity, const std::wstring & detail)
    {
        ReplicationEvent event;
        event.kind         = kind;
        event.profile_name = m_state.profile_name;
        event.severity     = severity;
        event.detail       = detail;

        m_eventSink.onEvent(event);
    }

} // namespace replicator
