// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// unit_orchestrator.cpp
//
#undef NDEBUG

#include "counters.hpp"
#include "exit-code.hpp"
#include "orchestrator.hpp"
#include "tick-driver.hpp"

#include <algorithm>
#include <cassert>
#include <deque>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace replicator;
using namespace std::chrono_literals;

namespace
{
    // Jobs whose source has a script entry finish the moment they start with the next scripted
    // exit code.  All others run until finish() is called.
    class FakeExecutor : public ICopyExecutor
    {
      public:
        JobHandle_t start(
            const fs::path & sourcePath,
            const fs::path &,
            const CopyOptions_t copyOptions) override
        {
            if (will_throw_on_start)
            {
                throw std::runtime_error("executor unavailable");
            }

            if (will_reuse_handles)
            {
                m_nextHandle = 1;
            }

            started.push_back(sourcePath.generic_string());
            options.push_back(copyOptions);

            Job & job{ m_jobs[m_nextHandle] };

            auto & script{ scripts[sourcePath.generic_string()] };
            if (!script.empty())
            {
                job.is_complete      = true;
                job.result.exit_code = script.front();
                script.pop_front();
            }

            return m_nextHandle++;
        }

        JobPoll poll(const JobHandle_t handle) override
        {
            const Job & job{ m_jobs.at(handle) };

            JobPoll poll;
            poll.is_complete         = job.is_complete;
            poll.bytes_copied_so_far = job.bytes;
            return poll;
        }

        JobResult awaitResult(const JobHandle_t handle) override
        {
            const auto iter{ m_jobs.find(handle) };
            if ((iter == std::end(m_jobs)) || !iter->second.is_complete)
            {
                throw std::logic_error("awaitResult() on a handle that is not complete");
            }

            const JobResult result{ iter->second.result };
            m_jobs.erase(iter);
            return result;
        }

        void kill(const JobHandle_t handle) override
        {
            killed.push_back(handle);
            m_jobs.erase(handle);
        }

        void finish(const JobHandle_t handle, const int exitCode)
        {
            Job & job{ m_jobs.at(handle) };
            job.is_complete      = true;
            job.result.exit_code = exitCode;
        }

        void finishAll(const int exitCode)
        {
            for (const JobHandle_t handle : runningHandles())
            {
                finish(handle, exitCode);
            }
        }

        void setBytes(const JobHandle_t handle, const std::uint64_t bytes)
        {
            m_jobs.at(handle).bytes = bytes;
        }

        std::vector<JobHandle_t> runningHandles() const
        {
            std::vector<JobHandle_t> handles;
            for (const auto & [handle, job] : m_jobs)
            {
                if (!job.is_complete)
                {
                    handles.push_back(handle);
                }
            }

            return handles;
        }

        std::size_t running() const { return m_jobs.size(); }

        std::map<std::string, std::deque<int>> scripts;
        std::vector<std::string> started;
        std::vector<CopyOptions_t> options;
        std::vector<JobHandle_t> killed;
        bool will_throw_on_start = false;
        bool will_reuse_handles  = false;

      private:
        struct Job
        {
            bool is_complete    = false;
            std::uint64_t bytes = 0;
            JobResult result;
        };

        JobHandle_t m_nextHandle = 1;
        std::map<JobHandle_t, Job> m_jobs;
    };

    class RecordingSink : public IEventSink
    {
      public:
        void onEvent(const ReplicationEvent & event) override { events.push_back(event); }

        std::size_t count(const EventKind kind) const
        {
            return static_cast<std::size_t>(std::count_if(
                std::begin(events), std::end(events), [&](const ReplicationEvent & event) {
                    return (event.kind == kind);
                }));
        }

        const ReplicationEvent & last(const EventKind kind) const
        {
            const auto iter{ std::find_if(
                std::rbegin(events), std::rend(events), [&](const ReplicationEvent & event) {
                    return (event.kind == kind);
                }) };

            assert(iter != std::rend(events));
            return *iter;
        }

        std::vector<ReplicationEvent> events;
    };

    // the orchestrator, its collaborators, and a clock that only moves when told to
    struct Harness
    {
        explicit Harness(const OrchestratorSettings & settings = OrchestratorSettings())
            : now(Clock_t::now())
            , executor()
            , sink()
            , orchestrator(executor, settings, sink, [this]() { return now; })
        {}

        void tickUntilTerminal(const std::size_t maxTicks = 1000)
        {
            for (std::size_t i{ 0 }; i < maxTicks; ++i)
            {
                orchestrator.tick();
                if (isTerminal(orchestrator.state().phase))
                {
                    return;
                }
            }

            assert(!"orchestrator never reached a terminal phase");
        }

        Clock_t::time_point now;
        FakeExecutor executor;
        RecordingSink sink;
        JobOrchestrator orchestrator;
    };

    ChunkVec_t makeChunks(const std::size_t count, const std::uint64_t size = 1000)
    {
        ChunkVec_t chunks;

        for (std::size_t i{ 0 }; i < count; ++i)
        {
            Chunk & chunk{ chunks.emplace_back() };
            chunk.id                   = (i + 1);
            chunk.source_path          = ("/src/c" + std::to_string(i));
            chunk.destination_path     = ("/dst/c" + std::to_string(i));
            chunk.estimated_size_bytes = size;
            chunk.estimated_file_count = 10;
            chunk.copy_options         = CopyOption::ExcludeReparsePoints;
        }

        return chunks;
    }

    bool contains(const std::wstring & str, const std::wstring & part)
    {
        return (str.find(part) != std::wstring::npos);
    }
} // namespace

static void test_never_exceeds_max_concurrent_jobs()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs = 4;

    Harness harness(settings);
    harness.orchestrator.load(makeChunks(20));

    harness.orchestrator.tick();
    assert(harness.executor.running() == 4);
    assert(harness.orchestrator.snapshot().jobs_active == 4);
    assert(harness.orchestrator.snapshot().jobs_queued == 16);

    for (std::size_t i{ 0 }; i < 100; ++i)
    {
        harness.executor.finishAll(exit_bit::files_copied);
        harness.orchestrator.tick();
        assert(harness.executor.running() <= 4);

        if (isTerminal(harness.orchestrator.state().phase))
        {
            break;
        }
    }

    assert(harness.orchestrator.state().phase == Phase::Complete);
    assert(harness.orchestrator.state().completed_chunks.size() == 20);
    assert(harness.orchestrator.outcome() == RunOutcome::Success);
    assert(harness.executor.started.size() == 20);
    assert(harness.sink.count(EventKind::ChunkStarted) == 20);
    assert(harness.sink.count(EventKind::ChunkCompleted) == 20);
    assert(harness.sink.count(EventKind::ProfileCompleted) == 1);
    assert(harness.executor.options.front() == CopyOption::ExcludeReparsePoints);
}

static void test_errors_retry_until_the_limit_then_fail_once()
{
    Harness harness;
    harness.executor.scripts["/src/c0"] = { exit_bit::some_failed,
                                            exit_bit::some_failed,
                                            exit_bit::some_failed,
                                            exit_bit::some_failed };

    harness.orchestrator.load(makeChunks(1));
    harness.tickUntilTerminal();

    const OrchestrationState & state{ harness.orchestrator.state() };
    assert(state.phase == Phase::Complete);
    assert(state.completed_chunks.empty());
    assert(state.failed_chunks.size() == 1);
    assert(state.failed_chunks.front().retry_count == 3);
    assert(state.failed_chunks.front().status == ChunkStatus::Failed);
    assert(!state.failed_chunks.front().last_error.empty());
    assert(state.retries_total == 3);

    assert(harness.executor.started.size() == 4);
    assert(harness.sink.count(EventKind::ChunkRetried) == 3);
    assert(harness.sink.count(EventKind::ChunkFailed) == 1);
    assert(harness.orchestrator.outcome() == RunOutcome::TotalFailure);
}

static void test_fatal_results_retry_less()
{
    {
        Harness harness;
        harness.executor.scripts["/src/c0"] = { exit_bit::fatal, exit_bit::fatal, 0 };

        harness.orchestrator.load(makeChunks(1));
        harness.tickUntilTerminal();

        assert(harness.executor.started.size() == 2);
        assert(harness.orchestrator.state().failed_chunks.size() == 1);
        assert(harness.orchestrator.state().failed_chunks.front().retry_count == 1);
    }

    {
        OrchestratorSettings settings;
        settings.max_retries = 0;

        Harness harness(settings);
        harness.executor.scripts["/src/c0"] = { exit_bit::fatal, 0 };

        harness.orchestrator.load(makeChunks(1));
        harness.tickUntilTerminal();

        assert(harness.executor.started.size() == 1);
        assert(harness.orchestrator.state().failed_chunks.size() == 1);
    }
}

static void test_fatal_after_error_still_gets_its_retry()
{
    {
        Harness harness;
        harness.executor.scripts["/src/c0"] = { exit_bit::some_failed, exit_bit::fatal, 0 };

        harness.orchestrator.load(makeChunks(1));
        harness.tickUntilTerminal();

        assert(harness.executor.started.size() == 3);
        assert(harness.orchestrator.outcome() == RunOutcome::Success);

        const Chunk & chunk{ harness.orchestrator.state().completed_chunks.front() };
        assert(chunk.retry_count == 2);
        assert(chunk.fatal_retry_count == 1);
    }

    // the one Fatal retry is used up, Error retries remaining do not matter
    {
        Harness harness;
        harness.executor.scripts["/src/c0"] = {
            exit_bit::some_failed, exit_bit::fatal, exit_bit::fatal, 0
        };

        harness.orchestrator.load(makeChunks(1));
        harness.tickUntilTerminal();

        assert(harness.executor.started.size() == 3);

        const Chunk & chunk{ harness.orchestrator.state().failed_chunks.front() };
        assert(chunk.retry_count == 2);
        assert(chunk.fatal_retry_count == 1);
    }

    // and the total still caps everything
    {
        OrchestratorSettings settings;
        settings.max_retries = 1;

        Harness harness(settings);
        harness.executor.scripts["/src/c0"] = { exit_bit::some_failed, exit_bit::fatal, 0 };

        harness.orchestrator.load(makeChunks(1));
        harness.tickUntilTerminal();

        assert(harness.executor.started.size() == 2);
        assert(harness.orchestrator.state().failed_chunks.size() == 1);
    }
}

static void test_warnings_still_count_as_complete()
{
    OrchestratorSettings settings;
    settings.max_retries = 0;

    Harness harness(settings);
    harness.executor.scripts["/src/c0"] = { exit_bit::mismatches };
    harness.executor.scripts["/src/c1"] = { (exit_bit::files_copied | exit_bit::extras_present) };
    harness.executor.scripts["/src/c2"] = { exit_bit::some_failed };

    harness.orchestrator.load(makeChunks(3));
    harness.tickUntilTerminal();

    const OrchestrationState & state{ harness.orchestrator.state() };
    assert(state.completed_chunks.size() == 2);
    assert(state.completed_chunks[0].status == ChunkStatus::CompleteWithWarnings);
    assert(state.completed_chunks[1].status == ChunkStatus::Complete);
    assert(state.failed_chunks.size() == 1);
    assert(harness.orchestrator.outcome() == RunOutcome::PartialFailure);
    assert(harness.sink.last(EventKind::ProfileCompleted).severity == Severity::Error);
}

static void test_stop_kills_everything_and_starts_nothing()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs = 2;

    Harness harness(settings);
    harness.orchestrator.load(makeChunks(10));

    harness.orchestrator.tick();
    harness.executor.finish(harness.executor.runningHandles().front(), 0);
    harness.orchestrator.tick();
    assert(harness.executor.started.size() == 3);

    harness.orchestrator.requestStop();

    // requests only take effect on the next tick
    assert(harness.orchestrator.state().phase == Phase::Replicating);

    harness.orchestrator.tick();

    const OrchestrationState & state{ harness.orchestrator.state() };
    assert(state.phase == Phase::Stopped);
    assert(state.active_jobs.empty());
    assert(state.chunk_queue.empty());
    assert(state.abandoned_chunks == 9);
    assert(state.completed_chunks.size() == 1);
    assert(harness.executor.killed.size() == 2);
    assert(harness.executor.running() == 0);
    assert(harness.orchestrator.snapshot().phase == Phase::Stopped);
    assert(contains(harness.sink.last(EventKind::ProfileCompleted).detail, L"stopped"));

    for (int i{ 0 }; i < 10; ++i)
    {
        harness.orchestrator.requestResume();
        harness.orchestrator.tick();
    }

    assert(harness.executor.started.size() == 3);
    assert(harness.orchestrator.state().phase == Phase::Stopped);
}

static void test_breaker_pauses_until_cooled_down()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs       = 2;
    settings.breaker.failure_threshold = 1;
    settings.breaker.window            = 60s;
    settings.breaker.cooldown          = 60s;

    Harness harness(settings);
    harness.executor.scripts["/src/c0"] = { exit_bit::some_failed, 0 };
    harness.executor.scripts["/src/c1"] = { exit_bit::some_failed, 0 };
    harness.executor.scripts["/src/c2"] = { 0 };

    const Clock_t::time_point t0{ harness.now };
    harness.orchestrator.load(makeChunks(3));

    harness.orchestrator.tick();
    assert(harness.executor.started.size() == 2);

    harness.orchestrator.tick();
    assert(harness.orchestrator.state().phase == Phase::Paused);
    assert(harness.sink.count(EventKind::CircuitOpened) == 1);
    assert(harness.orchestrator.state().circuit_open_until.value() == (t0 + 60s));
    assert(harness.orchestrator.state().consecutive_failure_count == 2);
    assert(harness.executor.started.size() == 2);

    const OrchestratorSnapshot pausedSnapshot{ harness.orchestrator.snapshot() };
    assert(pausedSnapshot.is_circuit_open);
    assert(pausedSnapshot.circuit_remaining == 60s);
    assert(pausedSnapshot.jobs_queued == 3);

    harness.now = (t0 + 30s);
    harness.orchestrator.tick();
    assert(harness.executor.started.size() == 2);
    assert(harness.orchestrator.snapshot().circuit_remaining == 30s);

    harness.now = (t0 + 60s);
    harness.orchestrator.tick();
    assert(harness.sink.count(EventKind::CircuitClosed) == 1);
    assert(harness.orchestrator.state().phase == Phase::Replicating);
    assert(!harness.orchestrator.state().circuit_open_until);
    assert(harness.executor.started.size() == 4);

    harness.tickUntilTerminal();
    assert(harness.orchestrator.outcome() == RunOutcome::Success);
    assert(harness.orchestrator.state().completed_chunks.size() == 3);
    assert(harness.orchestrator.state().retries_total == 2);
}

static void test_resume_overrides_an_open_breaker()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs       = 2;
    settings.breaker.failure_threshold = 1;
    settings.breaker.cooldown          = 1h;

    Harness harness(settings);
    harness.executor.scripts["/src/c0"] = { exit_bit::fatal, 0 };
    harness.executor.scripts["/src/c1"] = { exit_bit::fatal, 0 };

    harness.orchestrator.load(makeChunks(2));
    harness.orchestrator.tick();
    harness.orchestrator.tick();
    assert(harness.orchestrator.snapshot().is_circuit_open);

    harness.orchestrator.requestResume();
    harness.orchestrator.tick();
    assert(harness.sink.count(EventKind::CircuitClosed) == 1);
    assert(contains(harness.sink.last(EventKind::CircuitClosed).detail, L"resumed"));
    assert(harness.executor.started.size() == 4);
    assert(harness.orchestrator.state().consecutive_failure_count == 0);

    harness.tickUntilTerminal();
    assert(harness.orchestrator.outcome() == RunOutcome::Success);
}

static void test_pause_lets_running_jobs_finish()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs = 1;

    Harness harness(settings);
    harness.orchestrator.load(makeChunks(5));

    harness.orchestrator.tick();
    harness.orchestrator.requestPause();
    harness.orchestrator.tick();
    assert(harness.orchestrator.state().phase == Phase::Paused);
    assert(harness.executor.running() == 1);

    harness.executor.finishAll(0);
    for (int i{ 0 }; i < 5; ++i)
    {
        harness.orchestrator.tick();
    }

    assert(harness.orchestrator.state().phase == Phase::Paused);
    assert(harness.orchestrator.state().completed_chunks.size() == 1);
    assert(harness.executor.running() == 0);
    assert(harness.executor.started.size() == 1);
    assert(harness.orchestrator.snapshot().phase == Phase::Paused);

    harness.orchestrator.requestResume();
    harness.orchestrator.tick();
    assert(harness.orchestrator.state().phase == Phase::Replicating);
    assert(harness.executor.started.size() == 2);
    assert(harness.sink.count(EventKind::CircuitClosed) == 0);
}

static void test_jobs_that_run_too_long_are_killed_and_retried()
{
    OrchestratorSettings settings;
    settings.max_retries = 1;
    settings.job_timeout = 10s;

    Harness harness(settings);
    harness.orchestrator.load(makeChunks(1));

    harness.orchestrator.tick();
    harness.now += 5s;
    harness.orchestrator.tick();
    assert(harness.executor.killed.empty());

    harness.now += 5s;
    harness.orchestrator.tick();
    assert(harness.executor.killed.size() == 1);
    assert(harness.executor.started.size() == 2);
    assert(harness.sink.count(EventKind::ChunkRetried) == 1);

    harness.now += 10s;
    harness.orchestrator.tick();
    assert(harness.executor.killed.size() == 2);

    const OrchestrationState & state{ harness.orchestrator.state() };
    assert(state.phase == Phase::Complete);
    assert(state.failed_chunks.size() == 1);
    assert(contains(state.failed_chunks.front().last_error, L"timed out"));
    assert(harness.orchestrator.outcome() == RunOutcome::TotalFailure);
}

static void test_retries_wait_behind_the_queue_with_backoff()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs = 1;
    settings.max_retries         = 2;
    settings.retry_delay         = 10s;
    settings.retry_backoff       = 2.0;

    Harness harness(settings);
    harness.executor.scripts["/src/c0"] = { exit_bit::some_failed, exit_bit::some_failed, 0 };
    harness.executor.scripts["/src/c1"] = { 0 };
    harness.executor.scripts["/src/c2"] = { 0 };

    const Clock_t::time_point t0{ harness.now };
    harness.orchestrator.load(makeChunks(3));

    for (int i{ 0 }; i < 4; ++i)
    {
        harness.orchestrator.tick();
    }

    assert(harness.executor.started.size() == 3);
    assert(harness.orchestrator.state().phase == Phase::Replicating);
    assert(harness.orchestrator.state().chunk_queue.size() == 1);
    assert(harness.orchestrator.state().chunk_queue.front().not_before == (t0 + 10s));

    harness.now = (t0 + 10s);
    harness.orchestrator.tick();
    harness.orchestrator.tick();
    assert(harness.executor.started.size() == 4);
    assert(harness.orchestrator.state().chunk_queue.front().not_before == (t0 + 30s));

    harness.now = (t0 + 29s);
    harness.orchestrator.tick();
    assert(harness.executor.started.size() == 4);

    harness.now = (t0 + 30s);
    harness.tickUntilTerminal();

    const std::vector<std::string> expected{
        "/src/c0", "/src/c1", "/src/c2", "/src/c0", "/src/c0"
    };

    assert(harness.executor.started == expected);
    assert(harness.orchestrator.state().completed_chunks.size() == 3);
    assert(harness.orchestrator.state().completed_chunks.back().retry_count == 2);
}

static void test_snapshot_progress_and_eta()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs = 2;

    Harness harness(settings);
    const Clock_t::time_point t0{ harness.now };

    harness.orchestrator.beginScanning(L"photos");
    assert(harness.orchestrator.snapshot().phase == Phase::Scanning);
    assert(harness.orchestrator.snapshot().profile_name == L"photos");

    harness.orchestrator.load(makeChunks(4, 1000));

    OrchestratorSnapshot snapshot{ harness.orchestrator.snapshot() };
    assert(snapshot.phase == Phase::Replicating);
    assert(snapshot.chunks_total == 4);
    assert(snapshot.bytes_total == 4000);
    assert(snapshot.percent == 0);
    assert(!snapshot.eta);

    harness.orchestrator.tick();

    harness.now = (t0 + 10s);
    const std::vector<JobHandle_t> handles{ harness.executor.runningHandles() };
    assert(handles.size() == 2);
    harness.executor.setBytes(handles[0], 500);
    harness.executor.setBytes(handles[1], 500);
    harness.orchestrator.tick();

    snapshot = harness.orchestrator.snapshot();
    assert(snapshot.bytes_complete == 1000);
    assert(snapshot.percent == 25);
    assert(snapshot.elapsed == 10s);
    assert(snapshot.eta.has_value());
    assert(std::chrono::duration_cast<std::chrono::seconds>(snapshot.eta.value()) == 30s);

    // a job copying more than its estimate is capped at the estimate
    harness.executor.setBytes(handles[0], 50'000);
    harness.orchestrator.tick();
    assert(harness.orchestrator.snapshot().bytes_complete == 1500);

    for (int i{ 0 }; i < 10; ++i)
    {
        harness.executor.finishAll(0);
        harness.orchestrator.tick();
    }

    snapshot = harness.orchestrator.snapshot();
    assert(snapshot.phase == Phase::Complete);
    assert(snapshot.chunks_complete == 4);
    assert(snapshot.bytes_complete == 4000);
    assert(snapshot.percent == 100);
    assert(snapshot.eta.value() == Clock_t::duration(0));
    assert(harness.sink.last(EventKind::ProfileCompleted).profile_name == L"photos");
}

static void test_empty_profile_completes_on_first_tick()
{
    Harness harness;
    harness.orchestrator.load({});
    harness.orchestrator.tick();

    assert(harness.orchestrator.state().phase == Phase::Complete);
    assert(harness.orchestrator.snapshot().percent == 100);
    assert(harness.orchestrator.outcome() == RunOutcome::Success);
    assert(harness.executor.started.empty());
}

static void test_start_failures_count_as_fatal_attempts()
{
    OrchestratorSettings settings;
    settings.max_retries = 0;

    Harness harness(settings);
    harness.executor.will_throw_on_start = true;
    harness.orchestrator.load(makeChunks(2));

    // one failed start per tick
    harness.orchestrator.tick();
    assert(harness.orchestrator.state().failed_chunks.size() == 1);

    harness.tickUntilTerminal();

    const OrchestrationState & state{ harness.orchestrator.state() };
    assert(state.failed_chunks.size() == 2);
    assert(contains(state.failed_chunks.front().last_error, L"failed to start"));
    assert(harness.orchestrator.outcome() == RunOutcome::TotalFailure);
}

static void test_misuse_is_rejected()
{
    Harness harness;
    harness.orchestrator.load(makeChunks(1));

    bool didThrow{ false };
    try
    {
        harness.orchestrator.load(makeChunks(1));
    }
    catch (const std::logic_error &)
    {
        didThrow = true;
    }
    assert(didThrow);

    didThrow = false;
    try
    {
        harness.orchestrator.beginScanning(L"again");
    }
    catch (const std::logic_error &)
    {
        didThrow = true;
    }
    assert(didThrow);

    FakeExecutor executor;
    RecordingSink sink;

    OrchestratorSettings zeroJobs;
    zeroJobs.max_concurrent_jobs = 0;

    didThrow = false;
    try
    {
        JobOrchestrator orchestrator(executor, zeroJobs, sink);
    }
    catch (const std::invalid_argument &)
    {
        didThrow = true;
    }
    assert(didThrow);

    OrchestratorSettings shrinkingBackoff;
    shrinkingBackoff.retry_backoff = 0.5;

    didThrow = false;
    try
    {
        JobOrchestrator orchestrator(executor, shrinkingBackoff, sink);
    }
    catch (const std::invalid_argument &)
    {
        didThrow = true;
    }
    assert(didThrow);
}

static void test_driver_ticks_until_complete()
{
    OrchestratorSettings settings;
    settings.max_concurrent_jobs = 3;

    Harness harness(settings);
    for (std::size_t i{ 0 }; i < 10; ++i)
    {
        harness.executor.scripts["/src/c" + std::to_string(i)] = { 0 };
    }

    harness.orchestrator.load(makeChunks(10));

    TickDriver driver(harness.orchestrator, std::chrono::milliseconds(1));
    assert(!driver.isFinished());

    driver.start();

    std::size_t statusCalls{ 0 };
    driver.waitUntilFinished([&]() { ++statusCalls; });

    assert(driver.isFinished());
    assert(!driver.exceptions().wereAnyThrown());
    assert(harness.orchestrator.snapshot().phase == Phase::Complete);
    assert(harness.orchestrator.state().completed_chunks.size() == 10);
}

static void test_driver_stop_ends_a_run_that_would_never_finish()
{
    Harness harness;
    harness.orchestrator.load(makeChunks(20));

    TickDriver driver(harness.orchestrator, std::chrono::milliseconds(5));
    driver.start();
    driver.pause();
    driver.resume();
    driver.stop();
    driver.waitUntilFinished([]() {});

    assert(harness.orchestrator.snapshot().phase == Phase::Stopped);
    assert(harness.executor.running() == 0);
    assert(harness.orchestrator.state().abandoned_chunks > 0);
}

static void test_driver_commands_cut_a_long_tick_period_short()
{
    // with an hour between ticks, only a wake that is never lost lets these finish
    for (int i{ 0 }; i < 25; ++i)
    {
        Harness harness;
        harness.orchestrator.load(makeChunks(4));

        TickDriver driver(harness.orchestrator, std::chrono::hours(1));
        driver.start();

        if ((i % 2) == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        driver.stop();
        driver.waitUntilFinished([]() {});

        assert(driver.isFinished());
        assert(harness.orchestrator.snapshot().phase == Phase::Stopped);
    }
}

static void test_driver_rethrows_what_escaped_a_tick()
{
    Harness harness;
    harness.executor.will_reuse_handles = true;
    harness.orchestrator.load(makeChunks(2));

    TickDriver driver(harness.orchestrator, std::chrono::milliseconds(1));
    driver.start();

    bool didThrow{ false };
    try
    {
        driver.waitUntilFinished([]() {});
    }
    catch (const std::logic_error &)
    {
        didThrow = true;
    }

    assert(didThrow);
    assert(driver.exceptions().wereAnyThrown());

    didThrow = false;
    try
    {
        TickDriver badDriver(harness.orchestrator, std::chrono::milliseconds(0));
    }
    catch (const std::invalid_argument &)
    {
        didThrow = true;
    }
    assert(didThrow);
}

static void test_run_counters_tally_every_profile()
{
    RunCounters counters;
    assert(counters.outcome() == RunOutcome::Success);

    {
        OrchestratorSettings settings;
        settings.max_retries = 1;

        Harness harness(settings);
        harness.executor.scripts["/src/c0"] = { 0 };
        harness.executor.scripts["/src/c1"] = { exit_bit::mismatches };
        harness.executor.scripts["/src/c2"] = { exit_bit::some_failed, exit_bit::some_failed };

        harness.orchestrator.load(makeChunks(3, 2000));
        harness.tickUntilTerminal();
        counters.addProfile(harness.orchestrator.state());
    }

    {
        OrchestratorSettings settings;
        settings.max_concurrent_jobs = 1;

        Harness harness(settings);
        harness.orchestrator.load(makeChunks(4, 500));
        harness.orchestrator.tick();
        harness.executor.finishAll(0);
        harness.orchestrator.tick();
        harness.orchestrator.requestStop();
        harness.orchestrator.tick();
        counters.addProfile(harness.orchestrator.state());
    }

    assert(counters.profileCount() == 2);
    assert(counters.chunksTotal() == 7);
    assert(counters.succeededCount() == 3);
    assert(counters.warningCount() == 1);
    assert(counters.failedCount() == 1);
    assert(counters.retryCount() == 1);
    assert(counters.abandonedCount() == 3);
    assert(counters.tally(ChunkStatus::Complete).count == 2);
    assert(counters.tally(ChunkStatus::Complete).bytes == 2500);
    assert(counters.tally(ChunkStatus::Pending).count == 0);
    assert(counters.bytesComplete() == 4500);
    assert(counters.bytesTotal() == 8000);
    assert(counters.outcome() == RunOutcome::PartialFailure);

    // the title, then Complete, CompleteWithWarnings, and Failed
    const std::vector<std::wstring> lines{ counters.makeSummaryStrings() };
    assert(lines.size() == 4);
    assert(contains(lines[0], L"7 in 2 profiles"));
    assert(contains(lines[0], L"retries=1"));
    assert(contains(lines[0], L"not_finished=3"));
    assert(contains(lines[1], L"Complete "));
    assert(contains(lines[3], L"Failed"));
    assert(lines[1].size() == lines[2].size());
}

int main()
{
    test_never_exceeds_max_concurrent_jobs();
    test_errors_retry_until_the_limit_then_fail_once();
    test_fatal_results_retry_less();
    test_fatal_after_error_still_gets_its_retry();
    test_warnings_still_count_as_complete();
    test_stop_kills_everything_and_starts_nothing();
    test_breaker_pauses_until_cooled_down();
    test_resume_overrides_an_open_breaker();
    test_pause_lets_running_jobs_finish();
    test_jobs_that_run_too_long_are_killed_and_retried();
    test_retries_wait_behind_the_queue_with_backoff();
    test_snapshot_progress_and_eta();
    test_empty_profile_completes_on_first_tick();
    test_start_failures_count_as_fatal_attempts();
    test_misuse_is_rejected();
    test_run_counters_tally_every_profile();
    test_driver_ticks_until_complete();
    test_driver_stop_ends_a_run_that_would_never_finish();
    test_driver_commands_cut_a_long_tick_period_short();
    test_driver_rethrows_what_escaped_a_tick();

    std::cout << "All orchestrator tests passed" << std::endl;
    return 0;
}
