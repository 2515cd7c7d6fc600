#ifndef REPLICATOR_TICK_DRIVER_HPP_INCLUDED
#define REPLICATOR_TICK_DRIVER_HPP_INCLUDED
//
// tick-driver.hpp
//
#include "orchestrator.hpp"
#include "thread-exceptions.hpp"
#include "thread-pool.hpp"
#include "util.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace replicator
{

    // The one thread that owns a JobOrchestrator while it replicates.  It calls tick() once every
    // tickPeriod until the phase is Complete or Stopped, and nothing else ever calls tick().  Other
    // threads talk to it only through stop()/pause()/resume(), which queue commands in the
    // orchestrator's inbox and wake this thread early.
    class TickDriver
    {
      public:
        static inline const Duration_t default_tick_period{ 250 };

        TickDriver(JobOrchestrator & orchestrator, const Duration_t tickPeriod);

        // stops and joins if start() was called without waitUntilFinished()
        ~TickDriver();

        TickDriver(const TickDriver &) = delete;
        TickDriver & operator=(const TickDriver &) = delete;

        void start();

        // Blocks, calling statusFunction every so often, until the tick thread is done.  Any
        // exception that escaped the tick thread is re-thrown here.
        void waitUntilFinished(const std::function<void()> & statusFunction);

        void stop();
        void pause();
        void resume();

        inline bool isFinished() const noexcept { return m_isFinished; }
        inline const ThreadExceptions & exceptions() const noexcept { return m_exceptions; }

      private:
        bool executeLoop();

        // a command that arrives while the tick thread is busy still cuts its next wait short
        void wake();

      private:
        JobOrchestrator & m_orchestrator;
        const Duration_t m_tickPeriod;
        std::atomic<bool> m_isFinished;
        ThreadExceptions m_exceptions;
        std::mutex m_condVarMutex;
        bool m_isWakeRequested; // guarded by m_condVarMutex
        std::condition_variable m_condVar;
        ThreadPool<bool> m_threadPool;
    };

} // namespace replicator

#endif // REPLICATOR_TICK_DRIVER_HPP_INCLUDED
