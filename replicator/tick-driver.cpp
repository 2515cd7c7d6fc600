// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// tick-driver.cpp
//
#include "tick-driver.hpp"

#include <future>
#include <stdexcept>

namespace replicator
{

    TickDriver::TickDriver(JobOrchestrator & orchestrator, const Duration_t tickPeriod)
        : m_orchestrator(orchestrator)
        , m_tickPeriod(tickPeriod)
        , m_isFinished(false)
        , m_exceptions()
        , m_condVarMutex()
        , m_isWakeRequested(false)
        , m_condVar()
        , m_threadPool()
    {
        if (m_tickPeriod.count() <= 0)
        {
            throw std::invalid_argument("TickDriver tick period must be greater than zero");
        }
    }

    TickDriver::~TickDriver()
    {
        if (!m_threadPool.isEmpty())
        {
            stop();
            m_threadPool.joinAndDestroyAll();
        }
    }

    void TickDriver::start()
    {
        if (!m_threadPool.isEmpty())
        {
            throw std::logic_error("TickDriver::start() called while already running");
        }

        m_isFinished = false;
        m_threadPool.add(std::async(std::launch::async, &TickDriver::executeLoop, this));
    }

    void TickDriver::waitUntilFinished(const std::function<void()> & statusFunction)
    {
        m_threadPool.waitUntilAllJoinedAndDestroyed(statusFunction);
        m_isFinished = true;
        m_exceptions.reThrowFirst();
    }

    void TickDriver::stop()
    {
        m_orchestrator.requestStop();
        wake();
    }

    void TickDriver::pause()
    {
        m_orchestrator.requestPause();
        wake();
    }

    void TickDriver::resume()
    {
        m_orchestrator.requestResume();
        wake();
    }

    void TickDriver::wake()
    {
        {
            std::scoped_lock scopedLock(m_condVarMutex);
            m_isWakeRequested = true;
        }

        m_condVar.notify_all();
    }

    bool TickDriver::executeLoop()
    {
        try
        {
            while (true)
            {
                m_orchestrator.tick();

                if (isTerminal(m_orchestrator.state().phase))
                {
                    break;
                }

                std::unique_lock lock(m_condVarMutex);
                m_condVar.wait_for(lock, m_tickPeriod, [&]() { return m_isWakeRequested; });
                m_isWakeRequested = false;
            }
        }
        catch (...)
        {
            // kept and re-thrown by waitUntilFinished() on the thread that owns this driver
            m_exceptions.add(std::current_exception());
            return false;
        }

        return true;
    }

} // namespace replicator
