// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// circuit-breaker.cpp
//
#include "circuit-breaker.hpp"

namespace replicator
{

    CircuitBreaker::CircuitBreaker(const CircuitBreakerSettings & settings)
        : m_settings(settings)
        , m_consecutiveFailures(0)
        , m_failureTimes()
        , m_openUntil()
    {}

    void CircuitBreaker::recordSuccess()
    {
        m_consecutiveFailures = 0;
        m_failureTimes.clear();
    }

    bool CircuitBreaker::recordFailure(const Clock_t::time_point & now)
    {
        ++m_consecutiveFailures;

        if ((0 == m_settings.failure_threshold) || isOpen(now))
        {
            return false;
        }

        m_failureTimes.push_back(now);
        forgetFailuresOutsideWindow(now);

        if (m_failureTimes.size() <= m_settings.failure_threshold)
        {
            return false;
        }

        m_failureTimes.clear();
        m_openUntil = (now + m_settings.cooldown);
        return true;
    }

    bool CircuitBreaker::isOpen(const Clock_t::time_point & now) const
    {
        return (m_openUntil && (now < m_openUntil.value()));
    }

    bool CircuitBreaker::closeIfCooledDown(const Clock_t::time_point & now)
    {
        if (!m_openUntil || isOpen(now))
        {
            return false;
        }

        m_openUntil.reset();
        return true;
    }

    void CircuitBreaker::forceClose()
    {
        m_openUntil.reset();
        m_failureTimes.clear();
        m_consecutiveFailures = 0;
    }

    void CircuitBreaker::forgetFailuresOutsideWindow(const Clock_t::time_point & now)
    {
        while (!m_failureTimes.empty() && ((now - m_failureTimes.front()) > m_settings.window))
        {
            m_failureTimes.pop_front();
        }
    }

} // namespace replicator
