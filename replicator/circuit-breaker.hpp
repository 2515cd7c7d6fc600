#ifndef REPLICATOR_CIRCUIT_BREAKER_HPP_INCLUDED
#define REPLICATOR_CIRCUIT_BREAKER_HPP_INCLUDED
//
// circuit-breaker.hpp
//
#include "util.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace replicator
{

    struct CircuitBreakerSettings
    {
        static constexpr std::size_t default_failure_threshold{ 5 };
        static inline const Duration_t default_window{ std::chrono::seconds(60) };
        static inline const Duration_t default_cooldown{ std::chrono::seconds(120) };

        // zero disables the breaker
        std::size_t failure_threshold = default_failure_threshold;
        Duration_t window             = default_window;
        Duration_t cooldown           = default_cooldown;
    };

    // Trips once more than failure_threshold failures with no success between them fall inside
    // the trailing window.  Once tripped it stays open for cooldown, and the failure history is
    // cleared so that a whole new run of failures is needed to trip it again.  Failures recorded
    // while open never extend the open time.
    class CircuitBreaker
    {
      public:
        explicit CircuitBreaker(const CircuitBreakerSettings & settings = CircuitBreakerSettings());

        void recordSuccess();

        // returns true only if this failure is the one that tripped the breaker
        bool recordFailure(const Clock_t::time_point & now);

        bool isOpen(const Clock_t::time_point & now) const;

        // returns true only if the breaker was open and is now closed
        bool closeIfCooledDown(const Clock_t::time_point & now);

        // an operator resume, closes immediately and forgets all failures
        void forceClose();

        inline std::size_t consecutiveFailures() const noexcept { return m_consecutiveFailures; }
        inline std::optional<Clock_t::time_point> openUntil() const noexcept { return m_openUntil; }
        inline const CircuitBreakerSettings & settings() const noexcept { return m_settings; }

      private:
        void forgetFailuresOutsideWindow(const Clock_t::time_point & now);

      private:
        CircuitBreakerSettings m_settings;
        std::size_t m_consecutiveFailures;
        std::deque<Clock_t::time_point> m_failureTimes;
        std::optional<Clock_t::time_point> m_openUntil;
    };

} // namespace replicator

#endif // REPLICATOR_CIRCUIT_BREAKER_HPP_INCLUDED
