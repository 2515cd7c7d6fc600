#ifndef REPLICATOR_THROUGHPUT_HPP_INCLUDED
#define REPLICATOR_THROUGHPUT_HPP_INCLUDED
//
// throughput.hpp
//
#include "util.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

namespace replicator
{

    // Average rate of a monotonically growing byte count over a trailing window only, so that the
    // estimate follows changing conditions instead of the whole run's average.
    class ThroughputWindow
    {
      public:
        static inline const Duration_t default_window{ std::chrono::seconds(30) };

        explicit ThroughputWindow(const Duration_t window = default_window);

        // bytesSoFar is the running total, not a delta
        void addSample(const Clock_t::time_point & now, const std::uint64_t bytesSoFar);

        double bytesPerSecond() const;

        // nullopt until there are at least two samples with some progress between them
        std::optional<Clock_t::duration>
            estimateRemaining(const std::uint64_t remainingBytes) const;

        void reset() { m_samples.clear(); }

      private:
        Duration_t m_window;
        std::deque<std::pair<Clock_t::time_point, std::uint64_t>> m_samples;
    };

} // namespace replicator

#endif // REPLICATOR_THROUGHPUT_HPP_INCLUDED
