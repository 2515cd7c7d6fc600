// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// throughput.cpp
//
#include "throughput.hpp"

namespace replicator
{

    ThroughputWindow::ThroughputWindow(const Duration_t window)
        : m_window(window)
        , m_samples()
    {}

    void ThroughputWindow::addSample(
        const Clock_t::time_point & now, const std::uint64_t bytesSoFar)
    {
        // the running total can shrink when a failed chunk's live bytes are dropped
        if (!m_samples.empty() && (bytesSoFar < m_samples.back().second))
        {
            m_samples.clear();
        }

        m_samples.emplace_back(now, bytesSoFar);

        // keep one sample older than the window so the window is always fully covered
        while ((m_samples.size() > 2) && ((now - m_samples[1].first) >= m_window))
        {
            m_samples.pop_front();
        }
    }

    double ThroughputWindow::bytesPerSecond() const
    {
        if (m_samples.size() < 2)
        {
            return 0.0;
        }

        const auto & [firstTime, firstBytes] = m_samples.front();
        const auto & [lastTime, lastBytes]   = m_samples.back();

        const double seconds{ std::chrono::duration<double>(lastTime - firstTime).count() };
        if (seconds <= 0.0)
        {
            return 0.0;
        }

        return (static_cast<double>(lastBytes - firstBytes) / seconds);
    }

    std::optional<Clock_t::duration>
        ThroughputWindow::estimateRemaining(const std::uint64_t remainingBytes) const
    {
        const double rate{ bytesPerSecond() };
        if (rate <= 0.0)
        {
            return std::nullopt;
        }

        const std::chrono::duration<double> seconds(static_cast<double>(remainingBytes) / rate);
        return std::chrono::duration_cast<Clock_t::duration>(seconds);
    }

} // namespace replicator
