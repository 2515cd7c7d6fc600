// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// counters.cpp
//
#include "counters.hpp"

#include "filesystem-common.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace replicator
{

    RunCounters::RunCounters()
        : m_tallies()
        , m_profileCount(0)
        , m_retryCount(0)
        , m_abandonedCount(0)
        , m_chunksTotal(0)
        , m_bytesComplete(0)
        , m_bytesTotal(0)
    {}

    void RunCounters::addProfile(const OrchestrationState & state)
    {
        ++m_profileCount;

        for (const Chunk & chunk : state.completed_chunks)
        {
            add(chunk);
            m_bytesComplete += chunk.estimated_size_bytes;
        }

        for (const Chunk & chunk : state.failed_chunks)
        {
            add(chunk);
        }

        m_retryCount += state.retries_total;
        m_abandonedCount += state.abandoned_chunks;
        m_chunksTotal += state.total_chunks;
        m_bytesTotal += state.bytes_total;
    }

    void RunCounters::add(const Chunk & chunk)
    {
        StatusTally & statusTally{ m_tallies.at(static_cast<std::size_t>(chunk.status)) };
        ++statusTally.count;
        statusTally.bytes += chunk.estimated_size_bytes;
    }

    const StatusTally & RunCounters::tally(const ChunkStatus status) const
    {
        return m_tallies.at(static_cast<std::size_t>(status));
    }

    std::size_t RunCounters::succeededCount() const
    {
        return (tally(ChunkStatus::Complete).count + warningCount());
    }

    std::vector<std::wstring> RunCounters::makeSummaryStrings() const
    {
        std::vector<std::wstring> lines;

        std::wostringstream titleSS;
        titleSS << L"Chunks (" << m_chunksTotal << L" in " << m_profileCount
                << ((1 == m_profileCount) ? L" profile, " : L" profiles, ")
                << fileSizeToString(m_bytesComplete) << L" of " << fileSizeToString(m_bytesTotal)
                << L")";

        if (m_retryCount > 0)
        {
            titleSS << L"  retries=" << m_retryCount;
        }

        if (m_abandonedCount > 0)
        {
            titleSS << L"  not_finished=" << m_abandonedCount;
        }

        lines.push_back(titleSS.str());

        std::size_t countedTotal{ 0 };
        std::uint64_t bytesCountedTotal{ 0 };
        std::size_t nameWidth{ 0 };
        std::size_t countWidth{ 0 };
        std::size_t sizeWidth{ 0 };

        for (std::size_t i{ 0 }; i < status_count; ++i)
        {
            const StatusTally & statusTally{ m_tallies[i] };
            if (0 == statusTally.count)
            {
                continue;
            }

            countedTotal += statusTally.count;
            bytesCountedTotal += statusTally.bytes;

            const std::wstring name{ toString(static_cast<ChunkStatus>(i)) };
            nameWidth  = std::max(nameWidth, name.size());
            countWidth = std::max(countWidth, std::to_wstring(statusTally.count).size());
            sizeWidth  = std::max(sizeWidth, fileSizeToString(statusTally.bytes).size());
        }

        // in enum order, which is the order of the chunk lifecycle
        for (std::size_t i{ 0 }; i < status_count; ++i)
        {
            const StatusTally & statusTally{ m_tallies[i] };
            if (0 == statusTally.count)
            {
                continue;
            }

            std::wostringstream ss;
            ss << L"   " << std::left << std::setw(static_cast<int>(nameWidth))
               << toString(static_cast<ChunkStatus>(i));

            ss << L" -  " << std::right << std::setw(static_cast<int>(countWidth))
               << statusTally.count << L"x " << std::setw(4)
               << calcPercentString(statusTally.count, countedTotal);

            if (statusTally.bytes > 0)
            {
                ss << L"  - " << std::setw(static_cast<int>(sizeWidth))
                   << fileSizeToString(statusTally.bytes);

                if (statusTally.bytes != bytesCountedTotal)
                {
                    ss << L" " << std::setw(4)
                       << calcPercentString(statusTally.bytes, bytesCountedTotal);
                }
            }

            lines.push_back(ss.str());
        }

        return lines;
    }

} // namespace replicator
