// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// events.cpp
//
#include "events.hpp"

#include "filesystem-common.hpp"
#include "util.hpp"

#include <algorithm>
#include <sstream>

namespace replicator
{

    std::wstring makeEventLine(const ReplicationEvent & event)
    {
        std::wostringstream ss;

        ss.width(12);
        ss << std::left << toString(event.kind);

        ss.width(9);
        ss << std::left << toString(event.severity);

        if (event.chunk_id > 0)
        {
            ss << L" #";
            ss.width(6);
            ss << std::left << event.chunk_id;

            ss << event.source_path.wstring() << L" -> " << event.destination_path.wstring();
        }
        else
        {
            ss << L" " << event.profile_name;
        }

        std::wstring detail;

        auto appendDetail = [&](const std::wstring & str) {
            if (!detail.empty())
            {
                detail += L", ";
            }

            detail += str;
        };

        if ((EventKind::ChunkCompleted == event.kind) || (EventKind::ChunkFailed == event.kind) ||
            (EventKind::ChunkRetried == event.kind))
        {
            appendDetail(L"exit=" + std::to_wstring(event.exit_code));
            appendDetail(L"files=" + std::to_wstring(event.files_copied));
            appendDetail(L"size=" + fileSizeToString(event.bytes_copied));
            appendDetail(
                L"time=" +
                prettyTimeDurationString(std::chrono::milliseconds(event.duration_ms)));
        }

        if (event.retry_count > 0)
        {
            appendDetail(L"retry=" + std::to_wstring(event.retry_count));
        }

        // some error messages arrive with newlines in them, which would break the columns
        std::wstring eventDetail{ event.detail };
        eventDetail.erase(
            std::remove_if(
                std::begin(eventDetail),
                std::end(eventDetail),
                [](const wchar_t ch) { return ((ch < 32) || (ch == 127)); }),
            std::end(eventDetail));

        if (!eventDetail.empty())
        {
            appendDetail(eventDetail);
        }

        if (!detail.empty())
        {
            ss << L"   {" << detail << L"}";
        }

        return ss.str();
    }

    Color eventColor(const ReplicationEvent & event) noexcept
    {
        // clang-format off
        switch (event.kind)
        {
            case EventKind::ChunkStarted:     return Color::Default;
            case EventKind::ChunkRetried:     return Color::Yellow;
            case EventKind::ChunkFailed:      return Color::Red;
            case EventKind::CircuitOpened:    return Color::Red;
            case EventKind::CircuitClosed:    return Color::Yellow;
            case EventKind::ProfileCompleted: return (isFailure(event.severity) ? Color::Yellow : Color::Green);
            case EventKind::ChunkCompleted:   return ((Severity::Warning == event.severity) ? Color::Yellow : Color::Default);
            default:                          return Color::Default;
        }
        // clang-format on
    }

    LogEventSink::LogEventSink(VerifiedOutput & output, const bool isVerbose, const bool isQuiet)
        : m_output(output)
        , m_isVerbose(isVerbose)
        , m_isQuiet(isQuiet)
    {}

    void LogEventSink::onEvent(const ReplicationEvent & event)
    {
        if ((EventKind::ChunkStarted == event.kind) && !m_isVerbose)
        {
            return;
        }

        const Color color{ eventColor(event) };

        // quiet keeps the console to errors, but the logfile still gets the whole story
        if (m_isQuiet && (Color::Red != color))
        {
            m_output.printToLogfileOnly(makeEventLine(event), color);
        }
        else
        {
            m_output.print(makeEventLine(event), color);
        }
    }

} // namespace replicator
