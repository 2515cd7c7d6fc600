#ifndef REPLICATOR_EVENTS_HPP_INCLUDED
#define REPLICATOR_EVENTS_HPP_INCLUDED
//
// events.hpp
//
#include "chunk.hpp"
#include "enums.hpp"
#include "verified-output.hpp"

#include <cstdint>
#include <string>

namespace replicator
{

    enum class EventKind
    {
        ChunkStarted,
        ChunkCompleted, // success or warning
        ChunkRetried,
        ChunkFailed, // permanently, after all retries
        ProfileCompleted,
        CircuitOpened,
        CircuitClosed
    };

    [[nodiscard]] constexpr auto toString(const EventKind kind) noexcept
    {
        // clang-format off
        switch (kind)
        {
            case EventKind::ChunkStarted:     return L"Started";
            case EventKind::ChunkCompleted:   return L"Completed";
            case EventKind::ChunkRetried:     return L"Retrying";
            case EventKind::ChunkFailed:      return L"Failed";
            case EventKind::ProfileCompleted: return L"Finished";
            case EventKind::CircuitOpened:    return L"BreakerOpen";
            case EventKind::CircuitClosed:    return L"BreakerShut";
            default:                          return L"UNKNOWN_EVENT_KIND_ENUM_ERROR";
        }
        // clang-format on
    }

    // One structured record per chunk start/completion/failure and per profile completion.  The
    // chunk fields are zero/empty for the profile and circuit breaker events.
    struct ReplicationEvent
    {
        EventKind kind = EventKind::ChunkStarted;
        std::wstring profile_name;
        ChunkId_t chunk_id = 0;
        fs::path source_path;
        fs::path destination_path;
        Severity severity          = Severity::Success;
        int exit_code              = 0;
        std::uint64_t files_copied = 0;
        std::uint64_t bytes_copied = 0;
        std::int64_t duration_ms   = 0;
        std::size_t retry_count    = 0;
        std::wstring detail;
    };

    // Receives every event on the thread that runs the orchestrator's tick, so implementations
    // must be quick and must not call back into the orchestrator.
    struct IEventSink
    {
        virtual ~IEventSink() = default;
        virtual void onEvent(const ReplicationEvent & event) = 0;
    };

    // columns:  category, severity, chunk id, "src -> dst", then "{detail}"
    [[nodiscard]] std::wstring makeEventLine(const ReplicationEvent & event);

    [[nodiscard]] Color eventColor(const ReplicationEvent & event) noexcept;

    //

    // Prints events as single lines.  Chunk starts are only shown when verbose, and when quiet only
    // the red lines (permanent failures and the breaker tripping) are shown.
    class LogEventSink : public IEventSink
    {
      public:
        LogEventSink(VerifiedOutput & output, const bool isVerbose, const bool isQuiet);
        virtual ~LogEventSink() = default;

        void onEvent(const ReplicationEvent & event) override;

      private:
        VerifiedOutput & m_output;
        bool m_isVerbose;
        bool m_isQuiet;
    };

} // namespace replicator

#endif // REPLICATOR_EVENTS_HPP_INCLUDED
