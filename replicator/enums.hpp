#ifndef REPLICATOR_ENUMS_HPP_INCLUDED
#define REPLICATOR_ENUMS_HPP_INCLUDED
//
// enums.hpp
//
#include <cstddef>
#include <string>

namespace replicator
{

    enum class Phase
    {
        Idle,
        Scanning,
        Replicating,
        Paused,
        Stopping,
        Complete,
        Stopped
    };

    [[nodiscard]] constexpr auto toString(const Phase phase) noexcept
    {
        // clang-format off
        switch (phase)
        {
            case Phase::Idle:        return L"Idle";
            case Phase::Scanning:    return L"Scanning";
            case Phase::Replicating: return L"Replicating";
            case Phase::Paused:      return L"Paused";
            case Phase::Stopping:    return L"Stopping";
            case Phase::Complete:    return L"Complete";
            case Phase::Stopped:     return L"Stopped";
            default:                 return L"UNKNOWN_PHASE_ENUM_ERROR";
        }
        // clang-format on
    }

    [[nodiscard]] constexpr bool isTerminal(const Phase phase) noexcept
    {
        return ((Phase::Complete == phase) || (Phase::Stopped == phase));
    }

    enum class ChunkStatus
    {
        Pending,
        Running,
        Complete,
        CompleteWithWarnings,
        Failed
    };

    [[nodiscard]] constexpr auto toString(const ChunkStatus status) noexcept
    {
        // clang-format off
        switch (status)
        {
            case ChunkStatus::Pending:              return L"Pending";
            case ChunkStatus::Running:              return L"Running";
            case ChunkStatus::Complete:             return L"Complete";
            case ChunkStatus::CompleteWithWarnings: return L"CompleteWithWarnings";
            case ChunkStatus::Failed:               return L"Failed";
            default:                                return L"UNKNOWN_CHUNK_STATUS_ENUM_ERROR";
        }
        // clang-format on
    }

    // ordered from least to most severe, see decodeExitCode()
    enum class Severity
    {
        Success,
        Warning,
        Error,
        Fatal
    };

    [[nodiscard]] constexpr auto toString(const Severity severity) noexcept
    {
        // clang-format off
        switch (severity)
        {
            case Severity::Success: return L"Success";
            case Severity::Warning: return L"Warning";
            case Severity::Error:   return L"Error";
            case Severity::Fatal:   return L"Fatal";
            default:                return L"UNKNOWN_SEVERITY_ENUM_ERROR";
        }
        // clang-format on
    }

    [[nodiscard]] constexpr bool isFailure(const Severity severity) noexcept
    {
        return ((Severity::Error == severity) || (Severity::Fatal == severity));
    }

    enum class RunOutcome
    {
        Success,
        PartialFailure,
        TotalFailure
    };

    [[nodiscard]] constexpr auto toString(const RunOutcome outcome) noexcept
    {
        // clang-format off
        switch (outcome)
        {
            case RunOutcome::Success:        return L"Success";
            case RunOutcome::PartialFailure: return L"PartialFailure";
            case RunOutcome::TotalFailure:   return L"TotalFailure";
            default:                         return L"UNKNOWN_RUN_OUTCOME_ENUM_ERROR";
        }
        // clang-format on
    }

    [[nodiscard]] constexpr RunOutcome
        classifyRun(const std::size_t succeededCount, const std::size_t failedCount) noexcept
    {
        if (0 == failedCount)
        {
            return RunOutcome::Success;
        }
        else if (succeededCount > 0)
        {
            return RunOutcome::PartialFailure;
        }
        else
        {
            return RunOutcome::TotalFailure;
        }
    }

    enum class PlanError
    {
        Profile,
        Enumerate
    };

    [[nodiscard]] constexpr auto toString(const PlanError error) noexcept
    {
        // clang-format off
        switch (error)
        {
            case PlanError::Profile:   return L"Profile";
            case PlanError::Enumerate: return L"Enumerate";
            default:                   return L"UNKNOWN_PLAN_ERROR_ENUM_ERROR";
        }
        // clang-format on
    }

    enum class Color
    {
        Default,
        Gray,
        Green,
        Yellow,
        Red,
        Disabled
    };

    [[nodiscard]] constexpr auto toConsoleCode(const Color color) noexcept
    {
        // clang-format off
        switch (color)
        {
            case Color::Default:    return L"\033[0;0m";
            case Color::Gray:       return L"\033[37;40m";
            case Color::Green:      return L"\033[32;40m";
            case Color::Yellow:     return L"\033[33;40m";
            case Color::Red:        return L"\033[91;40m";
            case Color::Disabled:
            default:                return L"";
        }
        // clang-format on
    }

} // namespace replicator

#endif // REPLICATOR_ENUMS_HPP_INCLUDED
