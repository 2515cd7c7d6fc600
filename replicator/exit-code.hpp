#ifndef REPLICATOR_EXIT_CODE_HPP_INCLUDED
#define REPLICATOR_EXIT_CODE_HPP_INCLUDED
//
// exit-code.hpp
//
#include "enums.hpp"

#include <string>

namespace replicator
{

    // the bits a copy executor combines into its exit code
    namespace exit_bit
    {
        constexpr int files_copied   = 1 << 0; // informational
        constexpr int extras_present = 1 << 1; // informational, extra entries in the destination
        constexpr int mismatches     = 1 << 2; // warning
        constexpr int some_failed    = 1 << 3; // error, retryable
        constexpr int fatal          = 1 << 4; // fatal, nothing (or nothing useful) was processed

        constexpr int all_known =
            (files_copied | extras_present | mismatches | some_failed | fatal);
    } // namespace exit_bit

    // An executor exit code decoded exactly once, at the boundary where it enters the orchestrator.
    // Everything after that branches on severity and the named flags, never on raw bits.
    struct ExitOutcome
    {
        int exit_code     = 0;
        Severity severity = Severity::Success;

        bool files_copied   = false;
        bool extras_present = false;
        bool mismatches     = false;
        bool some_failed    = false;
        bool fatal          = false;

        // bits outside exit_bit::all_known, or a negative code, which are treated as fatal
        bool unrecognized = false;

        std::wstring toString() const;
    };

    // Severity is the most severe bit present:  Fatal > Error > Warning > Success.
    [[nodiscard]] ExitOutcome decodeExitCode(const int exitCode) noexcept;

    [[nodiscard]] constexpr int makeExitCode(
        const bool filesCopied,
        const bool extrasPresent,
        const bool mismatches,
        const bool someFailed,
        const bool fatal) noexcept
    {
        return (
            (filesCopied ? exit_bit::files_copied : 0) |
            (extrasPresent ? exit_bit::extras_present : 0) |
            (mismatches ? exit_bit::mismatches : 0) | (someFailed ? exit_bit::some_failed : 0) |
            (fatal ? exit_bit::fatal : 0));
    }

} // namespace replicator

#endif // REPLICATOR_EXIT_CODE_HPP_INCLUDED
