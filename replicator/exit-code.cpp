// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// exit-code.cpp
//
#include "exit-code.hpp"

namespace replicator
{

    ExitOutcome decodeExitCode(const int exitCode) noexcept
    {
        ExitOutcome outcome;
        outcome.exit_code = exitCode;

        if (exitCode < 0)
        {
            outcome.unrecognized = true;
            outcome.severity     = Severity::Fatal;
            return outcome;
        }

        outcome.files_copied   = ((exitCode & exit_bit::files_copied) != 0);
        outcome.extras_present = ((exitCode & exit_bit::extras_present) != 0);
        outcome.mismatches     = ((exitCode & exit_bit::mismatches) != 0);
        outcome.some_failed    = ((exitCode & exit_bit::some_failed) != 0);
        outcome.fatal          = ((exitCode & exit_bit::fatal) != 0);
        outcome.unrecognized   = ((exitCode & ~exit_bit::all_known) != 0);

        if (outcome.fatal || outcome.unrecognized)
        {
            outcome.severity = Severity::Fatal;
        }
        else if (outcome.some_failed)
        {
            outcome.severity = Severity::Error;
        }
        else if (outcome.mismatches)
        {
            outcome.severity = Severity::Warning;
        }
        else
        {
            outcome.severity = Severity::Success;
        }

        return outcome;
    }

    std::wstring ExitOutcome::toString() const
    {
        std::wstring str{ replicator::toString(severity) };
        str += L"(";
        str += std::to_wstring(exit_code);

        auto appendFlagIf = [&](const bool is, const wchar_t * name) {
            if (is)
            {
                str += L" ";
                str += name;
            }
        };

        appendFlagIf(files_copied, L"copied");
        appendFlagIf(extras_present, L"extras");
        appendFlagIf(mismatches, L"mismatches");
        appendFlagIf(some_failed, L"some_failed");
        appendFlagIf(fatal, L"fatal");
        appendFlagIf(unrecognized, L"unrecognized");

        str += L")";
        return str;
    }

} // namespace replicator
