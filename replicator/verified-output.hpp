#ifndef REPLICATOR_VERIFIED_OUTPUT_HPP_INCLUDED
#define REPLICATOR_VERIFIED_OUTPUT_HPP_INCLUDED
//
// verified-output.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "util.hpp"

#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace replicator
{

    // The one place that writes to wcout and the logfile.  It is shared by the main thread (status
    // lines, results) and the tick thread (chunk events), so every public function locks.
    //
    // Both the Windows and Linux filesystems allow unicode characters that will put even the
    // "wide" wcout into a failed state, after which nothing more appears.  So the stream state is
    // checked after every character, and a bad character is replaced with '?' and counted.
    //
    // Logfile lines look like "<elapsed>  <LEVEL>  <text>", where the level comes from the color
    // the line would have had on the console.  A multi-line string gets that prefix on every line.
    class VerifiedOutput
    {
      public:
        // An empty logFilenameBase means there is no logfile.  The base may contain directories,
        // which are created (relative to the current path) if needed.
        explicit VerifiedOutput(const std::wstring & logFilenameBase = L"");

        void color(const bool willEnable);
        bool color() const;

        void print(std::wstring_view sv, const Color color = Color::Default);
        void printToConsoleOnly(std::wstring_view sv, const Color color = Color::Default);
        void printToLogfileOnly(std::wstring_view sv, const Color color = Color::Default);

        Clock_t::time_point lastPrintTime() const;

        fs::path logfilePath() const;

        // how many characters were replaced with '?' so far, console and logfile together
        std::size_t badCharacterCount() const;

      private:
        inline bool canWriteToLogfile() const
        {
            return (m_logFileStream.is_open() && m_logFileStream.good());
        }

        void openLogfile(const std::wstring & logFilenameBase);

        void writeConsole(std::wstring_view sv, const Color color);
        void writeLogfile(std::wstring_view sv, const Color color);

        // returns the number of bad characters replaced
        std::size_t writeVerified(std::wostream & os, std::wstring_view sv, const Color color);

        void writeColor(std::wostream & os, const Color color) const;
        bool isColorOn(const Color color) const noexcept;

      private:
        bool m_isColorAllowed;
        std::wofstream m_logFileStream;
        fs::path m_logFilePath;
        const Clock_t::time_point m_startTime;
        Clock_t::time_point m_lastPrintTime;
        std::size_t m_badCharacterCount;

        // only the public functions lock, and they never call each other
        mutable std::mutex m_mutex;
    };

} // namespace replicator

#endif // REPLICATOR_VERIFIED_OUTPUT_HPP_INCLUDED
