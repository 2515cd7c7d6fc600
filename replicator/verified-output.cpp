// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// verified-output.cpp
//
#include "verified-output.hpp"

#include "str-util.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

#if defined(_MSC_VER)
#pragma warning(disable : 4996) // allow use of old unsafe localtime()
#endif

namespace replicator
{

    namespace
    {
        [[nodiscard]] constexpr const wchar_t * levelTag(const Color color) noexcept
        {
            // clang-format off
            switch (color)
            {
                case Color::Red:    return L"ERROR";
                case Color::Yellow: return L"WARN ";
                case Color::Gray:   return L"DEBUG";
                case Color::Green:
                case Color::Default:
                case Color::Disabled:
                default:            return L"INFO ";
            }
            // clang-format on
        }

        // "<base>--YYYY-MM-DD--HH-MM-SS--NNN.log", with the first NNN not already taken
        std::optional<fs::path>
            findFreeLogfilePath(const fs::path & dirPath, const std::wstring & stem)
        {
            const time_t nowCTime{ std::chrono::system_clock::to_time_t(
                std::chrono::system_clock::now()) };

            std::ostringstream timeSS;
            timeSS << std::put_time(std::localtime(&nowCTime), "--%F--%H-%M-%S--");
            const std::wstring timeStr{ strutil::toWideString(timeSS.str()) };

            for (std::size_t number{ 0 }; number < 1000; ++number)
            {
                std::wostringstream nameSS;
                nameSS << stem << timeStr << std::setw(3) << std::setfill(L'0') << number
                       << L".log";

                const fs::path path{ dirPath / nameSS.str() };
                if (!existsIgnoringErrors(path, false))
                {
                    return path;
                }
            }

            return std::nullopt;
        }
    } // namespace

    VerifiedOutput::VerifiedOutput(const std::wstring & logFilenameBase)
        : m_isColorAllowed(false)
        , m_logFileStream()
        , m_logFilePath()
        , m_startTime(Clock_t::now())
        , m_lastPrintTime(m_startTime)
        , m_badCharacterCount(0)
        , m_mutex()
    {
        openLogfile(logFilenameBase);
    }

    void VerifiedOutput::color(const bool willEnable)
    {
        std::scoped_lock scopedLock(m_mutex);
        m_isColorAllowed = willEnable;
    }

    bool VerifiedOutput::color() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_isColorAllowed;
    }

    void VerifiedOutput::print(std::wstring_view sv, const Color color)
    {
        if (sv.empty())
        {
            return;
        }

        std::scoped_lock scopedLock(m_mutex);
        writeConsole(sv, color);
        writeLogfile(sv, color);
    }

    void VerifiedOutput::printToConsoleOnly(std::wstring_view sv, const Color color)
    {
        std::scoped_lock scopedLock(m_mutex);
        writeConsole(sv, color);
    }

    void VerifiedOutput::printToLogfileOnly(std::wstring_view sv, const Color color)
    {
        std::scoped_lock scopedLock(m_mutex);
        writeLogfile(sv, color);
    }

    Clock_t::time_point VerifiedOutput::lastPrintTime() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_lastPrintTime;
    }

    fs::path VerifiedOutput::logfilePath() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_logFilePath;
    }

    std::size_t VerifiedOutput::badCharacterCount() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_badCharacterCount;
    }

    void VerifiedOutput::openLogfile(const std::wstring & logFilenameBase)
    {
        if (logFilenameBase.empty())
        {
            return;
        }

        ErrorCode_t errorCode;
        const fs::path currentPath{ fs::current_path(errorCode) }; //-V821
        if (errorCode)
        {
            writeConsole(
                L"Error: Unable to find the current path for the logfile: " + toString(errorCode),
                Color::Red);

            return;
        }

        const fs::path basePath{ logFilenameBase };
        const fs::path dirPath{ (currentPath / basePath).parent_path() };

        fs::create_directories(dirPath, errorCode);
        if (errorCode)
        {
            writeConsole(
                L"Error: Unable to create the logfile directory \"" + dirPath.wstring() +
                    L"\": " + toString(errorCode),
                Color::Red);

            return;
        }

        const std::optional<fs::path> pathOpt{ findFreeLogfilePath(
            dirPath, basePath.filename().wstring()) };

        if (!pathOpt)
        {
            writeConsole(
                L"Error: Every logfile name for today is taken in \"" + dirPath.wstring() + L"\"",
                Color::Red);

            return;
        }

        m_logFileStream.open(pathOpt.value(), (std::ios::trunc | std::ios::out));

        if (!canWriteToLogfile())
        {
            writeConsole(
                L"Error: Unable to create the logfile: \"" + pathOpt->wstring() + L"\"",
                Color::Red);

            return;
        }

        m_logFilePath = pathOpt.value();
    }

    void VerifiedOutput::writeConsole(std::wstring_view sv, const Color color)
    {
        if (isColorOn(color))
        {
            writeColor(std::wcout, color);
        }

        m_badCharacterCount += writeVerified(std::wcout, sv, color);

        if (isColorOn(color))
        {
            writeColor(std::wcout, Color::Default);
        }

        std::wcout << std::endl;
        m_lastPrintTime = Clock_t::now();
    }

    void VerifiedOutput::writeLogfile(std::wstring_view sv, const Color color)
    {
        if (!canWriteToLogfile() || sv.empty())
        {
            return;
        }

        const std::wstring elapsedStr{ prettyTimeDurationString(Clock_t::now() - m_startTime) };

        std::size_t lineStart{ 0 };
        while (lineStart <= sv.size())
        {
            std::size_t lineEnd{ sv.find(L'\n', lineStart) };
            if (lineEnd == std::wstring_view::npos)
            {
                lineEnd = sv.size();
            }

            m_logFileStream << std::setw(9) << std::right << elapsedStr << L"  "
                            << levelTag(color) << L"  ";

            m_badCharacterCount += writeVerified(
                m_logFileStream, sv.substr(lineStart, (lineEnd - lineStart)), Color::Disabled);

            m_logFileStream << L'\n';
            lineStart = (lineEnd + 1);
        }

        // errors are flushed immediately so they survive a crash
        if (Color::Red == color)
        {
            m_logFileStream.flush();
        }
    }

    std::size_t
        VerifiedOutput::writeVerified(std::wostream & os, std::wstring_view sv, const Color color)
    {
        std::size_t badCount{ 0 };

        for (const wchar_t ch : sv)
        {
            os << ch;

            if (!os.good())
            {
                os.clear();
                os.flush();
                os << L'?';
                ++badCount;
            }
        }

        if (badCount > 0)
        {
            const Color alertColor{ (Color::Yellow == color) ? Color::Red : Color::Yellow };

            if (isColorOn(color))
            {
                writeColor(os, alertColor);
            }

            os << L"   {output_error_" << badCount << L"_bad_chars}";

            if (isColorOn(color))
            {
                writeColor(os, color);
            }
        }

        return badCount;
    }

    void VerifiedOutput::writeColor(std::wostream & os, const Color color) const
    {
        os << toConsoleCode(color);
    }

    bool VerifiedOutput::isColorOn(const Color color) const noexcept
    {
        return (m_isColorAllowed && (Color::Disabled != color));
    }

} // namespace replicator
