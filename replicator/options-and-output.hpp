#ifndef REPLICATOR_OPTIONS_AND_OUTPUT_HPP_INCLUDED
#define REPLICATOR_OPTIONS_AND_OUTPUT_HPP_INCLUDED
//
// options-and-output.hpp
//
#include "options.hpp"
#include "verified-output.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace replicator
{

    // This base class is responsible for converting command line arguments into options, and for
    // wrapping all print/output operations.  The args do NOT include the program name.
    class OptionsAndOutput
    {
      protected:
        explicit OptionsAndOutput(const std::vector<std::string> & args);
        ~OptionsAndOutput() = default;

        inline const Options & options() const noexcept { return m_options; }
        inline VerifiedOutput & output() noexcept { return m_output; }

        void printLine(std::wstring_view str, const Color color = Color::Default);
        void printLineToConsoleOnly(std::wstring_view str, const Color color = Color::Default);

        inline Clock_t::time_point lastPrintTime() const { return m_output.lastPrintTime(); }

        void disableQuietOptionToPrintFinalResults() { m_options.quiet = false; }

      private:
        // the logfile has to be opened before any option is parsed, so that parse errors land in it
        static std::wstring findLogBase(const std::vector<std::string> & args);

        void setOptions(const std::vector<std::string> & args);
        void setOptions_FromCommandLineArgs(const std::vector<std::string> & args);
        bool setOptions_IfFlagString(const std::string & arg);

        bool setOptions_IfValueOption(
            const std::vector<std::string> & args, std::size_t & argIndex);

        std::uint64_t setOptions_ParseCount(
            const std::string & name,
            const std::string & value,
            const std::uint64_t min,
            const std::uint64_t max);

        Duration_t setOptions_ParseMs(const std::string & name, const std::string & value);

        std::wstring setOptions_MakePathString(const std::string & arg);
        void setOptions_addPath(const std::string & arg);
        fs::path setOptions_MakeSourcePath(const std::wstring & pathStr);
        fs::path setOptions_MakeDestinationPath(const std::wstring & pathStr);
        void setOptions_Profiles();

        void printUsage();
        void printJobSummary(const std::vector<std::string> & args);
        void printOptionsSummary();
        void printConflictingOptionsWarnings();

        [[noreturn]] void printAndThrow(const std::wstring & errorMessage);

        void printAndThrowIf(
            const bool isError, const std::wstring & path, const std::wstring & error);

        void printAndThrowIfErrorCode(
            const ErrorCode_t & errorCode, const std::wstring & path, const std::wstring & error);

      private:
        Options m_options;
        VerifiedOutput m_output;

        // a source path waiting for its destination, and the name given to it by --name
        std::wstring m_pendingSource;
        std::wstring m_pendingName;
    };

} // namespace replicator

#endif // REPLICATOR_OPTIONS_AND_OUTPUT_HPP_INCLUDED
