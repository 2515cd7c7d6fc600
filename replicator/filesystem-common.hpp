#ifndef REPLICATOR_FILESYSTEM_COMMON_HPP_INCLUDED
#define REPLICATOR_FILESYSTEM_COMMON_HPP_INCLUDED
//
// filesystem-common.hpp
//
#include "str-util.hpp"
#include "util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

//
// Links  (i.e. symlinks/shortcuts/junctions/etc)
//  - Nothing here ever follows a link of any kind to what it points to.
//  - A directory entry whose symlink_status() is not a plain directory or regular file is a
//    "reparse point".  The planner never descends into one and never makes a chunk for one, and
//    every chunk carries CopyOption::ExcludeReparsePoints so the executor skips them too.  This is
//    what keeps junction loops (i.e. "C:\Documents and Settings") from being copied forever.
//  - Symlinks to regular files are also skipped, so final file counts can differ between the
//    source and destination trees when links exist.
//

namespace replicator
{

    namespace fs = std::filesystem;

    using ErrorCode_t        = std::error_code;
    using InputFileStream_t  = std::ifstream;
    using OutputFileStream_t = std::ofstream;

    [[nodiscard]] inline const wchar_t * toString(const fs::file_type fileType) noexcept
    {
        // clang-format off
        switch (fileType)
        {
            case fs::file_type::none:       { return L"none"; }
            case fs::file_type::not_found:  { return L"not_found"; }
            case fs::file_type::regular:    { return L"file"; }
            case fs::file_type::directory:  { return L"directory"; }
            case fs::file_type::symlink:    { return L"symlink"; }
            case fs::file_type::block:      { return L"block"; }
            case fs::file_type::character:  { return L"character"; }
            case fs::file_type::fifo:       { return L"fifo"; }
            case fs::file_type::socket:     { return L"socket"; }
            case fs::file_type::unknown:    { return L"unknown"; }
            default:                        { return L"(UNKNOWN_FILE_TYPE_ENUM_ERROR)"; }
        }
        // clang-format on
    }

    [[nodiscard]] inline std::wstring toString(const ErrorCode_t & errorCode)
    {
        std::string str;
        str += "error_code=";
        str += std::to_string(errorCode.value());
        str += '=';
        str += errorCode.category().name();
        str += "=\"";
        str += errorCode.message();
        str += '\"';
        return strutil::toWideString(str);
    }

    [[nodiscard]] inline std::wstring fileSizeToString(const std::uint64_t size)
    {
        if (size < kibibyte)
        {
            return (std::to_wstring(size) + L"B");
        }

        std::wostringstream ss;

        auto appendSize = [&](const std::uint64_t step, const wchar_t * suffix) {
            ss << std::fixed << std::setprecision(1)
               << (static_cast<long double>(size) / static_cast<long double>(step)) << suffix;
        };

        if (size < mebibyte)
        {
            appendSize(kibibyte, L"KiB");
        }
        else if (size < gibibyte)
        {
            appendSize(mebibyte, L"MiB");
        }
        else if (size < tebibyte)
        {
            appendSize(gibibyte, L"GiB");
        }
        else
        {
            appendSize(tebibyte, L"TiB");
        }

        return ss.str();
    }

    [[nodiscard]] constexpr bool isDirectorySeparator(const wchar_t ch) noexcept
    {
        return ((ch == static_cast<wchar_t>(fs::path::preferred_separator)) || (ch == L'\\') ||
                (ch == L'/'));
    }

    // anything that is neither a plain directory nor a plain regular file once links are NOT
    // followed, see the comment at the top of this file
    [[nodiscard]] inline bool isReparsePoint(const fs::file_status & symlinkStatus) noexcept
    {
        return (!fs::is_directory(symlinkStatus) && !fs::is_regular_file(symlinkStatus));
    }

    [[nodiscard]] inline bool existsIgnoringErrors(const fs::path & path, const bool returnOnError)
    {
        ErrorCode_t errorCodeIgnored;
        const bool result{ fs::exists(path, errorCodeIgnored) };

        if (errorCodeIgnored)
        {
            return returnOnError;
        }
        else
        {
            return result;
        }
    }

} // namespace replicator

#endif // REPLICATOR_FILESYSTEM_COMMON_HPP_INCLUDED
