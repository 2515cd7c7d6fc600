// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// path-mapping.cpp
//
#include "path-mapping.hpp"

#include "str-util.hpp"

#include <algorithm>
#include <stdexcept>

namespace replicator
{

    namespace
    {
        std::wstring trimTrailingSeparators(const std::wstring & pathStr)
        {
            std::wstring trimmed{ pathStr };
            strutil::trimEndIf(trimmed, isDirectorySeparator);
            return trimmed;
        }

        bool isSameChar(const wchar_t left, const wchar_t right)
        {
            if (isDirectorySeparator(left) && isDirectorySeparator(right))
            {
                return true;
            }

            if constexpr (is_running_on_windows)
            {
                return (strutil::toLowerCopy(left) == strutil::toLowerCopy(right));
            }
            else
            {
                return (left == right);
            }
        }

        wchar_t joiningSeparator(const std::wstring & destinationRoot)
        {
            if (destinationRoot.find(L'\\') < destinationRoot.size())
            {
                return L'\\';
            }
            else if (destinationRoot.find(L'/') < destinationRoot.size())
            {
                return L'/';
            }
            else
            {
                return static_cast<wchar_t>(fs::path::preferred_separator);
            }
        }
    } // namespace

    std::optional<std::wstring>
        relativeRemainder(const std::wstring & sourcePathOrig, const std::wstring & rootPathOrig)
    {
        const std::wstring sourcePath{ trimTrailingSeparators(sourcePathOrig) };
        const std::wstring rootPath{ trimTrailingSeparators(rootPathOrig) };

        if (sourcePath.size() < rootPath.size())
        {
            return std::nullopt;
        }

        const auto [rootIter, sourceIter] = std::mismatch(
            std::cbegin(rootPath),
            std::cend(rootPath),
            std::cbegin(sourcePath),
            [](const wchar_t rootCh, const wchar_t sourceCh) {
                return isSameChar(rootCh, sourceCh);
            });

        if (rootIter != std::cend(rootPath))
        {
            return std::nullopt;
        }

        // "/data/abc" is not inside "/data/a"
        const bool isOnBoundary{ (sourceIter == std::cend(sourcePath)) || rootPath.empty() ||
                                 isDirectorySeparator(*sourceIter) };

        if (!isOnBoundary)
        {
            return std::nullopt;
        }

        std::wstring remainder(sourceIter, std::cend(sourcePath));
        strutil::trimIf(remainder, isDirectorySeparator);
        return remainder;
    }

    fs::path mapDestinationPath(
        const fs::path & sourcePath, const fs::path & rootPath, const fs::path & destinationRoot)
    {
        const auto remainder{ relativeRemainder(sourcePath.wstring(), rootPath.wstring()) };

        if (!remainder)
        {
            throw std::invalid_argument(
                "mapDestinationPath() source \"" + sourcePath.string() +
                "\" is not inside the root \"" + rootPath.string() + "\"");
        }

        const std::wstring destinationRootStr{ destinationRoot.wstring() };
        std::wstring result{ trimTrailingSeparators(destinationRootStr) };

        if (remainder->empty())
        {
            // trimming "/" or "D:\" would change what they mean, so keep those untouched
            const bool isBareRoot{ result.empty() || (result.back() == L':') };
            return (isBareRoot ? destinationRoot : fs::path(result));
        }

        result += joiningSeparator(destinationRootStr);
        result += *remainder;
        return fs::path(result);
    }

} // namespace replicator
