// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// directory-profiler.cpp
//
#include "directory-profiler.hpp"

#include <algorithm>

namespace replicator
{

    DirectoryProfile FilesystemProfiler::profile(const fs::path & path, ErrorCode_t & errorCode)
    {
        errorCode.clear();

        DirectoryProfile profile;
        profile.path = path;

        const fs::file_status status{ fs::symlink_status(path, errorCode) };
        if (errorCode)
        {
            return profile;
        }

        if (!fs::is_directory(status))
        {
            errorCode = std::make_error_code(std::errc::not_a_directory);
            return profile;
        }

        // the top level must be readable, everything below it is best effort
        const fs::directory_iterator topLevelIter(path, errorCode);
        if (errorCode)
        {
            return profile;
        }

        profileRecurse(path, profile);
        return profile;
    }

    void FilesystemProfiler::profileRecurse(const fs::path & dirPath, DirectoryProfile & profile)
    {
        ErrorCode_t errorCode;
        fs::directory_iterator iter(dirPath, errorCode);
        if (errorCode)
        {
            return;
        }

        const fs::directory_iterator iterEnd;
        while (iter != iterEnd)
        {
            const fs::directory_entry & entry{ *iter };

            ErrorCode_t errorCodeStatus;
            const fs::file_status status{ entry.symlink_status(errorCodeStatus) };

            if (!errorCodeStatus)
            {
                if (fs::is_directory(status))
                {
                    ++profile.dir_count;
                    profileRecurse(entry.path(), profile);
                }
                else if (fs::is_regular_file(status))
                {
                    ErrorCode_t errorCodeSize;
                    const std::uintmax_t size{ entry.file_size(errorCodeSize) };

                    ++profile.file_count;

                    if (!errorCodeSize)
                    {
                        profile.total_size_bytes += size;
                    }
                }
            }

            iter.increment(errorCode);
            if (errorCode)
            {
                return;
            }
        }
    }

    DirectoryListing FilesystemProfiler::list(const fs::path & path, ErrorCode_t & errorCode)
    {
        errorCode.clear();

        DirectoryListing listing;

        fs::directory_iterator iter(path, errorCode);
        if (errorCode)
        {
            return listing;
        }

        const fs::directory_iterator iterEnd;
        while (iter != iterEnd)
        {
            const fs::directory_entry & entry{ *iter };

            ErrorCode_t errorCodeStatus;
            const fs::file_status status{ entry.symlink_status(errorCodeStatus) };

            if (errorCodeStatus)
            {
                errorCode = errorCodeStatus;
                return listing;
            }

            if (fs::is_directory(status))
            {
                listing.child_dirs.push_back(entry.path());
            }
            else if (fs::is_regular_file(status))
            {
                ErrorCode_t errorCodeSize;
                const std::uintmax_t size{ entry.file_size(errorCodeSize) };

                ++listing.loose_file_count;

                if (!errorCodeSize)
                {
                    listing.loose_size_bytes += size;
                }
            }
            else if (isReparsePoint(status))
            {
                listing.reparse_points.push_back(entry.path());
            }

            iter.increment(errorCode);
            if (errorCode)
            {
                return listing;
            }
        }

        // directory_iterator order is unspecified, and chunk ids must be deterministic
        std::sort(std::begin(listing.child_dirs), std::end(listing.child_dirs));
        std::sort(std::begin(listing.reparse_points), std::end(listing.reparse_points));

        return listing;
    }

    //

    CachingProfiler::CachingProfiler(
        IDirectoryProfiler & profiler, const Duration_t timeToLive, NowFunc_t nowFunc)
        : m_profiler(profiler)
        , m_timeToLive(timeToLive)
        , m_nowFunc(std::move(nowFunc))
        , m_cache()
        , m_mutex()
    {}

    DirectoryProfile CachingProfiler::profile(const fs::path & path, ErrorCode_t & errorCode)
    {
        errorCode.clear();

        const Clock_t::time_point now{ m_nowFunc() };

        {
            std::scoped_lock scopedLock(m_mutex);

            const auto iter{ m_cache.find(path) };
            if (iter != std::end(m_cache))
            {
                const DirectoryProfile & cached{ iter->second };

                if (cached.last_scanned && ((now - *cached.last_scanned) < m_timeToLive))
                {
                    return cached;
                }

                m_cache.erase(iter);
            }
        }

        DirectoryProfile fresh{ m_profiler.profile(path, errorCode) };
        if (errorCode)
        {
            return fresh;
        }

        fresh.last_scanned = now;

        std::scoped_lock scopedLock(m_mutex);
        m_cache[path] = fresh;
        return fresh;
    }

    DirectoryListing CachingProfiler::list(const fs::path & path, ErrorCode_t & errorCode)
    {
        return m_profiler.list(path, errorCode);
    }

    void CachingProfiler::invalidate()
    {
        std::scoped_lock scopedLock(m_mutex);
        m_cache.clear();
    }

    std::size_t CachingProfiler::size() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_cache.size();
    }

} // namespace replicator
