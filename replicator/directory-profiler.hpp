#ifndef REPLICATOR_DIRECTORY_PROFILER_HPP_INCLUDED
#define REPLICATOR_DIRECTORY_PROFILER_HPP_INCLUDED
//
// directory-profiler.hpp
//
#include "filesystem-common.hpp"
#include "util.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace replicator
{

    struct DirectoryProfile
    {
        fs::path path;
        std::uint64_t total_size_bytes = 0;
        std::uint64_t file_count       = 0;
        std::uint64_t dir_count        = 0;

        // only set by profilers that cache, used to age cache entries
        std::optional<Clock_t::time_point> last_scanned;

        inline bool isEmpty() const noexcept
        {
            return ((0 == total_size_bytes) && (0 == file_count));
        }
    };

    // the immediate contents of one directory, never recursive
    struct DirectoryListing
    {
        std::vector<fs::path> child_dirs;     // sorted by name
        std::vector<fs::path> reparse_points; // links/junctions that must not be descended into
        std::uint64_t loose_file_count = 0;   // files directly inside, not in any subdirectory
        std::uint64_t loose_size_bytes = 0;
    };

    // Profiling a path can fail (access denied, transient I/O error, etc.) and that is normal,
    // so failures are returned as error codes and never thrown.
    struct IDirectoryProfiler
    {
        virtual ~IDirectoryProfiler() = default;

        virtual DirectoryProfile profile(const fs::path & path, ErrorCode_t & errorCode) = 0;
        virtual DirectoryListing list(const fs::path & path, ErrorCode_t & errorCode)    = 0;
    };

    //

    class FilesystemProfiler : public IDirectoryProfiler
    {
      public:
        FilesystemProfiler()          = default;
        virtual ~FilesystemProfiler() = default;

        DirectoryProfile profile(const fs::path & path, ErrorCode_t & errorCode) override;
        DirectoryListing list(const fs::path & path, ErrorCode_t & errorCode) override;

      private:
        // entries below the top level that could not be read are skipped, not reported as an
        // error, because the copy executor will meet (and report) them again anyway
        void profileRecurse(const fs::path & dirPath, DirectoryProfile & profile);
    };

    //

    // Remembers successful profiles for timeToLive, which is normally hours because profiling a
    // huge tree over the network can take a very long time.  Errors are never cached.
    class CachingProfiler : public IDirectoryProfiler
    {
      public:
        static inline const Duration_t default_time_to_live{ std::chrono::hours(4) };

        CachingProfiler(
            IDirectoryProfiler & profiler,
            const Duration_t timeToLive = default_time_to_live,
            NowFunc_t nowFunc           = realClock());

        virtual ~CachingProfiler() = default;

        DirectoryProfile profile(const fs::path & path, ErrorCode_t & errorCode) override;

        // listings are cheap compared to profiles, so they are passed straight through
        DirectoryListing list(const fs::path & path, ErrorCode_t & errorCode) override;

        void invalidate();
        std::size_t size() const;

      private:
        IDirectoryProfiler & m_profiler;
        const Duration_t m_timeToLive;
        NowFunc_t m_nowFunc;
        std::map<fs::path, DirectoryProfile> m_cache;
        mutable std::mutex m_mutex;
    };

} // namespace replicator

#endif // REPLICATOR_DIRECTORY_PROFILER_HPP_INCLUDED
