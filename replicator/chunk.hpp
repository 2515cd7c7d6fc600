#ifndef REPLICATOR_CHUNK_HPP_INCLUDED
#define REPLICATOR_CHUNK_HPP_INCLUDED
//
// chunk.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "util.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace replicator
{

    // executor directives, combined as a bitmask in Chunk::copy_options
    enum CopyOption : std::uint32_t
    {
        None                  = 0,
        TopLevelFilesOnly     = 1 << 0, // copy only the files directly inside source_path
        ExcludeSubdirectories = 1 << 1, // never touch any subdirectory of source_path
        ExcludeReparsePoints  = 1 << 2  // skip symlinks/junctions instead of following them
    };

    using CopyOptions_t = std::uint32_t;

    [[nodiscard]] constexpr bool hasOption(const CopyOptions_t options, const CopyOption option)
    {
        return ((options & option) != 0);
    }

    [[nodiscard]] inline std::wstring copyOptionsToString(const CopyOptions_t options)
    {
        std::wstring str;

        auto appendIf = [&](const CopyOption option, const wchar_t * name) {
            if (hasOption(options, option))
            {
                if (!str.empty())
                {
                    str += L'|';
                }

                str += name;
            }
        };

        appendIf(CopyOption::TopLevelFilesOnly, L"top_level_files_only");
        appendIf(CopyOption::ExcludeSubdirectories, L"exclude_subdirs");
        appendIf(CopyOption::ExcludeReparsePoints, L"exclude_reparse_points");

        return (str.empty() ? std::wstring(L"none") : str);
    }

    using ChunkId_t = std::size_t;

    struct Chunk
    {
        ChunkId_t id = 0;
        fs::path source_path;
        fs::path destination_path;

        // advisory only, taken from the profiler at planning time and never re-validated
        std::uint64_t estimated_size_bytes = 0;
        std::uint64_t estimated_file_count = 0;

        std::size_t depth          = 0;
        bool is_files_only         = false;
        CopyOptions_t copy_options = CopyOption::None;

        ChunkStatus status      = ChunkStatus::Pending;
        std::size_t retry_count = 0;

        // the retries that followed a Fatal attempt, also counted in retry_count
        std::size_t fatal_retry_count = 0;

        // a retried chunk may not be started before this time, see JobOrchestrator::startJobs()
        Clock_t::time_point not_before{};

        // the exit detail of the most recent failed attempt
        std::wstring last_error;
    };

    using ChunkVec_t = std::vector<Chunk>;

} // namespace replicator

#endif // REPLICATOR_CHUNK_HPP_INCLUDED
