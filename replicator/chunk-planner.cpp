// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// chunk-planner.cpp
//
#include "chunk-planner.hpp"

#include "path-mapping.hpp"

#include <numeric>

namespace replicator
{

    std::uint64_t PlanResult::totalEstimatedBytes() const
    {
        return std::accumulate(
            std::begin(chunks),
            std::end(chunks),
            0_u64,
            [](const std::uint64_t sumSoFar, const Chunk & chunk) {
                return (sumSoFar + chunk.estimated_size_bytes);
            });
    }

    std::uint64_t PlanResult::totalEstimatedFiles() const
    {
        return std::accumulate(
            std::begin(chunks),
            std::end(chunks),
            0_u64,
            [](const std::uint64_t sumSoFar, const Chunk & chunk) {
                return (sumSoFar + chunk.estimated_file_count);
            });
    }

    ChunkPlanner::ChunkPlanner(IDirectoryProfiler & profiler, const PlanThresholds & thresholds)
        : m_profiler(profiler)
        , m_thresholds(thresholds)
    {}

    PlanResult ChunkPlanner::plan(const fs::path & rootPath, const fs::path & destinationRoot)
    {
        PlanResult result;
        planRecurse(rootPath, 0, result);
        assignIdsAndDestinations(result.chunks, rootPath, destinationRoot);
        return result;
    }

    void ChunkPlanner::planRecurse(
        const fs::path & path, const std::size_t depth, PlanResult & result)
    {
        ErrorCode_t errorCodeProfile;
        const DirectoryProfile profile{ m_profiler.profile(path, errorCodeProfile) };
        if (errorCodeProfile)
        {
            result.skipped.push_back({ path, PlanError::Profile, toString(errorCodeProfile) });
            return;
        }

        if (profile.isEmpty())
        {
            return;
        }

        // the common case, and where the recursion normally ends
        if (isWithinThresholds(profile) ||
            (profile.total_size_bytes < m_thresholds.min_size_bytes))
        {
            appendWholeDirectoryChunk(path, profile, depth, result);
            return;
        }

        // depth wins over size so that planning always terminates
        if (depth >= m_thresholds.max_depth)
        {
            result.depth_limited.push_back(path);
            appendWholeDirectoryChunk(path, profile, depth, result);
            return;
        }

        ErrorCode_t errorCodeList;
        const DirectoryListing listing{ m_profiler.list(path, errorCodeList) };
        if (errorCodeList)
        {
            result.skipped.push_back({ path, PlanError::Enumerate, toString(errorCodeList) });
            return;
        }

        result.reparse_points.insert(
            std::end(result.reparse_points),
            std::begin(listing.reparse_points),
            std::end(listing.reparse_points));

        // a flat directory cannot be split any further
        if (listing.child_dirs.empty())
        {
            appendWholeDirectoryChunk(path, profile, depth, result);
            return;
        }

        for (const fs::path & childPath : listing.child_dirs)
        {
            planRecurse(childPath, (depth + 1), result);
        }

        appendFilesOnlyChunk(path, listing, depth, result);
    }

    void ChunkPlanner::appendWholeDirectoryChunk(
        const fs::path & path,
        const DirectoryProfile & profile,
        const std::size_t depth,
        PlanResult & result) const
    {
        Chunk & chunk{ result.chunks.emplace_back() };
        chunk.source_path          = path;
        chunk.estimated_size_bytes = profile.total_size_bytes;
        chunk.estimated_file_count = profile.file_count;
        chunk.depth                = depth;
        chunk.is_files_only        = false;
        chunk.copy_options         = CopyOption::ExcludeReparsePoints;
    }

    void ChunkPlanner::appendFilesOnlyChunk(
        const fs::path & path,
        const DirectoryListing & listing,
        const std::size_t depth,
        PlanResult & result) const
    {
        if (0 == listing.loose_file_count)
        {
            return;
        }

        // every subdirectory already has (or was deliberately denied) its own chunk, so this
        // chunk must never touch any of them
        Chunk & chunk{ result.chunks.emplace_back() };
        chunk.source_path          = path;
        chunk.estimated_size_bytes = listing.loose_size_bytes;
        chunk.estimated_file_count = listing.loose_file_count;
        chunk.depth                = depth;
        chunk.is_files_only        = true;

        chunk.copy_options =
            (CopyOption::TopLevelFilesOnly | CopyOption::ExcludeSubdirectories |
             CopyOption::ExcludeReparsePoints);
    }

    bool ChunkPlanner::isWithinThresholds(const DirectoryProfile & profile) const noexcept
    {
        return (
            (profile.total_size_bytes <= m_thresholds.max_size_bytes) &&
            (profile.file_count <= m_thresholds.max_files));
    }

    void ChunkPlanner::assignIdsAndDestinations(
        ChunkVec_t & chunks, const fs::path & rootPath, const fs::path & destinationRoot)
    {
        ChunkId_t nextId{ 1 };

        for (Chunk & chunk : chunks)
        {
            chunk.id               = nextId++;
            chunk.destination_path =
                mapDestinationPath(chunk.source_path, rootPath, destinationRoot);
        }
    }

} // namespace replicator
