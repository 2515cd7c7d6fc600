#ifndef REPLICATOR_CHUNK_PLANNER_HPP_INCLUDED
#define REPLICATOR_CHUNK_PLANNER_HPP_INCLUDED
//
// chunk-planner.hpp
//
#include "chunk.hpp"
#include "directory-profiler.hpp"
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "util.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace replicator
{

    struct PlanThresholds
    {
        static constexpr std::uint64_t default_max_size_bytes{ 10 * gibibyte };
        static constexpr std::uint64_t default_max_files{ 50'000 };
        static constexpr std::size_t default_max_depth{ 5 };
        static constexpr std::uint64_t default_min_size_bytes{ 100 * mebibyte };

        std::uint64_t max_size_bytes = default_max_size_bytes;
        std::uint64_t max_files      = default_max_files;
        std::size_t max_depth        = default_max_depth;

        // a directory smaller than this is never split, no matter how many files it has
        std::uint64_t min_size_bytes = default_min_size_bytes;
    };

    struct SkippedPath
    {
        fs::path path;
        PlanError error = PlanError::Profile;
        std::wstring reason;
    };

    struct PlanResult
    {
        ChunkVec_t chunks;

        // subtrees that contributed no chunk because they could not be read, never retried here
        std::vector<SkippedPath> skipped;

        // directories that exceeded the size/count thresholds but were chunked whole anyway
        std::vector<fs::path> depth_limited;

        // links/junctions found while splitting, none were descended into or chunked
        std::vector<fs::path> reparse_points;

        std::uint64_t totalEstimatedBytes() const;
        std::uint64_t totalEstimatedFiles() const;
    };

    // Recursively decomposes one root directory into a flat, ordered list of chunks that together
    // cover every file under the root exactly once (minus skipped subtrees).
    //
    //  - A directory within both the size and file count thresholds is one chunk.
    //  - A directory over a threshold is split into one (recursive) plan per child directory, plus
    //    one "files only" chunk for any files directly inside it.  The files only chunk is
    //    restricted to the top level so it can never overlap with the child directory chunks.
    //  - Splitting stops at max_depth, or when there are no child directories to split by, and the
    //    oversized directory becomes a single chunk.
    //  - Empty directories (size and file count both zero) produce no chunk at all.
    //
    // Ids are assigned 1..N over the final list after the traversal, so they follow the
    // traversal order and no counter is shared between recursive calls.
    class ChunkPlanner
    {
      public:
        ChunkPlanner(IDirectoryProfiler & profiler, const PlanThresholds & thresholds);

        PlanResult plan(const fs::path & rootPath, const fs::path & destinationRoot);

        inline const PlanThresholds & thresholds() const noexcept { return m_thresholds; }

      private:
        void planRecurse(const fs::path & path, const std::size_t depth, PlanResult & result);

        void appendWholeDirectoryChunk(
            const fs::path & path,
            const DirectoryProfile & profile,
            const std::size_t depth,
            PlanResult & result) const;

        void appendFilesOnlyChunk(
            const fs::path & path,
            const DirectoryListing & listing,
            const std::size_t depth,
            PlanResult & result) const;

        bool isWithinThresholds(const DirectoryProfile & profile) const noexcept;

        static void assignIdsAndDestinations(
            ChunkVec_t & chunks, const fs::path & rootPath, const fs::path & destinationRoot);

      private:
        IDirectoryProfiler & m_profiler;
        PlanThresholds m_thresholds;
    };

} // namespace replicator

#endif // REPLICATOR_CHUNK_PLANNER_HPP_INCLUDED
