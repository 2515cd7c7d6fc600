#ifndef REPLICATOR_COPY_EXECUTOR_HPP_INCLUDED
#define REPLICATOR_COPY_EXECUTOR_HPP_INCLUDED
//
// copy-executor.hpp
//
#include "chunk.hpp"
#include "filesystem-common.hpp"

#include <cstdint>
#include <string>

namespace replicator
{

    using JobHandle_t = std::uint64_t;

    struct JobPoll
    {
        bool is_complete                  = false;
        std::uint64_t bytes_copied_so_far = 0;
        std::wstring current_item;
    };

    struct JobResult
    {
        int exit_code               = 0; // see exit-code.hpp
        std::uint64_t files_copied  = 0;
        std::uint64_t files_skipped = 0; // unchanged since the last copy
        std::uint64_t bytes_copied  = 0;
        std::int64_t duration_ms    = 0;

        // human readable reason for any error bits, may be empty
        std::wstring detail;
    };

    // The thing that actually copies bytes, one independent unit of work per chunk.  Every call
    // here must return immediately, because the orchestrator that calls them never blocks.
    //
    //  - start()        Launches one unit and returns its handle.
    //  - poll()         Safe to call any number of times while the unit runs.  The byte count and
    //                   current item come from a progress channel the unit updates as it goes,
    //                   never from the (not yet existing) final result.
    //  - awaitResult()  Only valid once poll() has reported is_complete, and only once per handle.
    //                   The handle is forgotten afterwards.
    //  - kill()         Idempotent, safe on finished, awaited, or unknown handles.  A killed handle
    //                   is forgotten and must not be polled or awaited again.
    struct ICopyExecutor
    {
        virtual ~ICopyExecutor() = default;

        virtual JobHandle_t start(
            const fs::path & sourcePath,
            const fs::path & destinationPath,
            const CopyOptions_t copyOptions) = 0;

        virtual JobPoll poll(const JobHandle_t handle)        = 0;
        virtual JobResult awaitResult(const JobHandle_t handle) = 0;
        virtual void kill(const JobHandle_t handle)             = 0;
    };

} // namespace replicator

#endif // REPLICATOR_COPY_EXECUTOR_HPP_INCLUDED
