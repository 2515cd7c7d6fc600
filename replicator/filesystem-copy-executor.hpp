#ifndef REPLICATOR_FILESYSTEM_COPY_EXECUTOR_HPP_INCLUDED
#define REPLICATOR_FILESYSTEM_COPY_EXECUTOR_HPP_INCLUDED
//
// filesystem-copy-executor.hpp
//
#include "copy-executor.hpp"
#include "filesystem-common.hpp"
#include "thread-pool.hpp"
#include "util.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace replicator
{

    // Everything one running copy unit shares with the threads that poll or kill it.  The atomics
    // and the current item are the streaming progress channel, and they are the only things
    // touched by both sides while the unit runs.
    struct CopyJobResources
    {
        CopyJobResources(
            const fs::path & sourcePath,
            const fs::path & destinationPath,
            const CopyOptions_t copyOptions)
            : source_path(sourcePath)
            , destination_path(destinationPath)
            , copy_options(copyOptions)
            , buffer(block_size)
        {}

        void currentItem(const std::wstring & item)
        {
            std::scoped_lock scopedLock(m_itemMutex);
            m_currentItem = item;
        }

        std::wstring currentItem() const
        {
            std::scoped_lock scopedLock(m_itemMutex);
            return m_currentItem;
        }

        inline bool isCancelled() const noexcept { return cancel_requested.load(); }

        const fs::path source_path;
        const fs::path destination_path;
        const CopyOptions_t copy_options;

        std::atomic<bool> cancel_requested{ false };
        std::atomic<std::uint64_t> bytes_copied{ 0 };

        // only ever used by the copying thread
        std::vector<char> buffer;

        static inline constexpr std::size_t block_size{ 1 << 20 };

      private:
        mutable std::mutex m_itemMutex;
        std::wstring m_currentItem;
    };

    using CopyJobResourcesSPtr_t = std::shared_ptr<CopyJobResources>;

    // Copies each chunk on its own std::async thread with std::filesystem.
    //
    //  - Files whose destination already has the same size and last write time are skipped.
    //  - Files are copied in blocks so that progress is published as the copy proceeds, and so
    //    that kill() can take effect between blocks.  A killed unit deletes its partial file.
    //  - TopLevelFilesOnly and ExcludeSubdirectories copy only the files directly in the source.
    //  - Links are never followed (see filesystem-common.hpp), so ExcludeReparsePoints is always
    //    effectively on.
    class FilesystemCopyExecutor : public ICopyExecutor
    {
      public:
        FilesystemCopyExecutor();
        virtual ~FilesystemCopyExecutor();

        FilesystemCopyExecutor(const FilesystemCopyExecutor &) = delete;
        FilesystemCopyExecutor & operator=(const FilesystemCopyExecutor &) = delete;

        JobHandle_t start(
            const fs::path & sourcePath,
            const fs::path & destinationPath,
            const CopyOptions_t copyOptions) override;

        JobPoll poll(const JobHandle_t handle) override;
        JobResult awaitResult(const JobHandle_t handle) override;
        void kill(const JobHandle_t handle) override;

        std::size_t runningCount() const;

      private:
        struct Job
        {
            CopyJobResourcesSPtr_t resources;
            std::future<JobResult> future;
        };

        static JobResult execute(CopyJobResourcesSPtr_t resources);

      private:
        mutable std::mutex m_mutex;
        JobHandle_t m_nextHandle;
        std::map<JobHandle_t, Job> m_jobs;

        // killed units keep running until they notice, so their threads are kept here until done
        ThreadPool<JobResult> m_killedThreads;
    };

} // namespace replicator

#endif // REPLICATOR_FILESYSTEM_COPY_EXECUTOR_HPP_INCLUDED
