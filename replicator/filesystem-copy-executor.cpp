// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// filesystem-copy-executor.cpp
//
#include "filesystem-copy-executor.hpp"

#include "exit-code.hpp"
#include "str-util.hpp"
#include "thread-exceptions.hpp"

#include <set>
#include <stdexcept>

namespace replicator
{

    namespace
    {

        // One copy unit, from start to exit code.  Only ever used by the thread running it.
        class TreeCopier
        {
          public:
            explicit TreeCopier(CopyJobResources & resources)
                : m_res(resources)
                , m_filesCopied(0)
                , m_filesSkipped(0)
                , m_failureCount(0)
                , m_mismatchCount(0)
                , m_extraCount(0)
                , m_detailCount(0)
                , m_detail()
            {}

            JobResult run()
            {
                const Clock_t::time_point startTime{ Clock_t::now() };

                bool isFatal{ !setupRoots() };

                if (!isFatal)
                {
                    const bool isFilesOnly{
                        hasOption(m_res.copy_options, CopyOption::TopLevelFilesOnly) ||
                        hasOption(m_res.copy_options, CopyOption::ExcludeSubdirectories)
                    };

                    copyDirectory(m_res.source_path, m_res.destination_path, !isFilesOnly);
                }

                if (m_res.isCancelled())
                {
                    appendDetail(L"cancelled");
                    isFatal = true;
                }

                JobResult result;
                result.files_copied  = m_filesCopied;
                result.files_skipped = m_filesSkipped;
                result.bytes_copied = m_res.bytes_copied.load();
                result.duration_ms  = static_cast<std::int64_t>(elapsedCountMs(startTime));
                result.detail       = m_detail;

                result.exit_code = makeExitCode(
                    (m_filesCopied > 0),
                    (m_extraCount > 0),
                    (m_mismatchCount > 0),
                    (m_failureCount > 0),
                    isFatal);

                return result;
            }

          private:
            bool setupRoots()
            {
                ErrorCode_t errorCode;
                const fs::file_status status{ fs::symlink_status(m_res.source_path, errorCode) };
                if (errorCode)
                {
                    appendDetail(L"source unreadable: " + toString(errorCode));
                    return false;
                }

                if (!fs::is_directory(status))
                {
                    appendDetail(
                        std::wstring(L"source is a ") + toString(status.type()) +
                        L", not a directory");

                    return false;
                }

                fs::create_directories(m_res.destination_path, errorCode);
                if (errorCode)
                {
                    appendDetail(L"cannot create destination: " + toString(errorCode));
                    return false;
                }

                return true;
            }

            void copyDirectory(const fs::path & srcDir, const fs::path & dstDir, const bool isDeep)
            {
                ErrorCode_t errorCode;
                fs::directory_iterator iter(srcDir, errorCode);
                if (errorCode)
                {
                    countFailure(srcDir, L"cannot list: " + toString(errorCode));
                    return;
                }

                std::set<fs::path> srcNames;

                const fs::directory_iterator iterEnd;
                while ((iter != iterEnd) && !m_res.isCancelled())
                {
                    const fs::directory_entry & entry{ *iter };
                    srcNames.insert(entry.path().filename());
                    copyEntry(entry, dstDir, isDeep);

                    iter.increment(errorCode);
                    if (errorCode)
                    {
                        countFailure(srcDir, L"cannot list: " + toString(errorCode));
                        break;
                    }
                }

                countExtras(srcNames, dstDir, isDeep);
            }

            void copyEntry(
                const fs::directory_entry & entry, const fs::path & dstDir, const bool isDeep)
            {
                ErrorCode_t errorCode;
                const fs::file_status status{ entry.symlink_status(errorCode) };
                if (errorCode)
                {
                    countFailure(entry.path(), L"cannot stat: " + toString(errorCode));
                    return;
                }

                const fs::path dstPath{ dstDir / entry.path().filename() };

                if (fs::is_directory(status))
                {
                    if (isDeep)
                    {
                        copySubdirectory(entry.path(), dstPath);
                    }
                }
                else if (fs::is_regular_file(status))
                {
                    copyFileIfChanged(entry, dstPath);
                }

                // everything else is a link or something stranger, and is never followed
            }

            void copySubdirectory(const fs::path & srcPath, const fs::path & dstPath)
            {
                ErrorCode_t errorCode;
                const fs::file_status dstStatus{ fs::symlink_status(dstPath, errorCode) };

                if (fs::exists(dstStatus) && !fs::is_directory(dstStatus))
                {
                    ++m_mismatchCount;
                    appendDetail(L"not a directory in the destination: " + dstPath.wstring());
                    return;
                }

                fs::create_directory(dstPath, errorCode);
                if (errorCode)
                {
                    countFailure(dstPath, L"cannot create: " + toString(errorCode));
                    return;
                }

                copyDirectory(srcPath, dstPath, true);
            }

            void copyFileIfChanged(const fs::directory_entry & entry, const fs::path & dstPath)
            {
                ErrorCode_t errorCode;
                const fs::file_status dstStatus{ fs::symlink_status(dstPath, errorCode) };

                if (fs::exists(dstStatus))
                {
                    if (!fs::is_regular_file(dstStatus))
                    {
                        ++m_mismatchCount;
                        appendDetail(L"not a file in the destination: " + dstPath.wstring());
                        return;
                    }

                    if (isSameSizeAndTime(entry.path(), dstPath))
                    {
                        ++m_filesSkipped;
                        return;
                    }
                }

                m_res.currentItem(entry.path().wstring());

                if (copyFileInBlocks(entry.path(), dstPath))
                {
                    ++m_filesCopied;
                }
            }

            bool isSameSizeAndTime(const fs::path & srcPath, const fs::path & dstPath) const
            {
                ErrorCode_t errorCode;

                const auto srcSize{ fs::file_size(srcPath, errorCode) };
                if (errorCode)
                {
                    return false;
                }

                const auto dstSize{ fs::file_size(dstPath, errorCode) };
                if (errorCode || (srcSize != dstSize))
                {
                    return false;
                }

                const auto srcTime{ fs::last_write_time(srcPath, errorCode) };
                if (errorCode)
                {
                    return false;
                }

                const auto dstTime{ fs::last_write_time(dstPath, errorCode) };
                return (!errorCode && (srcTime == dstTime));
            }

            bool copyFileInBlocks(const fs::path & srcPath, const fs::path & dstPath)
            {
                bool wasCancelled{ false };

                {
                    InputFileStream_t inStream(srcPath, (std::ios::binary | std::ios::in));
                    if (!inStream)
                    {
                        countFailure(srcPath, L"cannot open for reading");
                        return false;
                    }

                    OutputFileStream_t outStream(
                        dstPath, (std::ios::binary | std::ios::out | std::ios::trunc));

                    if (!outStream)
                    {
                        countFailure(dstPath, L"cannot open for writing");
                        return false;
                    }

                    std::vector<char> & buffer{ m_res.buffer };

                    while (inStream)
                    {
                        if (m_res.isCancelled())
                        {
                            wasCancelled = true;
                            break;
                        }

                        inStream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                        const std::streamsize readCount{ inStream.gcount() };

                        if (inStream.bad())
                        {
                            countFailure(srcPath, L"read error");
                            return false;
                        }

                        if (readCount <= 0)
                        {
                            break;
                        }

                        outStream.write(buffer.data(), readCount);
                        if (!outStream)
                        {
                            countFailure(dstPath, L"write error");
                            return false;
                        }

                        m_res.bytes_copied += static_cast<std::uint64_t>(readCount);
                    }

                    outStream.flush();
                    if (!outStream)
                    {
                        countFailure(dstPath, L"write error");
                        return false;
                    }
                }

                if (wasCancelled)
                {
                    ErrorCode_t errorCodeIgnored;
                    fs::remove(dstPath, errorCodeIgnored);
                    return false;
                }

                return copyAttributes(srcPath, dstPath);
            }

            bool copyAttributes(const fs::path & srcPath, const fs::path & dstPath)
            {
                ErrorCode_t errorCode;

                const auto srcTime{ fs::last_write_time(srcPath, errorCode) };
                if (!errorCode)
                {
                    fs::last_write_time(dstPath, srcTime, errorCode);
                }

                if (!errorCode)
                {
                    const fs::file_status srcStatus{ fs::status(srcPath, errorCode) };
                    if (!errorCode)
                    {
                        fs::permissions(dstPath, srcStatus.permissions(), errorCode);
                    }
                }

                if (errorCode)
                {
                    countFailure(dstPath, L"cannot set attributes: " + toString(errorCode));
                    return false;
                }

                return true;
            }

            // extras are only informational, so failing to list the destination is not an error
            void countExtras(
                const std::set<fs::path> & srcNames, const fs::path & dstDir, const bool isDeep)
            {
                ErrorCode_t errorCode;
                fs::directory_iterator iter(dstDir, errorCode);
                if (errorCode)
                {
                    return;
                }

                const fs::directory_iterator iterEnd;
                while (iter != iterEnd)
                {
                    const fs::directory_entry & entry{ *iter };

                    ErrorCode_t errorCodeStatus;
                    const bool isDirectory{ entry.is_directory(errorCodeStatus) };

                    // a files only unit does not own the subdirectories, so it ignores them
                    const bool isOwned{ isDeep || !isDirectory };

                    if (isOwned && (srcNames.count(entry.path().filename()) == 0))
                    {
                        ++m_extraCount;
                    }

                    iter.increment(errorCode);
                    if (errorCode)
                    {
                        return;
                    }
                }
            }

            void countFailure(const fs::path & path, const std::wstring & message)
            {
                ++m_failureCount;
                appendDetail(message + L" \"" + path.wstring() + L"\"");
            }

            // only the first few reasons are kept, the count says how many there were
            void appendDetail(const std::wstring & message)
            {
                if (m_detailCount++ >= max_detail_count)
                {
                    return;
                }

                if (!m_detail.empty())
                {
                    m_detail += L"; ";
                }

                m_detail += message;
            }

          private:
            static constexpr std::size_t max_detail_count{ 5 };

            CopyJobResources & m_res;
            std::uint64_t m_filesCopied;
            std::uint64_t m_filesSkipped;
            std::uint64_t m_failureCount;
            std::uint64_t m_mismatchCount;
            std::uint64_t m_extraCount;
            std::size_t m_detailCount;
            std::wstring m_detail;
        };

    } // namespace

    FilesystemCopyExecutor::FilesystemCopyExecutor()
        : m_mutex()
        , m_nextHandle(1)
        , m_jobs()
        , m_killedThreads()
    {}

    FilesystemCopyExecutor::~FilesystemCopyExecutor()
    {
        std::scoped_lock scopedLock(m_mutex);

        for (auto & [handle, job] : m_jobs)
        {
            job.resources->cancel_requested = true;
            m_killedThreads.add(std::move(job.future));
        }

        m_jobs.clear();
        m_killedThreads.joinAndDestroyAll();
    }

    JobHandle_t FilesystemCopyExecutor::start(
        const fs::path & sourcePath,
        const fs::path & destinationPath,
        const CopyOptions_t copyOptions)
    {
        auto resources{ std::make_shared<CopyJobResources>(
            sourcePath, destinationPath, copyOptions) };

        std::future<JobResult> future{ std::async(
            std::launch::async, &FilesystemCopyExecutor::execute, resources) };

        std::scoped_lock scopedLock(m_mutex);
        m_killedThreads.reapFinished();

        const JobHandle_t handle{ m_nextHandle++ };
        m_jobs.emplace(handle, Job{ std::move(resources), std::move(future) });
        return handle;
    }

    JobPoll FilesystemCopyExecutor::poll(const JobHandle_t handle)
    {
        std::scoped_lock scopedLock(m_mutex);

        const auto iter{ m_jobs.find(handle) };
        if (iter == std::end(m_jobs))
        {
            throw std::logic_error(
                "FilesystemCopyExecutor::poll() unknown job handle " + std::to_string(handle));
        }

        const Job & job{ iter->second };

        JobPoll jobPoll;
        jobPoll.is_complete =
            (job.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);

        jobPoll.bytes_copied_so_far = job.resources->bytes_copied.load();
        jobPoll.current_item        = job.resources->currentItem();
        return jobPoll;
    }

    JobResult FilesystemCopyExecutor::awaitResult(const JobHandle_t handle)
    {
        std::scoped_lock scopedLock(m_mutex);

        const auto iter{ m_jobs.find(handle) };
        if (iter == std::end(m_jobs))
        {
            throw std::logic_error(
                "FilesystemCopyExecutor::awaitResult() unknown job handle " +
                std::to_string(handle));
        }

        if (iter->second.future.wait_for(std::chrono::milliseconds(0)) !=
            std::future_status::ready)
        {
            throw std::logic_error(
                "FilesystemCopyExecutor::awaitResult() job " + std::to_string(handle) +
                " has not finished");
        }

        std::future<JobResult> future{ std::move(iter->second.future) };
        m_jobs.erase(iter);

        // execute() never throws, but this is the only place a result can come from
        return future.get();
    }

    void FilesystemCopyExecutor::kill(const JobHandle_t handle)
    {
        std::scoped_lock scopedLock(m_mutex);

        const auto iter{ m_jobs.find(handle) };
        if (iter == std::end(m_jobs))
        {
            return;
        }

        iter->second.resources->cancel_requested = true;
        m_killedThreads.add(std::move(iter->second.future));
        m_jobs.erase(iter);

        m_killedThreads.reapFinished();
    }

    std::size_t FilesystemCopyExecutor::runningCount() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return (m_jobs.size() + m_killedThreads.size());
    }

    JobResult FilesystemCopyExecutor::execute(CopyJobResourcesSPtr_t resources)
    {
        try
        {
            TreeCopier copier(*resources);
            return copier.run();
        }
        catch (...)
        {
            JobResult result;
            result.exit_code    = exit_bit::fatal;
            result.bytes_copied = resources->bytes_copied.load();
            result.detail       = ThreadExceptions::describe(std::current_exception());
            return result;
        }
    }

} // namespace replicator
