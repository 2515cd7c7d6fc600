#ifndef REPLICATOR_THREAD_POOL_HPP_INCLUDED
#define REPLICATOR_THREAD_POOL_HPP_INCLUDED
//
// thread-pool.hpp
//
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace replicator
{

    // Owns the futures of std::async threads so that nothing ever blocks in a std::future
    // destructor by accident.  Result_t is whatever the threads return.
    template <typename Result_t>
    class ThreadPool
    {
      public:
        ThreadPool()
            : m_futures()
        {}

        ~ThreadPool() { joinAndDestroyAll(); }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool & operator=(const ThreadPool &) = delete;

        void add(std::future<Result_t> && future) { m_futures.push_back(std::move(future)); }

        std::size_t size() const noexcept { return m_futures.size(); }
        bool isEmpty() const noexcept { return m_futures.empty(); }

        // never blocks, destroys only the futures whose threads have already finished
        std::size_t reapFinished()
        {
            const auto sizeBefore{ m_futures.size() };

            m_futures.erase(
                std::remove_if(
                    std::begin(m_futures),
                    std::end(m_futures),
                    [](const std::future<Result_t> & future) { return isReady(future); }),
                std::end(m_futures));

            return (sizeBefore - m_futures.size());
        }

        template <typename StatusUpdateFunction_t>
        void waitUntilAllJoinedAndDestroyed(StatusUpdateFunction_t statusUpdateFunction)
        {
            std::size_t sleepCurrentMs{ 0 };
            const std::size_t sleepMaxMs{ 330 };
            const std::size_t sleepIncrementMs{ 5 };

            while (isAnyRunning())
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(sleepCurrentMs));
                sleepCurrentMs = std::clamp((sleepCurrentMs + sleepIncrementMs), 0_st, sleepMaxMs);
                statusUpdateFunction();
            }

            joinAndDestroyAll();
        }

        // blocks, and any exception a thread let escape is NOT rethrown here
        void joinAndDestroyAll()
        {
            for (auto & future : m_futures)
            {
                if (future.valid())
                {
                    future.wait();
                }
            }

            m_futures.clear();
        }

      private:
        static bool isReady(const std::future<Result_t> & future)
        {
            return (
                !future.valid() ||
                (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready));
        }

        bool isAnyRunning() const
        {
            return std::any_of(
                std::begin(m_futures), std::end(m_futures), [](const auto & future) {
                    return !isReady(future);
                });
        }

      private:
        std::vector<std::future<Result_t>> m_futures;
    };

} // namespace replicator

#endif // REPLICATOR_THREAD_POOL_HPP_INCLUDED
