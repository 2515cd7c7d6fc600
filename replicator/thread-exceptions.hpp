#ifndef REPLICATOR_THREAD_EXCEPTIONS_HPP_INCLUDED
#define REPLICATOR_THREAD_EXCEPTIONS_HPP_INCLUDED
//
// thread-exceptions.hpp
//
#include "str-util.hpp"

#include <exception>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace replicator
{

    // Collects exceptions that escaped worker threads so the thread that owns them can report
    // and rethrow them after joining.
    class ThreadExceptions
    {
      public:
        ThreadExceptions()
            : m_mutex()
            , m_exceptionPtrs()
        {}

        bool wereAnyThrown() const
        {
            std::scoped_lock scopedLock(m_mutex);
            return !m_exceptionPtrs.empty();
        }

        void add(const std::exception_ptr & exPtr)
        {
            std::scoped_lock scopedLock(m_mutex);
            m_exceptionPtrs.push_back(exPtr);
        }

        void reThrowFirst()
        {
            std::exception_ptr exceptionPtrToThrow;

            {
                std::scoped_lock scopedLock(m_mutex);
                if (m_exceptionPtrs.empty())
                {
                    return;
                }

                exceptionPtrToThrow = m_exceptionPtrs.front();
            }

            std::rethrow_exception(exceptionPtrToThrow);
        }

        std::wstring makeSummaryString() const
        {
            std::scoped_lock scopedLock(m_mutex);

            if (m_exceptionPtrs.empty())
            {
                return L"";
            }

            std::wostringstream ss;
            ss << L"Found " << m_exceptionPtrs.size() << L" exceptions thrown from sub-threads:";

            for (std::size_t i(0); i < m_exceptionPtrs.size(); ++i)
            {
                ss << L"\n\t#" << i << L": " << describe(m_exceptionPtrs.at(i));
            }

            return ss.str();
        }

        static std::wstring describe(const std::exception_ptr & exceptionPtr)
        {
            try
            {
                if (exceptionPtr != nullptr)
                {
                    std::rethrow_exception(exceptionPtr);
                }
            }
            catch (const std::exception & ex)
            {
                return (L"std::exception: \"" + strutil::toWideString(ex.what()) + L"\"");
            }
            catch (...)
            {
                return L"unknown_exception";
            }

            return L"null_exception";
        }

      private:
        mutable std::mutex m_mutex;
        std::vector<std::exception_ptr> m_exceptionPtrs;
    };

} // namespace replicator

#endif // REPLICATOR_THREAD_EXCEPTIONS_HPP_INCLUDED
