#ifndef REPLICATOR_UTIL_HPP_INCLUDED
#define REPLICATOR_UTIL_HPP_INCLUDED
//
// util.hpp
//
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

//

constexpr std::size_t operator"" _st(unsigned long long number)
{
    return static_cast<std::size_t>(number);
}

constexpr std::uint64_t operator"" _u64(unsigned long long number)
{
    return static_cast<std::uint64_t>(number);
}

//

namespace replicator
{

    // need this because the code that throws will already have printed the error message in color
    struct silent_runtime_error : public std::runtime_error
    {
        silent_runtime_error()
            : runtime_error("")
        {}
    };

    // platform detection stuff

#if (defined(WIN32) || defined(_WIN32) || defined(WIN64) || defined(_WIN64) || defined(__WINDOWS__))
    constexpr bool is_running_on_windows = true;
#else
    constexpr bool is_running_on_windows = false;
#endif

    // size stuff

    constexpr std::uint64_t kibibyte{ 1024 };
    constexpr std::uint64_t mebibyte{ kibibyte * 1024 };
    constexpr std::uint64_t gibibyte{ mebibyte * 1024 };
    constexpr std::uint64_t tebibyte{ gibibyte * 1024 };

    // time stuff

    // steady because every time_point here is used for measuring intervals, never for display
    using Clock_t    = std::chrono::steady_clock;
    using NowFunc_t  = std::function<Clock_t::time_point()>;
    using Duration_t = std::chrono::milliseconds;

    [[nodiscard]] inline NowFunc_t realClock()
    {
        return []() { return Clock_t::now(); };
    }

    [[nodiscard]] inline std::size_t
        elapsedCountMs(const Clock_t::time_point & from, const Clock_t::time_point & to)
    {
        using namespace std::chrono;
        return static_cast<std::size_t>(duration_cast<milliseconds>(to - from).count());
    }

    [[nodiscard]] inline std::size_t elapsedCountMs(const Clock_t::time_point & from)
    {
        return elapsedCountMs(from, Clock_t::now());
    }

    [[nodiscard]] inline std::wstring prettyTimeDurationString(const Clock_t::duration & dur)
    {
        using namespace std::chrono;

        if (const auto ms{ duration_cast<milliseconds>(dur).count() }; ms < 1000)
        {
            return (std::to_wstring(ms) + L"ms");
        }

        if (const auto secf{ duration<double>(dur).count() }; secf < 10.0)
        {
            std::wostringstream ss;
            ss << std::fixed << std::setprecision(1) << secf << L"s";
            return ss.str();
        }

        if (const auto sec{ duration_cast<seconds>(dur).count() }; sec < 60)
        {
            return (std::to_wstring(sec) + L"s");
        }

        const auto sec{ duration_cast<seconds>(dur).count() % 60 };
        const auto min{ duration_cast<minutes>(dur).count() % 60 };
        const auto hrs{ duration_cast<hours>(dur).count() };

        std::wostringstream ss;

        if (hrs > 0)
        {
            ss << hrs << L':' << std::setw(2) << std::setfill(L'0');
        }

        ss << min << L':' << std::setw(2) << std::setfill(L'0') << sec;
        return ss.str();
    }

    [[nodiscard]] inline std::wstring prettyTimeDurationString(const Clock_t::time_point & from)
    {
        return prettyTimeDurationString(Clock_t::now() - from);
    }

    // percent stuff

    template <typename T, typename U = T, typename Return_t = T>
    [[nodiscard]] Return_t calcPercent(const T numerator, const U denominator)
    {
        static_assert(std::is_integral_v<T>);
        static_assert(!std::is_same_v<std::remove_cv_t<T>, bool>);

        static_assert(std::is_integral_v<U>);
        static_assert(!std::is_same_v<std::remove_cv_t<U>, bool>);

        Return_t result{ 0 };

        if (denominator > 0)
        {
            result = static_cast<Return_t>(
                (static_cast<long double>(numerator) / static_cast<long double>(denominator)) *
                100.0L);
        }

        return result;
    }

    template <typename T, typename U = T, typename Return_t = T>
    [[nodiscard]] std::wstring calcPercentString(const T numerator, const U denominator)
    {
        return (std::to_wstring(calcPercent<T, U, Return_t>(numerator, denominator)) + L"%");
    }

} // namespace replicator

#endif // REPLICATOR_UTIL_HPP_INCLUDED
