#ifndef REPLICATOR_STR_UTIL_HPP_INCLUDED
#define REPLICATOR_STR_UTIL_HPP_INCLUDED
//
// str-util.hpp
//
#include "util.hpp"

#include <algorithm>
#include <codecvt>
#include <cstdint>
#include <limits>
#include <locale>
#include <optional>
#include <string>
#include <string_view>

namespace strutil
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4996)
#endif

    [[nodiscard]] inline std::wstring toWideString(std::string_view str)
    {
        std::wstring result;

        if (!str.empty())
        {
            std::wstring_convert<std::codecvt_utf8<wchar_t>, wchar_t> converter;
            result = converter.from_bytes(str.data(), (str.data() + str.size()));
        }

        return result;
    }

    [[nodiscard]] inline std::string toNarrowString(std::wstring_view str)
    {
        std::string result;

        if (!str.empty())
        {
            std::wstring_convert<std::codecvt_utf8<wchar_t>, wchar_t> converter;
            result = converter.to_bytes(str.data(), (str.data() + str.size()));
        }

        return result;
    }

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

    // single character query functions

    [[nodiscard]] constexpr bool isUpper(const char ch) noexcept
    {
        return ((ch >= 'A') && (ch <= 'Z'));
    }

    [[nodiscard]] constexpr bool isLower(const char ch) noexcept
    {
        return ((ch >= 'a') && (ch <= 'z'));
    }

    [[nodiscard]] constexpr bool isAlpha(const char ch) noexcept
    {
        return (isUpper(ch) || isLower(ch));
    }

    [[nodiscard]] constexpr bool isDigit(const char ch) noexcept
    {
        return ((ch >= '0') && (ch <= '9'));
    }

    [[nodiscard]] constexpr bool isWhitespace(const char ch) noexcept
    {
        return ((ch == ' ') || (ch == '\t'));
    }

    [[nodiscard]] constexpr char toLowerCopy(const char ch) noexcept
    {
        if (isUpper(ch))
        {
            return static_cast<char>(ch + 32); //-V112
        }
        else
        {
            return ch;
        }
    }

    // drive letters and share names are case insensitive on windows, so path prefixes compare
    // wide chars this way there
    [[nodiscard]] constexpr wchar_t toLowerCopy(const wchar_t ch) noexcept
    {
        if ((ch >= L'A') && (ch <= L'Z'))
        {
            return static_cast<wchar_t>(ch + 32); //-V112
        }
        else
        {
            return ch;
        }
    }

    // trim  functions

    template <typename String_t, typename WillTrimDetectorLambda_t>
    void trimIf(String_t & str, WillTrimDetectorLambda_t willTrimDetectorLambda)
    {
        str.erase(
            std::begin(str),
            std::find_if_not(std::cbegin(str), std::cend(str), willTrimDetectorLambda));

        str.erase(
            std::find_if_not(std::crbegin(str), std::crend(str), willTrimDetectorLambda).base(),
            std::end(str));
    }

    template <typename String_t, typename WillTrimDetectorLambda_t>
    void trimEndIf(String_t & str, WillTrimDetectorLambda_t willTrimDetectorLambda)
    {
        str.erase(
            std::find_if_not(std::crbegin(str), std::crend(str), willTrimDetectorLambda).base(),
            std::end(str));
    }

    // number parsing functions

    [[nodiscard]] inline std::optional<std::uint64_t> parseUnsigned(std::string_view str)
    {
        if (str.empty())
        {
            return std::nullopt;
        }

        std::uint64_t value{ 0 };
        for (const char ch : str)
        {
            if (!isDigit(ch))
            {
                return std::nullopt;
            }

            const std::uint64_t digit{ static_cast<std::uint64_t>(ch - '0') };
            if (value > ((std::numeric_limits<std::uint64_t>::max() - digit) / 10))
            {
                return std::nullopt;
            }

            value = ((value * 10) + digit);
        }

        return value;
    }

    // plain byte counts or a binary suffix:  "512", "64K", "100M", "10G", "2T", "10GiB"
    [[nodiscard]] inline std::optional<std::uint64_t> parseByteSize(std::string_view str)
    {
        std::string lower;
        for (const char ch : str)
        {
            lower.push_back(toLowerCopy(ch));
        }

        for (const std::string_view tail : { "ib", "b" })
        {
            if ((lower.size() > tail.size()) &&
                (std::string_view(lower).substr(lower.size() - tail.size()) == tail))
            {
                lower.erase(lower.size() - tail.size());
                break;
            }
        }

        if (lower.empty())
        {
            return std::nullopt;
        }

        std::uint64_t multiplier{ 1 };

        // clang-format off
        switch (lower.back())
        {
            case 'k': multiplier = replicator::kibibyte; break;
            case 'm': multiplier = replicator::mebibyte; break;
            case 'g': multiplier = replicator::gibibyte; break;
            case 't': multiplier = replicator::tebibyte; break;
            default:  break;
        }
        // clang-format on

        if (multiplier > 1)
        {
            lower.pop_back();
        }

        const auto number{ parseUnsigned(lower) };
        if (!number || (*number > (std::numeric_limits<std::uint64_t>::max() / multiplier)))
        {
            return std::nullopt;
        }

        return (*number * multiplier);
    }

    [[nodiscard]] inline std::optional<double> parsePositiveDecimal(const std::string & str)
    {
        try
        {
            std::size_t consumed{ 0 };
            const double value{ std::stod(str, &consumed) };
            if ((consumed != str.size()) || !(value > 0.0))
            {
                return std::nullopt;
            }

            return value;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

} // namespace strutil

#endif // REPLICATOR_STR_UTIL_HPP_INCLUDED
