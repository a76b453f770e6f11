//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef STS_STRING_UTILS_HPP
#define STS_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the analyzers, the policy loader and the CLI.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace sts::string_utils {

    /**
     * Trims whitespace from the beginning of a string.
     */
    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    /**
     * Trims whitespace from the end of a string.
     */
    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * True when the line holds nothing but whitespace.
     */
    inline bool is_blank(const std::string_view s) noexcept {
        return trim(s).empty();
    }

    /**
     * Splits text into physical lines.
     *
     * Accepts "\n", "\r\n" and lone "\r" terminators. A trailing terminator
     * does not produce an extra empty line, so "a\nb\n" yields two lines.
     *
     * @param text The text to split.
     * @return Views into @p text, one per line, without terminators.
     */
    inline std::vector<std::string_view> split_lines(const std::string_view text) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        std::size_t i = 0;

        while (i < text.size()) {
            if (text[i] == '\n' || text[i] == '\r') {
                lines.push_back(text.substr(start, i - start));
                if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                start = i + 1;
            }
            ++i;
        }

        if (start < text.size()) {
            lines.push_back(text.substr(start));
        }
        return lines;
    }

    /**
     * Joins strings with a delimiter.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    /**
     * Formats a floating point value with fixed precision.
     *
     * @param value The value.
     * @param precision Digits after the decimal point.
     * @return e.g. "0.10" for (0.1, 2).
     */
    inline std::string format_fixed(const double value, const int precision = 2) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }

    /**
     * Formats a duration in human-readable form.
     *
     * @param nanoseconds Duration in nanoseconds.
     * @return Human-readable string like "1.50s", "250.00ms", "42.00us".
     */
    inline std::string format_duration(const long long nanoseconds) {
        constexpr long long ns_per_us = 1000LL;
        constexpr long long ns_per_ms = 1000000LL;
        constexpr long long ns_per_s = 1000000000LL;

        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed;

        if (nanoseconds >= ns_per_s) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_s) << "s";
        } else if (nanoseconds >= ns_per_ms) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_ms) << "ms";
        } else if (nanoseconds >= ns_per_us) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_us) << "us";
        } else {
            oss << nanoseconds << "ns";
        }

        return oss.str();
    }

}  // namespace sts::string_utils

#endif //STS_STRING_UTILS_HPP
