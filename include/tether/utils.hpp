#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    // Runtime loggers, gated by a process-wide verbosity
    enum class log_level { quiet, normal, verbose };

    inline std::string to_log_text(std::string_view sv) {
        return std::string{sv};
    }

    inline std::string to_log_text(const char* s) {
        return s ? std::string{s} : std::string{"(null)"};
    }

    inline std::string to_log_text(const std::string& s) {
        return s;
    }

    inline std::string to_log_text(char c) {
        return std::string(1U, c);
    }

    inline std::string to_log_text(bool b) {
        return b ? "true" : "false";
    }

    template <typename T>
        requires std::integral<T> || std::floating_point<T>
    inline std::string to_log_text(T value) {
        return std::to_string(value);
    }

    namespace detail {
        inline std::atomic<log_level>& current_log_level() {
            static std::atomic<log_level> level{log_level::normal};
            return level;
        }

        template <typename... Args>
        void write_log(std::string_view tag, Args&&... args) {
            // one insertion per line so concurrent writers do not interleave mid-line
            std::string line{"[tether] "};
            line.append(tag);
            line.append(": ");
            ((line.append(to_log_text(std::forward<Args>(args)))), ...);
            line.push_back('\n');
            std::cerr << line << std::flush;
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::current_log_level().store(level, std::memory_order_relaxed);
    }

    inline log_level get_log_level() {
        return detail::current_log_level().load(std::memory_order_relaxed);
    }

    template <typename... Args>
    void log_info(Args&&... args) {
        if (get_log_level() == log_level::verbose) {
            detail::write_log("info", std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void log_warn(Args&&... args) {
        if (get_log_level() != log_level::quiet) {
            detail::write_log("warn", std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void log_error(Args&&... args) {
        if (get_log_level() != log_level::quiet) {
            detail::write_log("error", std::forward<Args>(args)...);
        }
    }

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        // case-insensitive substring search
        constexpr bool contains_icase(std::string_view haystack, std::string_view needle) {
            if (needle.empty()) {
                return true;
            }
            if (needle.size() > haystack.size()) {
                return false;
            }
            for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
                if (str_case_eq(haystack.substr(i, needle.size()), needle)) {
                    return true;
                }
            }
            return false;
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace tether
