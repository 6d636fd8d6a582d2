#pragma once

/**
 * @file print.hpp
 * @brief std::print / std::println for standard libraries without <print>
 */

#if __has_include(<print>)
    #include <print>
#else
    #include <cstdio>
    #include <format>
    #include <string>
    #include <utility>

namespace std {

namespace fieldlens_detail {

inline void write_text(FILE* stream, const std::string& text, bool newline)
{
    std::fwrite(text.data(), 1, text.size(), stream);
    if (newline) {
        std::fputc('\n', stream);
    }
}

}  // namespace fieldlens_detail

template <typename... Args>
void print(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    fieldlens_detail::write_text(stream, std::format(fmt, std::forward<Args>(args)...), false);
}

template <typename... Args>
void print(std::format_string<Args...> fmt, Args&&... args)
{
    fieldlens_detail::write_text(stdout, std::format(fmt, std::forward<Args>(args)...), false);
}

template <typename... Args>
void println(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    fieldlens_detail::write_text(stream, std::format(fmt, std::forward<Args>(args)...), true);
}

template <typename... Args>
void println(std::format_string<Args...> fmt, Args&&... args)
{
    fieldlens_detail::write_text(stdout, std::format(fmt, std::forward<Args>(args)...), true);
}

}  // namespace std
#endif
