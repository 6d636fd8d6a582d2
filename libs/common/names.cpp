/**
 * @file names.cpp
 * @brief Qualified class names, package patterns and JVM descriptors
 */

#include "fieldlens/common.hpp"

#include <cctype>
#include <format>

namespace fieldlens::common {

namespace {

[[nodiscard]] bool is_identifier_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

[[nodiscard]] std::string_view strip_suffix(std::string_view text, std::string_view suffix)
{
    if (text.ends_with(suffix)) {
        text.remove_suffix(suffix.size());
    }
    return text;
}

/**
 * @brief Consume one field type descriptor starting at `pos`
 * @return position after the type, or npos when malformed
 */
[[nodiscard]] std::size_t consume_type(std::string_view descriptor, std::size_t pos)
{
    while (pos < descriptor.size() && descriptor[pos] == '[') {
        ++pos;
    }
    if (pos >= descriptor.size()) {
        return std::string_view::npos;
    }
    switch (descriptor[pos]) {
        case 'B':
        case 'C':
        case 'D':
        case 'F':
        case 'I':
        case 'J':
        case 'S':
        case 'Z':
            return pos + 1;
        case 'L': {
            const auto end = descriptor.find(';', pos);
            if (end == std::string_view::npos || end == pos + 1) {
                return std::string_view::npos;
            }
            return end + 1;
        }
        default:
            return std::string_view::npos;
    }
}

}  // namespace

std::string to_qualified_name(std::string_view name)
{
    if (name.size() > 2 && name.front() == 'L' && name.back() == ';') {
        name = name.substr(1, name.size() - 2);
    }
    std::string result(name);
    for (char& c : result) {
        if (c == '/') {
            c = '.';
        }
    }
    return result;
}

bool is_valid_qualified_name(std::string_view name)
{
    if (name.empty() || name.front() == '.' || name.back() == '.') {
        return false;
    }
    char previous = '\0';
    for (char c : name) {
        if (c == '.') {
            if (previous == '.') {
                return false;
            }
        } else if (!is_identifier_char(c)) {
            return false;
        }
        previous = c;
    }
    return true;
}

std::string_view simple_name(std::string_view qualified_name)
{
    const auto pos = qualified_name.rfind('.');
    return pos == std::string_view::npos ? qualified_name : qualified_name.substr(pos + 1);
}

std::string_view package_name(std::string_view qualified_name)
{
    const auto pos = qualified_name.rfind('.');
    return pos == std::string_view::npos ? std::string_view{} : qualified_name.substr(0, pos);
}

bool names_match(std::string_view name, std::string_view reference)
{
    return name == reference || simple_name(name) == simple_name(reference);
}

bool is_valid_property_name(std::string_view name)
{
    if (name.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && name.front() != '_') {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

bool matches_package_pattern(std::string_view class_name, std::string_view pattern)
{
    if (pattern.empty()) {
        return false;
    }
    if (pattern == "**") {
        return true;
    }
    if (pattern.starts_with("**.") && pattern.ends_with(".**") && pattern.size() > 6) {
        const std::string needle = std::format(".{}.", pattern.substr(3, pattern.size() - 6));
        return std::format(".{}", class_name).find(needle) != std::string::npos;
    }
    if (pattern.ends_with("**")) {
        return class_name.starts_with(strip_suffix(pattern, "**"));
    }
    if (pattern.ends_with(".*")) {
        return package_name(class_name) == strip_suffix(pattern, ".*");
    }
    if (pattern.ends_with("*")) {
        return class_name.starts_with(strip_suffix(pattern, "*"));
    }
    return class_name.starts_with(pattern);
}

bool is_package_included(std::string_view class_name,
                         const std::vector<std::string>& include_patterns,
                         const std::vector<std::string>& exclude_patterns)
{
    bool included = include_patterns.empty();
    for (const auto& pattern : include_patterns) {
        if (matches_package_pattern(class_name, pattern)) {
            included = true;
            break;
        }
    }
    if (!included) {
        return false;
    }
    for (const auto& pattern : exclude_patterns) {
        if (matches_package_pattern(class_name, pattern)) {
            return false;
        }
    }
    return true;
}

fieldlens::Result<std::vector<std::string>> parse_descriptor_arguments(std::string_view descriptor)
{
    if (descriptor.empty() || descriptor.front() != '(') {
        return std::unexpected(Error::make(
            "InvalidDescriptor", std::format("Descriptor must start with '(': '{}'", descriptor)));
    }
    const auto close = descriptor.find(')');
    if (close == std::string_view::npos) {
        return std::unexpected(Error::make(
            "InvalidDescriptor", std::format("Descriptor has no ')': '{}'", descriptor)));
    }

    std::vector<std::string> arguments;
    std::size_t pos = 1;
    while (pos < close) {
        const auto next = consume_type(descriptor.substr(0, close), pos);
        if (next == std::string_view::npos) {
            return std::unexpected(
                Error::make("InvalidDescriptor",
                            std::format("Malformed parameter at offset {} in '{}'", pos, descriptor)));
        }
        arguments.emplace_back(descriptor.substr(pos, next - pos));
        pos = next;
    }
    return arguments;
}

}  // namespace fieldlens::common
