#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: result types, qualified class names, package patterns
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fieldlens {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }

    bool operator==(const Error&) const = default;
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace fieldlens

namespace fieldlens::common {

// ============================================================================
// Qualified Class Names
// ============================================================================

/**
 * Normalize a JVM internal name ("com/example/Order") or a descriptor
 * reference ("Lcom/example/Order;") to dotted form ("com.example.Order").
 */
[[nodiscard]] std::string to_qualified_name(std::string_view name);

/**
 * Check that a name is a well formed qualified class name: non-empty
 * segments separated by '.', each made of letters, digits, '_' or '$'.
 */
[[nodiscard]] bool is_valid_qualified_name(std::string_view name);

/**
 * Last segment of a qualified name ("com.example.Order" -> "Order").
 */
[[nodiscard]] std::string_view simple_name(std::string_view qualified_name);

/**
 * Package part of a qualified name ("com.example.Order" -> "com.example").
 */
[[nodiscard]] std::string_view package_name(std::string_view qualified_name);

/**
 * True when `name` equals `reference` or both have the same simple name.
 * Used for annotation and marker interface references, which arrive either
 * qualified or bare.
 */
[[nodiscard]] bool names_match(std::string_view name, std::string_view reference);

/**
 * Check whether a Kotlin/Java property name is usable: starts with a letter
 * or '_', continues with letters, digits or '_'.
 */
[[nodiscard]] bool is_valid_property_name(std::string_view name);

// ============================================================================
// Package Patterns
// ============================================================================

/**
 * Match a qualified class name against a package pattern.
 *
 * Supported forms:
 * - "**"                      every class
 * - "**.segment.**"           any class whose name contains ".segment."
 * - "com.example.**"          prefix match ("com.example.")
 * - "com.example.*"           direct members of "com.example" only
 * - "com.example"             plain prefix
 */
[[nodiscard]] bool matches_package_pattern(std::string_view class_name,
                                           std::string_view pattern);

/**
 * A class is considered when it matches at least one include pattern
 * (an empty include list means everything) and no exclude pattern.
 */
[[nodiscard]] bool is_package_included(std::string_view class_name,
                                       const std::vector<std::string>& include_patterns,
                                       const std::vector<std::string>& exclude_patterns);

// ============================================================================
// Method Descriptors
// ============================================================================

/**
 * Split the parameter list of a JVM method descriptor into per-argument
 * type descriptors ("(JLjava/lang/String;[I)V" -> {"J", "Ljava/lang/String;", "[I"}).
 *
 * @return argument types, or error if the descriptor is malformed
 */
[[nodiscard]] fieldlens::Result<std::vector<std::string>>
parse_descriptor_arguments(std::string_view descriptor);

}  // namespace fieldlens::common
