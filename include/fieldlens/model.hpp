#pragma once

/**
 * @file model.hpp
 * @brief Core analysis entities: method identity, property accesses, call
 *        edges, repository mappings and the call analysis document model
 */

#include <compare>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fieldlens {

/**
 * @brief Identity of a method: declaring class, name and JVM descriptor
 */
struct MethodId
{
    std::string owner_class;
    std::string name;
    std::string descriptor;

    auto operator<=>(const MethodId&) const = default;
    bool operator==(const MethodId&) const = default;

    /// "owner.name+descriptor"
    [[nodiscard]] std::string to_string() const
    {
        return owner_class + "." + name + descriptor;
    }
};

/**
 * @brief Inclusive line range covered by a method body
 */
struct SourceSpan
{
    int start_line = 0;
    int end_line = 0;

    auto operator<=>(const SourceSpan&) const = default;
    bool operator==(const SourceSpan&) const = default;

    [[nodiscard]] bool contains(int line) const
    {
        return line >= start_line && line <= end_line;
    }
};

enum class AccessKind {
    kGet,  ///< Property is read
    kSet   ///< Property is written
};

[[nodiscard]] constexpr std::string_view access_kind_name(AccessKind kind)
{
    return kind == AccessKind::kGet ? "GET" : "SET";
}

/**
 * @brief A single read or write of a named property
 *
 * Identity is (property_name, kind, owner_class). `via_accessor_call`
 * records whether the first occurrence came from an accessor call rather
 * than a direct field instruction; it does not take part in equality.
 */
struct PropertyAccess
{
    std::string property_name;
    AccessKind kind = AccessKind::kGet;
    std::optional<std::string> owner_class;
    bool via_accessor_call = false;

    [[nodiscard]] bool operator==(const PropertyAccess& other) const
    {
        return property_name == other.property_name && kind == other.kind
               && owner_class == other.owner_class;
    }
};

/**
 * @brief Directed caller -> callee edge, one per call instruction
 */
struct CallEdge
{
    MethodId caller;
    MethodId callee;
    std::optional<SourceSpan> source_span;  ///< Span of the caller's body
    std::optional<int> line;                ///< Line of the call instruction

    auto operator<=>(const CallEdge&) const = default;
    bool operator==(const CallEdge&) const = default;
};

enum class RepositoryMatchKind {
    kGenericInterface,  ///< Implements the marker interface with a type argument
    kAnnotation,        ///< Carries the repository annotation with a target type
    kNamingConvention   ///< Simple name matches a naming template
};

[[nodiscard]] constexpr std::string_view match_kind_name(RepositoryMatchKind kind)
{
    switch (kind) {
        case RepositoryMatchKind::kGenericInterface:
            return "generic_interface";
        case RepositoryMatchKind::kAnnotation:
            return "annotation";
        case RepositoryMatchKind::kNamingConvention:
            return "naming_convention";
    }
    return "unknown";
}

struct RepositoryMapping
{
    std::string aggregate_root_class;
    std::string repository_class;
    RepositoryMatchKind match_kind = RepositoryMatchKind::kNamingConvention;

    bool operator==(const RepositoryMapping&) const = default;
};

/**
 * @brief A call from application code into a repository method
 */
struct RepositoryCallSite
{
    MethodId caller_method;
    std::string repository_class;
    MethodId repository_method;
    std::string aggregate_root_class;
    std::optional<SourceSpan> source_span;  ///< Span of the caller's body

    auto operator<=>(const RepositoryCallSite&) const = default;
    bool operator==(const RepositoryCallSite&) const = default;
};

/// "<callerClass>.<callerMethod>+<start>-<end>", or "+unknown" without a span
[[nodiscard]] std::string call_site_key(const MethodId& caller,
                                        const std::optional<SourceSpan>& span);

/// "<repositoryMethod><descriptor>"
[[nodiscard]] std::string repository_method_key(const MethodId& repository_method);

// ============================================================================
// Call analysis document model
// ============================================================================

/**
 * @brief Fields required by one aggregate-root method reached from a call site
 */
struct CalledAggregateMethod
{
    std::string method;
    std::string descriptor;
    std::set<std::string> required_fields;

    bool operator==(const CalledAggregateMethod&) const = default;
};

struct CallSiteAnalysis
{
    std::string method_class;
    std::string method;
    std::string method_descriptor;
    std::string repository;
    std::string repository_method;
    std::string repository_method_descriptor;
    std::string aggregate_root;
    std::vector<CalledAggregateMethod> called_methods;
    std::set<std::string> required_fields;

    bool operator==(const CallSiteAnalysis&) const = default;
};

struct RepositoryMethodAnalysis
{
    /// Keyed by call_site_key()
    std::map<std::string, CallSiteAnalysis> calls;

    bool operator==(const RepositoryMethodAnalysis&) const = default;
};

struct AggregateRootAnalysis
{
    /// Keyed by repository_method_key()
    std::map<std::string, RepositoryMethodAnalysis> methods;

    bool operator==(const AggregateRootAnalysis&) const = default;
};

/**
 * @brief Whole-program result: aggregate root -> repository method -> call site
 */
struct AnalysisResult
{
    std::string version;
    std::string timestamp;
    std::map<std::string, AggregateRootAnalysis> call_graph;

    bool operator==(const AnalysisResult&) const = default;
};

}  // namespace fieldlens
