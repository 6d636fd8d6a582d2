#pragma once

/**
 * @file property_access.hpp
 * @brief Per-method property access classification and accessor-call conversion
 */

#include "fieldlens/diagnostics.hpp"
#include "fieldlens/model.hpp"
#include "fieldlens/program.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fieldlens::analyzer {

struct PropertyConversion
{
    std::string property_name;
    AccessKind kind = AccessKind::kGet;

    bool operator==(const PropertyConversion&) const = default;
};

/**
 * Map a call to the property it reads or writes, if it follows an accessor
 * naming pattern. First match wins:
 * 1. "<get-x>" / "<set-x>" synthetic accessors
 * 2. getX() / isX() without arguments
 * 3. setX(v) with exactly one argument
 *
 * Never throws; anything else is std::nullopt.
 */
[[nodiscard]] std::optional<PropertyConversion>
convert_call_to_property(std::string_view method_name, std::size_t arg_count);

/**
 * @brief A call instruction as the call graph sees it
 */
struct CallInstruction
{
    MethodId callee;
    std::size_t arg_count = 0;
    std::optional<int> line;
};

/**
 * @brief Immutable classification of one method body
 */
struct MethodFacts
{
    MethodId method;
    /// Distinct accesses in order of first occurrence
    std::vector<PropertyAccess> accesses;
    /// Every classifiable call instruction in stream order
    std::vector<CallInstruction> calls;
    /// First..last line marker seen in the body
    std::optional<SourceSpan> span;
};

/**
 * @brief Turns a method's event stream into MethodFacts
 *
 * Field instructions count only when their owner is the enclosing class.
 * Calls go through convert_call_to_property(). Branch markers are ignored,
 * so every path contributes. Unclassifiable events are skipped with a
 * ClassificationError.
 */
class PropertyAccessClassifier
{
public:
    [[nodiscard]] MethodFacts classify(std::string_view enclosing_class,
                                       const stream::MethodBody& body,
                                       diag::DiagnosticSink& sink) const;
};

}  // namespace fieldlens::analyzer
