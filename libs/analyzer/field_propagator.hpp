#pragma once

/**
 * @file field_propagator.hpp
 * @brief Field requirement propagation from repository call sites into
 *        aggregate-root methods
 */

#include "call_graph.hpp"
#include "class_registry.hpp"

#include "fieldlens/config.hpp"
#include "fieldlens/diagnostics.hpp"
#include "fieldlens/model.hpp"

#include <set>
#include <string>
#include <vector>

namespace fieldlens::analyzer {

struct CalledMethodRequirement
{
    MethodId method;
    std::set<std::string> required_fields;

    bool operator==(const CalledMethodRequirement&) const = default;
};

struct FieldRequirement
{
    RepositoryCallSite site;
    /// One entry per aggregate-root method the caller invokes directly, sorted
    std::vector<CalledMethodRequirement> called_methods;
    /// Caller's own accesses on the aggregate plus every called method's fields
    std::set<std::string> required_fields;
    bool truncated = false;
};

/**
 * @brief Computes the fields a repository call site needs loaded
 *
 * Walks from the caller into methods declared on the aggregate root with an
 * explicit work list. Each branch stops at max_recursion_depth or on a
 * method already on the current path; the fields gathered so far are kept.
 * A depth cut is reported only when no shorter path reaches past it.
 */
class FieldRequirementPropagator
{
public:
    FieldRequirementPropagator(const CallGraph& graph,
                               const ClassRegistry& registry,
                               FieldAccessConfig config);

    [[nodiscard]] FieldRequirement propagate(const RepositoryCallSite& site,
                                             diag::DiagnosticSink& sink) const;

    /// Fields reachable from one aggregate-root method (itself included)
    [[nodiscard]] std::set<std::string> fields_of(const MethodId& aggregate_method,
                                                  const std::string& aggregate_root,
                                                  diag::DiagnosticSink& sink,
                                                  bool& truncated) const;

private:
    /// Aggregate-root methods called directly from `method`, sorted and distinct
    [[nodiscard]] std::vector<MethodId> aggregate_callees(const MethodId& method,
                                                          const std::string& aggregate_root) const;

    [[nodiscard]] bool is_setter(const MethodId& method) const;

    const CallGraph& m_graph;
    const ClassRegistry& m_registry;
    FieldAccessConfig m_config;
};

}  // namespace fieldlens::analyzer
