#pragma once

/**
 * @file call_graph.hpp
 * @brief Whole-program call graph and repository call sites
 */

#include "class_registry.hpp"

#include "fieldlens/model.hpp"

#include <map>
#include <string>
#include <vector>

namespace fieldlens::analyzer {

/**
 * @brief Immutable multigraph of call edges in sorted order
 */
class CallGraph
{
public:
    [[nodiscard]] const std::vector<CallEdge>& edges() const { return m_edges; }
    [[nodiscard]] const std::vector<RepositoryCallSite>& repository_call_sites() const
    {
        return m_call_sites;
    }

    /// Distinct callees of a method, sorted
    [[nodiscard]] std::vector<MethodId> callees_of(const MethodId& caller) const;

    /// Distinct callers of a method, sorted
    [[nodiscard]] std::vector<MethodId> callers_of(const MethodId& callee) const;

    /**
     * Strongly connected components that form cycles (more than one
     * method, or a method calling itself). Each cycle is sorted; the list is
     * sorted by its first member.
     */
    [[nodiscard]] std::vector<std::vector<MethodId>> find_cycles() const;

    bool operator==(const CallGraph& other) const
    {
        return m_edges == other.m_edges && m_call_sites == other.m_call_sites;
    }

private:
    friend class CallGraphBuilder;

    std::vector<CallEdge> m_edges;
    std::vector<RepositoryCallSite> m_call_sites;
    std::map<MethodId, std::vector<MethodId>> m_successors;
    std::map<MethodId, std::vector<MethodId>> m_predecessors;
};

/**
 * @brief Accumulates per-class partial graphs
 *
 * Adding classes is purely additive; build() sorts everything, so the
 * order in which classes were added never shows in the result.
 */
class CallGraphBuilder
{
public:
    explicit CallGraphBuilder(const std::vector<RepositoryMapping>& mappings);

    void add_class(const ClassFacts& facts);

    /// Fold in edges collected by another builder (e.g. another worker)
    void merge(CallGraphBuilder&& other);

    [[nodiscard]] CallGraph build() &&;

private:
    std::map<std::string, RepositoryMapping> m_repositories;
    std::vector<CallEdge> m_edges;
    std::vector<RepositoryCallSite> m_call_sites;
};

}  // namespace fieldlens::analyzer
