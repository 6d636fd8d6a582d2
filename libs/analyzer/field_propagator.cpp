/**
 * @file field_propagator.cpp
 * @brief Iterative field requirement propagation with depth and cycle bounds
 */

#include "field_propagator.hpp"

#include "fieldlens/common.hpp"

#include <format>
#include <map>
#include <utility>

namespace fieldlens::analyzer {

namespace {

struct WorkItem
{
    MethodId method;
    int depth = 0;
    bool exiting = false;  ///< Second visit: pop the method off the current path
};

}  // namespace

FieldRequirementPropagator::FieldRequirementPropagator(const CallGraph& graph,
                                                       const ClassRegistry& registry,
                                                       FieldAccessConfig config)
    : m_graph(graph)
    , m_registry(registry)
    , m_config(config)
{}

bool FieldRequirementPropagator::is_setter(const MethodId& method) const
{
    auto args = common::parse_descriptor_arguments(method.descriptor);
    const std::size_t arg_count = args ? args->size() : 0;
    auto conversion = convert_call_to_property(method.name, arg_count);
    return conversion && conversion->kind == AccessKind::kSet;
}

std::vector<MethodId>
FieldRequirementPropagator::aggregate_callees(const MethodId& method,
                                              const std::string& aggregate_root) const
{
    std::vector<MethodId> result;
    for (auto& callee : m_graph.callees_of(method)) {
        if (callee.owner_class != aggregate_root || m_registry.find_method(callee) == nullptr) {
            continue;
        }
        if (m_config.exclude_setter_methods && is_setter(callee)) {
            continue;
        }
        result.push_back(std::move(callee));
    }
    return result;
}

std::set<std::string> FieldRequirementPropagator::fields_of(const MethodId& aggregate_method,
                                                            const std::string& aggregate_root,
                                                            diag::DiagnosticSink& sink,
                                                            bool& truncated) const
{
    std::set<std::string> fields;
    // Shallowest depth each method was walked at. With cycle detection a
    // method is walked again only when reached closer to the root, so a
    // branch cut on a long path is recovered through a shorter one.
    std::map<MethodId, int> best_depth;
    // Without cycle detection a method is walked once per depth.
    std::set<std::pair<MethodId, int>> walked;
    std::set<MethodId> on_path;
    std::set<MethodId> expanded;
    std::set<MethodId> cut;
    std::vector<WorkItem> work{
        WorkItem{.method = aggregate_method, .depth = 0, .exiting = false}
    };

    while (!work.empty()) {
        WorkItem item = std::move(work.back());
        work.pop_back();
        if (item.exiting) {
            on_path.erase(item.method);
            continue;
        }
        if (m_config.enable_cycle_detection) {
            if (on_path.contains(item.method)) {
                truncated = true;
                sink.report(diag::DiagnosticKind::kPropagationCycleDetected,
                            std::format("call cycle through {}{}; branch truncated",
                                        item.method.name, item.method.descriptor),
                            aggregate_root, aggregate_method.name + aggregate_method.descriptor);
                continue;
            }
            auto [it, inserted] = best_depth.try_emplace(item.method, item.depth);
            if (!inserted) {
                if (item.depth >= it->second) {
                    continue;
                }
                it->second = item.depth;
            }
        } else if (!walked.emplace(item.method, item.depth).second) {
            continue;
        }

        if (const MethodFacts* facts = m_registry.find_method(item.method)) {
            for (const auto& access : facts->accesses) {
                if (access.owner_class && *access.owner_class != aggregate_root) {
                    continue;
                }
                fields.insert(access.property_name);
            }
        }

        auto callees = aggregate_callees(item.method, aggregate_root);
        if (callees.empty()) {
            continue;
        }
        if (item.depth + 1 > m_config.max_recursion_depth) {
            cut.insert(item.method);
            continue;
        }

        expanded.insert(item.method);
        on_path.insert(item.method);
        work.push_back(WorkItem{.method = item.method, .depth = item.depth, .exiting = true});
        // Reverse so the first callee is processed first.
        for (auto it = callees.rbegin(); it != callees.rend(); ++it) {
            work.push_back(WorkItem{.method = *it, .depth = item.depth + 1, .exiting = false});
        }
    }

    for (const auto& method : cut) {
        if (m_config.enable_cycle_detection && expanded.contains(method)) {
            continue;
        }
        truncated = true;
        sink.report(diag::DiagnosticKind::kPropagationDepthExceeded,
                    std::format("max recursion depth {} reached at {}{}; branch truncated",
                                m_config.max_recursion_depth, method.name, method.descriptor),
                    aggregate_root, aggregate_method.name + aggregate_method.descriptor);
    }
    return fields;
}

FieldRequirement FieldRequirementPropagator::propagate(const RepositoryCallSite& site,
                                                       diag::DiagnosticSink& sink) const
{
    FieldRequirement requirement{.site = site, .called_methods = {}, .required_fields = {},
                                 .truncated = false};
    const std::string& aggregate_root = site.aggregate_root_class;

    if (const MethodFacts* caller = m_registry.find_method(site.caller_method)) {
        for (const auto& access : caller->accesses) {
            if (access.owner_class != aggregate_root) {
                continue;
            }
            if (m_config.exclude_setter_methods && access.kind == AccessKind::kSet
                && access.via_accessor_call) {
                continue;
            }
            requirement.required_fields.insert(access.property_name);
        }
    }

    for (const auto& method : aggregate_callees(site.caller_method, aggregate_root)) {
        bool truncated = false;
        auto fields = fields_of(method, aggregate_root, sink, truncated);
        requirement.truncated = requirement.truncated || truncated;
        requirement.required_fields.insert(fields.begin(), fields.end());
        requirement.called_methods.push_back(
            CalledMethodRequirement{.method = method, .required_fields = std::move(fields)});
    }
    return requirement;
}

}  // namespace fieldlens::analyzer
