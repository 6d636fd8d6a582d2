/**
 * @file call_graph.cpp
 * @brief Call graph construction and queries
 */

#include "call_graph.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace fieldlens::analyzer {

namespace {

[[nodiscard]] std::vector<MethodId> distinct_sorted(std::vector<MethodId> items)
{
    std::ranges::sort(items);
    auto [first, last] = std::ranges::unique(items);
    items.erase(first, last);
    return items;
}

/**
 * @brief Tarjan's SCC algorithm with an explicit stack
 */
class CycleFinder
{
public:
    explicit CycleFinder(const std::map<MethodId, std::vector<MethodId>>& successors)
        : m_successors(successors)
    {}

    [[nodiscard]] std::vector<std::vector<MethodId>> run()
    {
        for (const auto& [node, _] : m_successors) {
            if (!m_index.contains(node)) {
                visit(node);
            }
        }
        std::ranges::sort(m_cycles);
        return std::move(m_cycles);
    }

private:
    struct Frame
    {
        MethodId node;
        std::size_t next_child = 0;
    };

    [[nodiscard]] const std::vector<MethodId>& successors(const MethodId& node) const
    {
        static const std::vector<MethodId> kNone;
        auto it = m_successors.find(node);
        return it == m_successors.end() ? kNone : it->second;
    }

    void enter(const MethodId& node, std::vector<Frame>& frames)
    {
        m_index[node] = m_counter;
        m_lowlink[node] = m_counter;
        ++m_counter;
        m_stack.push_back(node);
        m_on_stack.insert(node);
        frames.push_back(Frame{.node = node, .next_child = 0});
    }

    void visit(const MethodId& root)
    {
        std::vector<Frame> frames;
        enter(root, frames);
        while (!frames.empty()) {
            Frame& frame = frames.back();
            const auto& children = successors(frame.node);
            if (frame.next_child < children.size()) {
                const MethodId child = children[frame.next_child++];
                if (!m_index.contains(child)) {
                    enter(child, frames);
                } else if (m_on_stack.contains(child)) {
                    m_lowlink[frame.node] = std::min(m_lowlink[frame.node], m_index[child]);
                }
                continue;
            }

            const MethodId node = frame.node;
            frames.pop_back();
            if (!frames.empty()) {
                const MethodId& parent = frames.back().node;
                m_lowlink[parent] = std::min(m_lowlink[parent], m_lowlink[node]);
            }
            if (m_lowlink[node] == m_index[node]) {
                pop_component(node);
            }
        }
    }

    void pop_component(const MethodId& root)
    {
        std::vector<MethodId> component;
        while (true) {
            MethodId member = m_stack.back();
            m_stack.pop_back();
            m_on_stack.erase(member);
            const bool done = member == root;
            component.push_back(std::move(member));
            if (done) {
                break;
            }
        }
        const auto& self_edges = successors(root);
        const bool self_loop =
            component.size() == 1 && std::ranges::binary_search(self_edges, root);
        if (component.size() > 1 || self_loop) {
            std::ranges::sort(component);
            m_cycles.push_back(std::move(component));
        }
    }

    const std::map<MethodId, std::vector<MethodId>>& m_successors;
    std::map<MethodId, std::size_t> m_index;
    std::map<MethodId, std::size_t> m_lowlink;
    std::set<MethodId> m_on_stack;
    std::vector<MethodId> m_stack;
    std::size_t m_counter = 0;
    std::vector<std::vector<MethodId>> m_cycles;
};

}  // namespace

std::vector<MethodId> CallGraph::callees_of(const MethodId& caller) const
{
    auto it = m_successors.find(caller);
    return it == m_successors.end() ? std::vector<MethodId>{} : it->second;
}

std::vector<MethodId> CallGraph::callers_of(const MethodId& callee) const
{
    auto it = m_predecessors.find(callee);
    return it == m_predecessors.end() ? std::vector<MethodId>{} : it->second;
}

std::vector<std::vector<MethodId>> CallGraph::find_cycles() const
{
    return CycleFinder(m_successors).run();
}

CallGraphBuilder::CallGraphBuilder(const std::vector<RepositoryMapping>& mappings)
{
    for (const auto& mapping : mappings) {
        m_repositories.emplace(mapping.repository_class, mapping);
    }
}

void CallGraphBuilder::add_class(const ClassFacts& facts)
{
    for (const auto& method : facts.methods) {
        for (const auto& call : method.calls) {
            m_edges.push_back(CallEdge{.caller = method.method,
                                       .callee = call.callee,
                                       .source_span = method.span,
                                       .line = call.line});

            auto repository = m_repositories.find(call.callee.owner_class);
            if (repository == m_repositories.end()) {
                continue;
            }
            m_call_sites.push_back(
                RepositoryCallSite{.caller_method = method.method,
                                   .repository_class = repository->second.repository_class,
                                   .repository_method = call.callee,
                                   .aggregate_root_class = repository->second.aggregate_root_class,
                                   .source_span = method.span});
        }
    }
}

void CallGraphBuilder::merge(CallGraphBuilder&& other)
{
    m_edges.insert(m_edges.end(), std::make_move_iterator(other.m_edges.begin()),
                   std::make_move_iterator(other.m_edges.end()));
    m_call_sites.insert(m_call_sites.end(), std::make_move_iterator(other.m_call_sites.begin()),
                        std::make_move_iterator(other.m_call_sites.end()));
    other.m_edges.clear();
    other.m_call_sites.clear();
}

CallGraph CallGraphBuilder::build() &&
{
    CallGraph graph;
    std::ranges::sort(m_edges);
    std::ranges::sort(m_call_sites);
    // One call site per (caller, repository method, span): repeated calls share a key.
    auto [first, last] = std::ranges::unique(m_call_sites);
    m_call_sites.erase(first, last);

    for (const auto& edge : m_edges) {
        graph.m_successors[edge.caller].push_back(edge.callee);
        graph.m_predecessors[edge.callee].push_back(edge.caller);
    }
    for (auto& [_, callees] : graph.m_successors) {
        callees = distinct_sorted(std::move(callees));
    }
    for (auto& [_, callers] : graph.m_predecessors) {
        callers = distinct_sorted(std::move(callers));
    }
    graph.m_edges = std::move(m_edges);
    graph.m_call_sites = std::move(m_call_sites);
    return graph;
}

}  // namespace fieldlens::analyzer
