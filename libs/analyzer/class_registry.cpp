/**
 * @file class_registry.cpp
 * @brief Per-run registry of classified classes
 */

#include "class_registry.hpp"

#include <utility>

namespace fieldlens::analyzer {

void ClassRegistry::add(ClassFacts facts)
{
    // A later duplicate of the same class name replaces the earlier one.
    if (auto existing = m_classes.find(facts.name); existing != m_classes.end()) {
        for (const auto& method : existing->second.methods) {
            m_methods.erase(method.method);
        }
        m_classes.erase(existing);
    }
    std::string name = facts.name;
    auto [it, inserted] = m_classes.emplace(std::move(name), std::move(facts));
    (void)inserted;
    for (const auto& method : it->second.methods) {
        m_methods[method.method] = &method;
    }
}

void ClassRegistry::set_aggregate_roots(std::set<std::string> aggregate_roots)
{
    m_aggregate_roots = std::move(aggregate_roots);
}

const ClassFacts* ClassRegistry::find_class(std::string_view name) const
{
    auto it = m_classes.find(name);
    return it == m_classes.end() ? nullptr : &it->second;
}

const MethodFacts* ClassRegistry::find_method(const MethodId& method) const
{
    auto it = m_methods.find(method);
    return it == m_methods.end() ? nullptr : it->second;
}

bool ClassRegistry::is_aggregate_root(std::string_view name) const
{
    return m_aggregate_roots.contains(std::string(name));
}

}  // namespace fieldlens::analyzer
