#pragma once

/**
 * @file class_registry.hpp
 * @brief Per-run registry of classified classes
 *
 * Built once per analysis run after phase 1 and passed explicitly to the
 * later phases; nothing survives the run.
 */

#include "property_access.hpp"

#include "fieldlens/model.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fieldlens::analyzer {

struct ClassFacts
{
    std::string name;
    bool is_interface = false;
    std::vector<MethodFacts> methods;
};

class ClassRegistry
{
public:
    ClassRegistry() = default;
    // Method lookups point into m_classes; moving keeps the nodes, copying would not.
    ClassRegistry(const ClassRegistry&) = delete;
    ClassRegistry& operator=(const ClassRegistry&) = delete;
    ClassRegistry(ClassRegistry&&) = default;
    ClassRegistry& operator=(ClassRegistry&&) = default;

    void add(ClassFacts facts);

    void set_aggregate_roots(std::set<std::string> aggregate_roots);

    [[nodiscard]] const ClassFacts* find_class(std::string_view name) const;
    [[nodiscard]] const MethodFacts* find_method(const MethodId& method) const;

    [[nodiscard]] bool is_aggregate_root(std::string_view name) const;
    [[nodiscard]] const std::set<std::string>& aggregate_roots() const { return m_aggregate_roots; }

    /// Classes in name order
    [[nodiscard]] const std::map<std::string, ClassFacts, std::less<>>& classes() const
    {
        return m_classes;
    }

private:
    std::map<std::string, ClassFacts, std::less<>> m_classes;
    std::map<MethodId, const MethodFacts*> m_methods;
    std::set<std::string> m_aggregate_roots;
};

}  // namespace fieldlens::analyzer
