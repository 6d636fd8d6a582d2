/**
 * @file repository_identifier.cpp
 * @brief Repository identification by marker interface, annotation or name
 */

#include "repository_identifier.hpp"

#include "fieldlens/common.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace fieldlens::analyzer {

namespace {

[[nodiscard]] bool is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

/**
 * @brief Split the text between '<' and its matching '>' into top-level
 *        type arguments. Handles both JVM ("Lcom/x/A;Lcom/x/B;") and source
 *        ("com.x.A, com.x.B") spellings.
 */
[[nodiscard]] std::vector<std::string> split_type_arguments(std::string_view args)
{
    std::vector<std::string> result;
    std::string current;
    int depth = 0;
    auto flush = [&result, &current]() {
        std::string_view text = current;
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
            text.remove_suffix(1);
        }
        if (!text.empty()) {
            result.emplace_back(text);
        }
        current.clear();
    };
    for (char c : args) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0) {
            if (c == ',') {
                flush();
                continue;
            }
            current.push_back(c);
            if (c == ';') {
                flush();
            }
            continue;
        }
        // Nested generic arguments do not change the raw type.
    }
    flush();
    return result;
}

[[nodiscard]] std::optional<std::string> type_argument_name(std::string_view arg)
{
    if (!arg.empty() && (arg.front() == '+' || arg.front() == '-')) {
        arg.remove_prefix(1);
    }
    // Wildcards and type variables ("TT;") name no concrete aggregate.
    if (arg.empty() || arg == "*" || (arg.front() == 'T' && arg.ends_with(";"))) {
        return std::nullopt;
    }
    std::string name = common::to_qualified_name(arg);
    if (name.ends_with(";")) {
        name.pop_back();
    }
    if (!common::is_valid_qualified_name(name)) {
        return std::nullopt;
    }
    return name;
}

[[nodiscard]] std::string strip_class_literal(std::string_view value)
{
    for (std::string_view suffix : {"::class", ".class"}) {
        if (value.ends_with(suffix)) {
            value.remove_suffix(suffix.size());
            break;
        }
    }
    return common::to_qualified_name(value);
}

}  // namespace

bool has_annotation(const stream::ClassUnit& unit, std::string_view annotation)
{
    return std::ranges::any_of(unit.annotations, [annotation](const stream::Annotation& a) {
        return common::names_match(common::to_qualified_name(a.name), annotation);
    });
}

RepositoryIdentifier::RepositoryIdentifier(RepositoryConfig config,
                                           std::set<std::string> aggregate_roots)
    : m_config(std::move(config))
    , m_aggregate_roots(std::move(aggregate_roots))
{}

std::optional<std::string> RepositoryIdentifier::generic_type_argument(std::string_view signature) const
{
    const std::string_view marker = common::simple_name(m_config.marker_interface);
    std::size_t search_from = 0;
    while (true) {
        const auto pos = signature.find(marker, search_from);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        search_from = pos + 1;
        const auto open = pos + marker.size();
        if (open >= signature.size() || signature[open] != '<') {
            continue;
        }
        // "XDomainRepository<" is a different interface.
        if (pos > 0 && is_name_char(signature[pos - 1]) && signature[pos - 1] != 'L') {
            continue;
        }
        if (pos > 0 && signature[pos - 1] == 'L' && pos > 1 && is_name_char(signature[pos - 2])) {
            continue;
        }

        int depth = 0;
        std::size_t close = open;
        for (; close < signature.size(); ++close) {
            if (signature[close] == '<') {
                ++depth;
            } else if (signature[close] == '>' && --depth == 0) {
                break;
            }
        }
        if (close >= signature.size()) {
            return std::nullopt;
        }
        auto args = split_type_arguments(signature.substr(open + 1, close - open - 1));
        if (args.size() != 1) {
            return std::nullopt;
        }
        return type_argument_name(args.front());
    }
}

std::string RepositoryIdentifier::resolve_type_name(std::string_view name) const
{
    std::string qualified = common::to_qualified_name(name);
    if (qualified.find('.') != std::string::npos || m_aggregate_roots.contains(qualified)) {
        return qualified;
    }
    for (const auto& root : m_aggregate_roots) {
        if (common::simple_name(root) == qualified) {
            return root;
        }
    }
    return qualified;
}

std::optional<std::string> RepositoryIdentifier::match_generic(const stream::ClassUnit& unit) const
{
    if (!unit.generic_signature) {
        return std::nullopt;
    }
    const bool implements_marker =
        std::ranges::any_of(unit.interfaces, [this](const std::string& iface) {
            return common::names_match(iface, m_config.marker_interface);
        });
    if (!implements_marker
        && unit.generic_signature->find(common::simple_name(m_config.marker_interface))
               == std::string::npos) {
        return std::nullopt;
    }
    auto argument = generic_type_argument(*unit.generic_signature);
    if (!argument) {
        return std::nullopt;
    }
    return resolve_type_name(*argument);
}

std::optional<std::string> RepositoryIdentifier::match_annotation(const stream::ClassUnit& unit) const
{
    for (const auto& annotation : unit.annotations) {
        if (!common::names_match(common::to_qualified_name(annotation.name), m_config.annotation)) {
            continue;
        }
        for (std::string_view key : {"targetType", "value"}) {
            auto it = annotation.arguments.find(std::string(key));
            if (it != annotation.arguments.end() && !it->second.empty()) {
                return resolve_type_name(strip_class_literal(it->second));
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> RepositoryIdentifier::match_naming(const stream::ClassUnit& unit) const
{
    const std::string_view class_simple = common::simple_name(unit.name);
    const std::string_view class_package = common::package_name(unit.name);
    std::optional<std::string> fallback;
    for (const auto& rule : m_config.naming_rules) {
        const auto placeholder = rule.find(kAggregateRootPlaceholder);
        if (placeholder == std::string::npos) {
            continue;
        }
        for (const auto& root : m_aggregate_roots) {
            if (root == unit.name) {
                continue;
            }
            std::string expected = rule;
            expected.replace(placeholder, kAggregateRootPlaceholder.size(),
                             common::simple_name(root));
            if (expected != class_simple) {
                continue;
            }
            if (common::package_name(root) == class_package) {
                return root;
            }
            if (!fallback) {
                fallback = root;
            }
        }
        if (fallback) {
            return fallback;
        }
    }
    return std::nullopt;
}

std::optional<RepositoryMapping> RepositoryIdentifier::identify(const stream::ClassUnit& unit,
                                                                diag::DiagnosticSink& sink) const
{
    if (unit.name.find("$$") != std::string::npos) {
        return std::nullopt;
    }
    if (!common::is_package_included(unit.name, m_config.include_packages,
                                     m_config.exclude_packages)) {
        return std::nullopt;
    }

    const std::array<std::pair<RepositoryMatchKind, std::optional<std::string>>, 3> matches = {{
        {RepositoryMatchKind::kGenericInterface, match_generic(unit)   },
        {RepositoryMatchKind::kAnnotation,       match_annotation(unit)},
        {RepositoryMatchKind::kNamingConvention, match_naming(unit)    },
    }};

    std::optional<RepositoryMapping> winner;
    for (const auto& [kind, target] : matches) {
        if (!target) {
            continue;
        }
        if (!winner) {
            winner = RepositoryMapping{
                .aggregate_root_class = *target, .repository_class = unit.name, .match_kind = kind};
            continue;
        }
        if (*target != winner->aggregate_root_class) {
            sink.report(diag::DiagnosticKind::kRepositoryAmbiguityWarning,
                        std::format("{} match resolves to {} but {} match to {}; using {}",
                                    match_kind_name(winner->match_kind),
                                    winner->aggregate_root_class, match_kind_name(kind), *target,
                                    winner->aggregate_root_class),
                        unit.name);
        }
    }
    return winner;
}

}  // namespace fieldlens::analyzer
