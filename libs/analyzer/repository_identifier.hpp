#pragma once

/**
 * @file repository_identifier.hpp
 * @brief Decide which classes are repositories and for which aggregate root
 */

#include "fieldlens/config.hpp"
#include "fieldlens/diagnostics.hpp"
#include "fieldlens/model.hpp"
#include "fieldlens/program.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fieldlens::analyzer {

/**
 * @brief Classifies classes as repositories
 *
 * Strategies in precedence order, first match wins:
 * 1. implements the marker interface with exactly one type argument
 * 2. carries the repository annotation with a targetType argument
 * 3. simple name fits a naming rule for a known aggregate root
 *
 * When strategies disagree on the target, the loser is reported as a
 * RepositoryAmbiguityWarning.
 */
class RepositoryIdentifier
{
public:
    RepositoryIdentifier(RepositoryConfig config, std::set<std::string> aggregate_roots);

    [[nodiscard]] std::optional<RepositoryMapping> identify(const stream::ClassUnit& unit,
                                                            diag::DiagnosticSink& sink) const;

    /// Aggregate type argument of the marker interface in a generic signature
    [[nodiscard]] std::optional<std::string>
    generic_type_argument(std::string_view signature) const;

private:
    [[nodiscard]] std::optional<std::string> match_generic(const stream::ClassUnit& unit) const;
    [[nodiscard]] std::optional<std::string> match_annotation(const stream::ClassUnit& unit) const;
    [[nodiscard]] std::optional<std::string> match_naming(const stream::ClassUnit& unit) const;
    [[nodiscard]] std::string resolve_type_name(std::string_view name) const;

    RepositoryConfig m_config;
    std::set<std::string> m_aggregate_roots;
};

/// True when the class carries the annotation (qualified or simple name)
[[nodiscard]] bool has_annotation(const stream::ClassUnit& unit, std::string_view annotation);

}  // namespace fieldlens::analyzer
