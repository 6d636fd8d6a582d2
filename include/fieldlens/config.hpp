#pragma once

/**
 * @file config.hpp
 * @brief Analyzer configuration and its JSON loader
 */

#include "fieldlens/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace fieldlens {

/// Placeholder substituted with an aggregate root's simple name in naming rules
inline constexpr std::string_view kAggregateRootPlaceholder = "{AggregateRoot}";

struct RepositoryConfig
{
    std::vector<std::string> naming_rules = {"{AggregateRoot}Repository",
                                             "I{AggregateRoot}Repository",
                                             "{AggregateRoot}Repo"};
    std::vector<std::string> include_packages = {"**"};
    std::vector<std::string> exclude_packages = {"**.test.**", "**.tests.**"};
    std::string marker_interface = "org.morecup.pragmaddd.core.repository.DomainRepository";
    std::string annotation = "org.morecup.pragmaddd.core.annotation.DomainRepository";
};

struct FieldAccessConfig
{
    int max_recursion_depth = 10;
    bool exclude_setter_methods = true;
    bool enable_cycle_detection = true;
};

struct AnalyzerConfig
{
    RepositoryConfig repository;
    FieldAccessConfig field_access;
    std::string aggregate_root_annotation = "org.morecup.pragmaddd.core.annotation.AggregateRoot";
    int jobs = 0;  ///< 0 = hardware concurrency
    bool fail_on_error = false;
    bool quiet = false;
};

}  // namespace fieldlens

namespace fieldlens::config {

/**
 * Build a configuration from a JSON object. Missing keys keep their
 * defaults; present keys must have the documented type.
 */
[[nodiscard]] fieldlens::Result<AnalyzerConfig> from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const AnalyzerConfig& config);

/**
 * Semantic checks the schema cannot express: non-negative depth, every
 * naming rule carries the {AggregateRoot} placeholder, non-empty marker names.
 */
[[nodiscard]] fieldlens::VoidResult validate(const AnalyzerConfig& config);

/**
 * Read, schema-validate (config.v1) and convert a config file.
 */
[[nodiscard]] fieldlens::Result<AnalyzerConfig> load_config(const std::filesystem::path& path,
                                                            const std::filesystem::path& schema_dir);

}  // namespace fieldlens::config
