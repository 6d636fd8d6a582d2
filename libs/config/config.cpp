/**
 * @file config.cpp
 * @brief Analyzer configuration loading and validation
 */

#include "fieldlens/config.hpp"

#include "fieldlens/json_fields.hpp"
#include "fieldlens/schema_validate.hpp"
#include "fieldlens/version.hpp"

#include <format>

namespace fieldlens::config {

namespace {

using json::JsonFieldContext;

fieldlens::VoidResult apply_repository(const nlohmann::json& j, RepositoryConfig& out)
{
    constexpr std::string_view kContext = "config.repository";
    auto field = [&j](std::string_view key) {
        return JsonFieldContext{.obj = &j, .key = key, .context = kContext};
    };

    struct ListField
    {
        std::string_view key;
        std::vector<std::string>* target;
    };
    for (const auto& [key, target] : {ListField{"naming_rules", &out.naming_rules},
                                      ListField{"include_packages", &out.include_packages},
                                      ListField{"exclude_packages", &out.exclude_packages}}) {
        auto list = json::optional_string_array(field(key));
        if (!list) {
            return std::unexpected(list.error());
        }
        if (*list) {
            *target = std::move(**list);
        }
    }

    auto marker = json::optional_string(field("marker_interface"));
    if (!marker) {
        return std::unexpected(marker.error());
    }
    if (*marker) {
        out.marker_interface = **marker;
    }
    auto annotation = json::optional_string(field("annotation"));
    if (!annotation) {
        return std::unexpected(annotation.error());
    }
    if (*annotation) {
        out.annotation = **annotation;
    }
    return {};
}

fieldlens::VoidResult apply_field_access(const nlohmann::json& j, FieldAccessConfig& out)
{
    constexpr std::string_view kContext = "config.field_access";
    auto depth = json::optional_int(
        JsonFieldContext{.obj = &j, .key = "max_recursion_depth", .context = kContext});
    if (!depth) {
        return std::unexpected(depth.error());
    }
    if (*depth) {
        out.max_recursion_depth = **depth;
    }
    auto exclude = json::optional_bool(
        JsonFieldContext{.obj = &j, .key = "exclude_setter_methods", .context = kContext});
    if (!exclude) {
        return std::unexpected(exclude.error());
    }
    if (*exclude) {
        out.exclude_setter_methods = **exclude;
    }
    auto cycles = json::optional_bool(
        JsonFieldContext{.obj = &j, .key = "enable_cycle_detection", .context = kContext});
    if (!cycles) {
        return std::unexpected(cycles.error());
    }
    if (*cycles) {
        out.enable_cycle_detection = **cycles;
    }
    return {};
}

}  // namespace

fieldlens::Result<AnalyzerConfig> from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidConfig", "Configuration document must be a JSON object"));
    }

    AnalyzerConfig config;
    constexpr std::string_view kContext = "config";

    if (j.contains("repository")) {
        auto repository =
            json::require_object(JsonFieldContext{.obj = &j, .key = "repository", .context = kContext});
        if (!repository) {
            return std::unexpected(repository.error());
        }
        if (auto applied = apply_repository(**repository, config.repository); !applied) {
            return std::unexpected(applied.error());
        }
    }
    if (j.contains("field_access")) {
        auto field_access = json::require_object(
            JsonFieldContext{.obj = &j, .key = "field_access", .context = kContext});
        if (!field_access) {
            return std::unexpected(field_access.error());
        }
        if (auto applied = apply_field_access(**field_access, config.field_access); !applied) {
            return std::unexpected(applied.error());
        }
    }

    auto annotation = json::optional_string(
        JsonFieldContext{.obj = &j, .key = "aggregate_root_annotation", .context = kContext});
    if (!annotation) {
        return std::unexpected(annotation.error());
    }
    if (*annotation) {
        config.aggregate_root_annotation = **annotation;
    }

    auto jobs = json::optional_int(JsonFieldContext{.obj = &j, .key = "jobs", .context = kContext});
    if (!jobs) {
        return std::unexpected(jobs.error());
    }
    if (*jobs) {
        config.jobs = **jobs;
    }

    auto fail_on_error =
        json::optional_bool(JsonFieldContext{.obj = &j, .key = "fail_on_error", .context = kContext});
    if (!fail_on_error) {
        return std::unexpected(fail_on_error.error());
    }
    if (*fail_on_error) {
        config.fail_on_error = **fail_on_error;
    }

    auto quiet = json::optional_bool(JsonFieldContext{.obj = &j, .key = "quiet", .context = kContext});
    if (!quiet) {
        return std::unexpected(quiet.error());
    }
    if (*quiet) {
        config.quiet = **quiet;
    }

    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

nlohmann::json to_json(const AnalyzerConfig& config)
{
    return nlohmann::json{
        {"schema_version", kConfigSchemaVersion},
        {"repository",
         {{"naming_rules", config.repository.naming_rules},
          {"include_packages", config.repository.include_packages},
          {"exclude_packages", config.repository.exclude_packages},
          {"marker_interface", config.repository.marker_interface},
          {"annotation", config.repository.annotation}}},
        {"field_access",
         {{"max_recursion_depth", config.field_access.max_recursion_depth},
          {"exclude_setter_methods", config.field_access.exclude_setter_methods},
          {"enable_cycle_detection", config.field_access.enable_cycle_detection}}},
        {"aggregate_root_annotation", config.aggregate_root_annotation},
        {"jobs", config.jobs},
        {"fail_on_error", config.fail_on_error},
        {"quiet", config.quiet}
    };
}

fieldlens::VoidResult validate(const AnalyzerConfig& config)
{
    if (config.field_access.max_recursion_depth < 0) {
        return std::unexpected(Error::make(
            "InvalidConfig", std::format("field_access.max_recursion_depth must be >= 0, got {}",
                                         config.field_access.max_recursion_depth)));
    }
    if (config.jobs < 0) {
        return std::unexpected(
            Error::make("InvalidConfig", std::format("jobs must be >= 0, got {}", config.jobs)));
    }
    for (const auto& rule : config.repository.naming_rules) {
        if (rule.find(kAggregateRootPlaceholder) == std::string::npos) {
            return std::unexpected(Error::make(
                "InvalidConfig",
                std::format("repository naming rule '{}' lacks the {} placeholder", rule,
                            kAggregateRootPlaceholder)));
        }
    }
    if (config.repository.marker_interface.empty() || config.repository.annotation.empty()
        || config.aggregate_root_annotation.empty()) {
        return std::unexpected(
            Error::make("InvalidConfig", "marker interface and annotation names must not be empty"));
    }
    return {};
}

fieldlens::Result<AnalyzerConfig> load_config(const std::filesystem::path& path,
                                              const std::filesystem::path& schema_dir)
{
    auto document = json::read_file(path.string());
    if (!document) {
        return std::unexpected(document.error());
    }
    if (auto valid = common::validate_json(*document, common::schema_file(schema_dir, "config.v1"));
        !valid) {
        return std::unexpected(Error::make(
            "InvalidConfig",
            std::format("Config {} failed schema validation: {}", path.string(), valid.error().message)));
    }
    return from_json(*document);
}

}  // namespace fieldlens::config
