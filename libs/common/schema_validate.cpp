/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "fieldlens/schema_validate.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace fieldlens::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "fieldlens:schema/";

/**
 * @brief Rewrite draft 2020-12 "$defs" into draft-07 "definitions" for valijson
 */
void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            const auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        normalize_schema_defs(value);
    }
}

[[nodiscard]] std::optional<nlohmann::json> read_schema_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    nlohmann::json schema = nlohmann::json::parse(in, nullptr, false);
    if (schema.is_discarded()) {
        return std::nullopt;
    }
    normalize_schema_defs(schema);
    return schema;
}

[[nodiscard]] std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text;
}

}  // namespace

std::string schema_file(const std::filesystem::path& schema_dir, std::string_view name)
{
    return (schema_dir / std::format("{}.schema.json", name)).string();
}

fieldlens::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_schema_file(schema_path);
    if (!schema_json) {
        return std::unexpected(Error::make(
            "SchemaLoadFailed", "Failed to open or parse schema file: " + schema_path));
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir,
                            &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto doc = read_schema_file(schema_file(schema_dir, uri.substr(kSchemaUriPrefix.size())));
        if (!doc) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return referenced.back().get();
    };
    // Fetched documents are owned by `referenced`.
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::format("Failed to build schema: {}", ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        std::string message = format_validation_errors(results);
        return std::unexpected(Error::make(
            "SchemaValidationFailed", message.empty() ? "Schema validation failed." : message));
    }
    return {};
}

}  // namespace fieldlens::common
