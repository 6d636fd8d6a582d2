/**
 * @file json_fields.cpp
 * @brief Typed field access on nlohmann::json objects
 */

#include "fieldlens/json_fields.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace fieldlens::json {

namespace {

[[nodiscard]] Error missing_field(const JsonFieldContext& input)
{
    return Error::make("MissingField", std::format("Missing required field '{}' in {}",
                                                   input.key, input.context));
}

[[nodiscard]] Error wrong_type(const JsonFieldContext& input, std::string_view expected)
{
    return Error::make("InvalidFieldType", std::format("Expected {} field '{}' in {}", expected,
                                                       input.key, input.context));
}

[[nodiscard]] const nlohmann::json* find_field(const JsonFieldContext& input)
{
    if (input.obj == nullptr || !input.obj->is_object()) {
        return nullptr;
    }
    auto it = input.obj->find(std::string(input.key));
    return it == input.obj->end() ? nullptr : &*it;
}

}  // namespace

fieldlens::Result<std::string> require_string(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr) {
        return std::unexpected(missing_field(input));
    }
    if (!value->is_string()) {
        return std::unexpected(wrong_type(input, "string"));
    }
    return value->get<std::string>();
}

fieldlens::Result<const nlohmann::json*> require_object(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr) {
        return std::unexpected(missing_field(input));
    }
    if (!value->is_object()) {
        return std::unexpected(wrong_type(input, "object"));
    }
    return value;
}

fieldlens::Result<const nlohmann::json*> require_array(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr) {
        return std::unexpected(missing_field(input));
    }
    if (!value->is_array()) {
        return std::unexpected(wrong_type(input, "array"));
    }
    return value;
}

fieldlens::Result<std::optional<std::string>> optional_string(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr || value->is_null()) {
        return std::optional<std::string>{};
    }
    if (!value->is_string()) {
        return std::unexpected(wrong_type(input, "string"));
    }
    return std::optional<std::string>{value->get<std::string>()};
}

fieldlens::Result<std::optional<bool>> optional_bool(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr) {
        return std::optional<bool>{};
    }
    if (!value->is_boolean()) {
        return std::unexpected(wrong_type(input, "boolean"));
    }
    return std::optional<bool>{value->get<bool>()};
}

fieldlens::Result<std::optional<int>> optional_int(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr) {
        return std::optional<int>{};
    }
    if (!value->is_number_integer()) {
        return std::unexpected(wrong_type(input, "integer"));
    }
    return std::optional<int>{value->get<int>()};
}

fieldlens::Result<std::optional<std::vector<std::string>>>
optional_string_array(const JsonFieldContext& input)
{
    const auto* value = find_field(input);
    if (value == nullptr) {
        return std::optional<std::vector<std::string>>{};
    }
    if (!value->is_array()) {
        return std::unexpected(wrong_type(input, "array"));
    }
    std::vector<std::string> items;
    items.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_string()) {
            return std::unexpected(wrong_type(input, "string array"));
        }
        items.push_back(item.get<std::string>());
    }
    return std::optional<std::vector<std::string>>{std::move(items)};
}

fieldlens::Result<nlohmann::json> parse_text(std::string_view text, std::string_view origin)
{
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("JsonParseFailed", std::format("Failed to parse {}: {}", origin, ex.what())));
    }
}

fieldlens::Result<nlohmann::json> read_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("FileOpenFailed", std::format("Failed to open file: {}", path)));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_text(buffer.str(), path);
}

}  // namespace fieldlens::json
