#pragma once

/**
 * @file json_fields.hpp
 * @brief Typed field access on nlohmann::json objects with Result errors
 */

#include "fieldlens/common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace fieldlens::json {

/**
 * @brief Object, key and a human readable location for error messages
 */
struct JsonFieldContext
{
    const nlohmann::json* obj = nullptr;
    std::string_view key;
    std::string_view context;
};

[[nodiscard]] fieldlens::Result<std::string> require_string(const JsonFieldContext& input);
[[nodiscard]] fieldlens::Result<const nlohmann::json*> require_object(const JsonFieldContext& input);
[[nodiscard]] fieldlens::Result<const nlohmann::json*> require_array(const JsonFieldContext& input);

/// Absent key -> nullopt; present key of the wrong type -> error
[[nodiscard]] fieldlens::Result<std::optional<std::string>>
optional_string(const JsonFieldContext& input);
[[nodiscard]] fieldlens::Result<std::optional<bool>> optional_bool(const JsonFieldContext& input);
[[nodiscard]] fieldlens::Result<std::optional<int>> optional_int(const JsonFieldContext& input);

/// Array of strings; absent key -> nullopt
[[nodiscard]] fieldlens::Result<std::optional<std::vector<std::string>>>
optional_string_array(const JsonFieldContext& input);

/// Parse JSON text, converting parse failures into an Error
[[nodiscard]] fieldlens::Result<nlohmann::json> parse_text(std::string_view text,
                                                           std::string_view origin);

/// Read and parse a JSON file
[[nodiscard]] fieldlens::Result<nlohmann::json> read_file(const std::string& path);

}  // namespace fieldlens::json
