#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "fieldlens/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace fieldlens::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings as "fieldlens:schema/<name>".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] fieldlens::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

/**
 * Path of "<schema_dir>/<name>.schema.json".
 */
[[nodiscard]] std::string schema_file(const std::filesystem::path& schema_dir,
                                      std::string_view name);

}  // namespace fieldlens::common
