#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for reproducible documents
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - Integers only (no floating point)
 * - Compact by default; an indent gives byte-stable pretty output
 */

#include "fieldlens/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace fieldlens::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @param indent -1 for compact output, otherwise spaces per level
 * @return Canonical text or error
 */
[[nodiscard]] fieldlens::Result<std::string> canonicalize(const nlohmann::json& j,
                                                          int indent = -1);

/**
 * Validate JSON for canonical form requirements (no floating point numbers)
 */
[[nodiscard]] fieldlens::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace fieldlens::canonical
