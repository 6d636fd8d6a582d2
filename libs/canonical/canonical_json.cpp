/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "fieldlens/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace fieldlens::canonical {

namespace {

fieldlens::VoidResult validate_no_float(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        std::size_t index = 0;
        for (const auto& elem : j) {
            if (auto result = validate_no_float(elem, std::format("{}[{}]", path, index));
                !result) {
                return result;
            }
            ++index;
        }
    }
    return {};
}

/**
 * @brief Recursively rebuild objects with keys inserted in lexicographic order
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    return j;
}

}  // namespace

fieldlens::Result<std::string> canonicalize(const nlohmann::json& j, int indent)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    nlohmann::json sorted = make_sorted_copy(j);
    try {
        return sorted.dump(indent, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "InvalidUtf8", std::format("JSON text is not valid UTF-8: {}", ex.what())));
    }
}

fieldlens::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_no_float(j, "$");
}

}  // namespace fieldlens::canonical
