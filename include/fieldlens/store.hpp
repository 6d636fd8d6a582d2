#pragma once

/**
 * @file store.hpp
 * @brief Call analysis document: serialization, file I/O, merge, checks, statistics
 */

#include "fieldlens/common.hpp"
#include "fieldlens/model.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fieldlens::store {

/// Document in the call analysis layout (camelCase keys, sorted field arrays)
[[nodiscard]] nlohmann::json serialize(const AnalysisResult& result);

[[nodiscard]] fieldlens::Result<AnalysisResult> deserialize(const nlohmann::json& j);

/// Canonical pretty text of the document (sorted keys, two-space indent)
[[nodiscard]] fieldlens::Result<std::string> to_document_text(const AnalysisResult& result);

[[nodiscard]] fieldlens::VoidResult write_result(const AnalysisResult& result,
                                                 const std::filesystem::path& path);

[[nodiscard]] fieldlens::Result<AnalysisResult> read_result(const std::filesystem::path& path);

/**
 * Union several documents. Call sites present in more than one input are
 * taken from the input with the latest timestamp; the merged timestamp is
 * the latest one.
 */
[[nodiscard]] fieldlens::Result<AnalysisResult>
merge_results(std::span<const AnalysisResult> results);

/**
 * Structural consistency checks. Returns one message per problem; an empty
 * vector means the document is consistent.
 */
[[nodiscard]] std::vector<std::string> validate_result(const AnalysisResult& result);

struct AnalysisStatistics
{
    std::size_t aggregate_roots = 0;
    std::size_t repository_methods = 0;
    std::size_t call_sites = 0;
    std::size_t called_aggregate_methods = 0;
    std::size_t distinct_required_fields = 0;
    std::map<std::string, std::size_t> call_sites_per_aggregate;
    std::map<std::string, std::size_t> field_usage;  ///< "Aggregate.field" -> call sites needing it

    bool operator==(const AnalysisStatistics&) const = default;
};

[[nodiscard]] AnalysisStatistics compute_statistics(const AnalysisResult& result);

[[nodiscard]] nlohmann::json to_json(const AnalysisStatistics& statistics);

}  // namespace fieldlens::store
