#pragma once

/**
 * @file query.hpp
 * @brief Runtime lookup of required fields from a call analysis document
 *
 * A missing file, a malformed document or a query without a match all
 * answer with an empty set; the query side never fails.
 */

#include "fieldlens/common.hpp"
#include "fieldlens/model.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fieldlens::query {

struct FieldQuery
{
    std::string aggregate_root_class;
    std::string caller_class;
    std::string caller_method;
    /// Repository method name, or name plus descriptor ("findById(J)Lcom/x/Order;")
    std::optional<std::string> repository_method;
    /// Restrict to call sites whose caller span contains this line
    std::optional<int> line;

    bool operator==(const FieldQuery&) const = default;
};

/**
 * @brief Immutable lookup structure over one AnalysisResult
 */
class RequiredFieldsIndex
{
public:
    [[nodiscard]] static RequiredFieldsIndex build(const AnalysisResult& result);

    [[nodiscard]] std::set<std::string> lookup(const FieldQuery& query) const;

    [[nodiscard]] std::vector<std::string> aggregate_roots() const;

    /// Repository method keys (name plus descriptor) recorded for an aggregate
    [[nodiscard]] std::vector<std::string> repository_methods(std::string_view aggregate) const;

    [[nodiscard]] bool empty() const { return m_entries.empty(); }

private:
    struct Entry
    {
        std::string repository_method;             ///< Name only
        std::string repository_method_key;         ///< Name plus descriptor
        std::optional<SourceSpan> caller_span;
        std::set<std::string> required_fields;
    };

    /// aggregate -> "callerClass.callerMethod" -> entries
    std::map<std::string, std::map<std::string, std::vector<Entry>>> m_entries;
    std::map<std::string, std::set<std::string>> m_repository_methods;
};

/**
 * @brief Lazily loaded, cached query service over one document
 *
 * The document is read on first use. Lookups are cached; readers run in
 * parallel under a shared lock. clear_cache() drops both the cache and the
 * loaded document so the next query reads the file again.
 */
class FieldRequirementQuery
{
public:
    explicit FieldRequirementQuery(std::filesystem::path document_path);
    explicit FieldRequirementQuery(AnalysisResult preloaded);

    FieldRequirementQuery(const FieldRequirementQuery&) = delete;
    FieldRequirementQuery& operator=(const FieldRequirementQuery&) = delete;

    [[nodiscard]] std::set<std::string>
    get_required_fields(std::string_view aggregate_root_class,
                        std::string_view caller_class,
                        std::string_view caller_method,
                        std::optional<std::string_view> repository_method = std::nullopt) const;

    [[nodiscard]] std::set<std::string>
    get_required_fields_at_line(std::string_view aggregate_root_class,
                                std::string_view caller_class,
                                std::string_view caller_method,
                                int line) const;

    [[nodiscard]] std::set<std::string> get_required_fields(const FieldQuery& query) const;

    [[nodiscard]] bool is_analysis_available() const;

    [[nodiscard]] std::vector<std::string> aggregate_roots() const;
    [[nodiscard]] std::vector<std::string> repository_methods(std::string_view aggregate) const;

    /// Why the document could not be used, if it could not
    [[nodiscard]] std::optional<Error> load_error() const;

    void clear_cache();

    /// Number of cached lookups (for diagnostics and tests)
    [[nodiscard]] std::size_t cached_entries() const;

private:
    [[nodiscard]] std::shared_ptr<const RequiredFieldsIndex> ensure_loaded() const;

    std::optional<std::filesystem::path> m_path;
    std::optional<AnalysisResult> m_preloaded;

    mutable std::shared_mutex m_mutex;
    mutable std::shared_ptr<const RequiredFieldsIndex> m_index;
    mutable std::optional<Error> m_load_error;
    mutable std::map<std::string, std::set<std::string>> m_cache;
};

}  // namespace fieldlens::query
