/**
 * @file query.cpp
 * @brief Required-field lookup over a call analysis document
 */

#include "fieldlens/query.hpp"

#include "fieldlens/store.hpp"

#include <format>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace fieldlens::query {

namespace {

/**
 * @brief Parse the span suffix of a call site key ("Handler.handle+12-30")
 */
[[nodiscard]] std::optional<SourceSpan> span_from_key(std::string_view key)
{
    const auto plus = key.rfind('+');
    if (plus == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view range = key.substr(plus + 1);
    const auto dash = range.find('-', 1);
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    try {
        return SourceSpan{.start_line = std::stoi(std::string(range.substr(0, dash))),
                          .end_line = std::stoi(std::string(range.substr(dash + 1)))};
    } catch (const std::logic_error&) {
        // "unknown" or otherwise unparsable: no span.
        return std::nullopt;
    }
}

[[nodiscard]] std::string cache_key(const FieldQuery& query)
{
    return std::format("{}\x1f{}\x1f{}\x1f{}\x1f{}", query.aggregate_root_class,
                       query.caller_class, query.caller_method,
                       query.repository_method.value_or(""),
                       query.line ? std::to_string(*query.line) : std::string{});
}

}  // namespace

// ----------------------------------------------------------------------------
// RequiredFieldsIndex
// ----------------------------------------------------------------------------

RequiredFieldsIndex RequiredFieldsIndex::build(const AnalysisResult& result)
{
    RequiredFieldsIndex index;
    for (const auto& [aggregate, analysis] : result.call_graph) {
        for (const auto& [method_key, method] : analysis.methods) {
            index.m_repository_methods[aggregate].insert(method_key);
            for (const auto& [call_key, call] : method.calls) {
                index.m_entries[aggregate][call.method_class + "." + call.method].push_back(
                    Entry{.repository_method = call.repository_method,
                          .repository_method_key = method_key,
                          .caller_span = span_from_key(call_key),
                          .required_fields = call.required_fields});
            }
        }
    }
    return index;
}

std::set<std::string> RequiredFieldsIndex::lookup(const FieldQuery& query) const
{
    std::set<std::string> fields;
    auto aggregate = m_entries.find(query.aggregate_root_class);
    if (aggregate == m_entries.end()) {
        return fields;
    }
    auto caller = aggregate->second.find(query.caller_class + "." + query.caller_method);
    if (caller == aggregate->second.end()) {
        return fields;
    }

    for (const auto& entry : caller->second) {
        if (query.repository_method) {
            const std::string& wanted = *query.repository_method;
            const bool has_descriptor = wanted.find('(') != std::string::npos;
            if (has_descriptor ? entry.repository_method_key != wanted
                               : entry.repository_method != wanted) {
                continue;
            }
        }
        // A call site without a recorded span matches any line.
        if (query.line && *query.line >= 0 && entry.caller_span
            && !entry.caller_span->contains(*query.line)) {
            continue;
        }
        fields.insert(entry.required_fields.begin(), entry.required_fields.end());
    }
    return fields;
}

std::vector<std::string> RequiredFieldsIndex::aggregate_roots() const
{
    std::vector<std::string> roots;
    roots.reserve(m_repository_methods.size());
    for (const auto& [aggregate, _] : m_repository_methods) {
        roots.push_back(aggregate);
    }
    return roots;
}

std::vector<std::string> RequiredFieldsIndex::repository_methods(std::string_view aggregate) const
{
    auto it = m_repository_methods.find(std::string(aggregate));
    if (it == m_repository_methods.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

// ----------------------------------------------------------------------------
// FieldRequirementQuery
// ----------------------------------------------------------------------------

FieldRequirementQuery::FieldRequirementQuery(std::filesystem::path document_path)
    : m_path(std::move(document_path))
{}

FieldRequirementQuery::FieldRequirementQuery(AnalysisResult preloaded)
    : m_preloaded(std::move(preloaded))
{}

std::shared_ptr<const RequiredFieldsIndex> FieldRequirementQuery::ensure_loaded() const
{
    {
        std::shared_lock lock(m_mutex);
        if (m_index) {
            return m_index;
        }
    }

    std::unique_lock lock(m_mutex);
    if (m_index) {
        return m_index;
    }
    if (m_preloaded) {
        m_index = std::make_shared<const RequiredFieldsIndex>(RequiredFieldsIndex::build(*m_preloaded));
        m_load_error.reset();
        return m_index;
    }

    auto result = store::read_result(*m_path);
    if (!result) {
        m_load_error = result.error();
        m_index = std::make_shared<const RequiredFieldsIndex>();
        return m_index;
    }
    m_load_error.reset();
    m_index = std::make_shared<const RequiredFieldsIndex>(RequiredFieldsIndex::build(*result));
    return m_index;
}

std::set<std::string> FieldRequirementQuery::get_required_fields(const FieldQuery& query) const
{
    auto index = ensure_loaded();
    const std::string key = cache_key(query);
    {
        std::shared_lock lock(m_mutex);
        if (auto it = m_cache.find(key); it != m_cache.end()) {
            return it->second;
        }
    }

    std::set<std::string> fields = index->lookup(query);
    {
        // Lookups are deterministic, so a concurrent insert of the same key is harmless.
        // An answer from an index dropped by clear_cache() is returned but not cached.
        std::unique_lock lock(m_mutex);
        if (m_index == index) {
            m_cache.insert_or_assign(key, fields);
        }
    }
    return fields;
}

std::set<std::string>
FieldRequirementQuery::get_required_fields(std::string_view aggregate_root_class,
                                           std::string_view caller_class,
                                           std::string_view caller_method,
                                           std::optional<std::string_view> repository_method) const
{
    FieldQuery query{.aggregate_root_class = std::string(aggregate_root_class),
                     .caller_class = std::string(caller_class),
                     .caller_method = std::string(caller_method),
                     .repository_method = std::nullopt,
                     .line = std::nullopt};
    if (repository_method) {
        query.repository_method = std::string(*repository_method);
    }
    return get_required_fields(query);
}

std::set<std::string>
FieldRequirementQuery::get_required_fields_at_line(std::string_view aggregate_root_class,
                                                   std::string_view caller_class,
                                                   std::string_view caller_method,
                                                   int line) const
{
    return get_required_fields(FieldQuery{.aggregate_root_class = std::string(aggregate_root_class),
                                          .caller_class = std::string(caller_class),
                                          .caller_method = std::string(caller_method),
                                          .repository_method = std::nullopt,
                                          .line = line});
}

bool FieldRequirementQuery::is_analysis_available() const
{
    static_cast<void>(ensure_loaded());
    std::shared_lock lock(m_mutex);
    return !m_load_error.has_value();
}

std::vector<std::string> FieldRequirementQuery::aggregate_roots() const
{
    return ensure_loaded()->aggregate_roots();
}

std::vector<std::string> FieldRequirementQuery::repository_methods(std::string_view aggregate) const
{
    return ensure_loaded()->repository_methods(aggregate);
}

std::optional<Error> FieldRequirementQuery::load_error() const
{
    static_cast<void>(ensure_loaded());
    std::shared_lock lock(m_mutex);
    return m_load_error;
}

void FieldRequirementQuery::clear_cache()
{
    std::unique_lock lock(m_mutex);
    m_cache.clear();
    m_index.reset();
    m_load_error.reset();
}

std::size_t FieldRequirementQuery::cached_entries() const
{
    std::shared_lock lock(m_mutex);
    return m_cache.size();
}

}  // namespace fieldlens::query
