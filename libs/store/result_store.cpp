/**
 * @file result_store.cpp
 * @brief Call analysis document serialization, file I/O, merge, checks and statistics
 */

#include "fieldlens/store.hpp"

#include "fieldlens/canonical_json.hpp"
#include "fieldlens/json_fields.hpp"
#include "fieldlens/version.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>
#include <utility>

namespace fieldlens::store {

namespace {

using json::JsonFieldContext;

[[nodiscard]] nlohmann::json field_array(const std::set<std::string>& fields)
{
    // std::set iterates in sorted order.
    nlohmann::json array = nlohmann::json::array();
    for (const auto& field : fields) {
        array.push_back(field);
    }
    return array;
}

[[nodiscard]] fieldlens::Result<std::set<std::string>> read_fields(const nlohmann::json& obj,
                                                                   std::string_view context)
{
    auto array =
        json::require_array(JsonFieldContext{.obj = &obj, .key = "requiredFields", .context = context});
    if (!array) {
        return std::unexpected(array.error());
    }
    std::set<std::string> fields;
    for (const auto& item : **array) {
        if (!item.is_string()) {
            return std::unexpected(Error::make(
                "InvalidFieldType", std::format("Expected string in requiredFields of {}", context)));
        }
        fields.insert(item.get<std::string>());
    }
    return fields;
}

[[nodiscard]] nlohmann::json serialize_call_site(const CallSiteAnalysis& call)
{
    nlohmann::json called = nlohmann::json::array();
    for (const auto& method : call.called_methods) {
        called.push_back({
            {"aggregateRootMethod",           method.method                      },
            {"aggregateRootMethodDescriptor", method.descriptor                  },
            {"requiredFields",                field_array(method.required_fields)}
        });
    }
    return nlohmann::json{
        {"methodClass",                call.method_class                },
        {"method",                     call.method                      },
        {"methodDescriptor",           call.method_descriptor           },
        {"repository",                 call.repository                  },
        {"repositoryMethod",           call.repository_method           },
        {"repositoryMethodDescriptor", call.repository_method_descriptor},
        {"aggregateRoot",              call.aggregate_root              },
        {"calledAggregateRootMethod",  std::move(called)                },
        {"requiredFields",             field_array(call.required_fields)}
    };
}

[[nodiscard]] fieldlens::Result<CallSiteAnalysis> deserialize_call_site(const nlohmann::json& j,
                                                                        const std::string& context)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidFieldType", std::format("Expected object for {}", context)));
    }
    CallSiteAnalysis call;
    struct StringField
    {
        std::string_view key;
        std::string* target;
    };
    for (const auto& [key, target] :
         {StringField{"methodClass", &call.method_class},
          StringField{"method", &call.method},
          StringField{"methodDescriptor", &call.method_descriptor},
          StringField{"repository", &call.repository},
          StringField{"repositoryMethod", &call.repository_method},
          StringField{"repositoryMethodDescriptor", &call.repository_method_descriptor},
          StringField{"aggregateRoot", &call.aggregate_root}}) {
        auto value = json::require_string(JsonFieldContext{.obj = &j, .key = key, .context = context});
        if (!value) {
            return std::unexpected(value.error());
        }
        *target = std::move(*value);
    }

    auto called = json::require_array(
        JsonFieldContext{.obj = &j, .key = "calledAggregateRootMethod", .context = context});
    if (!called) {
        return std::unexpected(called.error());
    }
    for (const auto& item : **called) {
        const std::string item_context = context + ".calledAggregateRootMethod";
        CalledAggregateMethod method;
        auto name = json::require_string(
            JsonFieldContext{.obj = &item, .key = "aggregateRootMethod", .context = item_context});
        if (!name) {
            return std::unexpected(name.error());
        }
        auto descriptor = json::require_string(JsonFieldContext{
            .obj = &item, .key = "aggregateRootMethodDescriptor", .context = item_context});
        if (!descriptor) {
            return std::unexpected(descriptor.error());
        }
        auto fields = read_fields(item, item_context);
        if (!fields) {
            return std::unexpected(fields.error());
        }
        method.method = std::move(*name);
        method.descriptor = std::move(*descriptor);
        method.required_fields = std::move(*fields);
        call.called_methods.push_back(std::move(method));
    }

    auto fields = read_fields(j, context);
    if (!fields) {
        return std::unexpected(fields.error());
    }
    call.required_fields = std::move(*fields);
    return call;
}

}  // namespace

nlohmann::json serialize(const AnalysisResult& result)
{
    nlohmann::json call_graph = nlohmann::json::object();
    for (const auto& [aggregate, analysis] : result.call_graph) {
        nlohmann::json methods = nlohmann::json::object();
        for (const auto& [method_key, method] : analysis.methods) {
            nlohmann::json calls = nlohmann::json::object();
            for (const auto& [call_key, call] : method.calls) {
                calls[call_key] = serialize_call_site(call);
            }
            methods[method_key] = {
                {"calls", std::move(calls)}
            };
        }
        call_graph[aggregate] = {
            {"methods", std::move(methods)}
        };
    }
    return nlohmann::json{
        {"version",   result.version     },
        {"timestamp", result.timestamp   },
        {"callGraph", std::move(call_graph)}
    };
}

fieldlens::Result<AnalysisResult> deserialize(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidAnalysisDocument", "Call analysis document must be a JSON object"));
    }
    constexpr std::string_view kContext = "call analysis document";
    AnalysisResult result;
    auto version = json::require_string(JsonFieldContext{.obj = &j, .key = "version", .context = kContext});
    if (!version) {
        return std::unexpected(version.error());
    }
    auto timestamp =
        json::require_string(JsonFieldContext{.obj = &j, .key = "timestamp", .context = kContext});
    if (!timestamp) {
        return std::unexpected(timestamp.error());
    }
    auto call_graph =
        json::require_object(JsonFieldContext{.obj = &j, .key = "callGraph", .context = kContext});
    if (!call_graph) {
        return std::unexpected(call_graph.error());
    }
    result.version = std::move(*version);
    result.timestamp = std::move(*timestamp);

    for (const auto& [aggregate, aggregate_json] : (*call_graph)->items()) {
        const std::string aggregate_context = "callGraph." + aggregate;
        auto methods = json::require_object(
            JsonFieldContext{.obj = &aggregate_json, .key = "methods", .context = aggregate_context});
        if (!methods) {
            return std::unexpected(methods.error());
        }
        AggregateRootAnalysis& aggregate_analysis = result.call_graph[aggregate];
        for (const auto& [method_key, method_json] : (*methods)->items()) {
            const std::string method_context = aggregate_context + "." + method_key;
            auto calls = json::require_object(
                JsonFieldContext{.obj = &method_json, .key = "calls", .context = method_context});
            if (!calls) {
                return std::unexpected(calls.error());
            }
            RepositoryMethodAnalysis& method_analysis = aggregate_analysis.methods[method_key];
            for (const auto& [call_key, call_json] : (*calls)->items()) {
                auto call = deserialize_call_site(call_json, method_context + "." + call_key);
                if (!call) {
                    return std::unexpected(call.error());
                }
                method_analysis.calls.emplace(call_key, std::move(*call));
            }
        }
    }
    return result;
}

fieldlens::Result<std::string> to_document_text(const AnalysisResult& result)
{
    return canonical::canonicalize(serialize(result), 2);
}

fieldlens::VoidResult write_result(const AnalysisResult& result, const std::filesystem::path& path)
{
    auto text = to_document_text(result);
    if (!text) {
        return std::unexpected(Error::make("SerializationFailed", text.error().message));
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "OutputWriteFailed", std::format("Failed to create directory {}: {}",
                                                 path.parent_path().string(), ec.message())));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error::make(
            "OutputWriteFailed", std::format("Failed to open output file: {}", path.string())));
    }
    out << *text << '\n';
    if (!out) {
        return std::unexpected(Error::make(
            "OutputWriteFailed", std::format("Failed to write output file: {}", path.string())));
    }
    return {};
}

fieldlens::Result<AnalysisResult> read_result(const std::filesystem::path& path)
{
    auto document = json::read_file(path.string());
    if (!document) {
        return std::unexpected(document.error());
    }
    return deserialize(*document);
}

fieldlens::Result<AnalysisResult> merge_results(std::span<const AnalysisResult> results)
{
    if (results.empty()) {
        return std::unexpected(Error::make("NothingToMerge", "No analysis results to merge"));
    }

    // Process in timestamp order so later documents overwrite earlier ones.
    // ISO-8601 UTC timestamps compare correctly as text.
    std::vector<const AnalysisResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& result : results) {
        ordered.push_back(&result);
    }
    std::ranges::stable_sort(ordered, {}, [](const AnalysisResult* r) { return r->timestamp; });

    AnalysisResult merged{.version = kResultVersion, .timestamp = {}, .call_graph = {}};
    for (const AnalysisResult* result : ordered) {
        if (result->version != kResultVersion) {
            return std::unexpected(Error::make(
                "UnsupportedVersion",
                std::format("Cannot merge document version '{}' (expected '{}')", result->version,
                            kResultVersion)));
        }
        merged.timestamp = result->timestamp;
        for (const auto& [aggregate, analysis] : result->call_graph) {
            auto& target = merged.call_graph[aggregate];
            for (const auto& [method_key, method] : analysis.methods) {
                auto& target_method = target.methods[method_key];
                for (const auto& [call_key, call] : method.calls) {
                    target_method.calls.insert_or_assign(call_key, call);
                }
            }
        }
    }
    return merged;
}

std::vector<std::string> validate_result(const AnalysisResult& result)
{
    std::vector<std::string> problems;
    if (result.version != kResultVersion) {
        problems.push_back(
            std::format("version is '{}', expected '{}'", result.version, kResultVersion));
    }
    if (result.timestamp.empty()) {
        problems.emplace_back("timestamp is empty");
    }
    for (const auto& [aggregate, analysis] : result.call_graph) {
        if (aggregate.empty()) {
            problems.emplace_back("callGraph has an empty aggregate root name");
        }
        for (const auto& [method_key, method] : analysis.methods) {
            if (method.calls.empty()) {
                problems.push_back(std::format("{} / {}: no call sites", aggregate, method_key));
            }
            for (const auto& [call_key, call] : method.calls) {
                const std::string where = std::format("{} / {} / {}", aggregate, method_key, call_key);
                if (call.aggregate_root != aggregate) {
                    problems.push_back(std::format("{}: aggregateRoot is '{}'", where,
                                                   call.aggregate_root));
                }
                if (call.repository_method + call.repository_method_descriptor != method_key) {
                    problems.push_back(std::format("{}: repository method '{}{}' does not match key",
                                                   where, call.repository_method,
                                                   call.repository_method_descriptor));
                }
                if (!call_key.starts_with(std::format("{}.{}+", call.method_class, call.method))) {
                    problems.push_back(std::format("{}: caller {}.{} does not match key", where,
                                                   call.method_class, call.method));
                }
                for (const auto& called : call.called_methods) {
                    for (const auto& field : called.required_fields) {
                        if (!call.required_fields.contains(field)) {
                            problems.push_back(std::format(
                                "{}: field '{}' of {} missing from requiredFields", where, field,
                                called.method));
                        }
                    }
                }
            }
        }
    }
    return problems;
}

AnalysisStatistics compute_statistics(const AnalysisResult& result)
{
    AnalysisStatistics stats;
    std::set<std::string> distinct_fields;
    stats.aggregate_roots = result.call_graph.size();
    for (const auto& [aggregate, analysis] : result.call_graph) {
        stats.repository_methods += analysis.methods.size();
        std::size_t& per_aggregate = stats.call_sites_per_aggregate[aggregate];
        for (const auto& [_, method] : analysis.methods) {
            stats.call_sites += method.calls.size();
            per_aggregate += method.calls.size();
            for (const auto& entry : method.calls) {
                const CallSiteAnalysis& call = entry.second;
                stats.called_aggregate_methods += call.called_methods.size();
                for (const auto& field : call.required_fields) {
                    const std::string qualified = std::format("{}.{}", aggregate, field);
                    distinct_fields.insert(qualified);
                    ++stats.field_usage[qualified];
                }
            }
        }
    }
    stats.distinct_required_fields = distinct_fields.size();
    return stats;
}

nlohmann::json to_json(const AnalysisStatistics& statistics)
{
    return nlohmann::json{
        {"aggregate_roots",          statistics.aggregate_roots         },
        {"repository_methods",       statistics.repository_methods      },
        {"call_sites",               statistics.call_sites              },
        {"called_aggregate_methods", statistics.called_aggregate_methods},
        {"distinct_required_fields", statistics.distinct_required_fields},
        {"call_sites_per_aggregate", statistics.call_sites_per_aggregate},
        {"field_usage",              statistics.field_usage             }
    };
}

}  // namespace fieldlens::store
