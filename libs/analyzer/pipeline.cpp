/**
 * @file pipeline.cpp
 * @brief Analyzer pipeline: parallel per-class phase, then whole-program phase
 */

#include "fieldlens/analyzer.hpp"

#include "call_graph.hpp"
#include "class_registry.hpp"
#include "field_propagator.hpp"
#include "property_access.hpp"
#include "repository_identifier.hpp"

#include "fieldlens/version.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <mutex>
#include <set>
#include <thread>
#include <tuple>
#include <utility>

namespace fieldlens::analyzer {

namespace {

/**
 * @brief Phase 1 output for one class; each worker writes only its own slot
 */
struct ClassOutcome
{
    std::optional<stream::ClassUnit> header;  ///< Class without method bodies
    std::optional<ClassFacts> facts;
    diag::DiagnosticSink sink;
};

[[nodiscard]] std::size_t worker_count(int configured, std::size_t classes)
{
    std::size_t count = configured > 0 ? static_cast<std::size_t>(configured)
                                       : static_cast<std::size_t>(std::thread::hardware_concurrency());
    if (count == 0) {
        count = 1;
    }
    return std::max<std::size_t>(1, std::min(count, classes));
}

void analyze_class(const stream::InstructionSource& source,
                   std::size_t index,
                   const std::string& name,
                   ClassOutcome& outcome)
{
    auto unit = source.load_class(index);
    if (!unit) {
        outcome.sink.report(diag::make_diagnostic(diag::DiagnosticKind::kInstructionReadError,
                                                  "class skipped: " + unit.error().message, name,
                                                  std::nullopt, unit.error()));
        return;
    }

    const PropertyAccessClassifier classifier;
    ClassFacts facts{.name = unit->name, .is_interface = unit->is_interface, .methods = {}};
    facts.methods.reserve(unit->methods.size());
    for (const auto& method : unit->methods) {
        facts.methods.push_back(classifier.classify(unit->name, method, outcome.sink));
    }
    unit->methods.clear();
    outcome.header = std::move(*unit);
    outcome.facts = std::move(facts);
}

/**
 * @brief Run analyze_class over every class on a fixed pool of threads
 *
 * Workers claim class indices from a shared atomic counter. Joining the
 * workers is the phase barrier. A std::exception thrown for one class only
 * skips that class.
 */
[[nodiscard]] std::vector<ClassOutcome> run_class_phase(const stream::InstructionSource& source,
                                                        const std::vector<std::string>& names,
                                                        int jobs)
{
    std::vector<ClassOutcome> outcomes(names.size());
    std::atomic<std::size_t> next_index{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        try {
            while (true) {
                const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
                if (index >= names.size()) {
                    return;
                }
                try {
                    analyze_class(source, index, names[index], outcomes[index]);
                } catch (const std::exception& ex) {
                    // A class that cannot be read is skipped; the rest of the batch continues.
                    ClassOutcome& outcome = outcomes[index];
                    outcome.header.reset();
                    outcome.facts.reset();
                    outcome.sink.report(diag::make_diagnostic(
                        diag::DiagnosticKind::kInstructionReadError,
                        std::format("class skipped: {}", ex.what()), names[index], std::nullopt,
                        std::nullopt));
                }
            }
        } catch (...) {
            std::scoped_lock lock(failure_mutex);
            if (!failure) {
                failure = std::current_exception();
            }
            next_index.store(names.size(), std::memory_order_relaxed);
        }
    };

    const std::size_t count = worker_count(jobs, names.size());
    if (count <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    return outcomes;
}

[[nodiscard]] CallSiteAnalysis to_call_site_analysis(const FieldRequirement& requirement)
{
    const RepositoryCallSite& site = requirement.site;
    CallSiteAnalysis analysis{.method_class = site.caller_method.owner_class,
                              .method = site.caller_method.name,
                              .method_descriptor = site.caller_method.descriptor,
                              .repository = site.repository_class,
                              .repository_method = site.repository_method.name,
                              .repository_method_descriptor = site.repository_method.descriptor,
                              .aggregate_root = site.aggregate_root_class,
                              .called_methods = {},
                              .required_fields = requirement.required_fields};
    for (const auto& called : requirement.called_methods) {
        analysis.called_methods.push_back(CalledAggregateMethod{
            .method = called.method.name,
            .descriptor = called.method.descriptor,
            .required_fields = called.required_fields});
    }
    return analysis;
}

/// Fold a call site whose key is already taken into the recorded one
void merge_call_site(CallSiteAnalysis& recorded, const CallSiteAnalysis& other)
{
    recorded.required_fields.insert(other.required_fields.begin(), other.required_fields.end());
    for (const auto& called : other.called_methods) {
        auto same = [&called](const CalledAggregateMethod& m) {
            return m.method == called.method && m.descriptor == called.descriptor;
        };
        if (auto it = std::ranges::find_if(recorded.called_methods, same);
            it != recorded.called_methods.end()) {
            it->required_fields.insert(called.required_fields.begin(), called.required_fields.end());
        } else {
            recorded.called_methods.push_back(called);
        }
    }
    std::ranges::sort(recorded.called_methods, [](const auto& lhs, const auto& rhs) {
        return std::tie(lhs.method, lhs.descriptor) < std::tie(rhs.method, rhs.descriptor);
    });
}

/// Drop exact repeats (e.g. the same cycle seen from several call sites), keeping first order
[[nodiscard]] std::vector<diag::Diagnostic> without_repeats(std::vector<diag::Diagnostic> items)
{
    std::vector<diag::Diagnostic> unique;
    unique.reserve(items.size());
    for (auto& item : items) {
        if (std::ranges::find(unique, item) == unique.end()) {
            unique.push_back(std::move(item));
        }
    }
    return unique;
}

}  // namespace

std::string current_time_utc()
{
    const auto now = std::chrono::system_clock::now();
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(now));
}

Analyzer::Analyzer(AnalyzerConfig config)
    : m_config(std::move(config))
{}

fieldlens::Result<AnalyzeOutput> Analyzer::analyze(const stream::InstructionSource& source,
                                                   const AnalyzeOptions& options) const
{
    if (auto valid = config::validate(m_config); !valid) {
        return std::unexpected(valid.error());
    }

    const std::vector<std::string> names = source.class_names();
    std::vector<ClassOutcome> outcomes = run_class_phase(source, names, m_config.jobs);

    // Phase 2: single thread from here on.
    diag::DiagnosticSink sink;
    AnalysisSummary summary;
    summary.classes_total = names.size();

    std::set<std::string> aggregate_roots;
    for (const auto& root : source.declared_aggregate_roots()) {
        aggregate_roots.insert(root);
    }
    for (const auto& outcome : outcomes) {
        if (outcome.header && has_annotation(*outcome.header, m_config.aggregate_root_annotation)) {
            aggregate_roots.insert(outcome.header->name);
        }
    }

    ClassRegistry registry;
    registry.set_aggregate_roots(aggregate_roots);
    const RepositoryIdentifier identifier(m_config.repository, aggregate_roots);
    std::vector<RepositoryMapping> mappings;
    for (auto& outcome : outcomes) {
        sink.absorb(std::move(outcome.sink));
        if (!outcome.facts) {
            ++summary.classes_skipped;
            continue;
        }
        if (auto mapping = identifier.identify(*outcome.header, sink)) {
            mappings.push_back(std::move(*mapping));
        }
        summary.methods_analyzed += outcome.facts->methods.size();
        registry.add(std::move(*outcome.facts));
    }
    std::ranges::sort(mappings, {}, &RepositoryMapping::repository_class);

    CallGraphBuilder builder(mappings);
    for (const auto& [_, facts] : registry.classes()) {
        builder.add_class(facts);
    }
    const CallGraph graph = std::move(builder).build();

    const FieldRequirementPropagator propagator(graph, registry, m_config.field_access);
    AnalysisResult result{.version = kResultVersion,
                          .timestamp = options.timestamp.value_or(current_time_utc()),
                          .call_graph = {}};
    for (const auto& site : graph.repository_call_sites()) {
        FieldRequirement requirement = propagator.propagate(site, sink);
        CallSiteAnalysis analysis = to_call_site_analysis(requirement);
        auto& calls = result.call_graph[site.aggregate_root_class]
                          .methods[repository_method_key(site.repository_method)]
                          .calls;
        const std::string key = call_site_key(site.caller_method, site.source_span);
        auto [it, inserted] = calls.try_emplace(key, analysis);
        if (!inserted) {
            // Overloads without line information share a key; keep the union of their fields.
            sink.report(diag::DiagnosticKind::kCallSiteKeyCollision,
                        std::format("call sites {}{} and {}{} share key {}; required fields merged",
                                    it->second.method, it->second.method_descriptor,
                                    analysis.method, analysis.method_descriptor, key),
                        site.caller_method.owner_class,
                        site.caller_method.name + site.caller_method.descriptor);
            merge_call_site(it->second, analysis);
        }
    }

    summary.call_edges = graph.edges().size();
    summary.repository_call_sites = graph.repository_call_sites().size();
    summary.call_cycles = graph.find_cycles().size();
    summary.aggregate_roots.assign(aggregate_roots.begin(), aggregate_roots.end());
    summary.repository_mappings = std::move(mappings);

    return AnalyzeOutput{.result = std::move(result),
                         .diagnostics = without_repeats(sink.take()),
                         .summary = std::move(summary)};
}

}  // namespace fieldlens::analyzer
