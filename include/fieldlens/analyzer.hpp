#pragma once

/**
 * @file analyzer.hpp
 * @brief Whole-program field requirement analysis pipeline
 *
 * Phase 1 runs per class on a fixed pool of worker threads: load the class,
 * classify every method body and identify repository candidates. After the
 * join, phase 2 resolves repositories, merges the per-class call graphs and
 * propagates field requirements for every repository call site.
 */

#include "fieldlens/config.hpp"
#include "fieldlens/diagnostics.hpp"
#include "fieldlens/model.hpp"
#include "fieldlens/program.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fieldlens::analyzer {

struct AnalysisSummary
{
    std::size_t classes_total = 0;
    std::size_t classes_skipped = 0;
    std::size_t methods_analyzed = 0;
    std::size_t call_edges = 0;
    std::size_t repository_call_sites = 0;
    std::size_t call_cycles = 0;
    std::vector<std::string> aggregate_roots;
    std::vector<RepositoryMapping> repository_mappings;
};

struct AnalyzeOutput
{
    AnalysisResult result;
    std::vector<diag::Diagnostic> diagnostics;
    AnalysisSummary summary;
};

struct AnalyzeOptions
{
    /// Timestamp written into the result; current UTC time when empty
    std::optional<std::string> timestamp;
};

class Analyzer
{
public:
    explicit Analyzer(AnalyzerConfig config);

    /**
     * Run the analysis over every class of `source`.
     *
     * Per-element problems (unreadable class, unclassifiable event, depth or
     * cycle truncation) are reported in AnalyzeOutput::diagnostics. Only an
     * unusable configuration returns an error.
     */
    [[nodiscard]] fieldlens::Result<AnalyzeOutput>
    analyze(const stream::InstructionSource& source, const AnalyzeOptions& options = {}) const;

    [[nodiscard]] const AnalyzerConfig& config() const { return m_config; }

private:
    AnalyzerConfig m_config;
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
[[nodiscard]] std::string current_time_utc();

}  // namespace fieldlens::analyzer
