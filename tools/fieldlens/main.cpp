/**
 * @file main.cpp
 * @brief fieldlens CLI entry point
 *
 * Commands:
 *   analyze   - Compute required fields for every repository call site
 *   query     - Look up required fields in a call analysis document
 *   validate  - Check a call analysis document
 *   merge     - Union several call analysis documents
 *   stats     - Summarize a call analysis document
 *   version   - Show version information
 */

#include "fieldlens/require_cpp23.hpp"

#include "fieldlens/analyzer.hpp"
#include "fieldlens/canonical_json.hpp"
#include "fieldlens/common.hpp"
#include "fieldlens/config.hpp"
#include "fieldlens/diagnostics.hpp"
#include "fieldlens/json_fields.hpp"
#include "fieldlens/print.hpp"
#include "fieldlens/program.hpp"
#include "fieldlens/query.hpp"
#include "fieldlens/schema_validate.hpp"
#include "fieldlens/store.hpp"
#include "fieldlens/version.hpp"

#include <charconv>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_version()
{
    std::println("fieldlens {} ({})", fieldlens::kVersion, fieldlens::kBuildId);
    std::println("  result document: {}", fieldlens::kResultVersion);
    std::println("  program schema:  {}", fieldlens::kProgramSchemaVersion);
    std::println("  config schema:   {}", fieldlens::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(fieldlens - field requirement analysis for DDD aggregate roots

Usage: fieldlens <command> [options]

Commands:
  analyze     Compute required fields for every repository call site
  query       Look up required fields for a caller
  validate    Check a call analysis document
  merge       Union several call analysis documents
  stats       Summarize a call analysis document
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'fieldlens <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: fieldlens analyze [options]

Compute required fields for every repository call site of a program document

Options:
  --input FILE, -i          Program document (program.v1) (required)
  --output FILE, -o         Output file (default: call-analysis.json)
  --config FILE             Analyzer configuration (config.v1)
  --jobs N, -j N            Number of worker threads (default: auto)
  --schema-dir DIR          Validate input, config and output against schemas in DIR
  --report FILE             Write diagnostics and a run summary as JSON
  --strict                  Exit non-zero on configuration/serialization/output errors
  --timestamp TEXT          Timestamp to record instead of the current time
  --quiet, -q               Do not print diagnostics
  --help, -h                Show this help

Output:
  <output> (call analysis document, version 1.0)
)");
}

void print_query_help()
{
    std::print(R"(Usage: fieldlens query [options]

Print the fields a caller needs loaded for an aggregate root

Options:
  --analysis FILE           Call analysis document (required)
  --aggregate CLASS         Aggregate root class (required)
  --caller-class CLASS      Calling class (required)
  --caller-method NAME      Calling method (required)
  --repository-method NAME  Repository method name, or name plus descriptor
  --line N                  Only call sites whose caller spans line N
  --help, -h                Show this help
)");
}

void print_validate_help()
{
    std::print(R"(Usage: fieldlens validate [options]

Check a call analysis document for structural consistency

Options:
  --analysis FILE           Call analysis document (required)
  --schema-dir DIR          Also validate against call_analysis.v1 in DIR
  --help, -h                Show this help
)");
}

void print_merge_help()
{
    std::print(R"(Usage: fieldlens merge [options]

Union several call analysis documents; the latest timestamp wins on conflicts

Options:
  --input FILE, -i          Document to merge (repeatable, required)
  --output FILE, -o         Merged document (required)
  --help, -h                Show this help
)");
}

void print_stats_help()
{
    std::print(R"(Usage: fieldlens stats [options]

Print statistics of a call analysis document as JSON

Options:
  --analysis FILE           Call analysis document (required)
  --help, -h                Show this help
)");
}

struct AnalyzeCliOptions
{
    std::string input;
    std::string output;
    std::optional<std::string> config;
    std::optional<int> jobs;
    std::optional<std::string> schema_dir;
    std::optional<std::string> report;
    std::optional<std::string> timestamp;
    bool strict;
    bool quiet;
    bool show_help;
};

struct QueryCliOptions
{
    std::string analysis;
    std::string aggregate;
    std::string caller_class;
    std::string caller_method;
    std::optional<std::string> repository_method;
    std::optional<int> line;
    bool show_help;
};

struct ValidateCliOptions
{
    std::string analysis;
    std::optional<std::string> schema_dir;
    bool show_help;
};

struct MergeCliOptions
{
    std::vector<std::string> inputs;
    std::string output;
    bool show_help;
};

struct StatsCliOptions
{
    std::string analysis;
    bool show_help;
};

[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> fieldlens::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(fieldlens::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] fieldlens::Result<int> parse_int_value(std::string_view value, std::string_view option)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(fieldlens::Error::make(
            "InvalidArgument",
            std::string("Invalid ") + std::string(option) + " value: " + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] fieldlens::Result<std::string> unknown_option(std::string_view arg)
{
    return std::unexpected(
        fieldlens::Error::make("UnknownOption", std::string("Unknown option: ") + std::string(arg)));
}

[[nodiscard]] fieldlens::Result<AnalyzeCliOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeCliOptions options{.input = std::string{},
                              .output = "call-analysis.json",
                              .config = std::nullopt,
                              .jobs = std::nullopt,
                              .schema_dir = std::nullopt,
                              .report = std::nullopt,
                              .timestamp = std::nullopt,
                              .strict = false,
                              .quiet = false,
                              .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--strict") {
            options.strict = true;
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
            continue;
        }

        auto value = read_option_value(args, idx, arg);
        if (arg == "--input" || arg == "-i") {
            if (!value) {
                return std::unexpected(value.error());
            }
            options.input = *value;
        } else if (arg == "--output" || arg == "-o") {
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
        } else if (arg == "--config") {
            if (!value) {
                return std::unexpected(value.error());
            }
            options.config = *value;
        } else if (arg == "--jobs" || arg == "-j") {
            if (!value) {
                return std::unexpected(value.error());
            }
            auto jobs = parse_int_value(*value, "--jobs");
            if (!jobs) {
                return std::unexpected(jobs.error());
            }
            options.jobs = *jobs;
        } else if (arg == "--schema-dir") {
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
        } else if (arg == "--report") {
            if (!value) {
                return std::unexpected(value.error());
            }
            options.report = *value;
        } else if (arg == "--timestamp") {
            if (!value) {
                return std::unexpected(value.error());
            }
            options.timestamp = *value;
        } else {
            return std::unexpected(unknown_option(arg).error());
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] fieldlens::Result<QueryCliOptions> parse_query_args(std::span<char*> args)
{
    QueryCliOptions options{.analysis = std::string{},
                            .aggregate = std::string{},
                            .caller_class = std::string{},
                            .caller_method = std::string{},
                            .repository_method = std::nullopt,
                            .line = std::nullopt,
                            .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--analysis") {
            options.analysis = *value;
        } else if (arg == "--aggregate") {
            options.aggregate = *value;
        } else if (arg == "--caller-class") {
            options.caller_class = *value;
        } else if (arg == "--caller-method") {
            options.caller_method = *value;
        } else if (arg == "--repository-method") {
            options.repository_method = *value;
        } else if (arg == "--line") {
            auto line = parse_int_value(*value, "--line");
            if (!line) {
                return std::unexpected(line.error());
            }
            options.line = *line;
        } else {
            return std::unexpected(unknown_option(arg).error());
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] fieldlens::Result<ValidateCliOptions> parse_validate_args(std::span<char*> args)
{
    ValidateCliOptions options{.analysis = std::string{}, .schema_dir = std::nullopt, .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--analysis") {
            options.analysis = *value;
        } else if (arg == "--schema-dir") {
            options.schema_dir = *value;
        } else {
            return std::unexpected(unknown_option(arg).error());
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] fieldlens::Result<MergeCliOptions> parse_merge_args(std::span<char*> args)
{
    MergeCliOptions options{.inputs = {}, .output = std::string{}, .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--input" || arg == "-i") {
            options.inputs.push_back(*value);
        } else if (arg == "--output" || arg == "-o") {
            options.output = *value;
        } else {
            return std::unexpected(unknown_option(arg).error());
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] fieldlens::Result<StatsCliOptions> parse_stats_args(std::span<char*> args)
{
    StatsCliOptions options{.analysis = std::string{}, .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--analysis") {
            options.analysis = *value;
        } else {
            return std::unexpected(unknown_option(arg).error());
        }
        ++idx;
    }
    return options;
}

[[nodiscard]] fieldlens::VoidResult write_text_file(const std::filesystem::path& path,
                                                    std::string_view text)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(fieldlens::Error::make(
                "OutputWriteFailed", "Failed to create directory: " + path.parent_path().string()));
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(fieldlens::Error::make(
            "OutputWriteFailed", "Failed to open output file: " + path.string()));
    }
    out << text << '\n';
    if (!out) {
        return std::unexpected(fieldlens::Error::make(
            "OutputWriteFailed", "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] nlohmann::json summary_to_json(const fieldlens::analyzer::AnalysisSummary& summary)
{
    nlohmann::json mappings = nlohmann::json::array();
    for (const auto& mapping : summary.repository_mappings) {
        mappings.push_back({
            {"repository",     mapping.repository_class                         },
            {"aggregate_root", mapping.aggregate_root_class                     },
            {"match",          std::string(fieldlens::match_kind_name(mapping.match_kind))}
        });
    }
    return nlohmann::json{
        {"classes_total",         summary.classes_total        },
        {"classes_skipped",       summary.classes_skipped      },
        {"methods_analyzed",      summary.methods_analyzed     },
        {"call_edges",            summary.call_edges           },
        {"repository_call_sites", summary.repository_call_sites},
        {"call_cycles",           summary.call_cycles          },
        {"aggregate_roots",       summary.aggregate_roots      },
        {"repository_mappings",   std::move(mappings)          }
    };
}

[[nodiscard]] int run_analyze(const AnalyzeCliOptions& options)
{
    fieldlens::diag::DiagnosticSink sink;

    fieldlens::AnalyzerConfig config;
    if (options.config) {
        auto loaded = options.schema_dir
                          ? fieldlens::config::load_config(*options.config, *options.schema_dir)
                          : fieldlens::json::read_file(*options.config)
                                .and_then([](const nlohmann::json& j) {
                                    return fieldlens::config::from_json(j);
                                });
        if (loaded) {
            config = std::move(*loaded);
        } else {
            sink.report(fieldlens::diag::make_diagnostic(
                fieldlens::diag::DiagnosticKind::kConfigurationError,
                "configuration rejected, using defaults", std::nullopt, *options.config,
                loaded.error()));
        }
    }
    if (options.jobs) {
        config.jobs = *options.jobs;
    }
    if (options.quiet) {
        config.quiet = true;
    }
    const bool fail_on_error = options.strict || config.fail_on_error;

    auto source = fieldlens::stream::read_program_document(options.input, options.schema_dir);
    if (!source) {
        std::println(stderr, "Error: cannot read program document {}: {}", options.input,
                     source.error().message);
        return 1;
    }

    const fieldlens::analyzer::Analyzer analyzer(config);
    auto output = analyzer.analyze(*source, fieldlens::analyzer::AnalyzeOptions{
                                                .timestamp = options.timestamp});
    if (!output) {
        std::println(stderr, "Error: analyze failed: {}", output.error().message);
        return 1;
    }
    for (auto& diagnostic : output->diagnostics) {
        sink.report(std::move(diagnostic));
    }

    bool written = false;
    const nlohmann::json document = fieldlens::store::serialize(output->result);
    fieldlens::VoidResult schema_check{};
    if (options.schema_dir) {
        schema_check = fieldlens::common::validate_json(
            document, fieldlens::common::schema_file(*options.schema_dir, "call_analysis.v1"));
    }
    if (!schema_check) {
        sink.report(fieldlens::diag::make_diagnostic(
            fieldlens::diag::DiagnosticKind::kSerializationError,
            "call analysis document failed schema validation", std::nullopt, options.output,
            schema_check.error()));
    } else if (auto write = fieldlens::store::write_result(output->result, options.output); !write) {
        sink.report(fieldlens::diag::make_diagnostic(
            write.error().code == "SerializationFailed"
                ? fieldlens::diag::DiagnosticKind::kSerializationError
                : fieldlens::diag::DiagnosticKind::kOutputWriteError,
            "call analysis document not written", std::nullopt, options.output, write.error()));
    } else {
        written = true;
    }

    const std::vector<fieldlens::diag::Diagnostic> diagnostics = sink.take();
    if (options.report) {
        const nlohmann::json report = {
            {"summary",     summary_to_json(output->summary)          },
            {"diagnostics", fieldlens::diag::to_json(diagnostics)     }
        };
        auto text = fieldlens::canonical::canonicalize(report, 2);
        auto write = text ? write_text_file(*options.report, *text)
                          : fieldlens::VoidResult{std::unexpected(text.error())};
        if (!write) {
            std::println(stderr, "Error: failed to write report: {}", write.error().message);
        }
    }
    if (!config.quiet) {
        fieldlens::diag::emit(diagnostics);
    }

    if (written) {
        std::println("[analyze] Wrote call analysis");
        std::println("  input: {}", options.input);
        std::println("  output: {}", options.output);
        std::println("  classes: {} ({} skipped)", output->summary.classes_total,
                     output->summary.classes_skipped);
        std::println("  repository call sites: {}", output->summary.repository_call_sites);
        std::println("  diagnostics: {}", diagnostics.size());
    }
    return fieldlens::diag::should_fail(diagnostics, fail_on_error) ? 1 : 0;
}

[[nodiscard]] int run_query(const QueryCliOptions& options)
{
    const fieldlens::query::FieldRequirementQuery query{std::filesystem::path(options.analysis)};
    if (!query.is_analysis_available()) {
        const auto error = query.load_error();
        std::println(stderr, "Warning: analysis not available: {}",
                     error ? error->message : std::string("unknown reason"));
    }
    const auto fields = query.get_required_fields(
        fieldlens::query::FieldQuery{.aggregate_root_class = options.aggregate,
                                     .caller_class = options.caller_class,
                                     .caller_method = options.caller_method,
                                     .repository_method = options.repository_method,
                                     .line = options.line});
    const nlohmann::json result(fields);
    std::println("{}", result.dump());
    return 0;
}

[[nodiscard]] int run_validate(const ValidateCliOptions& options)
{
    auto document = fieldlens::json::read_file(options.analysis);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return 1;
    }
    if (options.schema_dir) {
        if (auto valid = fieldlens::common::validate_json(
                *document, fieldlens::common::schema_file(*options.schema_dir, "call_analysis.v1"));
            !valid) {
            std::println(stderr, "Error: schema validation failed: {}", valid.error().message);
            return 1;
        }
    }
    auto result = fieldlens::store::deserialize(*document);
    if (!result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    const auto problems = fieldlens::store::validate_result(*result);
    for (const auto& problem : problems) {
        std::println(stderr, "  {}", problem);
    }
    if (!problems.empty()) {
        std::println(stderr, "Error: {} problem(s) in {}", problems.size(), options.analysis);
        return 1;
    }
    std::println("[validate] {} is consistent", options.analysis);
    return 0;
}

[[nodiscard]] int run_merge(const MergeCliOptions& options)
{
    std::vector<fieldlens::AnalysisResult> results;
    results.reserve(options.inputs.size());
    for (const auto& input : options.inputs) {
        auto result = fieldlens::store::read_result(input);
        if (!result) {
            std::println(stderr, "Error: {}: {}", input, result.error().message);
            return 1;
        }
        results.push_back(std::move(*result));
    }
    auto merged = fieldlens::store::merge_results(results);
    if (!merged) {
        std::println(stderr, "Error: merge failed: {}", merged.error().message);
        return 1;
    }
    if (auto write = fieldlens::store::write_result(*merged, options.output); !write) {
        std::println(stderr, "Error: {}", write.error().message);
        return 1;
    }
    std::println("[merge] Wrote {} ({} inputs)", options.output, options.inputs.size());
    return 0;
}

[[nodiscard]] int run_stats(const StatsCliOptions& options)
{
    auto result = fieldlens::store::read_result(options.analysis);
    if (!result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    auto text = fieldlens::canonical::canonicalize(
        fieldlens::store::to_json(fieldlens::store::compute_statistics(*result)), 2);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return 1;
    }
    std::println("{}", *text);
    return 0;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

int cmd_query(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_query_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_query_help();
        return 0;
    }
    if (options->analysis.empty() || options->aggregate.empty() || options->caller_class.empty()
        || options->caller_method.empty()) {
        std::println(stderr,
                     "Error: --analysis, --aggregate, --caller-class and --caller-method are required");
        print_query_help();
        return 1;
    }
    return run_query(*options);
}

int cmd_validate(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_validate_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_validate_help();
        return 0;
    }
    if (options->analysis.empty()) {
        std::println(stderr, "Error: --analysis is required");
        print_validate_help();
        return 1;
    }
    return run_validate(*options);
}

int cmd_merge(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_merge_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_merge_help();
        return 0;
    }
    if (options->inputs.empty() || options->output.empty()) {
        std::println(stderr, "Error: at least one --input and an --output are required");
        print_merge_help();
        return 1;
    }
    return run_merge(*options);
}

int cmd_stats(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_stats_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_stats_help();
        return 0;
    }
    if (options->analysis.empty()) {
        std::println(stderr, "Error: --analysis is required");
        print_stats_help();
        return 1;
    }
    return run_stats(*options);
}

int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];
        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }
        if (cmd == "query") {
            return cmd_query(sub_argc, sub_argv);
        }
        if (cmd == "validate") {
            return cmd_validate(sub_argc, sub_argv);
        }
        if (cmd == "merge") {
            return cmd_merge(sub_argc, sub_argv);
        }
        if (cmd == "stats") {
            return cmd_stats(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
