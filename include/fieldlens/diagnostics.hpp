#pragma once

/**
 * @file diagnostics.hpp
 * @brief Analysis diagnostics: kinds, severities, accumulation and reporting
 *
 * Analysis never throws for per-element problems. Each phase records a
 * Diagnostic into a DiagnosticSink, skips the offending element and keeps
 * going; the final report is an immutable vector.
 */

#include "fieldlens/common.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace fieldlens::diag {

enum class DiagnosticKind {
    kInstructionReadError,
    kClassificationError,
    kRepositoryAmbiguityWarning,
    kPropagationDepthExceeded,
    kPropagationCycleDetected,
    kSerializationError,
    kOutputWriteError,
    kConfigurationError,
    kCallSiteKeyCollision  ///< Two call sites map to one document key
};

enum class Severity {
    kInfo,
    kWarning,
    kError
};

struct Diagnostic
{
    DiagnosticKind kind = DiagnosticKind::kClassificationError;
    Severity severity = Severity::kWarning;
    std::string message;
    std::optional<std::string> class_name;
    std::optional<std::string> element;  ///< Method, field or file the diagnostic is about
    std::optional<Error> cause;

    bool operator==(const Diagnostic&) const = default;
};

[[nodiscard]] std::string_view kind_name(DiagnosticKind kind);
[[nodiscard]] std::string_view severity_name(Severity severity);

/// Severity a kind is reported with unless overridden
[[nodiscard]] Severity default_severity(DiagnosticKind kind);

[[nodiscard]] Diagnostic make_diagnostic(DiagnosticKind kind,
                                         std::string message,
                                         std::optional<std::string> class_name = std::nullopt,
                                         std::optional<std::string> element = std::nullopt,
                                         std::optional<Error> cause = std::nullopt);

/**
 * "[fieldlens] WARNING in com.example.Order.confirm: message"
 */
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diagnostic);

/**
 * @brief Append-only collector owned by one phase (or one worker)
 */
class DiagnosticSink
{
public:
    void report(Diagnostic diagnostic);
    void report(DiagnosticKind kind,
                std::string message,
                std::optional<std::string> class_name = std::nullopt,
                std::optional<std::string> element = std::nullopt);

    /// Append everything another sink collected, keeping its order
    void absorb(DiagnosticSink&& other);

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return m_items; }
    [[nodiscard]] std::size_t count(DiagnosticKind kind) const;
    [[nodiscard]] bool empty() const { return m_items.empty(); }

    /// Move the collected diagnostics out, leaving the sink empty
    [[nodiscard]] std::vector<Diagnostic> take();

private:
    std::vector<Diagnostic> m_items;
};

/**
 * True when fail-on-error is set and the report holds a configuration,
 * serialization or output error. Other kinds never fail a build.
 */
[[nodiscard]] bool should_fail(std::span<const Diagnostic> diagnostics, bool fail_on_error);

/// Print every diagnostic to stderr in format_diagnostic() form
void emit(std::span<const Diagnostic> diagnostics);

/// Machine readable report for `analyze --report`
[[nodiscard]] nlohmann::json to_json(std::span<const Diagnostic> diagnostics);

}  // namespace fieldlens::diag
