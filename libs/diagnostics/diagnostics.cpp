/**
 * @file diagnostics.cpp
 * @brief Diagnostic formatting, accumulation and build failure policy
 */

#include "fieldlens/diagnostics.hpp"

#include "fieldlens/print.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace fieldlens::diag {

std::string_view kind_name(DiagnosticKind kind)
{
    switch (kind) {
        case DiagnosticKind::kInstructionReadError:
            return "InstructionReadError";
        case DiagnosticKind::kClassificationError:
            return "ClassificationError";
        case DiagnosticKind::kRepositoryAmbiguityWarning:
            return "RepositoryAmbiguityWarning";
        case DiagnosticKind::kPropagationDepthExceeded:
            return "PropagationDepthExceeded";
        case DiagnosticKind::kPropagationCycleDetected:
            return "PropagationCycleDetected";
        case DiagnosticKind::kSerializationError:
            return "SerializationError";
        case DiagnosticKind::kOutputWriteError:
            return "OutputWriteError";
        case DiagnosticKind::kConfigurationError:
            return "ConfigurationError";
        case DiagnosticKind::kCallSiteKeyCollision:
            return "CallSiteKeyCollision";
    }
    return "Unknown";
}

std::string_view severity_name(Severity severity)
{
    switch (severity) {
        case Severity::kInfo:
            return "INFO";
        case Severity::kWarning:
            return "WARNING";
        case Severity::kError:
            return "ERROR";
    }
    return "UNKNOWN";
}

Severity default_severity(DiagnosticKind kind)
{
    switch (kind) {
        case DiagnosticKind::kRepositoryAmbiguityWarning:
            return Severity::kInfo;
        case DiagnosticKind::kInstructionReadError:
        case DiagnosticKind::kClassificationError:
        case DiagnosticKind::kPropagationDepthExceeded:
        case DiagnosticKind::kPropagationCycleDetected:
        case DiagnosticKind::kCallSiteKeyCollision:
            return Severity::kWarning;
        case DiagnosticKind::kSerializationError:
        case DiagnosticKind::kOutputWriteError:
        case DiagnosticKind::kConfigurationError:
            return Severity::kError;
    }
    return Severity::kWarning;
}

Diagnostic make_diagnostic(DiagnosticKind kind,
                           std::string message,
                           std::optional<std::string> class_name,
                           std::optional<std::string> element,
                           std::optional<Error> cause)
{
    return Diagnostic{.kind = kind,
                      .severity = default_severity(kind),
                      .message = std::move(message),
                      .class_name = std::move(class_name),
                      .element = std::move(element),
                      .cause = std::move(cause)};
}

std::string format_diagnostic(const Diagnostic& diagnostic)
{
    std::string location;
    if (diagnostic.class_name && diagnostic.element) {
        location = std::format(" in {}.{}", *diagnostic.class_name, *diagnostic.element);
    } else if (diagnostic.class_name) {
        location = " in " + *diagnostic.class_name;
    } else if (diagnostic.element) {
        location = " in " + *diagnostic.element;
    }

    std::string text = std::format("[fieldlens] {}{}: {}", severity_name(diagnostic.severity),
                                   location, diagnostic.message);
    if (diagnostic.cause) {
        text += std::format(" ({}: {})", diagnostic.cause->code, diagnostic.cause->message);
    }
    return text;
}

void DiagnosticSink::report(Diagnostic diagnostic)
{
    m_items.push_back(std::move(diagnostic));
}

void DiagnosticSink::report(DiagnosticKind kind,
                            std::string message,
                            std::optional<std::string> class_name,
                            std::optional<std::string> element)
{
    m_items.push_back(
        make_diagnostic(kind, std::move(message), std::move(class_name), std::move(element)));
}

void DiagnosticSink::absorb(DiagnosticSink&& other)
{
    m_items.insert(m_items.end(), std::make_move_iterator(other.m_items.begin()),
                   std::make_move_iterator(other.m_items.end()));
    other.m_items.clear();
}

std::size_t DiagnosticSink::count(DiagnosticKind kind) const
{
    return static_cast<std::size_t>(
        std::ranges::count(m_items, kind, &Diagnostic::kind));
}

std::vector<Diagnostic> DiagnosticSink::take()
{
    std::vector<Diagnostic> items = std::move(m_items);
    m_items.clear();
    return items;
}

bool should_fail(std::span<const Diagnostic> diagnostics, bool fail_on_error)
{
    if (!fail_on_error) {
        return false;
    }
    return std::ranges::any_of(diagnostics, [](const Diagnostic& d) {
        return d.kind == DiagnosticKind::kConfigurationError
               || d.kind == DiagnosticKind::kSerializationError
               || d.kind == DiagnosticKind::kOutputWriteError;
    });
}

void emit(std::span<const Diagnostic> diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        std::println(stderr, "{}", format_diagnostic(diagnostic));
    }
}

nlohmann::json to_json(std::span<const Diagnostic> diagnostics)
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto& d : diagnostics) {
        nlohmann::json item = {
            {"kind",     std::string(kind_name(d.kind))        },
            {"severity", std::string(severity_name(d.severity))},
            {"message",  d.message                }
        };
        if (d.class_name) {
            item["class"] = *d.class_name;
        }
        if (d.element) {
            item["element"] = *d.element;
        }
        if (d.cause) {
            item["cause"] = {
                {"code",    d.cause->code   },
                {"message", d.cause->message}
            };
        }
        items.push_back(std::move(item));
    }
    return items;
}

}  // namespace fieldlens::diag
