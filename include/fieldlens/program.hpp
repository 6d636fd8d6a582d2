#pragma once

/**
 * @file program.hpp
 * @brief Instruction event stream: the compiled program as seen by the analyzer
 *
 * The analyzer never looks at bytecode or a compiler IR directly. It
 * consumes classes whose method bodies are flat sequences of events
 * (line markers, field reads/writes, calls, branch markers) delivered by an
 * InstructionSource.
 */

#include "fieldlens/common.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace fieldlens::stream {

enum class EventKind {
    kLine,
    kFieldRead,
    kFieldWrite,
    kCall,
    kBranch,
    kBranchEnd,
    kUnknown
};

[[nodiscard]] std::string_view event_kind_name(EventKind kind);
[[nodiscard]] EventKind parse_event_kind(std::string_view name);

/**
 * @brief One instruction-level event of a method body
 *
 * Which members are meaningful depends on `kind`:
 * - kLine: line
 * - kFieldRead: owner, name
 * - kFieldWrite: owner, name, value_type
 * - kCall: owner, name, descriptor, arg_types
 */
struct Event
{
    EventKind kind = EventKind::kUnknown;
    std::string owner;
    std::string name;
    std::optional<std::string> descriptor;
    std::optional<std::vector<std::string>> arg_types;
    std::optional<std::string> value_type;
    int line = 0;
    std::string raw_kind;  ///< Kind text as read, kept for diagnostics on kUnknown

    bool operator==(const Event&) const = default;
};

struct Annotation
{
    std::string name;
    std::map<std::string, std::string> arguments;

    bool operator==(const Annotation&) const = default;
};

struct MethodBody
{
    std::string name;
    std::string descriptor;
    std::vector<std::string> modifiers;
    std::vector<Event> events;

    bool operator==(const MethodBody&) const = default;
};

struct ClassUnit
{
    std::string name;
    std::vector<std::string> modifiers;
    bool is_interface = false;
    std::optional<std::string> super_class;
    std::vector<std::string> interfaces;
    std::optional<std::string> generic_signature;
    std::vector<Annotation> annotations;
    std::vector<MethodBody> methods;

    bool operator==(const ClassUnit&) const = default;
};

// Event constructors used by adapters and tests
[[nodiscard]] Event line_event(int line);
[[nodiscard]] Event field_read(std::string owner, std::string name);
[[nodiscard]] Event field_write(std::string owner, std::string name, std::string value_type = {});
[[nodiscard]] Event call_event(std::string owner,
                               std::string name,
                               std::string descriptor,
                               std::optional<std::vector<std::string>> arg_types = std::nullopt);
[[nodiscard]] Event branch_event();
[[nodiscard]] Event branch_end_event();

// JSON mapping of the program.v1 document
[[nodiscard]] nlohmann::json to_json(const Event& event);
[[nodiscard]] nlohmann::json to_json(const MethodBody& method);
[[nodiscard]] nlohmann::json to_json(const ClassUnit& unit);

/**
 * Parse one class record. Unknown event kinds are kept as kUnknown so the
 * classifier can report them against the method they belong to.
 */
[[nodiscard]] fieldlens::Result<ClassUnit> class_from_json(const nlohmann::json& j);

/**
 * @brief Source of class units for one analysis run
 */
class InstructionSource
{
public:
    virtual ~InstructionSource() = default;

    /// Names of every class this source can deliver, in a stable order
    [[nodiscard]] virtual std::vector<std::string> class_names() const = 0;

    /// Load one class; an error becomes an InstructionReadError for that class only
    [[nodiscard]] virtual fieldlens::Result<ClassUnit> load_class(std::size_t index) const = 0;

    /// Aggregate roots declared outside of class annotations
    [[nodiscard]] virtual std::vector<std::string> declared_aggregate_roots() const = 0;
};

/**
 * @brief InstructionSource over already constructed class units
 */
class InMemorySource final : public InstructionSource
{
public:
    explicit InMemorySource(std::vector<ClassUnit> classes,
                            std::vector<std::string> aggregate_roots = {});

    [[nodiscard]] std::vector<std::string> class_names() const override;
    [[nodiscard]] fieldlens::Result<ClassUnit> load_class(std::size_t index) const override;
    [[nodiscard]] std::vector<std::string> declared_aggregate_roots() const override;

private:
    std::vector<ClassUnit> m_classes;
    std::vector<std::string> m_aggregate_roots;
};

/**
 * @brief InstructionSource over a program.v1 JSON document
 *
 * Class records are parsed lazily in load_class() so a malformed record
 * only costs that class.
 */
class ProgramDocumentSource final : public InstructionSource
{
public:
    /// Check the document envelope (schema_version, classes array)
    [[nodiscard]] static fieldlens::Result<ProgramDocumentSource> from_json(nlohmann::json document);

    [[nodiscard]] std::vector<std::string> class_names() const override;
    [[nodiscard]] fieldlens::Result<ClassUnit> load_class(std::size_t index) const override;
    [[nodiscard]] std::vector<std::string> declared_aggregate_roots() const override;

private:
    ProgramDocumentSource(std::vector<nlohmann::json> records,
                          std::vector<std::string> names,
                          std::vector<std::string> aggregate_roots);

    std::vector<nlohmann::json> m_records;
    std::vector<std::string> m_names;
    std::vector<std::string> m_aggregate_roots;
};

/**
 * Read a program document from disk, optionally validating it against
 * program.v1.schema.json in `schema_dir`.
 */
[[nodiscard]] fieldlens::Result<ProgramDocumentSource>
read_program_document(const std::string& path, const std::optional<std::string>& schema_dir);

}  // namespace fieldlens::stream
