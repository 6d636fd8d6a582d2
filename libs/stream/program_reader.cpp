/**
 * @file program_reader.cpp
 * @brief program.v1 document reading and the in-memory instruction source
 */

#include "fieldlens/program.hpp"

#include "fieldlens/json_fields.hpp"
#include "fieldlens/schema_validate.hpp"
#include "fieldlens/version.hpp"

#include <format>
#include <utility>

namespace fieldlens::stream {

namespace {

using json::JsonFieldContext;

struct EventKindEntry
{
    EventKind kind;
    std::string_view name;
};

constexpr EventKindEntry kEventKinds[] = {
    {EventKind::kLine,       "line"       },
    {EventKind::kFieldRead,  "field_read" },
    {EventKind::kFieldWrite, "field_write"},
    {EventKind::kCall,       "call"       },
    {EventKind::kBranch,     "branch"     },
    {EventKind::kBranchEnd,  "branch_end" },
};

/// Empty when the key is missing or not a string
[[nodiscard]] std::string string_member(const nlohmann::json& j, std::string_view key)
{
    auto it = j.find(std::string(key));
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

/**
 * @brief Lenient event parse: shape problems are left for the classifier
 */
[[nodiscard]] Event event_from_json(const nlohmann::json& j)
{
    Event event;
    if (!j.is_object()) {
        event.raw_kind = j.dump();
        return event;
    }
    if (auto it = j.find("kind"); it != j.end() && !it->is_string()) {
        event.raw_kind = it->dump();
    } else {
        event.raw_kind = string_member(j, "kind");
    }
    event.kind = parse_event_kind(event.raw_kind);
    event.owner = string_member(j, "owner");
    event.name = string_member(j, "name");
    if (auto it = j.find("descriptor"); it != j.end() && it->is_string()) {
        event.descriptor = it->get<std::string>();
    }
    if (auto it = j.find("value_type"); it != j.end() && it->is_string()) {
        event.value_type = it->get<std::string>();
    }
    if (auto it = j.find("arg_types"); it != j.end() && it->is_array()) {
        std::vector<std::string> args;
        for (const auto& arg : *it) {
            args.push_back(arg.is_string() ? arg.get<std::string>() : arg.dump());
        }
        event.arg_types = std::move(args);
    }
    if (auto it = j.find("line"); it != j.end() && it->is_number_integer()) {
        event.line = it->get<int>();
    }
    return event;
}

[[nodiscard]] fieldlens::Result<MethodBody> method_from_json(const nlohmann::json& j,
                                                             std::string_view class_name)
{
    const std::string context = std::format("method of {}", class_name);
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "Expected object for " + context));
    }
    MethodBody method;
    auto name = json::require_string(JsonFieldContext{.obj = &j, .key = "name", .context = context});
    if (!name) {
        return std::unexpected(name.error());
    }
    method.name = std::move(*name);
    auto descriptor =
        json::require_string(JsonFieldContext{.obj = &j, .key = "descriptor", .context = context});
    if (!descriptor) {
        return std::unexpected(descriptor.error());
    }
    method.descriptor = std::move(*descriptor);

    auto modifiers =
        json::optional_string_array(JsonFieldContext{.obj = &j, .key = "modifiers", .context = context});
    if (!modifiers) {
        return std::unexpected(modifiers.error());
    }
    method.modifiers = modifiers->value_or(std::vector<std::string>{});

    if (j.contains("events")) {
        auto events =
            json::require_array(JsonFieldContext{.obj = &j, .key = "events", .context = context});
        if (!events) {
            return std::unexpected(events.error());
        }
        method.events.reserve((*events)->size());
        for (const auto& event : **events) {
            method.events.push_back(event_from_json(event));
        }
    }
    return method;
}

[[nodiscard]] fieldlens::Result<Annotation> annotation_from_json(const nlohmann::json& j,
                                                                 std::string_view context)
{
    if (j.is_string()) {
        return Annotation{.name = j.get<std::string>(), .arguments = {}};
    }
    Annotation annotation;
    auto name = json::require_string(JsonFieldContext{.obj = &j, .key = "name", .context = context});
    if (!name) {
        return std::unexpected(name.error());
    }
    annotation.name = std::move(*name);
    if (auto it = j.find("arguments"); it != j.end()) {
        if (!it->is_object()) {
            return std::unexpected(Error::make(
                "InvalidFieldType", std::format("Expected object field 'arguments' in {}", context)));
        }
        for (const auto& [key, value] : it->items()) {
            annotation.arguments.emplace(key, value.is_string() ? value.get<std::string>()
                                                                : value.dump());
        }
    }
    return annotation;
}

}  // namespace

std::string_view event_kind_name(EventKind kind)
{
    for (const auto& entry : kEventKinds) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

EventKind parse_event_kind(std::string_view name)
{
    for (const auto& entry : kEventKinds) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return EventKind::kUnknown;
}

Event line_event(int line)
{
    return Event{.kind = EventKind::kLine, .line = line, .raw_kind = "line"};
}

Event field_read(std::string owner, std::string name)
{
    return Event{.kind = EventKind::kFieldRead,
                 .owner = std::move(owner),
                 .name = std::move(name),
                 .raw_kind = "field_read"};
}

Event field_write(std::string owner, std::string name, std::string value_type)
{
    Event event{.kind = EventKind::kFieldWrite,
                .owner = std::move(owner),
                .name = std::move(name),
                .raw_kind = "field_write"};
    if (!value_type.empty()) {
        event.value_type = std::move(value_type);
    }
    return event;
}

Event call_event(std::string owner,
                 std::string name,
                 std::string descriptor,
                 std::optional<std::vector<std::string>> arg_types)
{
    return Event{.kind = EventKind::kCall,
                 .owner = std::move(owner),
                 .name = std::move(name),
                 .descriptor = std::move(descriptor),
                 .arg_types = std::move(arg_types),
                 .raw_kind = "call"};
}

Event branch_event()
{
    return Event{.kind = EventKind::kBranch, .raw_kind = "branch"};
}

Event branch_end_event()
{
    return Event{.kind = EventKind::kBranchEnd, .raw_kind = "branch_end"};
}

nlohmann::json to_json(const Event& event)
{
    nlohmann::json j = {
        {"kind", event.kind == EventKind::kUnknown ? event.raw_kind
                                                   : std::string(event_kind_name(event.kind))}
    };
    switch (event.kind) {
        case EventKind::kLine:
            j["line"] = event.line;
            break;
        case EventKind::kFieldRead:
            j["owner"] = event.owner;
            j["name"] = event.name;
            break;
        case EventKind::kFieldWrite:
            j["owner"] = event.owner;
            j["name"] = event.name;
            if (event.value_type) {
                j["value_type"] = *event.value_type;
            }
            break;
        case EventKind::kCall:
            j["owner"] = event.owner;
            j["name"] = event.name;
            if (event.descriptor) {
                j["descriptor"] = *event.descriptor;
            }
            if (event.arg_types) {
                j["arg_types"] = *event.arg_types;
            }
            break;
        case EventKind::kBranch:
        case EventKind::kBranchEnd:
        case EventKind::kUnknown:
            break;
    }
    return j;
}

nlohmann::json to_json(const MethodBody& method)
{
    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : method.events) {
        events.push_back(to_json(event));
    }
    return nlohmann::json{
        {"name",       method.name      },
        {"descriptor", method.descriptor},
        {"modifiers",  method.modifiers },
        {"events",     std::move(events)}
    };
}

nlohmann::json to_json(const ClassUnit& unit)
{
    nlohmann::json annotations = nlohmann::json::array();
    for (const auto& annotation : unit.annotations) {
        annotations.push_back({
            {"name",      annotation.name     },
            {"arguments", annotation.arguments}
        });
    }
    nlohmann::json methods = nlohmann::json::array();
    for (const auto& method : unit.methods) {
        methods.push_back(to_json(method));
    }
    nlohmann::json j = {
        {"name",         unit.name              },
        {"modifiers",    unit.modifiers         },
        {"is_interface", unit.is_interface      },
        {"interfaces",   unit.interfaces        },
        {"annotations",  std::move(annotations) },
        {"methods",      std::move(methods)     }
    };
    if (unit.super_class) {
        j["super_class"] = *unit.super_class;
    }
    if (unit.generic_signature) {
        j["generic_signature"] = *unit.generic_signature;
    }
    return j;
}

fieldlens::Result<ClassUnit> class_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "Class record must be an object"));
    }
    ClassUnit unit;
    auto name = json::require_string(JsonFieldContext{.obj = &j, .key = "name", .context = "class"});
    if (!name) {
        return std::unexpected(name.error());
    }
    unit.name = common::to_qualified_name(*name);
    const std::string context = "class " + unit.name;

    auto modifiers =
        json::optional_string_array(JsonFieldContext{.obj = &j, .key = "modifiers", .context = context});
    if (!modifiers) {
        return std::unexpected(modifiers.error());
    }
    unit.modifiers = modifiers->value_or(std::vector<std::string>{});

    auto is_interface =
        json::optional_bool(JsonFieldContext{.obj = &j, .key = "is_interface", .context = context});
    if (!is_interface) {
        return std::unexpected(is_interface.error());
    }
    unit.is_interface = is_interface->value_or(false);

    auto super_class =
        json::optional_string(JsonFieldContext{.obj = &j, .key = "super_class", .context = context});
    if (!super_class) {
        return std::unexpected(super_class.error());
    }
    if (*super_class) {
        unit.super_class = common::to_qualified_name(**super_class);
    }

    auto interfaces =
        json::optional_string_array(JsonFieldContext{.obj = &j, .key = "interfaces", .context = context});
    if (!interfaces) {
        return std::unexpected(interfaces.error());
    }
    for (const auto& iface : interfaces->value_or(std::vector<std::string>{})) {
        unit.interfaces.push_back(common::to_qualified_name(iface));
    }

    auto signature = json::optional_string(
        JsonFieldContext{.obj = &j, .key = "generic_signature", .context = context});
    if (!signature) {
        return std::unexpected(signature.error());
    }
    unit.generic_signature = std::move(*signature);

    if (j.contains("annotations")) {
        auto annotations =
            json::require_array(JsonFieldContext{.obj = &j, .key = "annotations", .context = context});
        if (!annotations) {
            return std::unexpected(annotations.error());
        }
        for (const auto& item : **annotations) {
            auto annotation = annotation_from_json(item, context);
            if (!annotation) {
                return std::unexpected(annotation.error());
            }
            unit.annotations.push_back(std::move(*annotation));
        }
    }

    if (j.contains("methods")) {
        auto methods =
            json::require_array(JsonFieldContext{.obj = &j, .key = "methods", .context = context});
        if (!methods) {
            return std::unexpected(methods.error());
        }
        for (const auto& item : **methods) {
            auto method = method_from_json(item, unit.name);
            if (!method) {
                return std::unexpected(method.error());
            }
            unit.methods.push_back(std::move(*method));
        }
    }
    return unit;
}

// ----------------------------------------------------------------------------
// InMemorySource
// ----------------------------------------------------------------------------

InMemorySource::InMemorySource(std::vector<ClassUnit> classes,
                               std::vector<std::string> aggregate_roots)
    : m_classes(std::move(classes))
    , m_aggregate_roots(std::move(aggregate_roots))
{}

std::vector<std::string> InMemorySource::class_names() const
{
    std::vector<std::string> names;
    names.reserve(m_classes.size());
    for (const auto& unit : m_classes) {
        names.push_back(unit.name);
    }
    return names;
}

fieldlens::Result<ClassUnit> InMemorySource::load_class(std::size_t index) const
{
    if (index >= m_classes.size()) {
        return std::unexpected(Error::make(
            "ClassIndexOutOfRange",
            std::format("Class index {} out of range ({} classes)", index, m_classes.size())));
    }
    return m_classes[index];
}

std::vector<std::string> InMemorySource::declared_aggregate_roots() const
{
    return m_aggregate_roots;
}

// ----------------------------------------------------------------------------
// ProgramDocumentSource
// ----------------------------------------------------------------------------

ProgramDocumentSource::ProgramDocumentSource(std::vector<nlohmann::json> records,
                                             std::vector<std::string> names,
                                             std::vector<std::string> aggregate_roots)
    : m_records(std::move(records))
    , m_names(std::move(names))
    , m_aggregate_roots(std::move(aggregate_roots))
{}

fieldlens::Result<ProgramDocumentSource> ProgramDocumentSource::from_json(nlohmann::json document)
{
    if (!document.is_object()) {
        return std::unexpected(
            Error::make("InvalidProgramDocument", "Program document must be a JSON object"));
    }
    constexpr std::string_view kContext = "program document";
    auto version = json::require_string(
        JsonFieldContext{.obj = &document, .key = "schema_version", .context = kContext});
    if (!version) {
        return std::unexpected(version.error());
    }
    if (*version != kProgramSchemaVersion) {
        return std::unexpected(Error::make(
            "UnsupportedSchemaVersion",
            std::format("Expected schema_version '{}', got '{}'", kProgramSchemaVersion, *version)));
    }

    auto roots = json::optional_string_array(
        JsonFieldContext{.obj = &document, .key = "aggregate_roots", .context = kContext});
    if (!roots) {
        return std::unexpected(roots.error());
    }
    std::vector<std::string> aggregate_roots;
    for (const auto& root : roots->value_or(std::vector<std::string>{})) {
        aggregate_roots.push_back(common::to_qualified_name(root));
    }

    auto classes =
        json::require_array(JsonFieldContext{.obj = &document, .key = "classes", .context = kContext});
    if (!classes) {
        return std::unexpected(classes.error());
    }

    std::vector<nlohmann::json> records;
    std::vector<std::string> names;
    records.reserve((*classes)->size());
    names.reserve((*classes)->size());
    for (const auto& record : **classes) {
        std::string name = "<unnamed>";
        if (record.is_object()) {
            if (auto it = record.find("name"); it != record.end() && it->is_string()) {
                name = common::to_qualified_name(it->get<std::string>());
            }
        }
        names.push_back(std::move(name));
        records.push_back(record);
    }
    return ProgramDocumentSource(std::move(records), std::move(names), std::move(aggregate_roots));
}

std::vector<std::string> ProgramDocumentSource::class_names() const
{
    return m_names;
}

fieldlens::Result<ClassUnit> ProgramDocumentSource::load_class(std::size_t index) const
{
    if (index >= m_records.size()) {
        return std::unexpected(Error::make(
            "ClassIndexOutOfRange",
            std::format("Class index {} out of range ({} classes)", index, m_records.size())));
    }
    return class_from_json(m_records[index]);
}

std::vector<std::string> ProgramDocumentSource::declared_aggregate_roots() const
{
    return m_aggregate_roots;
}

fieldlens::Result<ProgramDocumentSource>
read_program_document(const std::string& path, const std::optional<std::string>& schema_dir)
{
    auto document = json::read_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (schema_dir) {
        if (auto valid =
                common::validate_json(*document, common::schema_file(*schema_dir, "program.v1"));
            !valid) {
            return std::unexpected(valid.error());
        }
    }
    return ProgramDocumentSource::from_json(std::move(*document));
}

}  // namespace fieldlens::stream
