/**
 * @file property_access.cpp
 * @brief Property access classifier and accessor-call converter
 */

#include "property_access.hpp"

#include "fieldlens/common.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace fieldlens::analyzer {

namespace {

[[nodiscard]] std::optional<std::string> bean_property(std::string_view method_name,
                                                       std::string_view prefix)
{
    if (!method_name.starts_with(prefix) || method_name.size() == prefix.size()) {
        return std::nullopt;
    }
    std::string_view rest = method_name.substr(prefix.size());
    if (std::isupper(static_cast<unsigned char>(rest.front())) == 0) {
        return std::nullopt;
    }
    std::string property(rest);
    property.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(property.front())));
    if (!common::is_valid_property_name(property)) {
        return std::nullopt;
    }
    return property;
}

[[nodiscard]] std::optional<std::string> synthetic_accessor(std::string_view method_name,
                                                            std::string_view prefix)
{
    if (!method_name.starts_with(prefix) || !method_name.ends_with(">")) {
        return std::nullopt;
    }
    std::string_view property = method_name.substr(prefix.size(),
                                                   method_name.size() - prefix.size() - 1);
    if (!common::is_valid_property_name(property)) {
        return std::nullopt;
    }
    return std::string(property);
}

/**
 * @brief Collects facts for one method and freezes them in build()
 */
class MethodFactsBuilder
{
public:
    explicit MethodFactsBuilder(MethodId method)
        : m_method(std::move(method))
    {}

    void add_access(PropertyAccess access)
    {
        if (std::ranges::find(m_accesses, access) == m_accesses.end()) {
            m_accesses.push_back(std::move(access));
        }
    }

    void add_call(CallInstruction call) { m_calls.push_back(std::move(call)); }

    void mark_line(int line)
    {
        if (line <= 0) {
            return;
        }
        if (!m_first_line) {
            m_first_line = line;
        }
        m_last_line = line;
    }

    [[nodiscard]] std::optional<int> current_line() const { return m_last_line; }

    [[nodiscard]] MethodFacts build() &&
    {
        std::optional<SourceSpan> span;
        if (m_first_line && m_last_line) {
            span = SourceSpan{.start_line = *m_first_line, .end_line = *m_last_line};
        }
        return MethodFacts{.method = std::move(m_method),
                           .accesses = std::move(m_accesses),
                           .calls = std::move(m_calls),
                           .span = span};
    }

private:
    MethodId m_method;
    std::vector<PropertyAccess> m_accesses;
    std::vector<CallInstruction> m_calls;
    std::optional<int> m_first_line;
    std::optional<int> m_last_line;
};

}  // namespace

std::optional<PropertyConversion> convert_call_to_property(std::string_view method_name,
                                                           std::size_t arg_count)
{
    if (auto property = synthetic_accessor(method_name, "<set-")) {
        return PropertyConversion{.property_name = std::move(*property), .kind = AccessKind::kSet};
    }
    if (auto property = synthetic_accessor(method_name, "<get-")) {
        return PropertyConversion{.property_name = std::move(*property), .kind = AccessKind::kGet};
    }
    if (arg_count == 0) {
        for (std::string_view prefix : {"get", "is"}) {
            if (auto property = bean_property(method_name, prefix)) {
                return PropertyConversion{.property_name = std::move(*property),
                                          .kind = AccessKind::kGet};
            }
        }
    }
    if (arg_count == 1) {
        if (auto property = bean_property(method_name, "set")) {
            return PropertyConversion{.property_name = std::move(*property),
                                      .kind = AccessKind::kSet};
        }
    }
    return std::nullopt;
}

MethodFacts PropertyAccessClassifier::classify(std::string_view enclosing_class,
                                               const stream::MethodBody& body,
                                               diag::DiagnosticSink& sink) const
{
    const std::string class_name(enclosing_class);
    const std::string element = body.name + body.descriptor;
    MethodFactsBuilder builder(
        MethodId{.owner_class = class_name, .name = body.name, .descriptor = body.descriptor});

    auto skip = [&sink, &class_name, &element](std::size_t index, std::string reason) {
        sink.report(diag::DiagnosticKind::kClassificationError,
                    std::format("skipped event #{}: {}", index, reason), class_name, element);
    };

    for (std::size_t index = 0; index < body.events.size(); ++index) {
        const stream::Event& event = body.events[index];
        switch (event.kind) {
            case stream::EventKind::kLine:
                builder.mark_line(event.line);
                break;
            case stream::EventKind::kBranch:
            case stream::EventKind::kBranchEnd:
                break;
            case stream::EventKind::kFieldRead:
            case stream::EventKind::kFieldWrite: {
                const std::string owner = common::to_qualified_name(event.owner);
                if (!common::is_valid_qualified_name(owner)) {
                    skip(index, std::format("malformed field owner '{}'", event.owner));
                    break;
                }
                if (event.name.empty()) {
                    skip(index, "field instruction without a field name");
                    break;
                }
                if (owner != class_name) {
                    break;
                }
                builder.add_access(PropertyAccess{
                    .property_name = event.name,
                    .kind = event.kind == stream::EventKind::kFieldRead ? AccessKind::kGet
                                                                        : AccessKind::kSet,
                    .owner_class = owner,
                    .via_accessor_call = false});
                break;
            }
            case stream::EventKind::kCall: {
                const std::string owner = common::to_qualified_name(event.owner);
                if (!common::is_valid_qualified_name(owner)) {
                    skip(index, std::format("malformed call owner '{}'", event.owner));
                    break;
                }
                if (event.name.empty()) {
                    skip(index, "call without a method name");
                    break;
                }
                std::size_t arg_count = 0;
                std::string descriptor;
                if (event.descriptor) {
                    auto args = common::parse_descriptor_arguments(*event.descriptor);
                    if (!args) {
                        skip(index, args.error().message);
                        break;
                    }
                    descriptor = *event.descriptor;
                    arg_count = event.arg_types ? event.arg_types->size() : args->size();
                } else if (event.arg_types) {
                    // Without a descriptor the argument list still identifies the overload.
                    descriptor = "(";
                    for (const auto& arg : *event.arg_types) {
                        descriptor += arg;
                    }
                    descriptor += ")";
                    arg_count = event.arg_types->size();
                } else {
                    skip(index, std::format("call to {}.{} has no descriptor", owner, event.name));
                    break;
                }

                if (auto conversion = convert_call_to_property(event.name, arg_count)) {
                    builder.add_access(PropertyAccess{.property_name = conversion->property_name,
                                                      .kind = conversion->kind,
                                                      .owner_class = owner,
                                                      .via_accessor_call = true});
                }
                builder.add_call(CallInstruction{
                    .callee = MethodId{.owner_class = owner,
                                       .name = event.name,
                                       .descriptor = std::move(descriptor)},
                    .arg_count = arg_count,
                    .line = builder.current_line()});
                break;
            }
            case stream::EventKind::kUnknown:
                skip(index, std::format("unknown event kind '{}'", event.raw_kind));
                break;
        }
    }
    return std::move(builder).build();
}

}  // namespace fieldlens::analyzer
