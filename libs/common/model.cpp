/**
 * @file model.cpp
 * @brief Key formatting for the call analysis document
 */

#include "fieldlens/model.hpp"

#include <format>

namespace fieldlens {

std::string call_site_key(const MethodId& caller, const std::optional<SourceSpan>& span)
{
    if (!span) {
        return std::format("{}.{}+unknown", caller.owner_class, caller.name);
    }
    return std::format("{}.{}+{}-{}", caller.owner_class, caller.name, span->start_line,
                       span->end_line);
}

std::string repository_method_key(const MethodId& repository_method)
{
    return repository_method.name + repository_method.descriptor;
}

}  // namespace fieldlens
