#include "Virtualization/inspect/ResourceInfo.hpp"
#include "System/Logger.hpp"

void reportLookupFailure(std::string_view kind, const std::string& name, const LookupFailure& failure) {
    if (failure.kind == LookupFailure::Kind::Malformed) {
        VRLOG_DEBUG("{} '{}' treated as absent: {}", kind, name, failure.reason);
    } else {
        VRLOG_TRACE("{} '{}' not found", kind, name);
    }
}
