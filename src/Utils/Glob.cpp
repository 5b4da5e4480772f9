#include "Utils/Glob.hpp"
#include <fnmatch.h>
#include <unordered_set>

bool Glob::matches(const std::string& pattern, const std::string& name) noexcept {
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

std::vector<std::string> Glob::filter(const std::vector<std::string>& names, const std::string& pattern) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (!matches(pattern, name)) continue;
        if (seen.insert(name).second) out.push_back(name);
    }
    return out;
}

bool Glob::hasWildcard(std::string_view pattern) noexcept {
    return pattern.find_first_of("*?[") != std::string_view::npos;
}
