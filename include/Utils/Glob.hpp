#pragma once
#include <string>
#include <string_view>
#include <vector>

// Shell-style name matching: '*', '?' and bracket classes. No regex.
class Glob {
public:
    [[nodiscard]] static bool matches(const std::string& pattern, const std::string& name) noexcept;

    // Keeps the order of first appearance and drops duplicate names.
    [[nodiscard]] static std::vector<std::string> filter(const std::vector<std::string>& names,
                                                         const std::string& pattern);

    [[nodiscard]] static bool hasWildcard(std::string_view pattern) noexcept;
};
