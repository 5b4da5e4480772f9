#pragma once
#include <string>
#include <string_view>

class MacAddress {
public:
    // prefix is "xx:xx:xx"; the remaining three octets are random.
    [[nodiscard]] static std::string generate(std::string_view prefix = "52:54:00");

    // Six hex pairs separated by ':' or '-'.
    [[nodiscard]] static bool isValid(std::string_view mac) noexcept;

    // Lower-case, ':' separated. Input must be valid.
    [[nodiscard]] static std::string normalize(std::string_view mac);
};
