#pragma once
#include <cstdint>
#include <string_view>

/**
 * @brief Parses capacity strings such as "10G", "512M", "1.5T" or "4096".
 *
 * Suffixes are binary: K = 1024, M = 1024^2, G = 1024^3, T = 1024^4, B = 1.
 * Fractional values are truncated to whole bytes.
 *
 * @throws InvalidInputException on empty, negative or malformed input
 */
[[nodiscard]] std::uint64_t parseSize(std::string_view text);
