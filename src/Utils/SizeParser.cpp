#include "Utils/SizeParser.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

std::uint64_t unitMultiplier(char unit) {
    switch (std::toupper(static_cast<unsigned char>(unit))) {
        case 'B': return 1ULL;
        case 'K': return 1024ULL;
        case 'M': return 1024ULL * 1024;
        case 'G': return 1024ULL * 1024 * 1024;
        case 'T': return 1024ULL * 1024 * 1024 * 1024;
        default:  return 0;
    }
}

} // namespace

std::uint64_t parseSize(std::string_view text) {
    std::string size(text);
    while (!size.empty() && std::isspace(static_cast<unsigned char>(size.back()))) size.pop_back();
    while (!size.empty() && std::isspace(static_cast<unsigned char>(size.front()))) size.erase(size.begin());
    if (size.empty()) throw InvalidInputException("Invalid size: empty value");

    std::uint64_t multiplier = 1;
    std::string number = size;
    if (!std::isdigit(static_cast<unsigned char>(size.back()))) {
        multiplier = unitMultiplier(size.back());
        if (multiplier == 0) throw InvalidInputException("Invalid size unit in '" + size + "'");
        number = size.substr(0, size.size() - 1);
    }
    if (number.empty()) throw InvalidInputException("Invalid size: '" + size + "'");

    for (char c : number) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') {
            throw InvalidInputException("Invalid size: '" + size + "'");
        }
    }

    const auto tooLarge = [&] { return InvalidInputException("Size too large: '" + size + "'"); };

    if (number.find('.') == std::string::npos) {
        std::uint64_t value = 0;
        try {
            value = std::stoull(number);
        } catch (const std::out_of_range&) {
            throw tooLarge();
        } catch (const std::exception&) {
            throw InvalidInputException("Invalid size: '" + size + "'");
        }
        if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) throw tooLarge();
        return value * multiplier;
    }

    double value = 0.0;
    try {
        value = std::stod(number);
    } catch (const std::exception&) {
        throw InvalidInputException("Invalid size: '" + size + "'");
    }
    const double bytes = std::floor(value * static_cast<double>(multiplier));
    // 2^64, the first double past the uint64_t range
    if (!(bytes < 18446744073709551616.0)) throw tooLarge();
    return static_cast<std::uint64_t>(bytes);
}
