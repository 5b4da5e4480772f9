#include "Utils/MacAddress.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

std::string MacAddress::generate(std::string_view prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);
    std::ostringstream ss;
    ss << prefix << std::hex << std::setfill('0');
    for (int i = 0; i < 3; ++i) {
        ss << ":" << std::setw(2) << (dis(gen) & 0xFF);
    }
    return ss.str();
}

bool MacAddress::isValid(std::string_view mac) noexcept {
    if (mac.size() != 17) return false;
    const char sep = mac[2];
    if (sep != ':' && sep != '-') return false;
    for (std::size_t i = 0; i < mac.size(); ++i) {
        if (i % 3 == 2) {
            if (mac[i] != sep) return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(mac[i]))) {
            return false;
        }
    }
    return true;
}

std::string MacAddress::normalize(std::string_view mac) {
    std::string out(mac);
    std::replace(out.begin(), out.end(), '-', ':');
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
