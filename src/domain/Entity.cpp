/**
 * @file Entity.cpp
 * @brief Implementation of entity helpers.
 */

#include "domain/Entity.hpp"
#include <algorithm>
#include <cctype>

namespace loopbinder::domain {

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string MakeFolderName(const std::string& loopNo, const std::string& systemNo) {
    return Trim(loopNo) + "_" + Trim(systemNo);
}

EntityStatus StatusFromString(const std::string& value) {
    std::string upper = Trim(value);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return std::toupper(c); });
    if (upper == "OK") return EntityStatus::Ok;
    if (upper == "MISSING") return EntityStatus::Missing;
    return EntityStatus::Unknown;
}

} // namespace loopbinder::domain
