/**
 * @file ReferenceIndex.cpp
 * @brief Implementation of ReferenceIndex.
 */

#include "infrastructure/ReferenceIndex.hpp"
#include "domain/DocumentNaming.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace loopbinder::infrastructure {

ReferenceIndex ReferenceIndex::Parse(const std::string& text) {
    ReferenceIndex index;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string document;
        std::string page;
        if (!(fields >> document >> page)) {
            if (!document.empty()) ++index.m_ignoredLines;
            continue;
        }
        bool digits = std::all_of(page.begin(), page.end(), [](unsigned char c){ return std::isdigit(c); });
        if (!digits || page.size() > 9) {
            ++index.m_ignoredLines;
            continue;
        }
        index.m_entries.push_back({domain::ToLower(document), std::stoi(page)});
    }
    return index;
}

ReferenceIndex ReferenceIndex::Load(const std::filesystem::path& path, const PersistenceService& persistence) {
    return Parse(persistence.readText(path));
}

std::vector<int> ReferenceIndex::pagesFor(const std::string& code) const {
    const std::string needle = domain::ToLower(code);
    std::vector<int> pages;
    if (needle.empty()) return pages;
    for (const auto& entry : m_entries) {
        if (entry.document.find(needle) != std::string::npos) pages.push_back(entry.page);
    }
    std::sort(pages.begin(), pages.end());
    pages.erase(std::unique(pages.begin(), pages.end()), pages.end());
    return pages;
}

} // namespace loopbinder::infrastructure
