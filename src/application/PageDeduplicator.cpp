/**
 * @file PageDeduplicator.cpp
 * @brief Implementation of PageDeduplicator.
 */

#include "application/PageDeduplicator.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace loopbinder::application {

PageDeduplicator::PageDeduplicator(domain::DocumentEngine& engine, const infrastructure::ContentHasher& hasher)
    : m_engine(engine), m_hasher(hasher) {}

DedupResult PageDeduplicator::run(const std::vector<fs::path>& orderedDocuments) const {
    DedupResult result;
    std::unordered_set<std::string> seen;

    for (const auto& document : orderedDocuments) {
        const auto contents = m_engine.pageContents(document);
        bool contributed = false;
        for (std::size_t i = 0; i < contents.size(); ++i) {
            if (!seen.insert(m_hasher.digest(contents[i])).second) {
                ++result.duplicatesSkipped;
                continue;
            }
            result.pages.push_back({document, static_cast<int>(i)});
            contributed = true;
        }
        if (!contributed) result.fullyDuplicated.push_back(document);
    }
    return result;
}

std::vector<fs::path> PageDeduplicator::OrderCandidates(const infrastructure::FolderSnapshot& snapshot,
                                                        const domain::NamingConvention& naming) {
    std::vector<std::pair<int, fs::path>> extracted;
    std::vector<std::pair<std::string, fs::path>> primary;
    std::vector<std::pair<std::string, fs::path>> backups;

    for (const auto& file : snapshot.files()) {
        switch (naming.classify(file.name)) {
            case domain::DocumentRole::ExtractedRange:
                extracted.emplace_back(domain::ParseExtractedPage(file.name).value_or(0), file.path);
                break;
            case domain::DocumentRole::SourceOriginal:
            case domain::DocumentRole::OtherDocument:
                primary.emplace_back(file.name, file.path);
                break;
            case domain::DocumentRole::BackupCopy:
                backups.emplace_back(file.name, file.path);
                break;
            case domain::DocumentRole::MergedOutput:
            case domain::DocumentRole::NotDocument:
                break;
        }
    }

    std::sort(extracted.begin(), extracted.end());
    std::sort(primary.begin(), primary.end());
    std::sort(backups.begin(), backups.end());

    std::vector<fs::path> ordered;
    ordered.reserve(extracted.size() + primary.size() + backups.size());
    for (auto& e : extracted) ordered.push_back(std::move(e.second));
    for (auto& p : primary) ordered.push_back(std::move(p.second));
    for (auto& b : backups) ordered.push_back(std::move(b.second));
    return ordered;
}

} // namespace loopbinder::application
