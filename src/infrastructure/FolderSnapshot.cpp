/**
 * @file FolderSnapshot.cpp
 * @brief Implementation of FolderSnapshot.
 */

#include "infrastructure/FolderSnapshot.hpp"
#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;

namespace loopbinder::infrastructure {

FolderSnapshot FolderSnapshot::Capture(const fs::path& directory) {
    FolderSnapshot snapshot;
    snapshot.m_directory = directory;

    for (const auto& entry : fs::directory_iterator(directory)) {
        FolderEntry item;
        item.name = entry.path().filename().string();
        if (item.name.empty() || item.name.front() == '.') continue;

        item.path = entry.path();
        std::error_code ec;
        item.isDirectory = entry.is_directory(ec);
        if (!item.isDirectory && entry.is_regular_file(ec)) {
            item.sizeBytes = entry.file_size(ec);
        }
        snapshot.m_entries.push_back(std::move(item));
    }

    std::sort(snapshot.m_entries.begin(), snapshot.m_entries.end(),
              [](const FolderEntry& a, const FolderEntry& b) { return a.name < b.name; });
    return snapshot;
}

std::vector<FolderEntry> FolderSnapshot::files() const {
    std::vector<FolderEntry> result;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(result),
                 [](const FolderEntry& e) { return !e.isDirectory; });
    return result;
}

std::vector<FolderEntry> FolderSnapshot::subdirectories() const {
    std::vector<FolderEntry> result;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(result),
                 [](const FolderEntry& e) { return e.isDirectory; });
    return result;
}

bool FolderSnapshot::contains(const std::string& name) const {
    return std::any_of(m_entries.begin(), m_entries.end(), [&](const FolderEntry& e) { return e.name == name; });
}

} // namespace loopbinder::infrastructure
