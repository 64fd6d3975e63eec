/**
 * @file SourceStore.cpp
 * @brief Implementation of SourceStore.
 */

#include "infrastructure/SourceStore.hpp"
#include "domain/DocumentNaming.hpp"
#include "domain/Entity.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/FolderSnapshot.hpp"

namespace fs = std::filesystem;

namespace loopbinder::infrastructure {

SourceStore::SourceStore(fs::path directory, std::string documentExtension)
    : m_directory(std::move(directory)), m_extension(domain::ToLower(std::move(documentExtension))) {
    for (const auto& entry : FolderSnapshot::Capture(m_directory).files()) {
        m_files.push_back({domain::ToLower(entry.name), entry.path});
    }
}

fs::path SourceStore::locate(const std::string& reference) const {
    const std::string wanted = domain::ToLower(domain::Trim(reference));
    if (wanted.empty()) {
        throw domain::LookupError("empty document reference");
    }

    for (const auto& file : m_files) {
        if (file.lowerName == wanted) return file.path;
    }

    const std::string marker = "(" + wanted + ")";
    for (const auto& file : m_files) {
        if (fs::path(file.lowerName).extension().string() != m_extension) continue;
        if (file.lowerName.find(marker) != std::string::npos) return file.path;
    }

    throw domain::LookupError("source document '" + reference + "' not found in " + m_directory.string());
}

} // namespace loopbinder::infrastructure
