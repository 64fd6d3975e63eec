/**
 * @file VerificationService.cpp
 * @brief Implementation of VerificationService.
 */

#include "application/VerificationService.hpp"
#include "application/CandidateTableService.hpp"
#include "infrastructure/FolderSnapshot.hpp"
#include <set>

namespace fs = std::filesystem;

namespace loopbinder::application {

VerificationService::VerificationService(RunContext& context,
                                         const infrastructure::CandidateTableRepository& repository)
    : m_context(context), m_repository(repository) {}

bool VerificationService::verifyFolder(const fs::path& folder) {
    auto table = CandidateTableService::LoadFor(m_context, m_repository, folder, "[P7]");
    if (!table) return false;

    const auto present = CandidateTableService::CodesInFolder(infrastructure::FolderSnapshot::Capture(folder),
                                                              m_context.config.naming);
    bool changed = false;
    for (auto& row : table->rows) {
        auto status = present.count(row.code) ? domain::EntityStatus::Ok : domain::EntityStatus::Missing;
        if (status != row.status) {
            row.status = status;
            changed = true;
        }
        if (status == domain::EntityStatus::Missing) {
            m_context.log.action("[P7] " + folder.filename().string() + ": " + row.code + " MISSING");
        }
    }
    if (changed) {
        m_repository.save(folder / m_context.config.naming.candidateTable, *table);
    }
    return changed;
}

void VerificationService::verifyEntities(domain::EntityRegistry& entities) {
    auto& summary = m_context.summary;
    summary.entitiesOk = 0;
    summary.entitiesMissing = 0;

    for (auto& entity : entities) {
        if (!entity.hasIdentity()) continue;
        if (entity.status == domain::EntityStatus::Ok) {
            const fs::path folder = m_context.folderPath(entity.folderName);
            std::error_code ec;
            const bool present = fs::is_directory(folder, ec) && !infrastructure::FolderSnapshot::Capture(folder).empty();
            if (!present) {
                entity.status = domain::EntityStatus::Missing;
                ++summary.openIssues;
                m_context.log.error("[P7] Open issue: folder " + entity.folderName + " of row " +
                                    std::to_string(entity.row) + " is empty or missing");
            }
        }
        if (entity.status == domain::EntityStatus::Ok) ++summary.entitiesOk;
        if (entity.status == domain::EntityStatus::Missing) ++summary.entitiesMissing;
    }
}

int VerificationService::removeOrphans(const domain::EntityRegistry& entities) {
    std::set<std::string> owned;
    for (const auto& entity : entities) {
        if (!entity.hasIdentity()) continue;
        owned.insert(entity.folderName);
        owned.insert(domain::Trim(entity.historyFolderName));
    }

    int removed = 0;
    for (const auto& dir : infrastructure::FolderSnapshot::Capture(m_context.config.destinationRoot).subdirectories()) {
        if (owned.count(dir.name)) continue;
        std::error_code ec;
        if (!fs::is_empty(dir.path, ec) || ec) continue;
        fs::remove(dir.path, ec);
        if (ec) {
            m_context.log.error("[P7] Could not remove orphan folder " + dir.name + ": " + ec.message());
            continue;
        }
        ++removed;
        ++m_context.summary.orphanFoldersRemoved;
        m_context.log.action("[P7] Removed orphan folder " + dir.name);
    }
    return removed;
}

} // namespace loopbinder::application
