/**
 * @file BackupService.cpp
 * @brief Implementation of BackupService.
 */

#include "application/BackupService.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/FolderSnapshot.hpp"

namespace fs = std::filesystem;

namespace loopbinder::application {

BackupService::BackupService(RunContext& context) : m_context(context) {}

int BackupService::processFolder(const fs::path& folder) {
    const auto& naming = m_context.config.naming;
    int written = 0;

    for (const auto& file : infrastructure::FolderSnapshot::Capture(folder).files()) {
        if (naming.classify(file.name) != domain::DocumentRole::SourceOriginal) continue;

        const fs::path backup = folder / naming.backupNameFor(file.name);
        try {
            auto outcome = m_context.copier.copy(file.path, backup);
            if (!outcome.copied) continue;
            ++written;
            ++m_context.summary.backupsCreated;
            m_context.log.action("[P4] Backup " + folder.filename().string() + "/" + outcome.path.filename().string());
        } catch (const domain::PipelineError& e) {
            m_context.log.error("[P4] Backup of " + file.path.string() + " failed: " + e.what());
        } catch (const fs::filesystem_error& e) {
            m_context.log.error("[P4] Backup of " + file.path.string() + " failed: " + e.what());
        }
    }
    return written;
}

} // namespace loopbinder::application
