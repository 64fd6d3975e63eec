/**
 * @file RedundancyCleanupService.cpp
 * @brief Implementation of RedundancyCleanupService.
 */

#include "application/RedundancyCleanupService.hpp"
#include "application/CandidateTableService.hpp"
#include "domain/DocumentNaming.hpp"
#include "infrastructure/FolderSnapshot.hpp"

namespace fs = std::filesystem;

namespace loopbinder::application {

RedundancyCleanupService::RedundancyCleanupService(RunContext& context,
                                                   const infrastructure::CandidateTableRepository& repository)
    : m_context(context), m_repository(repository) {}

int RedundancyCleanupService::processFolder(const fs::path& folder) {
    auto table = CandidateTableService::LoadFor(m_context, m_repository, folder, "[P5]");
    if (!table) return 0;

    const auto& naming = m_context.config.naming;
    int removed = 0;
    for (const auto& file : infrastructure::FolderSnapshot::Capture(folder).files()) {
        if (naming.classify(file.name) != domain::DocumentRole::SourceOriginal) continue;
        auto code = domain::ExtractContentCode(file.name);
        if (!code || table->contains(*code)) continue;

        std::error_code ec;
        fs::remove(file.path, ec);
        if (ec) {
            m_context.log.error("[P5] Could not delete " + file.name + " in " + folder.filename().string() +
                                ": " + ec.message());
            continue;
        }
        ++removed;
        ++m_context.summary.documentsRemoved;
        m_context.log.action("[P5] Deleted redundant " + file.name + " in " + folder.filename().string());
    }
    return removed;
}

} // namespace loopbinder::application
