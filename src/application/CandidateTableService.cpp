/**
 * @file CandidateTableService.cpp
 * @brief Implementation of CandidateTableService.
 */

#include "application/CandidateTableService.hpp"
#include "domain/DocumentNaming.hpp"

namespace fs = std::filesystem;

namespace loopbinder::application {

CandidateTableService::CandidateTableService(RunContext& context,
                                             const infrastructure::ReferenceIndex& index,
                                             const infrastructure::CandidateTableRepository& repository)
    : m_context(context), m_index(index), m_repository(repository) {}

std::set<std::string> CandidateTableService::CodesInFolder(const infrastructure::FolderSnapshot& snapshot,
                                                           const domain::NamingConvention& naming) {
    std::set<std::string> codes;
    for (const auto& file : snapshot.files()) {
        if (naming.classify(file.name) != domain::DocumentRole::SourceOriginal) continue;
        if (auto code = domain::ExtractContentCode(file.name)) codes.insert(*code);
    }
    return codes;
}

std::optional<domain::CandidateTable> CandidateTableService::LoadFor(
    RunContext& context, const infrastructure::CandidateTableRepository& repository,
    const fs::path& folder, const std::string& tag) {
    auto table = repository.load(folder / context.config.naming.candidateTable);
    if (table) {
        for (const auto& issue : table->issues) {
            context.log.error(tag + " " + folder.filename().string() + ": " + issue.describe());
        }
    }
    return table;
}

bool CandidateTableService::processFolder(const fs::path& folder) {
    const auto& naming = m_context.config.naming;
    const auto snapshot = infrastructure::FolderSnapshot::Capture(folder);
    const auto codes = CodesInFolder(snapshot, naming);
    if (codes.empty()) return false;

    auto table = LoadFor(m_context, m_repository, folder, "[P2]").value_or(domain::CandidateTable{});

    int added = 0;
    for (const auto& code : codes) {
        if (table.contains(code)) continue;
        domain::CandidateRow row;
        row.code = code;
        row.pages = m_index.pagesFor(code);
        if (row.pages.empty()) {
            m_context.log.action("[P2] " + folder.filename().string() + ": no index pages for " + code);
        }
        table.rows.push_back(std::move(row));
        ++added;
    }
    if (added == 0) return false;

    m_repository.save(folder / naming.candidateTable, table);
    m_context.log.action("[P2] Updated " + naming.candidateTable + " in " + folder.filename().string() +
                         " (+" + std::to_string(added) + ")");
    return true;
}

} // namespace loopbinder::application
