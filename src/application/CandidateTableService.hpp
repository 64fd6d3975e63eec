/**
 * @file CandidateTableService.hpp
 * @brief Derives and maintains each folder's candidate table.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include "application/RunContext.hpp"
#include "domain/CandidateTable.hpp"
#include "infrastructure/CandidateTableRepository.hpp"
#include "infrastructure/FolderSnapshot.hpp"
#include "infrastructure/ReferenceIndex.hpp"

namespace loopbinder::application {

class CandidateTableService {
public:
    CandidateTableService(RunContext& context,
                          const infrastructure::ReferenceIndex& index,
                          const infrastructure::CandidateTableRepository& repository);

    /**
     * @brief Appends rows for codes present in the folder but not yet in its table.
     * @return true if the table was (re)written.
     */
    bool processFolder(const std::filesystem::path& folder);

    /** @brief Content codes of the source-original documents in a snapshot. */
    static std::set<std::string> CodesInFolder(const infrastructure::FolderSnapshot& snapshot,
                                               const domain::NamingConvention& naming);

    /**
     * @brief Loads a folder's table, logging every recoverable row issue.
     * @return nullopt when the folder has no table.
     * @throws domain::FormatError when a required column is missing.
     */
    static std::optional<domain::CandidateTable> LoadFor(RunContext& context,
                                                         const infrastructure::CandidateTableRepository& repository,
                                                         const std::filesystem::path& folder,
                                                         const std::string& tag);

private:
    RunContext& m_context;
    const infrastructure::ReferenceIndex& m_index;
    const infrastructure::CandidateTableRepository& m_repository;
};

} // namespace loopbinder::application
