/**
 * @file RedundancyCleanupService.hpp
 * @brief Removes source-original documents the candidate table no longer references.
 */

#pragma once
#include <filesystem>
#include "application/RunContext.hpp"
#include "infrastructure/CandidateTableRepository.hpp"

namespace loopbinder::application {

/**
 * @class RedundancyCleanupService
 * @brief Extracted-range files, backups and the merged output are never touched.
 *
 * Folders without a candidate table are left alone.
 */
class RedundancyCleanupService {
public:
    RedundancyCleanupService(RunContext& context, const infrastructure::CandidateTableRepository& repository);

    /** @return Number of documents removed from this folder. */
    int processFolder(const std::filesystem::path& folder);

private:
    RunContext& m_context;
    const infrastructure::CandidateTableRepository& m_repository;
};

} // namespace loopbinder::application
