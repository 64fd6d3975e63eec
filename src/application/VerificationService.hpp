/**
 * @file VerificationService.hpp
 * @brief Final consistency pass over candidate tables, entities and folders.
 */

#pragma once
#include <filesystem>
#include "application/RunContext.hpp"
#include "domain/Entity.hpp"
#include "infrastructure/CandidateTableRepository.hpp"

namespace loopbinder::application {

class VerificationService {
public:
    VerificationService(RunContext& context, const infrastructure::CandidateTableRepository& repository);

    /**
     * @brief Marks each candidate row OK or MISSING from the documents present.
     * @return true if the table changed and was rewritten.
     */
    bool verifyFolder(const std::filesystem::path& folder);

    /** @brief Flags OK entities whose folder is missing or empty, then tallies statuses. */
    void verifyEntities(domain::EntityRegistry& entities);

    /** @brief Removes empty destination folders that no entity owns. */
    int removeOrphans(const domain::EntityRegistry& entities);

private:
    RunContext& m_context;
    const infrastructure::CandidateTableRepository& m_repository;
};

} // namespace loopbinder::application
