/**
 * @file RangeExtractionService.hpp
 * @brief Cuts the pages a folder references out of the master document.
 */

#pragma once
#include <filesystem>
#include "application/RunContext.hpp"
#include "infrastructure/CandidateTableRepository.hpp"

namespace loopbinder::application {

/**
 * @class RangeExtractionService
 * @brief Writes one "<page>.pdf" per referenced master page.
 *
 * Pages already present are skipped. Each page is written to a hidden
 * ".<page>.pdf.part" file first and renamed once complete.
 */
class RangeExtractionService {
public:
    RangeExtractionService(RunContext& context,
                           const infrastructure::CandidateTableRepository& repository,
                           int masterPageCount);

    /** @return Number of pages written for this folder. */
    int processFolder(const std::filesystem::path& folder);

    static std::filesystem::path PartialPath(const std::filesystem::path& finalPath);

private:
    RunContext& m_context;
    const infrastructure::CandidateTableRepository& m_repository;
    int m_masterPageCount;

    bool extractOne(const std::filesystem::path& folder, int page);
};

} // namespace loopbinder::application
