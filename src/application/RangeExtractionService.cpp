/**
 * @file RangeExtractionService.cpp
 * @brief Implementation of RangeExtractionService.
 */

#include "application/RangeExtractionService.hpp"
#include "application/CandidateTableService.hpp"
#include "domain/PipelineErrors.hpp"
#include <set>

namespace fs = std::filesystem;

namespace loopbinder::application {

RangeExtractionService::RangeExtractionService(RunContext& context,
                                               const infrastructure::CandidateTableRepository& repository,
                                               int masterPageCount)
    : m_context(context), m_repository(repository), m_masterPageCount(masterPageCount) {}

fs::path RangeExtractionService::PartialPath(const fs::path& finalPath) {
    return finalPath.parent_path() / ("." + finalPath.filename().string() + ".part");
}

int RangeExtractionService::processFolder(const fs::path& folder) {
    auto table = CandidateTableService::LoadFor(m_context, m_repository, folder, "[P3]");
    if (!table) return 0;

    std::set<int> pages;
    for (std::size_t r = 0; r < table->rows.size(); ++r) {
        for (int page : table->rows[r].pages) {
            if (page >= 1 && page <= m_masterPageCount) {
                pages.insert(page);
                continue;
            }
            domain::FormatIssue issue;
            issue.kind = domain::FormatIssue::Kind::BadValue;
            issue.column = infrastructure::CandidateTableRepository::kPagesColumn;
            issue.value = std::to_string(page);
            m_context.log.error("[P3] " + folder.filename().string() + ": " + issue.describe() +
                                " for " + table->rows[r].code + ", master has " +
                                std::to_string(m_masterPageCount) + " pages");
        }
    }

    int written = 0;
    for (int page : pages) {
        if (extractOne(folder, page)) ++written;
    }
    if (written > 0) {
        m_context.log.action("[P3] Extracted " + std::to_string(written) + " page(s) into " +
                             folder.filename().string());
    }
    return written;
}

bool RangeExtractionService::extractOne(const fs::path& folder, int page) {
    const fs::path target = folder / (std::to_string(page) + m_context.config.naming.documentExtension);
    if (fs::exists(target)) return false;

    const fs::path partial = PartialPath(target);
    try {
        m_context.engine.extractPage(m_context.config.masterDocument, page, partial);
        fs::rename(partial, target);
    } catch (const domain::PipelineError& e) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        m_context.log.error("[P3] " + folder.filename().string() + " page " + std::to_string(page) + ": " + e.what());
        return false;
    } catch (const fs::filesystem_error& e) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        m_context.log.error("[P3] " + folder.filename().string() + " page " + std::to_string(page) + ": " + e.what());
        return false;
    }
    ++m_context.summary.pagesExtracted;
    return true;
}

} // namespace loopbinder::application
