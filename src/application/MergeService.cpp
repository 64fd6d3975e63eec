/**
 * @file MergeService.cpp
 * @brief Implementation of MergeService.
 */

#include "application/MergeService.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/FolderSnapshot.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;

namespace loopbinder::application {

MergeService::MergeService(RunContext& context, const infrastructure::MergeCacheStore& cache)
    : m_context(context), m_cache(cache), m_deduplicator(context.engine, context.hasher) {}

std::string MergeService::fingerprint(const fs::path& folder) const {
    auto inputs = PageDeduplicator::OrderCandidates(infrastructure::FolderSnapshot::Capture(folder),
                                                    m_context.config.naming);
    return m_context.hasher.setDigest(std::move(inputs));
}

MergeOutcome MergeService::processFolder(const fs::path& folder) {
    const std::string name = folder.filename().string();
    const auto inputs = PageDeduplicator::OrderCandidates(infrastructure::FolderSnapshot::Capture(folder),
                                                          m_context.config.naming);
    if (inputs.empty()) return MergeOutcome::NoInputs;

    const std::string folderFingerprint = m_context.hasher.setDigest(inputs);
    const fs::path output = folder / m_context.config.naming.mergedOutput;

    if (fs::exists(output) && m_cache.matches(folder, folderFingerprint)) {
        ++m_context.summary.mergesCached;
        m_context.log.action("[P6] " + name + ": unchanged, merge skipped");
        return MergeOutcome::Cached;
    }

    DedupResult dedup = m_deduplicator.run(inputs);
    for (const auto& skipped : dedup.fullyDuplicated) {
        m_context.log.action("[P6] " + name + ": " + skipped.filename().string() + " only repeats earlier pages, skipped");
    }
    if (dedup.pages.empty()) {
        throw domain::IoError(name + ": merge inputs contain no pages");
    }

    writeMerged(dedup.pages, output);
    m_cache.store(folder, folderFingerprint);

    ++m_context.summary.mergesWritten;
    m_context.log.action("[P6] " + name + ": wrote " + output.filename().string() + " (" +
                         std::to_string(dedup.pages.size()) + " pages, " +
                         std::to_string(dedup.duplicatesSkipped) + " duplicates skipped)");
    return MergeOutcome::Written;
}

void MergeService::writeMerged(const std::vector<domain::PageRef>& pages, const fs::path& output) {
    const fs::path temp = infrastructure::PersistenceService::TempPathFor(output);
    try {
        m_context.engine.assemble(pages, temp);
        const int written = m_context.engine.pageCount(temp);
        if (written != static_cast<int>(pages.size())) {
            throw domain::IoError("merged output has " + std::to_string(written) + " pages, expected " +
                                  std::to_string(pages.size()));
        }
        fs::rename(temp, output);
    } catch (const domain::PipelineError&) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw;
    } catch (const fs::filesystem_error&) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw;
    }
}

} // namespace loopbinder::application
