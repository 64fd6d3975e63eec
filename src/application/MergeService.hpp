/**
 * @file MergeService.hpp
 * @brief Produces one deduplicated merged document per folder, cached by fingerprint.
 */

#pragma once
#include <filesystem>
#include <string>
#include "application/PageDeduplicator.hpp"
#include "application/RunContext.hpp"
#include "infrastructure/MergeCacheStore.hpp"

namespace loopbinder::application {

enum class MergeOutcome {
    NoInputs, ///< Folder has nothing to merge.
    Cached,   ///< Inputs unchanged since the last merge; output left untouched.
    Written   ///< Output rebuilt and cache entry refreshed.
};

/**
 * @class MergeService
 * @brief Merge stage for a single folder.
 *
 * The folder fingerprint covers every merge input (names and bytes). A
 * matching cache entry skips the merge as long as the merged output still
 * exists. The cache entry is written only after the new output has been
 * assembled, verified and renamed into place.
 */
class MergeService {
public:
    MergeService(RunContext& context, const infrastructure::MergeCacheStore& cache);

    MergeOutcome processFolder(const std::filesystem::path& folder);

    /** @brief Folder-scope fingerprint of the current merge inputs. */
    std::string fingerprint(const std::filesystem::path& folder) const;

private:
    RunContext& m_context;
    const infrastructure::MergeCacheStore& m_cache;
    PageDeduplicator m_deduplicator;

    void writeMerged(const std::vector<domain::PageRef>& pages, const std::filesystem::path& output);
};

} // namespace loopbinder::application
