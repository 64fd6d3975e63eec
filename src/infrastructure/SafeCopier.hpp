/**
 * @file SafeCopier.hpp
 * @brief Collision-avoiding file copy that never overwrites distinct content.
 */

#pragma once
#include <filesystem>
#include "infrastructure/ContentHasher.hpp"

namespace loopbinder::infrastructure {

/**
 * @enum CopyIdentity
 * @brief How an existing destination is recognised as "already copied".
 */
enum class CopyIdentity {
    Size,  ///< Equal byte size (historical behaviour, false positives possible).
    Digest ///< Equal SHA-256 of the full content.
};

/**
 * @struct CopyOutcome
 * @brief Where the content ended up and whether bytes were written.
 */
struct CopyOutcome {
    std::filesystem::path path;
    bool copied = false; ///< False when an identical file was already present.
};

/**
 * @class SafeCopier
 * @brief Copies a file into a destination, choosing "name_dupN.ext" on collision.
 *
 * Candidates are tried in order dst, dst_dup1, dst_dup2, ... The first
 * candidate that already holds an identical file is returned untouched; the
 * first unused name receives the copy. Bytes and timestamps are copied via a
 * hidden temp file that is renamed into place, so a failed transfer never
 * leaves a truncated file under a candidate name.
 */
class SafeCopier {
public:
    explicit SafeCopier(CopyIdentity identity = CopyIdentity::Size);

    /**
     * @brief Copies src to dst or to the first free collision name.
     * @return Path that now holds src's content, and whether it was written now.
     * @throws domain::LookupError if src does not exist.
     * @throws std::filesystem::filesystem_error if the copy fails.
     */
    CopyOutcome copy(const std::filesystem::path& src, const std::filesystem::path& dst) const;

    /** @brief "dir/base_dupN.ext"; n == 0 returns dst unchanged. */
    static std::filesystem::path CandidateName(const std::filesystem::path& dst, int n);

    CopyIdentity identity() const { return m_identity; }

private:
    CopyIdentity m_identity;
    ContentHasher m_hasher;

    bool sameContent(const std::filesystem::path& existing, const std::filesystem::path& src) const;
};

} // namespace loopbinder::infrastructure
