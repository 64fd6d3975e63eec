/**
 * @file SafeCopier.cpp
 * @brief Implementation of SafeCopier.
 */

#include "infrastructure/SafeCopier.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "domain/PipelineErrors.hpp"

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

SafeCopier::SafeCopier(CopyIdentity identity) : m_identity(identity) {}

fs::path SafeCopier::CandidateName(const fs::path& dst, int n) {
    if (n == 0) return dst;
    fs::path name = dst.stem().string() + "_dup" + std::to_string(n) + dst.extension().string();
    return dst.parent_path() / name;
}

bool SafeCopier::sameContent(const fs::path& existing, const fs::path& src) const {
    if (!fs::is_regular_file(existing)) return false;
    if (fs::file_size(existing) != fs::file_size(src)) return false;
    if (m_identity == CopyIdentity::Size) return true;
    return m_hasher.fileDigest(existing) == m_hasher.fileDigest(src);
}

CopyOutcome SafeCopier::copy(const fs::path& src, const fs::path& dst) const {
    if (!fs::is_regular_file(src)) {
        throw domain::LookupError("source not found: " + src.string());
    }
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path());

    fs::path candidate = dst;
    for (int n = 1; fs::exists(candidate); ++n) {
        if (sameContent(candidate, src)) return {candidate, false};
        candidate = CandidateName(dst, n);
    }

    const fs::path tempPath = PersistenceService::TempPathFor(candidate);
    try {
        fs::copy_file(src, tempPath, fs::copy_options::overwrite_existing);
        fs::permissions(tempPath, fs::status(src).permissions());
        fs::last_write_time(tempPath, fs::last_write_time(src));
        fs::rename(tempPath, candidate);
    } catch (const fs::filesystem_error&) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw;
    }
    return {candidate, true};
}

} // namespace loopbinder::infrastructure
