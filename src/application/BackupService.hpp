/**
 * @file BackupService.hpp
 * @brief Keeps a backup-marked duplicate of every source-original document.
 */

#pragma once
#include <filesystem>
#include "application/RunContext.hpp"

namespace loopbinder::application {

class BackupService {
public:
    explicit BackupService(RunContext& context);

    /** @return Number of backups written for this folder. */
    int processFolder(const std::filesystem::path& folder);

private:
    RunContext& m_context;
};

} // namespace loopbinder::application
