/**
 * @file RunContext.hpp
 * @brief Handles every stage receives instead of reaching for globals.
 */

#pragma once
#include <filesystem>
#include "domain/DocumentEngine.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RunLog.hpp"
#include "infrastructure/SafeCopier.hpp"

namespace loopbinder::application {

/**
 * @struct RunSummary
 * @brief Counters reported at the end of a run.
 */
struct RunSummary {
    int entitiesOk = 0;
    int entitiesMissing = 0;
    int openIssues = 0;
    int foldersCreated = 0;
    int foldersRenamed = 0;
    int foldersMerged = 0;
    int documentsCopied = 0;
    int pagesExtracted = 0;
    int backupsCreated = 0;
    int documentsRemoved = 0;
    int mergesWritten = 0;
    int mergesCached = 0;
    int orphanFoldersRemoved = 0;
    int errors = 0;
};

/**
 * @struct RunContext
 * @brief Configuration, log sinks and shared components of one run.
 *
 * Non-owning: the composition root (or a test) keeps every referenced
 * object alive for the duration of the run.
 */
struct RunContext {
    const infrastructure::RunConfig& config;
    infrastructure::RunLog& log;
    domain::DocumentEngine& engine;
    const infrastructure::SafeCopier& copier;
    const infrastructure::ContentHasher& hasher;
    const infrastructure::PersistenceService& persistence;
    RunSummary& summary;

    std::filesystem::path folderPath(const std::string& name) const {
        return config.destinationRoot / name;
    }
};

} // namespace loopbinder::application
