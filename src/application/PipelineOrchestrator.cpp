/**
 * @file PipelineOrchestrator.cpp
 * @brief Implementation of PipelineOrchestrator.
 */

#include "application/PipelineOrchestrator.hpp"
#include "application/BackupService.hpp"
#include "application/CandidateTableService.hpp"
#include "application/EntityReconciler.hpp"
#include "application/MergeService.hpp"
#include "application/RangeExtractionService.hpp"
#include "application/RedundancyCleanupService.hpp"
#include "application/SourceIngestionService.hpp"
#include "application/VerificationService.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/FolderSnapshot.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace loopbinder::application {

PipelineOrchestrator::PipelineOrchestrator(RunContext& context)
    : m_context(context),
      m_entityTable(context.config.entityTable, context.persistence),
      m_candidateTables(context.persistence),
      m_mergeCache(context.config.naming.cacheSidecar, context.persistence) {}

PipelineOrchestrator::~PipelineOrchestrator() = default;

const char* PipelineOrchestrator::StageName(int stage) {
    switch (stage) {
        case 1: return "RECONCILE & FETCH";
        case 2: return "CANDIDATE TABLES";
        case 3: return "EXTRACT RANGES";
        case 4: return "BACKUP COPIES";
        case 5: return "CLEANUP REDUNDANCY";
        case 6: return "MERGE";
        case 7: return "VERIFY";
        default: return "UNKNOWN";
    }
}

void PipelineOrchestrator::preflight() {
    const auto& config = m_context.config;
    std::error_code ec;

    if (!fs::is_directory(config.destinationRoot, ec)) {
        throw domain::SetupError("destination root not found: " + config.destinationRoot.string());
    }

    if (!m_entityTable.exists()) {
        m_entityTable.createTemplate();
        throw domain::SetupError("entity table created at " + config.entityTable.string() +
                                 "; fill in the identity columns and run again");
    }
    try {
        auto loaded = m_entityTable.load();
        for (const auto& issue : loaded.issues) {
            m_context.log.error("[Preflight] Entity table: " + issue.describe());
        }
    } catch (const domain::FormatError& e) {
        throw domain::SetupError("entity table " + config.entityTable.string() + ": " + e.what());
    } catch (const domain::IoError& e) {
        throw domain::SetupError(e.what());
    }

    if (!fs::is_directory(config.sourceStore, ec)) {
        throw domain::SetupError("source store not found: " + config.sourceStore.string());
    }
    if (!fs::is_regular_file(config.referenceIndex, ec)) {
        throw domain::SetupError("reference index not found: " + config.referenceIndex.string());
    }
    if (!fs::is_regular_file(config.masterDocument, ec)) {
        throw domain::SetupError("master document not found: " + config.masterDocument.string());
    }

    std::string reason;
    if (!m_context.engine.isAvailable(reason)) {
        throw domain::SetupError("document engine unavailable: " + reason);
    }

    try {
        m_masterPageCount = m_context.engine.pageCount(config.masterDocument);
        m_referenceIndex = std::make_unique<infrastructure::ReferenceIndex>(
            infrastructure::ReferenceIndex::Load(config.referenceIndex, m_context.persistence));
        m_sourceStore = std::make_unique<infrastructure::SourceStore>(config.sourceStore, config.naming.documentExtension);
    } catch (const domain::PipelineError& e) {
        throw domain::SetupError(e.what());
    } catch (const fs::filesystem_error& e) {
        throw domain::SetupError(e.what());
    }
    if (m_masterPageCount <= 0) {
        throw domain::SetupError("master document has no pages: " + config.masterDocument.string());
    }

    m_context.log.action("[Preflight] Master document: " + std::to_string(m_masterPageCount) + " pages");
    m_context.log.action("[Preflight] Reference index: " + std::to_string(m_referenceIndex->entries().size()) +
                         " entries, " + std::to_string(m_referenceIndex->ignoredLines()) + " lines ignored");
    m_context.log.action("[Preflight] Source store: " + std::to_string(m_sourceStore->size()) + " files");
    m_ready = true;
}

const RunSummary& PipelineOrchestrator::run() {
    if (!m_ready) preflight();

    for (int stage : m_context.config.stages) {
        switch (stage) {
            case 1: runStage(1, [this]{ reconcileAndFetch(); }); break;
            case 2: runStage(2, [this]{ deriveCandidateTables(); }); break;
            case 3: runStage(3, [this]{ extractRanges(); }); break;
            case 4: runStage(4, [this]{ createBackups(); }); break;
            case 5: runStage(5, [this]{ cleanupRedundancy(); }); break;
            case 6: runStage(6, [this]{ mergeFolders(); }); break;
            case 7: runStage(7, [this]{ verify(); }); break;
            default: break;
        }
    }

    m_context.summary.errors = m_context.log.errorCount();
    writeSummary();
    return m_context.summary;
}

domain::EntityRegistry PipelineOrchestrator::loadEntities() {
    auto loaded = m_entityTable.load();
    for (auto& entity : loaded.entities) entity.normalize();
    return std::move(loaded.entities);
}

void PipelineOrchestrator::saveEntities(const domain::EntityRegistry& entities) {
    m_entityTable.save(entities);
}

void PipelineOrchestrator::runStage(int stage, const std::function<void()>& body) {
    const std::string tag = "P" + std::to_string(stage) + ": " + StageName(stage);
    const auto start = std::chrono::steady_clock::now();
    m_context.log.action("=== " + tag + " START ===");

    try {
        body();
    } catch (const domain::PipelineError& e) {
        m_context.log.error("[P" + std::to_string(stage) + "] " + e.what());
    } catch (const fs::filesystem_error& e) {
        m_context.log.error("[P" + std::to_string(stage) + "] " + e.what());
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    m_context.log.action("=== " + tag + " END (" + infrastructure::RunLog::FormatElapsed(elapsed.count()) + ") ===");
}

void PipelineOrchestrator::forEachFolder(int stage, const std::function<void(const fs::path&)>& body) {
    const auto folders = infrastructure::FolderSnapshot::Capture(m_context.config.destinationRoot).subdirectories();
    for (const auto& folder : folders) {
        try {
            body(folder.path);
        } catch (const domain::PipelineError& e) {
            m_context.log.error("[P" + std::to_string(stage) + "] " + folder.name + ": " + e.what());
        } catch (const fs::filesystem_error& e) {
            m_context.log.error("[P" + std::to_string(stage) + "] " + folder.name + ": " + e.what());
        }
    }
}

void PipelineOrchestrator::reconcileAndFetch() {
    auto entities = loadEntities();

    EntityReconciler reconciler(m_context);
    reconciler.reconcile(entities);

    SourceIngestionService ingestion(m_context, *m_sourceStore);
    ingestion.ingest(entities);

    saveEntities(entities);
}

void PipelineOrchestrator::deriveCandidateTables() {
    CandidateTableService service(m_context, *m_referenceIndex, m_candidateTables);
    forEachFolder(2, [&](const fs::path& folder){ service.processFolder(folder); });
}

void PipelineOrchestrator::extractRanges() {
    RangeExtractionService service(m_context, m_candidateTables, m_masterPageCount);
    forEachFolder(3, [&](const fs::path& folder){ service.processFolder(folder); });
}

void PipelineOrchestrator::createBackups() {
    BackupService service(m_context);
    forEachFolder(4, [&](const fs::path& folder){ service.processFolder(folder); });
}

void PipelineOrchestrator::cleanupRedundancy() {
    RedundancyCleanupService service(m_context, m_candidateTables);
    forEachFolder(5, [&](const fs::path& folder){ service.processFolder(folder); });
}

void PipelineOrchestrator::mergeFolders() {
    MergeService service(m_context, m_mergeCache);
    forEachFolder(6, [&](const fs::path& folder){ service.processFolder(folder); });
}

void PipelineOrchestrator::verify() {
    VerificationService service(m_context, m_candidateTables);
    forEachFolder(7, [&](const fs::path& folder){ service.verifyFolder(folder); });

    auto entities = loadEntities();
    service.verifyEntities(entities);
    service.removeOrphans(entities);
    saveEntities(entities);

    m_context.log.action("[P7] Entities OK: " + std::to_string(m_context.summary.entitiesOk) +
                         ", MISSING: " + std::to_string(m_context.summary.entitiesMissing) +
                         ", open issues: " + std::to_string(m_context.summary.openIssues));
}

void PipelineOrchestrator::writeSummary() {
    const auto& s = m_context.summary;
    json j = {
        {"entities_ok", s.entitiesOk},
        {"entities_missing", s.entitiesMissing},
        {"open_issues", s.openIssues},
        {"folders_created", s.foldersCreated},
        {"folders_renamed", s.foldersRenamed},
        {"folders_merged", s.foldersMerged},
        {"documents_copied", s.documentsCopied},
        {"pages_extracted", s.pagesExtracted},
        {"backups_created", s.backupsCreated},
        {"documents_removed", s.documentsRemoved},
        {"merges_written", s.mergesWritten},
        {"merges_cached", s.mergesCached},
        {"orphan_folders_removed", s.orphanFoldersRemoved},
        {"errors", s.errors},
    };

    const auto& dir = m_context.config.logDirectory;
    if (dir.empty()) return;
    try {
        m_context.persistence.writeTextAtomic(dir / "run_summary.json", j.dump(4));
    } catch (const domain::IoError& e) {
        m_context.log.error(std::string("[Summary] ") + e.what());
    }
}

} // namespace loopbinder::application
