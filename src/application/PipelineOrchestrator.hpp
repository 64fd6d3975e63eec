/**
 * @file PipelineOrchestrator.hpp
 * @brief Runs the seven consolidation stages over the destination tree.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include "application/RunContext.hpp"
#include "domain/Entity.hpp"
#include "infrastructure/CandidateTableRepository.hpp"
#include "infrastructure/EntityTableRepository.hpp"
#include "infrastructure/MergeCacheStore.hpp"
#include "infrastructure/ReferenceIndex.hpp"
#include "infrastructure/SourceStore.hpp"

namespace loopbinder::application {

/**
 * @class PipelineOrchestrator
 * @brief Strictly sequential stage runner with per-folder error isolation.
 *
 * preflight() validates every global input without touching the destination
 * tree and throws domain::SetupError on the first problem. Failures inside a
 * stage are logged against the folder or row that caused them and the stage
 * carries on with the next one.
 */
class PipelineOrchestrator {
public:
    explicit PipelineOrchestrator(RunContext& context);
    ~PipelineOrchestrator();

    void preflight();

    /** @brief Runs preflight (if not yet done) and the configured stages. */
    const RunSummary& run();

    static const char* StageName(int stage);

private:
    RunContext& m_context;
    infrastructure::EntityTableRepository m_entityTable;
    infrastructure::CandidateTableRepository m_candidateTables;
    infrastructure::MergeCacheStore m_mergeCache;
    std::unique_ptr<infrastructure::SourceStore> m_sourceStore;
    std::unique_ptr<infrastructure::ReferenceIndex> m_referenceIndex;
    int m_masterPageCount = 0;
    bool m_ready = false;

    domain::EntityRegistry loadEntities();
    void saveEntities(const domain::EntityRegistry& entities);

    void runStage(int stage, const std::function<void()>& body);
    void forEachFolder(int stage, const std::function<void(const std::filesystem::path&)>& body);

    void reconcileAndFetch();
    void deriveCandidateTables();
    void extractRanges();
    void createBackups();
    void cleanupRedundancy();
    void mergeFolders();
    void verify();

    void writeSummary();
};

} // namespace loopbinder::application
