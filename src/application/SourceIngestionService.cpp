/**
 * @file SourceIngestionService.cpp
 * @brief Implementation of SourceIngestionService.
 */

#include "application/SourceIngestionService.hpp"
#include "domain/PipelineErrors.hpp"

namespace fs = std::filesystem;

namespace loopbinder::application {

SourceIngestionService::SourceIngestionService(RunContext& context, const infrastructure::SourceStore& store)
    : m_context(context), m_store(store) {}

void SourceIngestionService::ingest(domain::EntityRegistry& entities) {
    for (auto& entity : entities) {
        if (!entity.hasIdentity() || domain::Trim(entity.documentNo).empty()) continue;
        ingestOne(entity);
    }
}

void SourceIngestionService::ingestOne(domain::Entity& entity) {
    const fs::path folder = m_context.folderPath(entity.folderName);
    const std::string reference = domain::Trim(entity.documentNo);
    try {
        fs::create_directories(folder);
        const fs::path source = m_store.locate(reference);
        auto outcome = m_context.copier.copy(source, folder / source.filename());
        if (outcome.copied) {
            ++m_context.summary.documentsCopied;
            m_context.log.action("[Ingest] Copied " + source.filename().string() + " -> " +
                                 entity.folderName + "/" + outcome.path.filename().string());
        }
        entity.status = domain::EntityStatus::Ok;
    } catch (const domain::LookupError& e) {
        entity.status = domain::EntityStatus::Missing;
        m_context.log.error("[Ingest] MISSING " + reference + " (row " + std::to_string(entity.row) + "): " + e.what());
    } catch (const domain::PipelineError& e) {
        entity.status = domain::EntityStatus::Missing;
        m_context.log.error("[Ingest] Error copying " + reference + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        entity.status = domain::EntityStatus::Missing;
        m_context.log.error("[Ingest] Error copying " + reference + ": " + e.what());
    }
}

} // namespace loopbinder::application
