/**
 * @file SourceIngestionService.hpp
 * @brief Fetches each entity's source-original document into its folder.
 */

#pragma once
#include "application/RunContext.hpp"
#include "domain/Entity.hpp"
#include "infrastructure/SourceStore.hpp"

namespace loopbinder::application {

class SourceIngestionService {
public:
    SourceIngestionService(RunContext& context, const infrastructure::SourceStore& store);

    /** @brief Copies every referenced document and sets each entity's status to OK or MISSING. */
    void ingest(domain::EntityRegistry& entities);

private:
    RunContext& m_context;
    const infrastructure::SourceStore& m_store;

    void ingestOne(domain::Entity& entity);
};

} // namespace loopbinder::application
