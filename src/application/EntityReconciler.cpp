/**
 * @file EntityReconciler.cpp
 * @brief Implementation of EntityReconciler.
 */

#include "application/EntityReconciler.hpp"
#include "domain/PipelineErrors.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace loopbinder::application {

EntityReconciler::EntityReconciler(RunContext& context) : m_context(context) {}

std::vector<ReconcileAction> EntityReconciler::Plan(const domain::EntityRegistry& entities,
                                                    const infrastructure::FolderSnapshot& root) {
    std::set<std::string> existing;
    for (const auto& dir : root.subdirectories()) existing.insert(dir.name);

    std::vector<ReconcileAction> plan;
    std::map<std::pair<std::string, std::string>, std::size_t> planned;
    std::vector<bool> settled(entities.size(), false);

    auto record = [&](std::size_t i, ReconcileAction::Kind kind) {
        const std::string history = domain::Trim(entities[i].historyFolderName);
        const auto key = std::make_pair(history, entities[i].folderName);
        settled[i] = true;
        auto seen = planned.find(key);
        if (seen != planned.end()) {
            plan[seen->second].entities.push_back(i);
            return;
        }
        ReconcileAction action;
        action.kind = kind;
        action.history = history;
        action.desired = entities[i].folderName;
        action.entities.push_back(i);
        planned[key] = plan.size();
        plan.push_back(std::move(action));
    };

    // Moves first: a folder moved away frees its name for the row that wants it.
    std::vector<std::size_t> moves;
    for (std::size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        if (!entity.hasIdentity()) continue;
        const std::string history = domain::Trim(entity.historyFolderName);
        if (history != entity.folderName && existing.count(history)) moves.push_back(i);
    }

    // A move whose target is still another pending move's source waits for it.
    while (!moves.empty()) {
        std::set<std::string> pendingSources;
        for (std::size_t i : moves) pendingSources.insert(domain::Trim(entities[i].historyFolderName));

        auto next = std::find_if(moves.begin(), moves.end(), [&](std::size_t i) {
            return !pendingSources.count(entities[i].folderName);
        });
        if (next == moves.end()) next = moves.begin(); // cycle: fall back to table order

        const std::size_t i = *next;
        moves.erase(next);
        const std::string history = domain::Trim(entities[i].historyFolderName);
        const std::string& desired = entities[i].folderName;

        const auto key = std::make_pair(history, desired);
        if (planned.count(key)) {
            record(i, ReconcileAction::Kind::Rename);
            continue;
        }
        // Already moved by an earlier row with another target; settled in the second pass.
        if (!existing.count(history)) continue;

        if (!existing.count(desired)) {
            record(i, ReconcileAction::Kind::Rename);
            existing.insert(desired);
        } else {
            record(i, ReconcileAction::Kind::Merge);
        }
        existing.erase(history);
    }

    for (std::size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        if (!entity.hasIdentity() || settled[i]) continue;

        const std::string history = domain::Trim(entity.historyFolderName);
        if (!existing.count(entity.folderName)) {
            record(i, ReconcileAction::Kind::Create);
            existing.insert(entity.folderName);
        } else if (history != entity.folderName) {
            record(i, ReconcileAction::Kind::Adopt);
        }
    }
    return plan;
}

void EntityReconciler::reconcile(domain::EntityRegistry& entities) {
    for (auto& entity : entities) entity.normalize();
    auto root = infrastructure::FolderSnapshot::Capture(m_context.config.destinationRoot);
    apply(Plan(entities, root), entities);
}

void EntityReconciler::apply(const std::vector<ReconcileAction>& plan, domain::EntityRegistry& entities) {
    auto& log = m_context.log;
    auto& summary = m_context.summary;

    for (const auto& action : plan) {
        const fs::path desiredPath = m_context.folderPath(action.desired);
        try {
            switch (action.kind) {
                case ReconcileAction::Kind::Create:
                    fs::create_directories(desiredPath);
                    ++summary.foldersCreated;
                    log.action("[Reconcile] Created folder " + action.desired);
                    break;
                case ReconcileAction::Kind::Rename:
                    fs::rename(m_context.folderPath(action.history), desiredPath);
                    ++summary.foldersRenamed;
                    log.action("[Reconcile] Renamed " + action.history + " -> " + action.desired);
                    break;
                case ReconcileAction::Kind::Merge:
                    mergeInto(action.history, action.desired);
                    ++summary.foldersMerged;
                    break;
                case ReconcileAction::Kind::Adopt:
                    break;
            }
        } catch (const domain::PipelineError& e) {
            log.error("[Reconcile] " + action.history + " -> " + action.desired + ": " + e.what());
            continue;
        } catch (const fs::filesystem_error& e) {
            log.error("[Reconcile] " + action.history + " -> " + action.desired + ": " + e.what());
            continue;
        }

        for (std::size_t index : action.entities) {
            entities[index].historyFolderName = action.desired;
        }
        if (action.movesHistory()) {
            for (auto& entity : entities) {
                // A row that owns the vacated name keeps it; its Create follows.
                if (entity.folderName == action.history) continue;
                if (domain::Trim(entity.historyFolderName) == action.history) {
                    entity.historyFolderName = action.desired;
                }
            }
        }
    }
}

void EntityReconciler::mergeInto(const std::string& history, const std::string& desired) {
    const fs::path historyPath = m_context.folderPath(history);
    const fs::path desiredPath = m_context.folderPath(desired);
    const auto& naming = m_context.config.naming;

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(historyPath)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        const std::string name = file.filename().string();
        // Derived from the folder's inputs; regenerated for the merged folder.
        if (name == naming.cacheSidecar ||
            naming.classify(name) == domain::DocumentRole::MergedOutput) {
            fs::remove(file);
            continue;
        }
        auto outcome = m_context.copier.copy(file, desiredPath / name);
        if (outcome.copied) ++m_context.summary.documentsCopied;
        fs::remove(file);
    }

    std::error_code ec;
    fs::remove(historyPath, ec);
    if (ec) {
        ++m_context.summary.openIssues;
        m_context.log.error("[Reconcile] Open issue: " + history + " merged into " + desired +
                            " but could not be removed (" + ec.message() + ")");
    } else {
        m_context.log.action("[Reconcile] Merged " + history + " into " + desired);
    }
}

} // namespace loopbinder::application
