/**
 * @file EntityReconciler.hpp
 * @brief Brings entity folders on disk in line with the entity table.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "application/RunContext.hpp"
#include "domain/Entity.hpp"
#include "infrastructure/FolderSnapshot.hpp"

namespace loopbinder::application {

/**
 * @struct ReconcileAction
 * @brief One physical step of a reconciliation plus the rows it settles.
 */
struct ReconcileAction {
    enum class Kind {
        Create, ///< Desired folder absent, nothing to move.
        Rename, ///< history -> desired, desired absent.
        Merge,  ///< history folded into an existing desired folder.
        Adopt   ///< Desired already present, history gone; bookkeeping only.
    };

    Kind kind = Kind::Create;
    std::string history;
    std::string desired;
    std::vector<std::size_t> entities; ///< Indices into the registry.

    /** @brief Rename and Merge settle every row that still points at @c history. */
    bool movesHistory() const { return kind == Kind::Rename || kind == Kind::Merge; }
};

/**
 * @class EntityReconciler
 * @brief Folder-identity reconciliation (rename, merge, create).
 *
 * Planning is pure: it reads the registry and a snapshot of the destination
 * root. Applying performs each action and only then moves the history name of
 * the affected rows, so a failed action is retried on the next run.
 */
class EntityReconciler {
public:
    explicit EntityReconciler(RunContext& context);

    static std::vector<ReconcileAction> Plan(const domain::EntityRegistry& entities,
                                             const infrastructure::FolderSnapshot& root);

    /** @brief Plans against the current destination root and applies the plan. */
    void reconcile(domain::EntityRegistry& entities);

    void apply(const std::vector<ReconcileAction>& plan, domain::EntityRegistry& entities);

private:
    RunContext& m_context;

    void mergeInto(const std::string& history, const std::string& desired);
};

} // namespace loopbinder::application
