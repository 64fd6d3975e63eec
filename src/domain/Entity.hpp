/**
 * @file Entity.hpp
 * @brief Domain entity for one row of the entity table (loop + system key).
 */

#pragma once
#include <string>
#include <vector>

namespace loopbinder::domain {

/**
 * @enum EntityStatus
 * @brief Outcome of the last source-document fetch for an entity.
 */
enum class EntityStatus {
    Unknown, ///< Never fetched (empty cell).
    Ok,      ///< Source document present in the folder.
    Missing  ///< Source document not found or not copied.
};

inline std::string StatusToString(EntityStatus status) {
    switch (status) {
        case EntityStatus::Ok: return "OK";
        case EntityStatus::Missing: return "MISSING";
        case EntityStatus::Unknown: return "";
    }
    return "";
}

EntityStatus StatusFromString(const std::string& value);

/** @brief Trims leading/trailing whitespace. */
std::string Trim(const std::string& value);

/**
 * @brief Folder name an entity should live in: "<loop>_<system>", both parts trimmed.
 */
std::string MakeFolderName(const std::string& loopNo, const std::string& systemNo);

/**
 * @class Entity
 * @brief A logical record owning exactly one destination folder.
 */
class Entity {
public:
    std::string documentNo;        ///< Source-document reference (may be empty).
    std::string loopNo;            ///< Identity part 1.
    std::string systemNo;          ///< Identity part 2.
    std::string folderName;        ///< Desired folder, recomputed every run.
    std::string historyFolderName; ///< Last folder name confirmed on disk.
    EntityStatus status = EntityStatus::Unknown;
    int row = 0;                   ///< 1-based data row in the table (header excluded).

    /** @brief True when both identity parts are non-blank. */
    bool hasIdentity() const {
        return !Trim(loopNo).empty() && !Trim(systemNo).empty();
    }

    /** @brief Recomputes folderName and seeds an empty history with it. */
    void normalize() {
        folderName = hasIdentity() ? MakeFolderName(loopNo, systemNo) : std::string();
        if (Trim(historyFolderName).empty()) historyFolderName = folderName;
    }
};

using EntityRegistry = std::vector<Entity>;

} // namespace loopbinder::domain
