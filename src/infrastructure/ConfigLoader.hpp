/**
 * @file ConfigLoader.hpp
 * @brief Loads the run configuration (settings.json).
 *
 * Keeps every JSON detail of the settings file in one place. Relative paths
 * in the file are resolved against the directory holding it.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "domain/DocumentNaming.hpp"
#include "infrastructure/SafeCopier.hpp"

namespace loopbinder::infrastructure {

/**
 * @struct RunConfig
 * @brief Every input location and naming rule of one pipeline run.
 */
struct RunConfig {
    std::filesystem::path entityTable;     ///< Primary entity table (CSV).
    std::filesystem::path sourceStore;     ///< Directory holding source-original documents.
    std::filesystem::path referenceIndex;  ///< "<document> <page>" index of the master document.
    std::filesystem::path masterDocument;  ///< Document that ranges are extracted from.
    std::filesystem::path destinationRoot; ///< Parent of all entity folders.
    std::filesystem::path logDirectory;    ///< Where the action log and error report go.
    std::string toolDirectory;             ///< Optional directory prefix for the PDF tools.
    domain::NamingConvention naming;
    CopyIdentity copyIdentity = CopyIdentity::Size;
    std::vector<int> stages = {1, 2, 3, 4, 5, 6, 7};
};

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a settings file.
     * @throws domain::SetupError if the file is missing, unparsable, or lacks a required key.
     */
    static RunConfig Load(const std::filesystem::path& settingsPath);

    /**
     * @brief Writes a template settings file with every key present.
     * @throws domain::IoError if it cannot be written.
     */
    static void WriteTemplate(const std::filesystem::path& settingsPath);

    /** @brief Parses "size" / "digest". @throws domain::SetupError otherwise. */
    static CopyIdentity ParseCopyIdentity(const std::string& value);
};

} // namespace loopbinder::infrastructure
