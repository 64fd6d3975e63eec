/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "domain/PipelineErrors.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string RequireString(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw domain::SetupError(std::string("settings: missing required key '") + key + "'");
    }
    return j[key].get<std::string>();
}

void ReadOptional(const json& j, const char* key, std::string& target) {
    if (j.contains(key) && j[key].is_string()) target = j[key].get<std::string>();
}

} // namespace

CopyIdentity ConfigLoader::ParseCopyIdentity(const std::string& value) {
    if (value == "size") return CopyIdentity::Size;
    if (value == "digest") return CopyIdentity::Digest;
    throw domain::SetupError("settings: copy_identity must be \"size\" or \"digest\", got \"" + value + "\"");
}

RunConfig ConfigLoader::Load(const fs::path& settingsPath) {
    if (!fs::exists(settingsPath)) {
        throw domain::SetupError("settings file not found: " + settingsPath.string());
    }

    json j;
    try {
        std::ifstream f(settingsPath);
        f >> j;
    } catch (const json::exception& e) {
        throw domain::SetupError("settings: cannot parse " + settingsPath.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw domain::SetupError("settings: top level must be an object");
    }

    const fs::path base = fs::absolute(settingsPath).parent_path();
    RunConfig config;
    config.entityTable = PathUtils::Resolve(base, RequireString(j, "entity_table"));
    config.sourceStore = PathUtils::Resolve(base, RequireString(j, "source_store"));
    config.referenceIndex = PathUtils::Resolve(base, RequireString(j, "reference_index"));
    config.masterDocument = PathUtils::Resolve(base, RequireString(j, "master_document"));
    config.destinationRoot = PathUtils::Resolve(base, RequireString(j, "destination_root"));

    std::string logDirectory = ".";
    ReadOptional(j, "log_directory", logDirectory);
    config.logDirectory = PathUtils::Resolve(base, logDirectory);
    ReadOptional(j, "tool_directory", config.toolDirectory);

    if (j.contains("naming")) {
        const json& naming = j["naming"];
        if (!naming.is_object()) throw domain::SetupError("settings: 'naming' must be an object");
        ReadOptional(naming, "candidate_table", config.naming.candidateTable);
        ReadOptional(naming, "merged_output", config.naming.mergedOutput);
        ReadOptional(naming, "backup_marker", config.naming.backupMarker);
        ReadOptional(naming, "cache_sidecar", config.naming.cacheSidecar);
        ReadOptional(naming, "document_extension", config.naming.documentExtension);
    }
    if (config.naming.backupMarker.empty()) {
        throw domain::SetupError("settings: naming.backup_marker must not be empty");
    }

    if (j.contains("copy_identity")) {
        if (!j["copy_identity"].is_string()) throw domain::SetupError("settings: copy_identity must be a string");
        config.copyIdentity = ParseCopyIdentity(j["copy_identity"].get<std::string>());
    }

    if (j.contains("stages")) {
        if (!j["stages"].is_array()) throw domain::SetupError("settings: 'stages' must be an array");
        config.stages.clear();
        for (const auto& stage : j["stages"]) {
            if (!stage.is_number_integer() || stage.get<int>() < 1 || stage.get<int>() > 7) {
                throw domain::SetupError("settings: stages must be integers 1..7");
            }
            config.stages.push_back(stage.get<int>());
        }
        std::sort(config.stages.begin(), config.stages.end());
        config.stages.erase(std::unique(config.stages.begin(), config.stages.end()), config.stages.end());
    }
    return config;
}

void ConfigLoader::WriteTemplate(const fs::path& settingsPath) {
    const domain::NamingConvention defaults;
    json j = {
        {"entity_table", "loop_system_documents.csv"},
        {"source_store", "server"},
        {"reference_index", "master_index.txt"},
        {"master_document", "master.pdf"},
        {"destination_root", "destination"},
        {"log_directory", "."},
        {"tool_directory", ""},
        {"copy_identity", "size"},
        {"stages", {1, 2, 3, 4, 5, 6, 7}},
        {"naming", {
            {"candidate_table", defaults.candidateTable},
            {"merged_output", defaults.mergedOutput},
            {"backup_marker", defaults.backupMarker},
            {"cache_sidecar", defaults.cacheSidecar},
            {"document_extension", defaults.documentExtension},
        }},
    };
    PersistenceService().writeTextAtomic(settingsPath, j.dump(4) + "\n");
}

} // namespace loopbinder::infrastructure
