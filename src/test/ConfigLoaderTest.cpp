#include <cassert>
#include <iostream>

#include "domain/PipelineErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "TestSupport.hpp"

using namespace loopbinder;
using namespace loopbinder::test;
using infrastructure::ConfigLoader;
using infrastructure::CopyIdentity;

static bool LoadFails(const fs::path& path) {
    try {
        ConfigLoader::Load(path);
    } catch (const domain::SetupError& e) {
        std::cout << "  expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    TempDir dir("config");

    // Template round-trips through the loader with every default.
    ConfigLoader::WriteTemplate(dir / "template.json");
    auto defaults = ConfigLoader::Load(dir / "template.json");
    assert(defaults.entityTable == dir.path() / "loop_system_documents.csv");
    assert(defaults.naming.mergedOutput == "Combined.pdf");
    assert(defaults.copyIdentity == CopyIdentity::Size);
    assert(defaults.stages.size() == 7);

    WriteFile(dir / "settings.json", R"({
        "entity_table": "tables/entities.csv",
        "source_store": "/srv/store",
        "reference_index": "index.txt",
        "master_document": "master.pdf",
        "destination_root": "out",
        "copy_identity": "digest",
        "stages": [6, 2, 6],
        "naming": { "merged_output": "All.pdf", "backup_marker": "_FRI" }
    })");
    auto config = ConfigLoader::Load(dir / "settings.json");
    assert(config.entityTable == dir.path() / "tables/entities.csv");
    assert(config.sourceStore == fs::path("/srv/store"));
    assert(config.logDirectory == dir.path() / ".");
    assert(config.copyIdentity == CopyIdentity::Digest);
    assert((config.stages == std::vector<int>{2, 6}));
    assert(config.naming.mergedOutput == "All.pdf");
    assert(config.naming.backupMarker == "_FRI");
    assert(config.naming.candidateTable == "candidates.csv");

    assert(LoadFails(dir / "absent.json"));

    WriteFile(dir / "broken.json", "{ not json");
    assert(LoadFails(dir / "broken.json"));

    WriteFile(dir / "missing_key.json", R"({"entity_table": "e.csv"})");
    assert(LoadFails(dir / "missing_key.json"));

    WriteFile(dir / "bad_stage.json", R"({
        "entity_table": "e.csv", "source_store": "s", "reference_index": "i",
        "master_document": "m.pdf", "destination_root": "d", "stages": [0]
    })");
    assert(LoadFails(dir / "bad_stage.json"));

    WriteFile(dir / "bad_identity.json", R"({
        "entity_table": "e.csv", "source_store": "s", "reference_index": "i",
        "master_document": "m.pdf", "destination_root": "d", "copy_identity": "bytes"
    })");
    assert(LoadFails(dir / "bad_identity.json"));

    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
