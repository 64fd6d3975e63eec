#include <cassert>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

#include "application/PipelineOrchestrator.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/EntityTableRepository.hpp"
#include "TestSupport.hpp"

using namespace loopbinder;
using namespace loopbinder::test;
using application::PipelineOrchestrator;

namespace {

void PrepareInputs(Harness& h, const TempDir& dir) {
    h.config.entityTable = dir / "entities.csv";
    h.config.sourceStore = dir / "store";
    h.config.referenceIndex = dir / "index.txt";
    h.config.masterDocument = dir / "master.pdf";
    h.config.logDirectory = dir / "logs";

    WriteFile(h.config.entityTable,
              "document no,loop no,system no\n"
              "A-1-1,L1,S1\n"
              "B-2-1,L2,S2\n"
              "Z-9-9,L3,S3\n");
    WriteFile(h.config.sourceStore / "Sheet (A-1-1).pdf", FakeDocumentEngine::MakeDocument({"A1", "A2"}));
    WriteFile(h.config.sourceStore / "Sheet (B-2-1).pdf", FakeDocumentEngine::MakeDocument({"B1"}));
    WriteFile(h.config.masterDocument, FakeDocumentEngine::MakeDocument({"M1", "M2", "M3", "M4"}));
    WriteFile(h.config.referenceIndex,
              "Sheet(A-1-1).pdf 2\n"
              "Sheet(A-1-1).pdf 3\n"
              "Sheet(B-2-1).pdf 4\n"
              "Sheet(B-2-1).pdf 9\n");
    fs::create_directories(h.config.destinationRoot / "orphan");
}

std::map<std::string, std::string> Snapshot(const fs::path& root) {
    std::map<std::string, std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) files[fs::relative(entry.path(), root).string()] = ReadFile(entry.path());
    }
    return files;
}

void TestFullRunIsIdempotent() {
    TempDir dir("pipeline");
    Harness h(dir / "dest");
    PrepareInputs(h, dir);
    const fs::path root = h.config.destinationRoot;

    {
        PipelineOrchestrator orchestrator(h.context);
        const auto& summary = orchestrator.run();
        assert(summary.foldersCreated == 3);
        assert(summary.documentsCopied == 2);
        assert(summary.pagesExtracted == 3);
        assert(summary.backupsCreated == 2);
        assert(summary.documentsRemoved == 0);
        assert(summary.mergesWritten == 2);
        assert(summary.mergesCached == 0);
        assert(summary.orphanFoldersRemoved == 1);
        assert(summary.entitiesOk == 2);
        assert(summary.entitiesMissing == 1);
        assert(summary.errors >= 2); // missing Z-9-9, page 9 out of range
    }

    assert((FakeDocumentEngine::Pages(ReadFile(root / "L1_S1/Combined.pdf")) ==
            std::vector<std::string>{"M2", "M3", "A1", "A2"}));
    assert((FakeDocumentEngine::Pages(ReadFile(root / "L2_S2/Combined.pdf")) ==
            std::vector<std::string>{"M4", "B1"}));
    assert(fs::exists(root / "L1_S1/Sheet (A-1-1)_backup.pdf"));
    assert(fs::is_directory(root / "L3_S3"));
    assert(!fs::exists(root / "orphan"));
    assert(ReadFile(root / "L1_S1/candidates.csv") == "code,page range,status\nA-1,\"2,3\",OK\n");
    assert(ReadFile(root / "L2_S2/candidates.csv") == "code,page range,status\nB-2,\"4,9\",OK\n");

    infrastructure::EntityTableRepository table(h.config.entityTable, h.persistence);
    auto entities = table.load().entities;
    assert(entities[0].historyFolderName == "L1_S1" && entities[0].status == domain::EntityStatus::Ok);
    assert(entities[2].status == domain::EntityStatus::Missing);

    auto json = nlohmann::json::parse(ReadFile(dir / "logs/run_summary.json"));
    assert(json["merges_written"].get<int>() == 2);

    const auto firstTree = Snapshot(root);
    const std::string firstTable = ReadFile(h.config.entityTable);
    const auto mergedTime = fs::last_write_time(root / "L1_S1/Combined.pdf");

    h.summary = application::RunSummary{};
    {
        PipelineOrchestrator orchestrator(h.context);
        const auto& summary = orchestrator.run();
        assert(summary.foldersCreated == 0 && summary.foldersRenamed == 0 && summary.foldersMerged == 0);
        assert(summary.documentsCopied == 0);
        assert(summary.pagesExtracted == 0);
        assert(summary.backupsCreated == 0);
        assert(summary.mergesWritten == 0);
        assert(summary.mergesCached == 2);
    }
    assert(Snapshot(root) == firstTree);
    assert(ReadFile(h.config.entityTable) == firstTable);
    assert(fs::last_write_time(root / "L1_S1/Combined.pdf") == mergedTime);
}

void TestRedundancyAndRename() {
    TempDir dir("pipeline_rename");
    Harness h(dir / "dest");
    PrepareInputs(h, dir);
    const fs::path root = h.config.destinationRoot;

    PipelineOrchestrator(h.context).run();

    // Rename the entity's system key and drop its code from the candidate table.
    WriteFile(h.config.entityTable,
              "document no,loop no,system no,folder name,history folder name,status\n"
              "A-1-1,L1,S9,L1_S1,L1_S1,OK\n");
    WriteFile(root / "L1_S1/candidates.csv", "code,page range,status\nQ-1,2,\n");
    WriteFile(h.config.sourceStore / "Sheet (A-1-1).pdf", FakeDocumentEngine::MakeDocument({"A1", "A2", "A3"}));

    h.summary = application::RunSummary{};
    h.config.stages = {1, 5, 6};
    PipelineOrchestrator orchestrator(h.context);
    orchestrator.run();

    assert(!fs::exists(root / "L1_S1"));
    assert(h.summary.foldersRenamed == 1);
    // The changed source lands beside the first copy, then P5 removes both unreferenced originals.
    assert(h.summary.documentsCopied == 1);
    assert(h.summary.documentsRemoved == 2);
    assert(!fs::exists(root / "L1_S9/Sheet (A-1-1).pdf"));
    assert(!fs::exists(root / "L1_S9/Sheet (A-1-1)_dup1.pdf"));
    assert(fs::exists(root / "L1_S9/Sheet (A-1-1)_backup.pdf"));
    assert(h.summary.mergesWritten == 1);
    assert((FakeDocumentEngine::Pages(ReadFile(root / "L1_S9/Combined.pdf")) ==
            std::vector<std::string>{"M2", "M3", "A1", "A2"}));
}

bool PreflightFails(Harness& h) {
    try {
        PipelineOrchestrator(h.context).preflight();
    } catch (const domain::SetupError& e) {
        std::cout << "  expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void TestPreflight() {
    TempDir dir("preflight");
    Harness h(dir / "dest");
    PrepareInputs(h, dir);

    fs::remove(h.config.entityTable);
    assert(PreflightFails(h));
    assert(ReadFile(h.config.entityTable) ==
           "document no,loop no,system no,folder name,history folder name,status\n");

    WriteFile(h.config.entityTable, "document no,loop no\nA-1-1,L1\n");
    assert(PreflightFails(h));

    WriteFile(h.config.entityTable, "document no,loop no,system no\nA-1-1,L1,S1\n");
    WriteFile(h.config.masterDocument, "");
    assert(PreflightFails(h));

    WriteFile(h.config.masterDocument, "M1");
    fs::remove(h.config.referenceIndex);
    assert(PreflightFails(h));

    WriteFile(h.config.referenceIndex, "");
    h.config.destinationRoot = dir / "nowhere";
    assert(PreflightFails(h));
    assert(!fs::exists(dir / "nowhere"));

    h.config.destinationRoot = dir / "dest";
    PipelineOrchestrator orchestrator(h.context);
    orchestrator.preflight();
}

} // namespace

int main() {
    std::cout << "[Test] Starting PipelineOrchestrator Test..." << std::endl;

    TestFullRunIsIdempotent();
    TestRedundancyAndRename();
    TestPreflight();

    std::cout << "[PASS] PipelineOrchestrator Test." << std::endl;
    return 0;
}
