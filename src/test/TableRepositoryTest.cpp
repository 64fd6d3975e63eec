#include <cassert>
#include <iostream>

#include "domain/PipelineErrors.hpp"
#include "infrastructure/CandidateTableRepository.hpp"
#include "infrastructure/CsvTable.hpp"
#include "infrastructure/EntityTableRepository.hpp"
#include "TestSupport.hpp"

using namespace loopbinder;
using namespace loopbinder::test;
using namespace loopbinder::infrastructure;

static void TestCsvQuoting() {
    auto table = CsvTable::Parse("\xEF\xBB\xBF" "code,page range\r\n\"A-1\",\"1, 2\"\n\n\"say \"\"hi\"\"\",3\n");
    assert(table.headers().size() == 2);
    assert(table.rowCount() == 2);
    assert(table.cell(0, "page range") == "1, 2");
    assert(table.cell(1, "code") == "say \"hi\"");
    assert(CsvTable::Parse(table.serialize()).cell(1, "code") == "say \"hi\"");
}

static void TestEntityTable(const TempDir& dir) {
    PersistenceService persistence;
    EntityTableRepository repo(dir / "entities.csv", persistence);
    assert(!repo.exists());
    repo.createTemplate();
    assert(repo.exists());
    assert(repo.load().entities.empty());

    WriteFile(dir / "entities.csv",
              "loop no,system no,document no,extra\n"
              "L1,S1,A-1-1,x\n"
              ",S2,A-2-1,y\n");
    auto loaded = repo.load();
    assert(loaded.entities.size() == 2);
    assert(loaded.entities[0].documentNo == "A-1-1");
    assert(loaded.entities[0].historyFolderName.empty());
    assert(loaded.issues.size() == 1);
    assert(loaded.issues[0].kind == domain::FormatIssue::Kind::BadValue);
    assert(loaded.issues[0].column == EntityTableRepository::kLoopColumn);
    assert(loaded.issues[0].row == 2);

    auto entities = loaded.entities;
    for (auto& e : entities) e.normalize();
    entities[0].status = domain::EntityStatus::Ok;
    repo.save(entities);
    auto reloaded = repo.load();
    assert(reloaded.entities[0].folderName == "L1_S1");
    assert(reloaded.entities[0].historyFolderName == "L1_S1");
    assert(reloaded.entities[0].status == domain::EntityStatus::Ok);
    assert(reloaded.entities[1].folderName.empty());
    assert(ReadFile(dir / "entities.csv") ==
           "loop no,system no,document no,extra,folder name,history folder name,status\n"
           "L1,S1,A-1-1,x,L1_S1,L1_S1,OK\n"
           ",S2,A-2-1,y,,,\n");

    WriteFile(dir / "entities.csv", "document no,loop no\nA-1-1,L1\n");
    bool threw = false;
    try {
        repo.load();
    } catch (const domain::FormatError& e) {
        threw = true;
        assert(e.issue().kind == domain::FormatIssue::Kind::MissingColumn);
        assert(e.issue().column == EntityTableRepository::kSystemColumn);
    }
    assert(threw);
}

static void TestCandidateTable(const TempDir& dir) {
    PersistenceService persistence;
    CandidateTableRepository repo(persistence);
    assert(!repo.load(dir / "missing.csv"));

    WriteFile(dir / "candidates.csv",
              "code,page range\n"
              "A-1,\"3, 1,x,0\"\n"
              ",5\n"
              "B-2,\n");
    auto table = repo.load(dir / "candidates.csv");
    assert(table);
    assert(table->rows.size() == 2);
    assert((table->rows[0].pages == std::vector<int>{3, 1}));
    assert(table->rows[1].pages.empty());
    assert(table->issues.size() == 3);
    assert(table->issues[0].value == "x" && table->issues[0].row == 1);
    assert(table->issues[1].value == "0");
    assert(table->issues[2].column == CandidateTableRepository::kCodeColumn && table->issues[2].row == 2);
    assert(table->contains("B-2") && !table->contains("C-3"));
    assert((table->allPages() == std::vector<int>{1, 3}));

    table->rows[0].status = domain::EntityStatus::Missing;
    repo.save(dir / "candidates.csv", *table);
    assert(ReadFile(dir / "candidates.csv") == "code,page range,status\nA-1,\"3, 1,x,0\",MISSING\n,5,\nB-2,,\n");

    WriteFile(dir / "broken.csv", "code\nA-1\n");
    bool threw = false;
    try {
        repo.load(dir / "broken.csv");
    } catch (const domain::FormatError& e) {
        threw = e.issue().kind == domain::FormatIssue::Kind::MissingColumn;
    }
    assert(threw);
}

static void TestOperatorCellsSurviveSave(const TempDir& dir) {
    PersistenceService persistence;

    EntityTableRepository entities(dir / "operator_entities.csv", persistence);
    WriteFile(entities.path(),
              "document no,remarks,loop no,system no,status\n"
              "A-1,call vendor,L1,S1,\n"
              "B-2,\"rev 3, pending\",L2 ,S2,MISSING\n");
    auto registry = entities.load().entities;
    for (auto& e : registry) e.normalize();
    registry[0].status = domain::EntityStatus::Ok;

    domain::Entity added;
    added.documentNo = "C-3";
    added.loopNo = "L3";
    added.systemNo = "S3";
    added.normalize();
    registry.push_back(added);

    entities.save(registry);
    assert(ReadFile(entities.path()) ==
           "document no,remarks,loop no,system no,status,folder name,history folder name\n"
           "A-1,call vendor,L1,S1,OK,L1_S1,L1_S1\n"
           "B-2,\"rev 3, pending\",L2 ,S2,MISSING,L2_S2,L2_S2\n"
           "C-3,,L3,S3,,L3_S3,L3_S3\n");

    CandidateTableRepository candidates(persistence);
    const fs::path tablePath = dir / "operator_candidates.csv";
    WriteFile(tablePath, "code,note,page range,status\nA-1,checked,7,\n");
    auto table = candidates.load(tablePath);
    assert(table && table->rows.size() == 1 && table->rows[0].row == 1);
    table->rows[0].status = domain::EntityStatus::Ok;
    domain::CandidateRow fresh;
    fresh.code = "B-2";
    fresh.pages = {4, 5};
    table->rows.push_back(fresh);

    candidates.save(tablePath, *table);
    assert(ReadFile(tablePath) == "code,note,page range,status\nA-1,checked,7,OK\nB-2,,\"4,5\",\n");
}

int main() {
    std::cout << "[Test] Starting Table Repository Test..." << std::endl;
    TempDir dir("tables");

    TestCsvQuoting();
    TestEntityTable(dir);
    TestCandidateTable(dir);
    TestOperatorCellsSurviveSave(dir);

    std::cout << "[PASS] Table Repository Test." << std::endl;
    return 0;
}
