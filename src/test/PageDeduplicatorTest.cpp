#include <cassert>
#include <iostream>
#include <set>

#include "application/PageDeduplicator.hpp"
#include "TestSupport.hpp"

using namespace loopbinder;
using namespace loopbinder::test;
using application::PageDeduplicator;

static std::vector<std::string> Names(const std::vector<fs::path>& paths) {
    std::vector<std::string> names;
    for (const auto& p : paths) names.push_back(p.filename().string());
    return names;
}

static void TestCandidateOrder() {
    TempDir dir("order");
    for (const char* name : {"10.pdf", "2.pdf", "b (B-1-1).pdf", "a (A-1-1).pdf", "notes.pdf",
                             "a (A-1-1)_backup.pdf", "2_backup.pdf", "Combined.pdf", "candidates.csv",
                             ".merge_cache.json", "20240101123.pdf"}) {
        WriteFile(dir / name, name);
    }
    fs::create_directories(dir / "sub.pdf");

    auto ordered = PageDeduplicator::OrderCandidates(infrastructure::FolderSnapshot::Capture(dir.path()),
                                                     domain::NamingConvention{});
    const std::vector<std::string> expected = {
        "2.pdf", "10.pdf",
        "20240101123.pdf", "a (A-1-1).pdf", "b (B-1-1).pdf", "notes.pdf",
        "2_backup.pdf", "a (A-1-1)_backup.pdf",
    };
    assert(Names(ordered) == expected);
}

static void TestScenario() {
    TempDir dir("dedup");
    WriteFile(dir / "1.pdf", FakeDocumentEngine::MakeDocument({"P1"}));
    WriteFile(dir / "(A-1-1).pdf", FakeDocumentEngine::MakeDocument({"P1", "P2"}));
    WriteFile(dir / "(A-1-1)_backup.pdf", FakeDocumentEngine::MakeDocument({"P1"}));

    FakeDocumentEngine engine;
    infrastructure::ContentHasher hasher;
    PageDeduplicator dedup(engine, hasher);

    auto ordered = PageDeduplicator::OrderCandidates(infrastructure::FolderSnapshot::Capture(dir.path()),
                                                     domain::NamingConvention{});
    auto result = dedup.run(ordered);

    assert(result.pages.size() == 2);
    assert(result.pages[0].document == dir / "1.pdf" && result.pages[0].pageIndex == 0);
    assert(result.pages[1].document == dir / "(A-1-1).pdf" && result.pages[1].pageIndex == 1);
    assert(result.duplicatesSkipped == 2);
    assert(result.fullyDuplicated.size() == 1);
    assert(result.fullyDuplicated[0] == dir / "(A-1-1)_backup.pdf");

    engine.assemble(result.pages, dir / "out.pdf");
    assert((FakeDocumentEngine::Pages(ReadFile(dir / "out.pdf")) == std::vector<std::string>{"P1", "P2"}));
}

static void TestNoRepeatedFingerprints() {
    TempDir dir("unique");
    WriteFile(dir / "1.pdf", FakeDocumentEngine::MakeDocument({"X", "X", "Y"}));
    WriteFile(dir / "2.pdf", FakeDocumentEngine::MakeDocument({"Y", "Z", "X"}));
    WriteFile(dir / "(C-1-1).pdf", FakeDocumentEngine::MakeDocument({"Z", "W"}));

    FakeDocumentEngine engine;
    infrastructure::ContentHasher hasher;
    PageDeduplicator dedup(engine, hasher);
    auto result = dedup.run(PageDeduplicator::OrderCandidates(
        infrastructure::FolderSnapshot::Capture(dir.path()), domain::NamingConvention{}));

    std::set<std::string> fingerprints;
    std::vector<std::string> contents;
    for (const auto& ref : result.pages) {
        const std::string page = engine.pageContents(ref.document).at(ref.pageIndex);
        assert(fingerprints.insert(hasher.digest(page)).second);
        contents.push_back(page);
    }
    assert((contents == std::vector<std::string>{"X", "Y", "Z", "W"}));
    assert(result.fullyDuplicated.empty());

    bool threw = false;
    try {
        dedup.run({dir / "absent.pdf"});
    } catch (const domain::IoError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    std::cout << "[Test] Starting PageDeduplicator Test..." << std::endl;

    TestCandidateOrder();
    TestScenario();
    TestNoRepeatedFingerprints();

    std::cout << "[PASS] PageDeduplicator Test." << std::endl;
    return 0;
}
