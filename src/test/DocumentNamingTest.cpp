#include <cassert>
#include <iostream>

#include "domain/DocumentNaming.hpp"
#include "domain/Entity.hpp"

using namespace loopbinder::domain;

int main() {
    std::cout << "[Test] Starting DocumentNaming Test..." << std::endl;

    NamingConvention naming;

    assert(naming.classify("12.pdf") == DocumentRole::ExtractedRange);
    assert(naming.classify("123456789.pdf") == DocumentRole::ExtractedRange);
    assert(naming.classify("1234567890.pdf") == DocumentRole::OtherDocument);
    assert(naming.classify("Drawing (AB-12-3).pdf") == DocumentRole::SourceOriginal);
    assert(naming.classify("Drawing (AB-12-3)_dup1.pdf") == DocumentRole::SourceOriginal);
    assert(naming.classify("Drawing (AB-12-3)_backup.pdf") == DocumentRole::BackupCopy);
    assert(naming.classify("12_BACKUP.PDF") == DocumentRole::BackupCopy);
    assert(naming.classify("Combined.pdf") == DocumentRole::MergedOutput);
    assert(naming.classify("notes.pdf") == DocumentRole::OtherDocument);
    assert(naming.classify("candidates.csv") == DocumentRole::NotDocument);
    assert(naming.classify(".merge_cache.json") == DocumentRole::NotDocument);
    assert(naming.classify(".12.pdf.part") == DocumentRole::NotDocument);
    assert(naming.classify(".Combined.pdf.1234.tmp") == DocumentRole::NotDocument);

    assert(ExtractContentCode("Drawing (AB-12-3).pdf").value() == "AB-12");
    assert(ExtractContentCode("(A-1).pdf").value() == "A-1");
    assert(ExtractContentCode("x (A-1-1)_dup2.pdf").value() == "A-1");
    assert(!ExtractContentCode("(A).pdf"));
    assert(!ExtractContentCode("plain.pdf"));

    assert(naming.backupNameFor("(A-1-1).pdf") == "(A-1-1)_backup.pdf");
    assert(ParseExtractedPage("007.pdf").value() == 7);
    assert(!ParseExtractedPage("7a.pdf"));

    assert(MakeFolderName("  L1 ", "S1\t") == "L1_S1");
    Entity entity;
    entity.loopNo = "L1";
    entity.systemNo = "S2";
    entity.normalize();
    assert(entity.folderName == "L1_S2");
    assert(entity.historyFolderName == "L1_S2");
    entity.historyFolderName = "L1_Sold";
    entity.normalize();
    assert(entity.historyFolderName == "L1_Sold");

    assert(StatusFromString(" ok ") == EntityStatus::Ok);
    assert(StatusFromString("MISSING") == EntityStatus::Missing);
    assert(StatusFromString("") == EntityStatus::Unknown);

    std::cout << "[PASS] DocumentNaming Test." << std::endl;
    return 0;
}
