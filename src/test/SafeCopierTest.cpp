#include <cassert>
#include <iostream>

#include "domain/PipelineErrors.hpp"
#include "infrastructure/SafeCopier.hpp"
#include "TestSupport.hpp"

using namespace loopbinder;
using namespace loopbinder::test;
using infrastructure::CopyIdentity;
using infrastructure::SafeCopier;

int main() {
    std::cout << "[Test] Starting SafeCopier Test..." << std::endl;
    TempDir dir("safecopy");

    WriteFile(dir / "src/a/report.pdf", "first version");
    WriteFile(dir / "src/b/report.pdf", "second version, longer");
    WriteFile(dir / "src/c/report.pdf", "third version, longest of all");

    SafeCopier copier;
    const fs::path dst = dir / "out/report.pdf";

    auto first = copier.copy(dir / "src/a/report.pdf", dst);
    assert(first.copied && first.path == dst);
    auto second = copier.copy(dir / "src/b/report.pdf", dst);
    assert(second.copied && second.path == dir / "out/report_dup1.pdf");
    auto third = copier.copy(dir / "src/c/report.pdf", dst);
    assert(third.copied && third.path == dir / "out/report_dup2.pdf");

    assert(ReadFile(dst) == "first version");
    assert(ReadFile(dir / "out/report_dup1.pdf") == "second version, longer");
    assert(ReadFile(dir / "out/report_dup2.pdf") == "third version, longest of all");

    // Re-copying any of them is a no-op that points at the existing copy.
    auto again = copier.copy(dir / "src/b/report.pdf", dst);
    assert(!again.copied && again.path == dir / "out/report_dup1.pdf");
    assert(!fs::exists(dir / "out/report_dup3.pdf"));

    assert(fs::last_write_time(dst) == fs::last_write_time(dir / "src/a/report.pdf"));

    // Equal size, different bytes: size identity treats it as present, digest identity does not.
    WriteFile(dir / "src/d/report.pdf", "FIRST VERSION");
    auto bySize = copier.copy(dir / "src/d/report.pdf", dst);
    assert(!bySize.copied && bySize.path == dst);

    SafeCopier digestCopier(CopyIdentity::Digest);
    auto byDigest = digestCopier.copy(dir / "src/d/report.pdf", dst);
    assert(byDigest.copied && byDigest.path == dir / "out/report_dup3.pdf");
    assert(ReadFile(dst) == "first version");

    bool threw = false;
    try {
        copier.copy(dir / "src/none.pdf", dst);
    } catch (const domain::LookupError&) {
        threw = true;
    }
    assert(threw);

    assert(SafeCopier::CandidateName(dir / "x/(A-1).pdf", 2) == dir / "x/(A-1)_dup2.pdf");

    std::cout << "[PASS] SafeCopier Test." << std::endl;
    return 0;
}
