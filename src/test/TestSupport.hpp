/**
 * @file TestSupport.hpp
 * @brief Shared fixtures for the LoopBinder test programs.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "application/RunContext.hpp"
#include "domain/DocumentEngine.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RunLog.hpp"
#include "infrastructure/SafeCopier.hpp"

namespace loopbinder::test {

namespace fs = std::filesystem;

inline void WriteFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/** @brief Scratch directory removed when the test ends. */
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() / ("loopbinder_" + name + "_" + std::to_string(stamp));
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }
    fs::path operator/(const std::string& child) const { return m_path / child; }

private:
    fs::path m_path;
};

/**
 * @class FakeDocumentEngine
 * @brief Plain-text "documents" whose pages are separated by form feeds.
 */
class FakeDocumentEngine : public domain::DocumentEngine {
public:
    int assembleCalls = 0;
    bool failAssemble = false;

    static std::string MakeDocument(const std::vector<std::string>& pages) {
        std::string text;
        for (std::size_t i = 0; i < pages.size(); ++i) {
            if (i > 0) text += '\f';
            text += pages[i];
        }
        return text;
    }

    static std::vector<std::string> Pages(const std::string& text) {
        std::vector<std::string> pages;
        if (text.empty()) return pages;
        std::stringstream ss(text);
        std::string page;
        while (std::getline(ss, page, '\f')) pages.push_back(page);
        if (text.back() == '\f') pages.push_back("");
        return pages;
    }

    bool isAvailable(std::string&) const override { return true; }

    int pageCount(const fs::path& document) override {
        return static_cast<int>(pageContents(document).size());
    }

    std::vector<std::string> pageContents(const fs::path& document) override {
        if (!fs::is_regular_file(document)) throw domain::IoError("cannot read " + document.string());
        return Pages(ReadFile(document));
    }

    void extractPage(const fs::path& source, int pageNumber, const fs::path& destination) override {
        auto pages = pageContents(source);
        if (pageNumber < 1 || pageNumber > static_cast<int>(pages.size())) {
            throw domain::IoError("page out of range");
        }
        WriteFile(destination, pages[pageNumber - 1]);
    }

    void assemble(const std::vector<domain::PageRef>& refs, const fs::path& destination) override {
        ++assembleCalls;
        if (failAssemble) throw domain::IoError("assemble failed");
        std::vector<std::string> out;
        for (const auto& ref : refs) out.push_back(pageContents(ref.document).at(ref.pageIndex));
        WriteFile(destination, MakeDocument(out));
    }
};

/**
 * @struct Harness
 * @brief Owns everything a RunContext points at, with a quiet console-only log.
 */
struct Harness {
    infrastructure::RunConfig config;
    infrastructure::RunLog log{fs::path(), false};
    FakeDocumentEngine engine;
    infrastructure::SafeCopier copier;
    infrastructure::ContentHasher hasher;
    infrastructure::PersistenceService persistence;
    application::RunSummary summary;
    application::RunContext context{config, log, engine, copier, hasher, persistence, summary};

    explicit Harness(const fs::path& destinationRoot) {
        config.destinationRoot = destinationRoot;
        config.logDirectory.clear();
        fs::create_directories(destinationRoot);
    }
};

} // namespace loopbinder::test
