/**
 * @file PdfToolkit.hpp
 * @brief DocumentEngine backed by the poppler-utils command line tools.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "domain/DocumentEngine.hpp"

namespace loopbinder::infrastructure {

/**
 * @class PdfToolkit
 * @brief Runs pdfinfo / pdftotext / pdfseparate / pdfunite as child processes.
 *
 * Page content for fingerprinting comes from `pdftotext -bbox`: the words of
 * a page with their bounding boxes. That output ignores object numbering,
 * producer strings and timestamps, so a re-saved copy of a page yields the
 * same content while any visible text or layout change does not.
 */
class PdfToolkit : public domain::DocumentEngine {
public:
    /** @param toolDirectory Optional directory holding the tools; PATH lookup when empty. */
    explicit PdfToolkit(std::string toolDirectory = {});

    bool isAvailable(std::string& reason) const override;
    int pageCount(const std::filesystem::path& document) override;
    std::vector<std::string> pageContents(const std::filesystem::path& document) override;
    void extractPage(const std::filesystem::path& source, int pageNumber,
                     const std::filesystem::path& destination) override;
    void assemble(const std::vector<domain::PageRef>& pages, const std::filesystem::path& destination) override;

    /** @brief Splits `pdftotext -bbox` output into one block per <page> element. */
    static std::vector<std::string> SplitBboxPages(const std::string& xhtml);

    /** @brief Reads the "Pages:" line of pdfinfo output; -1 if absent. */
    static int ParsePageCount(const std::string& pdfinfoOutput);

    static std::string ShellQuote(const std::string& value);

    /** @brief pdfseparate reads its output argument as a %d pattern; any '%' breaks it. */
    static bool IsSeparateTargetSafe(const std::filesystem::path& destination);

private:
    struct CommandResult {
        std::string output;
        int exitCode = -1;
    };

    std::string m_toolDirectory;

    std::string tool(const std::string& name) const;
    static CommandResult RunCommand(const std::string& cmd);
    static bool HasTool(const std::string& tool);
    static std::filesystem::path MakeStagingDirectory();
    void separatePage(const std::filesystem::path& source, int pageNumber,
                      const std::filesystem::path& destination) const;
};

} // namespace loopbinder::infrastructure
