/**
 * @file PdfToolkit.cpp
 * @brief Implementation of PdfToolkit.
 */

#include "infrastructure/PdfToolkit.hpp"
#include "domain/PipelineErrors.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace loopbinder::infrastructure {

namespace {

// Removes a staging directory when the assembling scope ends.
class StagingGuard {
public:
    explicit StagingGuard(fs::path dir) : m_dir(std::move(dir)) {}
    ~StagingGuard() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }
    StagingGuard(const StagingGuard&) = delete;
    StagingGuard& operator=(const StagingGuard&) = delete;

private:
    fs::path m_dir;
};

} // namespace

PdfToolkit::PdfToolkit(std::string toolDirectory) : m_toolDirectory(std::move(toolDirectory)) {}

std::string PdfToolkit::tool(const std::string& name) const {
    if (m_toolDirectory.empty()) return name;
    return ShellQuote((fs::path(m_toolDirectory) / name).string());
}

std::string PdfToolkit::ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') quoted += "'\\''";
        else quoted.push_back(c);
    }
    quoted += "'";
    return quoted;
}

PdfToolkit::CommandResult PdfToolkit::RunCommand(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;
    char buffer[4096];
    std::size_t read = 0;
    while ((read = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, read);
    }
    int status = pclose(pipe);
    result.exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

bool PdfToolkit::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

bool PdfToolkit::isAvailable(std::string& reason) const {
    for (const char* name : {"pdfinfo", "pdftotext", "pdfseparate", "pdfunite"}) {
        if (!HasTool(tool(name))) {
            reason = std::string(name) + " not found (install poppler-utils or set tool_directory)";
            return false;
        }
    }
    return true;
}

int PdfToolkit::ParsePageCount(const std::string& pdfinfoOutput) {
    std::istringstream in(pdfinfoOutput);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("Pages:", 0) == 0) {
            try {
                return std::stoi(line.substr(6));
            } catch (const std::exception&) {
                return -1;
            }
        }
    }
    return -1;
}

int PdfToolkit::pageCount(const fs::path& document) {
    auto result = RunCommand(tool("pdfinfo") + " " + ShellQuote(document.string()) + " 2>/dev/null");
    const int pages = ParsePageCount(result.output);
    if (result.exitCode != 0 || pages < 0) {
        throw domain::IoError("pdfinfo cannot read " + document.string());
    }
    return pages;
}

std::vector<std::string> PdfToolkit::SplitBboxPages(const std::string& xhtml) {
    std::vector<std::string> pages;
    std::size_t pos = 0;
    while ((pos = xhtml.find("<page ", pos)) != std::string::npos) {
        std::size_t end = xhtml.find("</page>", pos);
        if (end == std::string::npos) break;
        end += 7;

        std::string block;
        block.reserve(end - pos);
        for (std::size_t i = pos; i < end; ++i) {
            if (xhtml[i] != '\r') block.push_back(xhtml[i]);
        }
        pages.push_back(std::move(block));
        pos = end;
    }
    return pages;
}

std::vector<std::string> PdfToolkit::pageContents(const fs::path& document) {
    auto result = RunCommand(tool("pdftotext") + " -q -bbox " + ShellQuote(document.string()) + " - 2>/dev/null");
    if (result.exitCode != 0) {
        throw domain::IoError("pdftotext cannot read " + document.string());
    }
    return SplitBboxPages(result.output);
}

bool PdfToolkit::IsSeparateTargetSafe(const fs::path& destination) {
    return destination.string().find('%') == std::string::npos;
}

void PdfToolkit::separatePage(const fs::path& source, int pageNumber, const fs::path& destination) const {
    const std::string page = std::to_string(pageNumber);
    auto result = RunCommand(tool("pdfseparate") + " -f " + page + " -l " + page + " " +
                             ShellQuote(source.string()) + " " + ShellQuote(destination.string()) + " 2>&1");
    if (result.exitCode != 0 || !fs::exists(destination)) {
        throw domain::IoError("pdfseparate page " + page + " of " + source.string() + " failed: " + result.output);
    }
}

void PdfToolkit::extractPage(const fs::path& source, int pageNumber, const fs::path& destination) {
    if (IsSeparateTargetSafe(destination)) {
        separatePage(source, pageNumber, destination);
        return;
    }

    const fs::path staging = MakeStagingDirectory();
    StagingGuard guard(staging);
    const fs::path single = staging / "page.pdf";
    separatePage(source, pageNumber, single);

    std::error_code ec;
    fs::rename(single, destination, ec);
    if (ec) {
        // staging may sit on another filesystem
        fs::copy_file(single, destination, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw domain::IoError("cannot move page " + std::to_string(pageNumber) + " to " +
                                  destination.string() + ": " + ec.message());
        }
    }
}

fs::path PdfToolkit::MakeStagingDirectory() {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("loopbinder_" + std::to_string(now));
    fs::create_directories(dir);
    return dir;
}

void PdfToolkit::assemble(const std::vector<domain::PageRef>& pages, const fs::path& destination) {
    if (pages.empty()) {
        throw domain::IoError("nothing to assemble into " + destination.string());
    }

    const fs::path staging = MakeStagingDirectory();
    StagingGuard guard(staging);

    std::vector<fs::path> singles;
    singles.reserve(pages.size());
    for (std::size_t i = 0; i < pages.size(); ++i) {
        std::ostringstream name;
        name << std::setw(6) << std::setfill('0') << i << ".pdf";
        fs::path single = staging / name.str();
        separatePage(pages[i].document, pages[i].pageIndex + 1, single);
        singles.push_back(single);
    }

    if (singles.size() == 1) {
        fs::copy_file(singles.front(), destination, fs::copy_options::overwrite_existing);
        return;
    }

    std::string cmd = tool("pdfunite");
    for (const auto& single : singles) cmd += " " + ShellQuote(single.string());
    cmd += " " + ShellQuote(destination.string()) + " 2>&1";
    auto result = RunCommand(cmd);
    if (result.exitCode != 0 || !fs::exists(destination)) {
        throw domain::IoError("pdfunite into " + destination.string() + " failed: " + result.output);
    }
}

} // namespace loopbinder::infrastructure
