/**
 * @file DocumentNaming.cpp
 * @brief Implementation of document role inference.
 */

#include "domain/DocumentNaming.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace loopbinder::domain {

namespace {

const std::regex& SourcePattern() {
    static const std::regex pattern(R"(\(([^)]+)\)(_dup[0-9]+)?\.[^.]+$)", std::regex::icase);
    return pattern;
}

bool AllDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c); });
}

} // namespace

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

bool NamingConvention::isDocument(const std::string& filename) const {
    return ToLower(fs::path(filename).extension().string()) == ToLower(documentExtension);
}

DocumentRole NamingConvention::classify(const std::string& filename) const {
    if (filename.empty() || filename.front() == '.') return DocumentRole::NotDocument;
    if (!isDocument(filename)) return DocumentRole::NotDocument;
    if (ToLower(filename) == ToLower(mergedOutput)) return DocumentRole::MergedOutput;

    const std::string stem = fs::path(filename).stem().string();
    if (!backupMarker.empty() && ToLower(stem).find(ToLower(backupMarker)) != std::string::npos) {
        return DocumentRole::BackupCopy;
    }
    if (ParseExtractedPage(filename)) return DocumentRole::ExtractedRange;
    if (ExtractContentCode(filename)) return DocumentRole::SourceOriginal;
    return DocumentRole::OtherDocument;
}

std::string NamingConvention::backupNameFor(const std::string& filename) const {
    fs::path p(filename);
    return p.stem().string() + backupMarker + p.extension().string();
}

std::optional<std::string> ExtractContentCode(const std::string& filename) {
    std::smatch match;
    if (!std::regex_search(filename, match, SourcePattern())) return std::nullopt;

    const std::string inner = match[1].str();
    const auto firstDash = inner.find('-');
    if (firstDash == std::string::npos) return std::nullopt;
    const auto secondDash = inner.find('-', firstDash + 1);
    std::string code = inner.substr(0, secondDash);
    if (code.size() <= firstDash + 1) return std::nullopt;
    return code;
}

std::optional<int> ParseExtractedPage(const std::string& filename) {
    const std::string stem = fs::path(filename).stem().string();
    if (!AllDigits(stem) || stem.size() > 9) return std::nullopt;
    return std::stoi(stem);
}

} // namespace loopbinder::domain
