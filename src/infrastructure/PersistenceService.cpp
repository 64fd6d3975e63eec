/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/PipelineErrors.hpp"
#include <chrono>
#include <fstream>
#include <sstream>

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

fs::path PersistenceService::TempPathFor(const fs::path& target) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path name = "." + target.filename().string() + "." + std::to_string(timestamp) + ".tmp";
    return target.parent_path() / name;
}

void PersistenceService::writeTextAtomic(const fs::path& target, const std::string& content) const {
    std::error_code ec;
    if (target.has_parent_path() && !fs::exists(target.parent_path(), ec)) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw domain::IoError("cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    const fs::path tempPath = TempPathFor(target);
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::IoError("cannot open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::IoError("write failed for " + tempPath.string());
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw domain::IoError("rename to " + target.string() + " failed: " + ec.message());
    }
}

std::string PersistenceService::readText(const fs::path& source) const {
    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        throw domain::IoError("cannot open " + source.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace loopbinder::infrastructure
