/**
 * @file MergeCacheStore.cpp
 * @brief Implementation of MergeCacheStore.
 */

#include "infrastructure/MergeCacheStore.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace loopbinder::infrastructure {

MergeCacheStore::MergeCacheStore(std::string sidecarName, const PersistenceService& persistence)
    : m_sidecarName(std::move(sidecarName)), m_persistence(persistence) {}

fs::path MergeCacheStore::sidecarPath(const fs::path& folder) const {
    return folder / m_sidecarName;
}

std::string MergeCacheStore::NowUtc() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<MergeCacheEntry> MergeCacheStore::load(const fs::path& folder) const {
    const fs::path p = sidecarPath(folder);
    if (!fs::exists(p)) return std::nullopt;

    try {
        std::ifstream f(p);
        if (!f.is_open()) return std::nullopt;

        json j = json::parse(f);
        if (!j.contains("fingerprint") || !j["fingerprint"].is_string()) return std::nullopt;

        MergeCacheEntry entry;
        entry.fingerprint = j["fingerprint"].get<std::string>();
        entry.folder = j.value("folder", std::string());
        entry.timestamp = j.value("timestamp", std::string());
        return entry;
    } catch (const json::exception&) {
        // Corrupt sidecar: a miss forces a fresh merge that rewrites it.
        return std::nullopt;
    }
}

bool MergeCacheStore::matches(const fs::path& folder, const std::string& fingerprint) const {
    auto entry = load(folder);
    return entry && entry->fingerprint == fingerprint;
}

MergeCacheEntry MergeCacheStore::store(const fs::path& folder, const std::string& fingerprint) const {
    MergeCacheEntry entry;
    entry.folder = folder.filename().string();
    entry.fingerprint = fingerprint;
    entry.timestamp = NowUtc();

    json j = {
        {"folder", entry.folder},
        {"fingerprint", entry.fingerprint},
        {"timestamp", entry.timestamp},
    };
    m_persistence.writeTextAtomic(sidecarPath(folder), j.dump(4, ' ', false, json::error_handler_t::replace));
    return entry;
}

} // namespace loopbinder::infrastructure
