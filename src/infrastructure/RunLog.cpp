/**
 * @file RunLog.cpp
 * @brief Implementation of RunLog.
 */

#include "infrastructure/RunLog.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

RunLog::RunLog(const fs::path& logDirectory, bool echo) : m_directory(logDirectory), m_echo(echo) {
    if (m_directory.empty()) return;

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    m_actions.open(actionLogPath(), std::ios::out | std::ios::trunc);
    m_errors.open(errorReportPath(), std::ios::out | std::ios::trunc);
    if (!m_actions.is_open() || !m_errors.is_open()) {
        std::cerr << "[RunLog] Cannot open log files in " << m_directory << std::endl;
    }
}

fs::path RunLog::actionLogPath() const {
    return m_directory / kActionLogName;
}

fs::path RunLog::errorReportPath() const {
    return m_directory / kErrorReportName;
}

std::string RunLog::Timestamp() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "[%Y-%m-%d %H:%M:%S]", &tm);
    return buffer;
}

std::string RunLog::FormatElapsed(double seconds) {
    const long total = seconds > 0 ? static_cast<long>(seconds) : 0;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02ld:%02ld:%02ld", total / 3600, (total % 3600) / 60, total % 60);
    return buffer;
}

void RunLog::action(const std::string& message) {
    const std::string line = Timestamp() + " " + message;
    if (m_echo) std::cout << line << std::endl;
    if (m_actions.is_open()) m_actions << line << "\n" << std::flush;
}

void RunLog::error(const std::string& message) {
    ++m_errorCount;
    const std::string line = Timestamp() + " " + message;
    if (m_echo) std::cerr << line << std::endl;
    if (m_errors.is_open()) m_errors << line << "\n" << std::flush;
    if (m_actions.is_open()) m_actions << line << "\n" << std::flush;
}

} // namespace loopbinder::infrastructure
