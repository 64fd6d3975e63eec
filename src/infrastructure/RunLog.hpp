/**
 * @file RunLog.hpp
 * @brief Action log and error report sinks for one pipeline run.
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <string>

namespace loopbinder::infrastructure {

/**
 * @class RunLog
 * @brief Two append-only text sinks, truncated when the run starts.
 *
 * Every line is prefixed with "[YYYY-MM-DD HH:MM:SS]". Actions are echoed to
 * stdout, errors to stderr. An empty log directory disables the files and
 * keeps only the console echo (used by tests).
 */
class RunLog {
public:
    static constexpr const char* kActionLogName = "orchestrator_log.txt";
    static constexpr const char* kErrorReportName = "error_report.txt";

    explicit RunLog(const std::filesystem::path& logDirectory, bool echo = true);

    /** @brief Appends a line to the action log. */
    void action(const std::string& message);

    /** @brief Appends a line to the error report (and to the action log). */
    void error(const std::string& message);

    /** @brief Number of error lines written during this run. */
    int errorCount() const { return m_errorCount; }

    std::filesystem::path actionLogPath() const;
    std::filesystem::path errorReportPath() const;

    /** @brief "HH:MM:SS" for an elapsed number of seconds. */
    static std::string FormatElapsed(double seconds);

private:
    std::filesystem::path m_directory;
    std::ofstream m_actions;
    std::ofstream m_errors;
    bool m_echo;
    int m_errorCount = 0;

    static std::string Timestamp();
};

} // namespace loopbinder::infrastructure
