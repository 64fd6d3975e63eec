/**
 * @file PipelineErrors.hpp
 * @brief Error taxonomy shared by every pipeline stage.
 *
 * SetupError aborts the run before stage 1. The others are recoverable and
 * are caught at the smallest unit boundary (row, file, folder).
 */

#pragma once
#include <stdexcept>
#include <string>

namespace loopbinder::domain {

class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Required global input missing or unreadable. Fatal. */
class SetupError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/** @brief Expected source document not found. */
class LookupError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/** @brief Copy/write/read failure for a single file. */
class IoError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/**
 * @struct FormatIssue
 * @brief Tagged description of a schema violation in a table or value.
 */
struct FormatIssue {
    enum class Kind { MissingColumn, BadValue };

    Kind kind = Kind::BadValue;
    std::string column;
    std::string value;
    int row = 0; ///< 1-based data row, 0 when not row-specific.

    std::string describe() const {
        if (kind == Kind::MissingColumn) {
            return "missing column '" + column + "'";
        }
        std::string text = "bad value '" + value + "' in column '" + column + "'";
        if (row > 0) text += " (row " + std::to_string(row) + ")";
        return text;
    }
};

/** @brief Malformed table or value. Carries the issue that caused it. */
class FormatError : public PipelineError {
public:
    explicit FormatError(FormatIssue issue)
        : PipelineError(issue.describe()), m_issue(std::move(issue)) {}

    const FormatIssue& issue() const { return m_issue; }

private:
    FormatIssue m_issue;
};

} // namespace loopbinder::domain
