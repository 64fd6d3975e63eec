/**
 * @file DocumentNaming.hpp
 * @brief Naming conventions that determine a document's role inside a folder.
 *
 * Roles are never stored; they are inferred from file names every time a
 * folder is inspected.
 */

#pragma once
#include <optional>
#include <string>

namespace loopbinder::domain {

/**
 * @enum DocumentRole
 * @brief Classification of a file inside an entity folder.
 */
enum class DocumentRole {
    ExtractedRange, ///< "<page>.pdf" cut from the master document.
    SourceOriginal, ///< "...(<code>).pdf" fetched from the source store.
    BackupCopy,     ///< Any document whose stem carries the backup marker.
    MergedOutput,   ///< The consolidated output of the folder.
    OtherDocument,  ///< A document matching none of the above.
    NotDocument     ///< Wrong extension, hidden file, tables, sidecars.
};

/**
 * @struct NamingConvention
 * @brief File names the pipeline reads and writes inside each folder.
 */
struct NamingConvention {
    std::string candidateTable = "candidates.csv";
    std::string mergedOutput = "Combined.pdf";
    std::string backupMarker = "_backup";
    std::string cacheSidecar = ".merge_cache.json";
    std::string documentExtension = ".pdf";

    /** @brief Classifies a bare file name (no directory part). */
    DocumentRole classify(const std::string& filename) const;

    /** @brief "<stem><marker><ext>" for a primary document. */
    std::string backupNameFor(const std::string& filename) const;

    /** @brief True if the extension matches documentExtension (case-insensitive). */
    bool isDocument(const std::string& filename) const;
};

/**
 * @brief Content code of a source-original file name.
 *
 * "Drawing(AB-12-34).pdf" yields "AB-12": the first two '-' separated
 * segments inside the trailing parentheses. A "_dupN" collision suffix after
 * the parentheses is tolerated.
 */
std::optional<std::string> ExtractContentCode(const std::string& filename);

/** @brief Page number of an extracted-range file name ("12.pdf" -> 12). */
std::optional<int> ParseExtractedPage(const std::string& filename);

/** @brief Lower-cases ASCII letters. */
std::string ToLower(std::string value);

} // namespace loopbinder::domain
