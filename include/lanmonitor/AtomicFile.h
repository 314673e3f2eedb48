/**
 * @file AtomicFile.h
 * @brief Crash-safe replacement of the device store document.
 *
 * The store is rewritten whole on every commit. The new document goes to a
 * ".part" sibling first and is renamed over the old one, so a reader (or the
 * next daemon start) sees either the previous commit or the new one.
 */

#pragma once

#include <filesystem>
#include <string>

namespace LanMonitor {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;   ///< finalPath + ".part"
};

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Replace finalPath with content via temp file and rename(2).
 *
 * Missing parent directories are created. On failure the temp file is
 * removed, finalPath keeps its previous content and errorMsg says which
 * step failed.
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg);

/**
 * @brief Delete a ".part" file left behind by an interrupted write.
 * @return true if a leftover existed and was removed
 */
bool removeStaleTempFile(const std::filesystem::path& finalPath);

bool readWholeFile(const std::filesystem::path& path,
                   std::string& content,
                   std::string& errorMsg);

}  // namespace LanMonitor
