/**
 * @file AtomicFile.cpp
 * @brief Temp-file-and-rename writes for the device store.
 */

#include "lanmonitor/AtomicFile.h"

#include <fstream>
#include <sstream>

namespace LanMonitor {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& content,
                         std::string& errorMsg)
{
    errorMsg.clear();

    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);
    std::error_code ec;

    const auto parent = finalPath.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            errorMsg = std::string("create_directories failed: ") + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            errorMsg = "Cannot open temp file: " + paths.tempPath.string();
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            errorMsg = "Write failed: " + paths.tempPath.string();
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            return false;
        }
    }

    std::filesystem::rename(paths.tempPath, paths.finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        std::error_code removeEc;
        std::filesystem::remove(paths.tempPath, removeEc);
        return false;
    }

    return true;
}

bool removeStaleTempFile(const std::filesystem::path& finalPath)
{
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(paths.tempPath, ec)) {
        return false;
    }
    return std::filesystem::remove(paths.tempPath, ec) && !ec;
}

bool readWholeFile(const std::filesystem::path& path,
                   std::string& content,
                   std::string& errorMsg)
{
    errorMsg.clear();
    content.clear();

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        errorMsg = "Cannot open file: " + path.string();
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        errorMsg = "Read failed: " + path.string();
        return false;
    }

    content = buffer.str();
    return true;
}

}  // namespace LanMonitor
