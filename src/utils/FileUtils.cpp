#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return true;
    }
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if(path2.empty()){
        return path1;
    }
    std::string rel = path2;
    if (!rel.empty() && rel[0] == '/') {
        rel = rel.substr(1);
    }
    fs::path p = fs::path(path1) / fs::path(rel);
    return p.lexically_normal().string();
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

bool removeFileIfExists(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }
    if (!fs::remove(path, ec) || ec) {
        throw episim::FileIOException("FileUtils::removeFileIfExists",
            "Unable to remove existing file " + path + (ec ? ": " + ec.message() : ""));
    }
    return true;
}

std::string getOutputPath(const std::string& instanceFolder, const std::string& outputFolder) {
    std::string dir = joinPaths(instanceFolder, outputFolder.empty() ? "output" : outputFolder);
    if (!ensureDirectoryExists(dir)) {
        throw episim::FileIOException("FileUtils::getOutputPath", "Could not create output directory: " + dir);
    }
    return dir;
}

} // namespace FileUtils
