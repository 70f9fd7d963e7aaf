#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace compartmental {
namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return fs::is_directory(path, ec);
    }
    fs::create_directories(path, ec);
    if (ec) {
        Logger::getInstance().error("FileUtils::ensureDirectoryExists",
                                    "Error creating directory '" + path + "': " + ec.message());
        return false;
    }
    return true;
}

std::string getProjectRoot() {
    fs::path current = fs::current_path();
    std::vector<fs::path> candidates = { current };
    for (int i = 0; i < 5 && current.has_parent_path() && current != current.parent_path(); i++) {
        current = current.parent_path();
        candidates.push_back(current);
    }

    for (const auto& root : candidates) {
        if (fs::exists(root / "data") && fs::exists(root / "include") && fs::exists(root / "src")) {
            return fs::absolute(root).lexically_normal().string();
        }
    }
    return fs::absolute(fs::current_path()).lexically_normal().string();
}

std::string getOutputPath(const std::string& filename) {
    fs::path output_dir = fs::path(getProjectRoot()) / "data" / "output";
    if (!ensureDirectoryExists(output_dir.string())) {
        Logger::getInstance().warning("FileUtils::getOutputPath",
                                      "Could not create output directory: " + output_dir.string());
    }
    if (filename.empty()) {
        return output_dir.lexically_normal().string();
    }
    return (output_dir / filename).lexically_normal().string();
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if (path2.empty()) {
        return path1;
    }
    std::string rel = path2;
    if (rel[0] == '/') {
        rel = rel.substr(1);
    }
    return (fs::path(path1) / fs::path(rel)).lexically_normal().string();
}

} // namespace FileUtils
} // namespace compartmental
