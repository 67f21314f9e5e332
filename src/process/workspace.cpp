//===----------------------------------------------------------------------===//
//                         runnerd
//
// process/workspace.cpp
//
// Workspace helpers
//===----------------------------------------------------------------------===//

#include "process/workspace.hpp"
#include "logging/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace runnerd {

namespace fs = std::filesystem;

std::string CreateWorkspace(const std::string& root, const std::string& prefix) {
    std::string base = root;
    if (base.empty()) {
        std::error_code ec;
        base = fs::temp_directory_path(ec).string();
        if (ec || base.empty()) {
            base = "/tmp";
        }
    }

    std::string pattern = JoinPath(base, prefix + "XXXXXX");
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Failed to create workspace in " + base + ": " +
                                 std::strerror(errno));
    }

    return std::string(buffer.data());
}

void RemoveWorkspace(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        LOG_WARN("workspace", "Failed to remove " + path + ": " + ec.message());
    }
}

void WriteTextFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write " + path);
    }
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

} // namespace runnerd
