//===----------------------------------------------------------------------===//
//                         runnerd
//
// artifacts/artifact_scanner.cpp
//
// Artifact scanner implementation
//===----------------------------------------------------------------------===//

#include "artifacts/artifact_scanner.hpp"
#include "artifacts/image_resizer.hpp"
#include "session/session.hpp"
#include "utils/base64.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace runnerd {

namespace {

std::string LowerExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return ext;
}

std::string ReadBinaryFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open file");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("read error");
    }
    return buffer.str();
}

} // anonymous namespace

const std::vector<std::string>& ArtifactScanner::Extensions() {
    static const std::vector<std::string> extensions = {".png", ".jpg", ".jpeg"};
    return extensions;
}

ArtifactScanner::ArtifactScanner(const Config& config_p)
    : config(config_p) {
}

std::vector<std::string> ArtifactScanner::ListCandidates(const std::string& workspace) const {
    std::vector<std::string> result;
    if (workspace.empty()) {
        return result;
    }

    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::directory_iterator it(workspace, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("artifacts", "Cannot list " + workspace + ": " + ec.message());
    }

    for (const auto& ext : Extensions()) {
        std::vector<std::string> matched;
        for (const auto& file : files) {
            if (LowerExtension(file) == ext) {
                matched.push_back(file.string());
            }
        }
        std::sort(matched.begin(), matched.end());
        result.insert(result.end(), matched.begin(), matched.end());
    }

    return result;
}

size_t ArtifactScanner::Scan(Session& session, const std::string& workspace) const {
    size_t delivered = 0;
    for (const auto& path : ListCandidates(workspace)) {
        if (session.IsClosing()) {
            break;
        }
        if (session.IsArtifactSent(path)) {
            continue;
        }
        if (SendArtifact(session, path)) {
            delivered++;
        }
    }
    return delivered;
}

bool ArtifactScanner::SendArtifact(Session& session, const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        session.Emit(SessionEvent::Error(SessionErrorCode::MISSING_ARTIFACT,
                                         "Plot file not found: " + path));
        return false;
    }

    std::string encoded;
    try {
        encoded = Base64Encode(LoadImage(path));
    } catch (const std::exception& e) {
        LOG_WARN("artifacts", "Session " + std::to_string(session.GetSessionId()) +
                 " cannot handle " + path + ": " + e.what());
        session.Emit(SessionEvent::Error(SessionErrorCode::ARTIFACT_PROCESSING_FAILURE,
                                         "Could not handle plot file " + path + ": " + e.what()));
        return false;
    }

    std::string name = fs::path(path).filename().string();
    if (!session.Emit(SessionEvent::Artifact(name, std::move(encoded)))) {
        return false;
    }

    session.MarkArtifactSent(path);
    LOG_DEBUG("artifacts", "Session " + std::to_string(session.GetSessionId()) + " sent " + name);
    return true;
}

std::string ArtifactScanner::LoadImage(const std::string& path) const {
    std::string bytes = ReadBinaryFile(path);
    if (!ImageCodecAvailable()) {
        return bytes;
    }
    return ShrinkToPng(bytes, static_cast<int>(config.max_dimension));
}

} // namespace runnerd
