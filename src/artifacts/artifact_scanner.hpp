//===----------------------------------------------------------------------===//
//                         runnerd
//
// artifacts/artifact_scanner.hpp
//
// Detects image files written by a program and sends them to its client
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace runnerd {

class ArtifactScanner {
public:
    struct Config {
        // Longest side of a sent image
        uint32_t max_dimension;

        Config()
            : max_dimension(DEFAULT_MAX_IMAGE_DIMENSION) {}
    };

    // Scan order: extension first, then file name
    static const std::vector<std::string>& Extensions();

    explicit ArtifactScanner(const Config& config_p = Config{});

    // Image files in `workspace`, in scan order
    std::vector<std::string> ListCandidates(const std::string& workspace) const;

    // Sends every candidate the session has not sent yet.
    // Returns the number of artifacts delivered.
    size_t Scan(Session& session, const std::string& workspace) const;

    // Sends one file. A missing or undecodable file is reported to the
    // session and left unmarked. Returns true if the artifact was delivered.
    bool SendArtifact(Session& session, const std::string& path) const;

    // Bytes sent for an image file (resized and re-encoded when supported).
    // Throws std::runtime_error on read or decode failure.
    std::string LoadImage(const std::string& path) const;

private:
    Config config;
};

} // namespace runnerd
