//===----------------------------------------------------------------------===//
//                         runnerd
//
// process/workspace.hpp
//
// Temporary per-session directories
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace runnerd {

// Creates a fresh, uniquely named directory `<root>/<prefix>XXXXXX`.
// An empty root means the system temporary directory.
// Throws std::runtime_error on failure.
std::string CreateWorkspace(const std::string& root, const std::string& prefix);

// Recursively removes a workspace. Errors are logged and ignored.
void RemoveWorkspace(const std::string& path);

// Writes `content` verbatim to `path`. Throws std::runtime_error on failure.
void WriteTextFile(const std::string& path, const std::string& content);

// Joins a directory and a file name
std::string JoinPath(const std::string& dir, const std::string& name);

} // namespace runnerd
