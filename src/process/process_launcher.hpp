//===----------------------------------------------------------------------===//
//                         runnerd
//
// process/process_launcher.hpp
//
// Materializes source code into a workspace and spawns it on a pty
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "language/language_spec.hpp"

namespace runnerd {

class ProcessLauncher {
public:
    struct Config {
        // Parent directory for workspaces (empty = system temp dir)
        std::string workspace_root;

        // Query engine CLI run against the session's database file
        std::string query_engine;

        Config()
            : query_engine(DEFAULT_QUERY_ENGINE) {}
    };

    // Source file name and run command resolved for one submission
    struct SourcePlan {
        std::string filename;
        std::string run_command;
    };

    // A spawned program and the workspaces it owns
    struct Launch {
        PtyProcessPtr process;
        std::string workspace;
        std::string store_workspace;
        std::string source_path;
        std::string command;
    };

    explicit ProcessLauncher(const Config& config_p = Config{},
                             std::shared_ptr<QueryStore> query_store_p = nullptr);

    // Creates the workspace(s), writes the source and spawns the program.
    // On failure every workspace created so far is removed and
    // std::runtime_error is thrown.
    Launch Start(uint64_t session_id, const LanguageSpec& spec, const std::string& code) const;

    // Filename and command for a non-query language
    static SourcePlan PlanSource(const LanguageSpec& spec, const std::string& code);

    // Full shell command run inside the workspace
    static std::string BuildShellCommand(const std::string& workspace, const std::string& run_command);

    // Engine invocation applying user_code.sql to the store database
    std::string BuildQueryCommand(const std::string& store_workspace) const;

    const Config& GetConfig() const { return config; }

private:
    void PrepareProgram(const LanguageSpec& spec, const std::string& code, Launch& launch) const;
    void PrepareQuery(const std::string& code, Launch& launch) const;

    Config config;
    std::shared_ptr<QueryStore> query_store;
};

} // namespace runnerd
