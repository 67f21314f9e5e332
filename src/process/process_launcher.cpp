//===----------------------------------------------------------------------===//
//                         runnerd
//
// process/process_launcher.cpp
//
// Process launcher implementation
//===----------------------------------------------------------------------===//

#include "process/process_launcher.hpp"
#include "process/pty_process.hpp"
#include "process/workspace.hpp"
#include "query/query_store.hpp"
#include "logging/logger.hpp"

#include <stdexcept>

namespace runnerd {

ProcessLauncher::ProcessLauncher(const Config& config_p, std::shared_ptr<QueryStore> query_store_p)
    : config(config_p)
    , query_store(std::move(query_store_p)) {
}

ProcessLauncher::Launch ProcessLauncher::Start(uint64_t session_id,
                                               const LanguageSpec& spec,
                                               const std::string& code) const {
    Launch launch;
    try {
        if (spec.is_query) {
            PrepareQuery(code, launch);
        } else {
            PrepareProgram(spec, code, launch);
        }

        launch.process = PtyProcess::Spawn(launch.command);
    } catch (const std::exception& e) {
        LOG_WARN("launcher", "Session " + std::to_string(session_id) + " failed to start " +
                 spec.key + ": " + e.what());
        RemoveWorkspace(launch.workspace);
        RemoveWorkspace(launch.store_workspace);
        throw;
    }

    LOG_DEBUG("launcher", "Session " + std::to_string(session_id) + " running: " + launch.command);
    return launch;
}

ProcessLauncher::SourcePlan ProcessLauncher::PlanSource(const LanguageSpec& spec, const std::string& code) {
    SourcePlan plan;
    std::string stem = spec.default_stem;

    if (spec.needs_entry_discovery) {
        std::string symbol = FindEntrySymbol(code);
        if (!symbol.empty()) {
            stem = symbol;
        }
    }

    plan.filename = stem + "." + spec.extension;
    plan.run_command = ExpandCommand(spec.command_template, plan.filename, stem);
    return plan;
}

std::string ProcessLauncher::BuildShellCommand(const std::string& workspace, const std::string& run_command) {
    return "cd " + ShellQuote(workspace) + " && env TERM=dumb " + run_command;
}

std::string ProcessLauncher::BuildQueryCommand(const std::string& store_workspace) const {
    return config.query_engine + " " +
           ShellQuote(JoinPath(store_workspace, QueryStore::DATABASE_FILENAME)) +
           " < user_code.sql";
}

void ProcessLauncher::PrepareProgram(const LanguageSpec& spec, const std::string& code, Launch& launch) const {
    launch.workspace = CreateWorkspace(config.workspace_root, "user_session_");

    SourcePlan plan = PlanSource(spec, code);
    launch.source_path = JoinPath(launch.workspace, plan.filename);
    WriteTextFile(launch.source_path, code);

    launch.command = BuildShellCommand(launch.workspace, plan.run_command);
}

void ProcessLauncher::PrepareQuery(const std::string& code, Launch& launch) const {
    launch.workspace = CreateWorkspace(config.workspace_root, "sql_session_");
    launch.store_workspace = CreateWorkspace(config.workspace_root, "sql_store_");

    if (query_store) {
        query_store->Materialize(launch.store_workspace);
    }

    launch.source_path = JoinPath(launch.workspace, "user_code.sql");
    WriteTextFile(launch.source_path, code);

    launch.command = BuildShellCommand(launch.workspace, BuildQueryCommand(launch.store_workspace));
}

} // namespace runnerd
