//===----------------------------------------------------------------------===//
//                         runnerd
//
// query/query_store.cpp
//
// Template database built with DuckDB
//===----------------------------------------------------------------------===//

#include "query/query_store.hpp"
#include "process/workspace.hpp"
#include "logging/logger.hpp"
#include "duckdb.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace runnerd {

namespace fs = std::filesystem;

QueryStore::QueryStore(std::string prepopulate_script_p, std::string template_root_p)
    : script_path(std::move(prepopulate_script_p))
    , template_root(std::move(template_root_p)) {
}

QueryStore::~QueryStore() {
    std::lock_guard<std::mutex> lock(mutex);
    RemoveWorkspace(template_dir);
}

bool QueryStore::Prepare(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex);

    if (!template_path.empty()) {
        return true;
    }
    if (script_path.empty()) {
        LOG_DEBUG("query_store", "No prepopulation script configured");
        return true;
    }

    std::error_code ec;
    if (!fs::is_regular_file(script_path, ec)) {
        LOG_WARN("query_store", "Prepopulation script not found: " + script_path);
        return true;
    }

    std::ifstream file(script_path, std::ios::binary);
    if (!file) {
        error = "Cannot open prepopulation script: " + script_path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string script = buffer.str();

    std::string dir;
    try {
        dir = CreateWorkspace(template_root, "sql_template_");
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    std::string path = JoinPath(dir, DATABASE_FILENAME);

    try {
        duckdb::DuckDB db(path);
        duckdb::Connection con(db);

        auto statements = con.ExtractStatements(script);
        for (auto& statement : statements) {
            auto result = con.Query(std::move(statement));
            if (result->HasError()) {
                error = "Prepopulation failed: " + result->GetError();
                RemoveWorkspace(dir);
                return false;
            }
        }

        auto checkpoint = con.Query("CHECKPOINT");
        if (checkpoint->HasError()) {
            LOG_WARN("query_store", "Checkpoint failed: " + checkpoint->GetError());
        }
    } catch (const std::exception& e) {
        error = "Prepopulation failed: " + std::string(e.what());
        RemoveWorkspace(dir);
        return false;
    }

    template_dir = dir;
    template_path = path;

    LOG_INFO("query_store", "Prepared template database " + template_path +
             " from " + script_path);
    return true;
}

bool QueryStore::HasTemplate() const {
    std::lock_guard<std::mutex> lock(mutex);
    return !template_path.empty();
}

std::string QueryStore::GetTemplatePath() const {
    std::lock_guard<std::mutex> lock(mutex);
    return template_path;
}

void QueryStore::Materialize(const std::string& store_dir) const {
    std::string source = GetTemplatePath();
    if (source.empty()) {
        return;
    }

    std::error_code ec;
    fs::copy_file(source, JoinPath(store_dir, DATABASE_FILENAME),
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw std::runtime_error("Failed to copy template database: " + ec.message());
    }
}

} // namespace runnerd
