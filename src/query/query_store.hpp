//===----------------------------------------------------------------------===//
//                         runnerd
//
// query/query_store.hpp
//
// Prepopulated database template for query-language sessions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace runnerd {

// Builds one template database from the prepopulation script with the
// embedded DuckDB engine. Every query session gets a private copy of it;
// the template itself is never opened by a session.
class QueryStore {
public:
    static constexpr const char* DATABASE_FILENAME = "ephemeral.db";

    // `template_root` is where the template directory is created (empty =
    // system temp dir). An empty script path disables prepopulation.
    QueryStore(std::string prepopulate_script_p, std::string template_root_p = "");
    ~QueryStore();

    // Non-copyable
    QueryStore(const QueryStore&) = delete;
    QueryStore& operator=(const QueryStore&) = delete;

    // Runs the prepopulation script into a fresh template database. A missing
    // script is not an error (there is simply no template). Returns false and
    // sets `error` if the script fails.
    bool Prepare(std::string& error);

    bool HasTemplate() const;
    std::string GetTemplatePath() const;
    const std::string& GetScriptPath() const { return script_path; }

    // Copies the template to `<store_dir>/ephemeral.db`. No-op without a
    // template. Throws std::runtime_error if the copy fails.
    void Materialize(const std::string& store_dir) const;

private:
    std::string script_path;
    std::string template_root;

    mutable std::mutex mutex;
    std::string template_dir;
    std::string template_path;
};

} // namespace runnerd
