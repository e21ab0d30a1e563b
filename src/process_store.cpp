#include "process_store.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <iostream>
#include <nlohmann/json.hpp>

namespace mcphub {

ProcessStore::ProcessStore(const std::string& db_path) {
    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open process DB: " + msg);
    }
    // `run` and `ps` in two terminals may touch the file at the same time
    sqlite3_busy_timeout(db_, 2000);
    init_db();
}

ProcessStore::~ProcessStore() {
    if (db_) sqlite3_close(db_);
}

void ProcessStore::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS processes (
            name TEXT PRIMARY KEY,
            pid INTEGER NOT NULL,
            command TEXT NOT NULL,
            args_json TEXT NOT NULL DEFAULT '[]',
            env_json TEXT NOT NULL DEFAULT '{}',
            cwd TEXT NOT NULL DEFAULT '',
            ports_json TEXT NOT NULL DEFAULT '[]',
            started_at INTEGER DEFAULT 0
        );
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init process DB: " + msg);
    }
}

sqlite3_stmt* ProcessStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

void ProcessStore::save(const ServerProcessRecord& rec) {
    if (!rec.pid) {
        throw std::runtime_error("Cannot persist " + rec.name + " without a pid");
    }
    nlohmann::json env_json = nlohmann::json::object();
    for (auto& [k, v] : rec.env) env_json[k] = v;

    std::string args = nlohmann::json(rec.args).dump();
    std::string env = env_json.dump();
    std::string ports = nlohmann::json(rec.ports).dump();

    const char* sql = "INSERT OR REPLACE INTO processes (name, pid, command, args_json, env_json, cwd, ports_json, started_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = prepare(sql);
    sqlite3_bind_text(stmt, 1, rec.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, *rec.pid);
    sqlite3_bind_text(stmt, 3, rec.command.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, args.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, env.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, rec.working_directory.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, ports.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 8, rec.started_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to save process " + rec.name + ": " +
                                 std::string(sqlite3_errmsg(db_)));
    }
}

bool ProcessStore::remove(const std::string& name) {
    const char* sql = "DELETE FROM processes WHERE name = ?";
    sqlite3_stmt* stmt = prepare(sql);
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    int changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to remove process " + name + ": " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return changes > 0;
}

static ServerProcessRecord row_to_record(sqlite3_stmt* stmt) {
    ServerProcessRecord r;
    r.name = column_text(stmt, 0);
    r.pid = static_cast<int>(sqlite3_column_int64(stmt, 1));
    r.command = column_text(stmt, 2);
    r.working_directory = column_text(stmt, 5);
    r.started_at = sqlite3_column_int64(stmt, 7);
    // Unverified until the registry probes it
    r.status = ProcessStatus::unknown;

    try {
        auto args = nlohmann::json::parse(column_text(stmt, 3));
        r.args = args.get<std::vector<std::string>>();
        auto env = nlohmann::json::parse(column_text(stmt, 4));
        for (auto& [k, v] : env.items()) {
            if (v.is_string()) r.env[k] = v.get<std::string>();
        }
        auto ports = nlohmann::json::parse(column_text(stmt, 6));
        r.ports = ports.get<std::vector<int>>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Damaged row for " << r.name << ": " << e.what() << "\n";
        r.warnings.push_back("stored launch snapshot is damaged");
    }
    return r;
}

std::optional<ServerProcessRecord> ProcessStore::get(const std::string& name) {
    const char* sql = "SELECT name, pid, command, args_json, env_json, cwd, ports_json, started_at FROM processes WHERE name = ?";
    sqlite3_stmt* stmt = prepare(sql);
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<ServerProcessRecord> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) out = row_to_record(stmt);
    sqlite3_finalize(stmt);
    return out;
}

std::vector<ServerProcessRecord> ProcessStore::list() {
    std::vector<ServerProcessRecord> records;
    const char* sql = "SELECT name, pid, command, args_json, env_json, cwd, ports_json, started_at FROM processes ORDER BY name";
    sqlite3_stmt* stmt = prepare(sql);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(row_to_record(stmt));
    }
    sqlite3_finalize(stmt);
    return records;
}

} // namespace mcphub
