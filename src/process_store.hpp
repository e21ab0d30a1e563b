#pragma once
#include "process_registry.hpp"
#include <string>
#include <vector>
#include <optional>
#include <sqlite3.h>

namespace mcphub {

// Durable copy of the process records so that separate invocations (`run` in one
// terminal, `ps` in another) see each other's servers. Rows say nothing about
// liveness; callers re-verify through ProcessRegistry::refresh_status().
class ProcessStore {
public:
    explicit ProcessStore(const std::string& db_path);
    ~ProcessStore();

    ProcessStore(const ProcessStore&) = delete;
    ProcessStore& operator=(const ProcessStore&) = delete;

    // Insert or replace by name.
    void save(const ServerProcessRecord& rec);
    bool remove(const std::string& name);
    std::optional<ServerProcessRecord> get(const std::string& name);
    std::vector<ServerProcessRecord> list();

private:
    sqlite3* db_ = nullptr;
    void init_db();
    sqlite3_stmt* prepare(const char* sql);
};

} // namespace mcphub
