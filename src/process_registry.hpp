#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <cstdint>

namespace mcphub {

enum class ProcessStatus { not_started, running, stopped, zombie, unknown };

const char* process_status_name(ProcessStatus s);

struct ServerProcessRecord {
    std::string name;
    std::optional<int> pid;

    // Launch snapshot, fixed once the process is spawned
    std::string command;
    std::vector<std::string> args;
    std::string working_directory;
    std::map<std::string, std::string> env;

    ProcessStatus status = ProcessStatus::not_started;
    int64_t started_at = 0;
    std::vector<int> ports;
    std::vector<int> listening_ports;
    std::vector<std::string> warnings;
};

// Index of server processes by logical name. The OS is the source of truth:
// refresh_status() re-reads /proc every time and never trusts the stored status.
// Thread-safe.
class ProcessRegistry {
public:
    // Replaces any record already held for the same name.
    void register_record(ServerProcessRecord record);

    std::optional<ServerProcessRecord> find(const std::string& name) const;

    // Stopped when the pid is gone, Zombie when it is terminated but unreaped,
    // Unknown when the pid now runs something else, Running otherwise.
    // NotStarted for names without a record.
    ProcessStatus refresh_status(const std::string& name);

    bool forget(const std::string& name);

    std::vector<ServerProcessRecord> all() const;
    std::vector<std::string> names() const;
    std::optional<std::string> name_for_pid(int pid) const;

private:
    mutable std::mutex mu_;
    std::map<std::string, ServerProcessRecord> records_;
};

} // namespace mcphub
