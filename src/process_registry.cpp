#include "process_registry.hpp"
#include "proc_table.hpp"
#include <algorithm>
#include <iostream>

namespace mcphub {

const char* process_status_name(ProcessStatus s) {
    switch (s) {
    case ProcessStatus::not_started: return "not started";
    case ProcessStatus::running:     return "running";
    case ProcessStatus::stopped:     return "stopped";
    case ProcessStatus::zombie:      return "zombie";
    case ProcessStatus::unknown:     return "unknown";
    }
    return "unknown";
}

void ProcessRegistry::register_record(ServerProcessRecord record) {
    std::lock_guard<std::mutex> lock(mu_);
    std::string name = record.name;
    records_[name] = std::move(record);
}

std::optional<ServerProcessRecord> ProcessRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(name);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

ProcessStatus ProcessRegistry::refresh_status(const std::string& name) {
    // Snapshot the pid and launch spec, then probe without holding the lock.
    std::optional<int> pid;
    std::string command;
    std::vector<std::string> args;
    std::vector<int> ports;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = records_.find(name);
        if (it == records_.end()) return ProcessStatus::not_started;
        pid = it->second.pid;
        command = it->second.command;
        args = it->second.args;
        ports = it->second.ports;
    }

    ProcessStatus status = ProcessStatus::stopped;
    std::vector<int> listening;
    std::vector<std::string> warnings;

    if (pid) {
        auto info = read_proc(*pid);
        if (!info) {
            status = ProcessStatus::stopped;
        } else if (info->zombie()) {
            // cmdline is empty for zombies, so this check comes first
            status = ProcessStatus::zombie;
            warnings.push_back("Process is in zombie state");
        } else if (!command_matches(info->argv, command, args)) {
            status = ProcessStatus::unknown;
            warnings.push_back("PID " + std::to_string(*pid) + " now runs '" +
                               info->command_line() + "'");
        } else {
            status = ProcessStatus::running;
            listening = listening_ports(*pid);
            for (int p : ports) {
                if (!listening.empty() &&
                    std::find(listening.begin(), listening.end(), p) == listening.end()) {
                    warnings.push_back("Port " + std::to_string(p) + " is not bound by the process");
                }
            }
        }
    }

    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(name);
    if (it == records_.end()) return ProcessStatus::not_started;
    // The record may have been replaced by a fresh start while we probed.
    if (it->second.pid != pid) return it->second.status;
    if (it->second.status != status) {
        std::cerr << "[registry] " << name << ": " << process_status_name(it->second.status)
                  << " -> " << process_status_name(status) << "\n";
    }
    it->second.status = status;
    it->second.listening_ports = std::move(listening);
    it->second.warnings = std::move(warnings);
    return status;
}

bool ProcessRegistry::forget(const std::string& name) {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.erase(name) > 0;
}

std::vector<ServerProcessRecord> ProcessRegistry::all() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ServerProcessRecord> result;
    result.reserve(records_.size());
    for (auto& [_, rec] : records_) result.push_back(rec);
    return result;
}

std::vector<std::string> ProcessRegistry::names() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> names;
    for (auto& [n, _] : records_) names.push_back(n);
    return names;
}

std::optional<std::string> ProcessRegistry::name_for_pid(int pid) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [name, rec] : records_) {
        if (rec.pid && *rec.pid == pid) return name;
    }
    return std::nullopt;
}

} // namespace mcphub
