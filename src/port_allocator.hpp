#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <cstdint>

namespace mcphub {

struct PortBinding {
    int port = 0;
    std::string owner;
    int64_t bound_at = 0;
};

// In-process port bookkeeping plus a loopback bind probe. A reservation does not
// hold the socket open; the server binds it itself after spawn.
class PortAllocator {
public:
    explicit PortAllocator(int base = 3000, int max_attempts = 100)
        : base_(base), max_attempts_(max_attempts) {}

    // Reserves `preferred` if it is free, otherwise the first free candidate
    // in [start, start + max_attempts). Throws HubError(port_exhaustion).
    int allocate(const std::string& owner, std::optional<int> preferred = std::nullopt);

    // Records a port that an adopted process already holds; no bind probe.
    // False when another owner has it.
    bool adopt(int port, const std::string& owner);

    // Idempotent: releasing a free port is a no-op.
    void release(int port);
    void release_owner(const std::string& owner);

    bool is_free(int port) const;
    bool is_reserved(int port) const;

    // OS-level probe only, ignoring in-process reservations.
    static bool os_port_free(int port);

    std::vector<PortBinding> bindings() const;
    std::vector<int> ports_of(const std::string& owner) const;

    int base() const { return base_; }
    int max_attempts() const { return max_attempts_; }

private:
    int base_;
    int max_attempts_;
    mutable std::mutex mu_;
    std::map<int, PortBinding> reserved_;
};

} // namespace mcphub
