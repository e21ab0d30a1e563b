#include "port_allocator.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace mcphub {

bool PortAllocator::os_port_free(int port) {
    if (port <= 0 || port > 65535) return false;

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::cerr << "[ports] socket() failed: " << std::strerror(errno) << "\n";
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

int PortAllocator::allocate(const std::string& owner, std::optional<int> preferred) {
    std::lock_guard<std::mutex> lock(mu_);

    auto take = [&](int port) {
        reserved_[port] = PortBinding{port, owner, epoch_now()};
        std::cerr << "[ports] Reserved " << port << " for " << owner << "\n";
        return port;
    };

    if (preferred && *preferred > 65535) {
        throw HubError(ErrorKind::config_error, owner,
                       "port " + std::to_string(*preferred) + " is out of range (1-65535)");
    }

    int start = base_;
    if (preferred && *preferred > 0) {
        if (!reserved_.count(*preferred) && os_port_free(*preferred)) return take(*preferred);
        std::cerr << "[ports] Port " << *preferred << " is in use, probing from "
                  << *preferred + 1 << "\n";
        start = *preferred + 1;
    }

    for (int i = 0; i < max_attempts_; i++) {
        int port = start + i;
        if (port > 65535) break;
        if (reserved_.count(port)) continue;
        if (!os_port_free(port)) continue;
        return take(port);
    }

    long long last = std::min<long long>(65535, static_cast<long long>(start) + max_attempts_ - 1);
    throw HubError(ErrorKind::port_exhaustion, owner,
                   "no free port in " + std::to_string(start) + "-" + std::to_string(last) +
                   " after " + std::to_string(max_attempts_) + " attempts");
}

bool PortAllocator::adopt(int port, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = reserved_.find(port);
    if (it != reserved_.end()) return it->second.owner == owner;
    reserved_[port] = PortBinding{port, owner, epoch_now()};
    return true;
}

void PortAllocator::release(int port) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = reserved_.find(port);
    if (it == reserved_.end()) return;
    std::cerr << "[ports] Released " << port << " (" << it->second.owner << ")\n";
    reserved_.erase(it);
}

void PortAllocator::release_owner(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = reserved_.begin(); it != reserved_.end();) {
        if (it->second.owner == owner) {
            std::cerr << "[ports] Released " << it->first << " (" << owner << ")\n";
            it = reserved_.erase(it);
        } else {
            ++it;
        }
    }
}

bool PortAllocator::is_reserved(int port) const {
    std::lock_guard<std::mutex> lock(mu_);
    return reserved_.count(port) > 0;
}

bool PortAllocator::is_free(int port) const {
    return !is_reserved(port) && os_port_free(port);
}

std::vector<PortBinding> PortAllocator::bindings() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<PortBinding> out;
    for (auto& [_, b] : reserved_) out.push_back(b);
    return out;
}

std::vector<int> PortAllocator::ports_of(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<int> out;
    for (auto& [port, b] : reserved_) {
        if (b.owner == owner) out.push_back(port);
    }
    return out;
}

} // namespace mcphub
