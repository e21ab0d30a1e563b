#pragma once
#include <string>
#include <stdexcept>

namespace mcphub {

enum class ErrorKind {
    setup_failed,
    missing_env_var,
    port_conflict,
    port_exhaustion,
    spawn_failed,
    request_timeout,
    transport_closed,
    protocol_error,
    remote_error,
    cancelled,
    invalid_transition,
    server_not_found,
    config_error,
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
    case ErrorKind::setup_failed:       return "SetupFailed";
    case ErrorKind::missing_env_var:    return "MissingEnvironmentVariable";
    case ErrorKind::port_conflict:      return "PortConflict";
    case ErrorKind::port_exhaustion:    return "PortExhaustion";
    case ErrorKind::spawn_failed:       return "SpawnFailed";
    case ErrorKind::request_timeout:    return "RequestTimeout";
    case ErrorKind::transport_closed:   return "TransportClosed";
    case ErrorKind::protocol_error:     return "ProtocolError";
    case ErrorKind::remote_error:       return "RemoteError";
    case ErrorKind::cancelled:          return "Cancelled";
    case ErrorKind::invalid_transition: return "InvalidTransition";
    case ErrorKind::server_not_found:   return "ServerNotFound";
    case ErrorKind::config_error:       return "ConfigError";
    }
    return "Unknown";
}

// Status code the HTTP gateway answers with.
inline int http_status_for(ErrorKind k) {
    switch (k) {
    case ErrorKind::server_not_found:   return 404;
    case ErrorKind::invalid_transition:
    case ErrorKind::port_conflict:      return 409;
    case ErrorKind::request_timeout:    return 504;
    case ErrorKind::transport_closed:
    case ErrorKind::protocol_error:
    case ErrorKind::remote_error:       return 502;
    default:                            return 500;
    }
}

// Every failure that leaves the hub carries the server it concerns and,
// when there is any, the output captured from the process.
class HubError : public std::runtime_error {
public:
    HubError(ErrorKind kind, const std::string& server, const std::string& message,
             std::string output = {})
        : std::runtime_error(message)
        , kind_(kind)
        , server_(server)
        , output_(std::move(output)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& server() const { return server_; }
    const std::string& output() const { return output_; }

    // "[PortConflict] s1: port 3000 was bound before spawn"
    std::string describe() const {
        std::string s = std::string("[") + error_kind_name(kind_) + "] ";
        if (!server_.empty()) s += server_ + ": ";
        s += what();
        return s;
    }

private:
    ErrorKind kind_;
    std::string server_;
    std::string output_;
};

} // namespace mcphub
