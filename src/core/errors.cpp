#include "topojar/errors.hpp"

#include <utility>

namespace topojar {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::JarError: return "JarError";
        case ErrorKind::TopologyError: return "TopologyError";
        case ErrorKind::InvalidTopologyError: return "InvalidTopologyError";
        case ErrorKind::DependenciesError: return "DependenciesError";
    }
    return "Unknown";
}

bool Error::is_topology_error() const {
    return kind == ErrorKind::TopologyError ||
           kind == ErrorKind::InvalidTopologyError ||
           kind == ErrorKind::DependenciesError;
}

std::string Error::to_string() const {
    return "[" + std::string(error_kind_to_string(kind)) + "] " + message;
}

Status Status::failure(ErrorKind kind, std::string message) {
    Status status;
    status.ok = false;
    status.error.kind = kind;
    status.error.message = std::move(message);
    return status;
}

std::string format_error(const std::string& program, const std::string& message) {
    return program + ": error: " + message;
}

std::string format_error(const std::string& program, const Error& error) {
    return format_error(program, error.to_string());
}

} // namespace topojar
