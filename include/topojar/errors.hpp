#pragma once

#include <string>

namespace topojar {

// ============================================================================
// Error Kinds
// ============================================================================

// TopologyError is the parent kind of InvalidTopologyError and
// DependenciesError. Callers match on the kind, never on a type.
enum class ErrorKind {
    None,
    JarError,               // Base jar missing/invalid, output jar pre-exists
    TopologyError,          // Topology directory missing or not a directory
    InvalidTopologyError,   // Missing YAML or requirements, reserved name collision
    DependenciesError,      // virtualenv or pip exited non-zero
};

const char* error_kind_to_string(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    // True for TopologyError and both of its sub-kinds
    bool is_topology_error() const;

    // "[Kind] message"
    std::string to_string() const;
};

// Outcome of a pipeline step that can fail with a domain error.
struct Status {
    bool ok = true;
    Error error;

    static Status success() { return Status{}; }
    static Status failure(ErrorKind kind, std::string message);
};

// Render "<program>: error: <message>" as printed on stderr.
std::string format_error(const std::string& program, const std::string& message);
std::string format_error(const std::string& program, const Error& error);

} // namespace topojar
