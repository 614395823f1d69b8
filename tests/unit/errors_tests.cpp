#include <doctest/doctest.h>
#include <topojar/errors.hpp>

using namespace topojar;

TEST_CASE("error_kind_to_string names every kind") {
    CHECK(std::string(error_kind_to_string(ErrorKind::JarError)) == "JarError");
    CHECK(std::string(error_kind_to_string(ErrorKind::TopologyError)) == "TopologyError");
    CHECK(std::string(error_kind_to_string(ErrorKind::InvalidTopologyError)) == "InvalidTopologyError");
    CHECK(std::string(error_kind_to_string(ErrorKind::DependenciesError)) == "DependenciesError");
}

TEST_CASE("TopologyError covers its sub-kinds") {
    Error topology{ErrorKind::TopologyError, "x"};
    Error invalid{ErrorKind::InvalidTopologyError, "x"};
    Error deps{ErrorKind::DependenciesError, "x"};
    Error jar{ErrorKind::JarError, "x"};

    CHECK(topology.is_topology_error());
    CHECK(invalid.is_topology_error());
    CHECK(deps.is_topology_error());
    CHECK_FALSE(jar.is_topology_error());
}

TEST_CASE("Status::failure carries kind and message") {
    Status status = Status::failure(ErrorKind::JarError, "Base jar not found: /x/minimal.jar");

    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::JarError);
    CHECK(status.error.message == "Base jar not found: /x/minimal.jar");
    CHECK(Status::success().ok);
}

TEST_CASE("format_error renders a single prefixed line") {
    Error error{ErrorKind::InvalidTopologyError, "Topology YAML not found: /t/pyleus_topology.yaml"};

    CHECK(error.to_string() == "[InvalidTopologyError] Topology YAML not found: /t/pyleus_topology.yaml");
    CHECK(format_error("topojar", error) ==
          "topojar: error: [InvalidTopologyError] Topology YAML not found: /t/pyleus_topology.yaml");
    CHECK(format_error("topojar", "No space left on device") ==
          "topojar: error: No space left on device");
}
