#include <doctest/doctest.h>
#include <topojar/validator.hpp>

#include "test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace topojar;
using namespace topojar::test;

TEST_CASE("resolve_use_env follows the requirements file only when unset") {
    CHECK(resolve_use_env(UseEnv::Unset, true) == UseEnv::Enabled);
    CHECK(resolve_use_env(UseEnv::Unset, false) == UseEnv::Disabled);
    CHECK(resolve_use_env(UseEnv::Enabled, false) == UseEnv::Enabled);
    CHECK(resolve_use_env(UseEnv::Disabled, true) == UseEnv::Disabled);
}

TEST_CASE("validate_topology accepts a minimal topology") {
    TempDir temp;
    fs::path dir = make_topology(temp.path());

    RunOptions options;
    Status status = validate_topology(resolve_topology_paths(dir.string()), options);
    CHECK(status.ok);
    CHECK(options.use_env == UseEnv::Disabled);
}

TEST_CASE("validate_topology enables the virtualenv when requirements exist") {
    TempDir temp;
    fs::path dir = make_topology(temp.path());
    write_text(dir / "requirements.txt", "simplejson\n");

    RunOptions options;
    Status status = validate_topology(resolve_topology_paths(dir.string()), options);
    CHECK(status.ok);
    CHECK(options.use_env == UseEnv::Enabled);
}

TEST_CASE("validate_topology reports a missing or non-directory topology") {
    TempDir temp;

    RunOptions options;
    std::string missing = (temp / "nope").string();
    Status status = validate_topology(resolve_topology_paths(missing), options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::TopologyError);
    CHECK(status.error.message == "Topology directory not found: " + missing);
    CHECK(options.use_env == UseEnv::Unset);

    write_text(temp / "file", "x");
    std::string file = (temp / "file").string();
    status = validate_topology(resolve_topology_paths(file), options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::TopologyError);
    CHECK(status.error.message == "Topology directory is not a directory: " + file);
}

TEST_CASE("validate_topology requires the topology YAML") {
    TempDir temp;
    fs::path dir = temp / "myjob";
    write_text(dir / "handler.py", "pass\n");

    RunOptions options;
    TopologyPaths paths = resolve_topology_paths(dir.string());
    Status status = validate_topology(paths, options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::InvalidTopologyError);
    CHECK(status.error.message == "Topology YAML not found: " + paths.yaml);

    // A directory with the YAML's name does not count
    fs::create_directories(paths.yaml);
    status = validate_topology(paths, options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::InvalidTopologyError);
}

TEST_CASE("validate_topology requires requirements.txt when the virtualenv is forced") {
    TempDir temp;
    fs::path dir = make_topology(temp.path());

    RunOptions options;
    options.use_env = UseEnv::Enabled;
    Status status = validate_topology(resolve_topology_paths(dir.string()), options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::InvalidTopologyError);
    CHECK(status.error.message == "requirements.txt file not found");
}

TEST_CASE("validate_topology rejects a pyleus_venv entry when installing") {
    TempDir temp;
    fs::path dir = make_topology(temp.path());
    write_text(dir / "requirements.txt", "simplejson\n");
    fs::create_directories(dir / "pyleus_venv");

    RunOptions options;
    TopologyPaths paths = resolve_topology_paths(dir.string());
    Status status = validate_topology(paths, options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::InvalidTopologyError);
    CHECK(status.error.message == "Topology directory must not contain a file named " + paths.virtualenv);

    // Dangling links collide too
    fs::remove_all(dir / "pyleus_venv");
    fs::create_symlink(temp / "gone", dir / "pyleus_venv");
    status = validate_topology(paths, options);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::InvalidTopologyError);
}

TEST_CASE("validate_topology ignores pyleus_venv when not installing") {
    TempDir temp;
    fs::path dir = make_topology(temp.path());
    write_text(dir / "requirements.txt", "simplejson\n");
    fs::create_directories(dir / "pyleus_venv");

    RunOptions options;
    options.use_env = UseEnv::Disabled;
    Status status = validate_topology(resolve_topology_paths(dir.string()), options);
    CHECK(status.ok);
    CHECK(options.use_env == UseEnv::Disabled);
}

TEST_CASE("validate_topology does not modify the topology directory") {
    TempDir temp;
    fs::path dir = make_topology(temp.path());
    write_text(dir / "requirements.txt", "simplejson\n");

    RunOptions options;
    REQUIRE(validate_topology(resolve_topology_paths(dir.string()), options).ok);

    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    CHECK(count == 3);
}
