#include <doctest/doctest.h>
#include <topojar/path_utils.hpp>

using namespace topojar;

TEST_CASE("resolve_entry_path joins plain entries under root") {
    auto result = resolve_entry_path("/ws", "com/example/TopologyRunner.class");
    CHECK(result.ok);
    CHECK(result.path == "/ws/com/example/TopologyRunner.class");
}

TEST_CASE("resolve_entry_path drops the trailing slash of directory entries") {
    auto result = resolve_entry_path("/ws", "resources/");
    CHECK(result.ok);
    CHECK(result.path == "/ws/resources");
}

TEST_CASE("resolve_entry_path collapses dot segments") {
    auto result = resolve_entry_path("/ws", "./a/./b/../c.txt");
    CHECK(result.ok);
    CHECK(result.path == "/ws/a/c.txt");

    auto root = resolve_entry_path("/ws", "./");
    CHECK(root.ok);
    CHECK(root.path == "/ws");
}

TEST_CASE("resolve_entry_path accepts backslash separators") {
    auto result = resolve_entry_path("/ws", "META-INF\\MANIFEST.MF");
    CHECK(result.ok);
    CHECK(result.path == "/ws/META-INF/MANIFEST.MF");
}

TEST_CASE("resolve_entry_path rejects unsafe names") {
    CHECK(resolve_entry_path("/ws", "").error == PathError::Empty);
    CHECK(resolve_entry_path("/ws", std::string("a\0b", 3)).error == PathError::ContainsNul);
    CHECK(resolve_entry_path("/ws", "/etc/passwd").error == PathError::AbsoluteNotAllowed);
    CHECK(resolve_entry_path("/ws", "C:/Windows").error == PathError::AbsoluteNotAllowed);
    CHECK(resolve_entry_path("/ws", "../outside").error == PathError::EscapesRoot);
    CHECK(resolve_entry_path("/ws", "a/../../outside").error == PathError::EscapesRoot);
    CHECK_FALSE(resolve_entry_path("/ws", "../outside").ok);
}

TEST_CASE("path_error_to_string") {
    CHECK(std::string(path_error_to_string(PathError::EscapesRoot)) == "entry escapes extraction root");
    CHECK(std::string(path_error_to_string(PathError::None)) == "none");
}
