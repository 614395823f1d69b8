#include <doctest/doctest.h>
#include <topojar/installer.hpp>

#include "test_helpers.hpp"

#include <cstdio>
#include <filesystem>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

using namespace topojar;
using namespace topojar::test;

namespace {

// Records commands and answers with scripted exit codes
struct RecordingRunner {
    std::vector<Command> commands;
    std::vector<int> exit_codes;

    CommandRunner runner() {
        return [this](const Command& command) {
            commands.push_back(command);
            ExecResult result;
            result.ok = true;
            size_t i = commands.size() - 1;
            result.exit_code = i < exit_codes.size() ? exit_codes[i] : 0;
            return result;
        };
    }
};

} // namespace

TEST_CASE("installer_config_from copies the installer options") {
    RunOptions options;
    options.system_site_packages = true;
    options.index_url = "https://pypi.example.com/simple/";
    options.pip_log = "/tmp/pip.log";
    options.verbose = true;
    options.virtualenv_tool = "/opt/bin/virtualenv";
    options.subprocess_output_to_stderr = true;

    InstallerConfig config = installer_config_from(options);
    CHECK(config.system_site_packages);
    CHECK(config.index_url == options.index_url);
    CHECK(config.pip_log == options.pip_log);
    CHECK(config.verbose);
    CHECK(config.virtualenv_tool == "/opt/bin/virtualenv");
    CHECK(config.output_to_stderr);
}

TEST_CASE("build_virtualenv_command") {
    InstallerConfig config;

    Command plain = build_virtualenv_command("/ws/resources", config);
    CHECK(plain.argv == std::vector<std::string>{"virtualenv", "pyleus_venv"});
    CHECK(plain.cwd == "/ws/resources");
    CHECK(plain.output == OutputTarget::Discard);

    config.system_site_packages = true;
    config.verbose = true;
    Command system = build_virtualenv_command("/ws/resources", config);
    CHECK(system.argv == std::vector<std::string>{"virtualenv", "pyleus_venv", "--system-site-packages"});
    CHECK(system.output == OutputTarget::Stdout);

    config.output_to_stderr = true;
    CHECK(build_virtualenv_command("/ws/resources", config).output == OutputTarget::Stderr);
    CHECK(build_pip_command("/ws/resources", "/t/requirements.txt", config).output == OutputTarget::Stderr);

    config.verbose = false;
    CHECK(build_pip_command("/ws/resources", "/t/requirements.txt", config).output == OutputTarget::Discard);
}

TEST_CASE("build_pip_command") {
    InstallerConfig config;

    Command plain = build_pip_command("/ws/resources", "/t/requirements.txt", config);
    CHECK(plain.argv ==
          std::vector<std::string>{"pyleus_venv/bin/pip", "install", "-r", "/t/requirements.txt"});
    CHECK(plain.cwd == "/ws/resources");

    config.index_url = "https://pypi.example.com/simple/";
    config.pip_log = "/tmp/pip.log";
    Command full = build_pip_command("/ws/resources", "/t/requirements.txt", config);
    CHECK(full.argv == std::vector<std::string>{"pyleus_venv/bin/pip", "install", "-r",
                                                "/t/requirements.txt",
                                                "-i", "https://pypi.example.com/simple/",
                                                "--log", "/tmp/pip.log"});
    CHECK(full.to_string() ==
          "pyleus_venv/bin/pip install -r /t/requirements.txt -i https://pypi.example.com/simple/ "
          "--log /tmp/pip.log");
}

TEST_CASE("install_dependencies runs virtualenv then pip") {
    RecordingRunner recorder;
    InstallerConfig config;

    Status status = install_dependencies("/ws/resources", "/t/requirements.txt", config,
                                         recorder.runner());
    CHECK(status.ok);
    REQUIRE(recorder.commands.size() == 2);
    CHECK(recorder.commands[0].argv.front() == "virtualenv");
    CHECK(recorder.commands[1].argv.front() == "pyleus_venv/bin/pip");
    CHECK(recorder.commands[0].cwd == "/ws/resources");
    CHECK(recorder.commands[1].cwd == "/ws/resources");
}

TEST_CASE("install_dependencies stops when the virtualenv cannot be created") {
    RecordingRunner recorder;
    recorder.exit_codes = {1};

    Status status = install_dependencies("/ws/resources", "/t/requirements.txt", InstallerConfig{},
                                         recorder.runner());
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::DependenciesError);
    CHECK(status.error.message == "failed to create isolated environment pyleus_venv");
    CHECK(recorder.commands.size() == 1);
}

TEST_CASE("install_dependencies reports a failing pip") {
    RecordingRunner recorder;
    recorder.exit_codes = {0, 2};

    Status status = install_dependencies("/ws/resources", "/t/requirements.txt", InstallerConfig{},
                                         recorder.runner());
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::DependenciesError);
    CHECK(status.error.message ==
          "failed to install dependencies from /t/requirements.txt, rerun with --verbose for details");
}

TEST_CASE("install_dependencies treats a runner failure as a dependency error") {
    CommandRunner broken = [](const Command&) {
        ExecResult result;
        result.error = "fork failed";
        return result;
    };

    Status status = install_dependencies("/ws/resources", "/t/requirements.txt", InstallerConfig{},
                                         broken);
    CHECK_FALSE(status.ok);
    CHECK(status.error.kind == ErrorKind::DependenciesError);
}

#if !defined(_WIN32)
namespace {

// Points one of this process's standard descriptors at a file until destroyed
class ScopedRedirect {
public:
    ScopedRedirect(int fd, const fs::path& file) : fd_(fd) {
        std::fflush(nullptr);
        saved_ = dup(fd_);
        int target = open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        REQUIRE(saved_ >= 0);
        REQUIRE(target >= 0);
        REQUIRE(dup2(target, fd_) >= 0);
        close(target);
    }

    ~ScopedRedirect() {
        std::fflush(nullptr);
        dup2(saved_, fd_);
        close(saved_);
    }

    ScopedRedirect(const ScopedRedirect&) = delete;
    ScopedRedirect& operator=(const ScopedRedirect&) = delete;

private:
    int fd_;
    int saved_ = -1;
};

Command echo_both_streams(OutputTarget output) {
    Command command;
    command.argv = {"/bin/sh", "-c", "echo out; echo err >&2"};
    command.output = output;
    return command;
}

} // namespace

TEST_CASE("run_command merges stderr into stdout") {
    TempDir temp;
    ExecResult result;
    {
        ScopedRedirect redirect(STDOUT_FILENO, temp / "stdout.txt");
        result = run_command(echo_both_streams(OutputTarget::Stdout));
    }
    CHECK(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(read_text(temp / "stdout.txt") == "out\nerr\n");
}

TEST_CASE("run_command discards output when asked") {
    TempDir temp;
    ExecResult result;
    {
        ScopedRedirect out(STDOUT_FILENO, temp / "stdout.txt");
        ScopedRedirect err(STDERR_FILENO, temp / "stderr.txt");
        result = run_command(echo_both_streams(OutputTarget::Discard));
    }
    CHECK(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(read_text(temp / "stdout.txt").empty());
    CHECK(read_text(temp / "stderr.txt").empty());
}

TEST_CASE("run_command can keep stdout clean") {
    TempDir temp;
    ExecResult result;
    {
        ScopedRedirect out(STDOUT_FILENO, temp / "stdout.txt");
        ScopedRedirect err(STDERR_FILENO, temp / "stderr.txt");
        result = run_command(echo_both_streams(OutputTarget::Stderr));
    }
    CHECK(result.ok);
    CHECK(read_text(temp / "stdout.txt").empty());
    CHECK(read_text(temp / "stderr.txt") == "out\nerr\n");
}

TEST_CASE("run_command reports exit codes and working directory") {
    TempDir temp;

    Command command;
    command.cwd = temp.path();
    command.argv = {"/bin/sh", "-c", "pwd > where.txt; exit 3"};

    ExecResult result = run_command(command);
    CHECK(result.ok);
    CHECK(result.exit_code == 3);
    CHECK(read_text(temp / "where.txt").find(fs::path(temp.path()).filename().string()) !=
          std::string::npos);
}

TEST_CASE("run_command exits 127 for a missing program") {
    Command command;
    command.argv = {"topojar-no-such-program"};

    ExecResult result = run_command(command);
    CHECK(result.ok);
    CHECK(result.exit_code == 127);

    Command empty;
    CHECK_FALSE(run_command(empty).ok);
}
#endif
