/**
 * topojar CLI - Entry Point
 *
 * Build a standalone topology jar from a topology directory.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

int main(int argc, char** argv) {
    using namespace topojar;
    using namespace topojar::cli;

    CLI::App app{"Build up a storm jar from a topology source directory"};
    app.set_version_flag("-V,--version", TOPOJAR_VERSION);

    GlobalOptions opts;
    OptionInputs inputs;

    std::string base_jar;
    std::string output_jar;
    std::string index_url;
    std::string pip_log;
    std::string virtualenv_cmd;

    const Layout& layout = default_layout();

    app.add_option("TOPOLOGY_DIRECTORY", inputs.topology_dir,
                   "Directory containing " + layout.yaml_filename + " and the topology sources")
        ->required();
    app.add_option("-b,--base", base_jar,
                   "Base jar file path (default $TOPOJAR_BASE_JAR or " + layout.default_base_jar + ")");
    app.add_option("-o,--out", output_jar,
                   "Path of the jar file that will contain all the dependencies and the resources");

    auto* use_flag = app.add_flag_callback(
        "--use-virtualenv,--use-env", [&inputs]() { inputs.use_virtualenv = true; },
        "Use virtualenv and pip install for dependencies. TOPOLOGY_DIRECTORY must contain " +
            layout.requirements_filename);
    auto* no_use_flag = app.add_flag_callback(
        "--no-use-virtualenv,--no-use-env", [&inputs]() { inputs.use_virtualenv = false; },
        "Do not use virtualenv and pip for dependencies");
    use_flag->excludes(no_use_flag);

    app.add_option("-i,--index-url", index_url,
                   "Base URL of Python Package Index used by pip");
    app.add_flag("-s,--system-packages", inputs.system_site_packages,
                 "Do not install packages already present in your system");
    app.add_option("--log", pip_log, "Log location for pip");
    app.add_option("--virtualenv-cmd", virtualenv_cmd,
                   "virtualenv executable (default $TOPOJAR_VIRTUALENV or virtualenv)");
    app.add_flag("-v,--verbose", opts.verbose, "Verbose");
    app.add_flag("--json", opts.json, "Machine-readable output");

    CLI11_PARSE(app, argc, argv);

    if (!base_jar.empty()) inputs.base_jar = base_jar;
    if (!output_jar.empty()) inputs.output_jar = output_jar;
    if (!index_url.empty()) inputs.index_url = index_url;
    if (!pip_log.empty()) inputs.pip_log = pip_log;
    if (!virtualenv_cmd.empty()) inputs.virtualenv_tool = virtualenv_cmd;
    inputs.verbose = opts.verbose;

    init_logging(opts.verbose);
    const std::string program = program_name(argv[0]);

    try {
        ResolvedOptions resolved = resolve_options(inputs, layout);
        resolved.options.subprocess_output_to_stderr = opts.json;

        BuildResult result = build_jar(resolved.topology_dir, resolved.options, run_command, layout);
        if (!result.ok) {
            print_error(program, result.error, opts.json);
            return 1;
        }

        if (opts.json) {
            output_json(build_result_to_json(result));
        }
        return 0;
    } catch (const std::exception& e) {
        print_error(program, e.what(), opts.json);
        return 1;
    }
}
