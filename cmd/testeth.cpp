// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <testeth/compare/result_comparator.hpp>
#include <testeth/compare/verdict.hpp>
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/log_level_map.hpp>
#include <testeth/registry/registry_file.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/registry/tool_registry.hpp>
#include <testeth/report/report_table.hpp>
#include <testeth/run/run_config.hpp>
#include <testeth/run/run_coordinator.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

sig_atomic_t volatile stop;

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

// all passed / some verdict other than pass / could not run
constexpr int EXIT_ALL_PASSED = 0;
constexpr int EXIT_SOME_FAILED = 1;
constexpr int EXIT_NOT_RUN = 2;

void signal_handler(int)
{
    stop = 1;
}

int register_tool(
    fs::path const &config_file, std::string const &name,
    fs::path const &path, std::vector<std::string> args, Dialect const dialect)
{
    auto registry = load_registry(config_file);
    if (registry.has_error()) {
        std::cerr << registry.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    auto const abs_path = fs::absolute(path);
    if (auto const res = registry.value().register_tool(
            name, abs_path, std::move(args), dialect);
        res.has_error()) {
        std::cerr << name << ": " << res.error().message().c_str() << " ("
                  << abs_path.string() << ")\n";
        return EXIT_NOT_RUN;
    }
    if (auto const res = save_registry(registry.value(), config_file);
        res.has_error()) {
        std::cerr << res.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    return EXIT_ALL_PASSED;
}

int unregister_tool(fs::path const &config_file, std::string const &name)
{
    auto registry = load_registry(config_file);
    if (registry.has_error()) {
        std::cerr << registry.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    if (auto const res = registry.value().unregister_tool(name);
        res.has_error()) {
        std::cerr << name << ": " << res.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    if (auto const res = save_registry(registry.value(), config_file);
        res.has_error()) {
        std::cerr << res.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    return EXIT_ALL_PASSED;
}

int list_tools(fs::path const &config_file)
{
    auto const registry = load_registry(config_file);
    if (registry.has_error()) {
        std::cerr << registry.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    for (auto const &tool : registry.value().list()) {
        std::cout << fmt::format(
            "{:<16}{:<6}{} {}\n",
            tool.name,
            std::string{to_string(tool.dialect)},
            tool.path.string(),
            fmt::join(tool.args, " "));
    }
    return EXIT_ALL_PASSED;
}

int run_tests(
    fs::path const &config_file, fs::path const &test_path,
    RunConfig const &config)
{
    auto const registry = load_registry(config_file);
    if (registry.has_error()) {
        std::cerr << registry.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }
    if (registry.value().empty()) {
        std::cerr << "no tools registered in " << config_file.string()
                  << '\n';
        return EXIT_NOT_RUN;
    }

    std::stop_source cancel;
    signal(SIGINT, signal_handler);
    stop = 0;
    // request_stop is not async signal safe, so poll the flag instead
    std::jthread watcher{[&cancel](std::stop_token const done) {
        while (!done.stop_requested()) {
            if (stop) {
                LOG_WARNING("interrupted, cancelling run");
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
        }
    }};

    RunCoordinator coordinator{registry.value(), config};
    auto const summary = coordinator.run(test_path, cancel.get_token());
    watcher.request_stop();
    watcher.join();
    signal(SIGINT, SIG_DFL);

    if (summary.has_error()) {
        std::cerr << test_path.string() << ": "
                  << summary.error().message().c_str() << '\n';
        return EXIT_NOT_RUN;
    }

    std::vector<std::string> tools;
    for (auto const &tool : registry.value().list()) {
        tools.push_back(tool.name);
    }
    auto const records = coordinator.aggregator().get_records();
    std::cout << render_results_table(records, tools) << '\n'
              << render_summary_table(summary.value().summaries);
    if (auto const failures = render_failures(records); !failures.empty()) {
        std::cout << '\n' << failures;
    }
    std::cout << fmt::format(
        "\n{} of {} runs recorded in {} ms\n",
        summary.value().records,
        summary.value().units,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            summary.value().elapsed)
            .count());
    for (auto const &malformed : summary.value().malformed) {
        std::cerr << "skipped " << malformed.what() << '\n';
    }

    if (summary.value().cancelled) {
        return EXIT_SOME_FAILED;
    }
    for (auto const &record : records) {
        if (!is_pass(record.verdict)) {
            return EXIT_SOME_FAILED;
        }
    }
    return EXIT_ALL_PASSED;
}

TESTETH_ANONYMOUS_NAMESPACE_END

int main(int argc, char *argv[])
{
    using namespace testeth;

    auto log_level = quill::LogLevel::Info;
    fs::path config_file = DEFAULT_REGISTRY_FILE;

    CLI::App cli{"compare EVM implementations against shared test vectors"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);
    cli.add_option("--config", config_file, "tool registry file");
    cli.add_option("--log_level", log_level, "level of detail for logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    auto *const tool = cli.add_subcommand("tool", "manage registered tools");
    tool->require_subcommand(1);

    std::string tool_name;
    fs::path tool_path;
    Dialect dialect = Dialect::Json;
    auto *const reg = tool->add_subcommand("register", "register a tool");
    reg->add_option("--dialect", dialect, "output format of the tool")
        ->transform(CLI::CheckedTransformer(dialect_map, CLI::ignore_case));
    reg->add_option("name", tool_name, "tool name")->required();
    reg->add_option("path", tool_path, "tool executable")->required();
    // everything after the path is passed through to the tool
    reg->prefix_command();

    auto *const unreg = tool->add_subcommand("unregister", "remove a tool");
    unreg->add_option("name", tool_name, "tool name")->required();

    auto *const list = tool->add_subcommand("list", "list registered tools");

    RunConfig config;
    fs::path test_path;
    int64_t timeout_ms = 10'000;
    auto *const test = cli.add_subcommand("test", "run test vectors");
    test->add_option("--jobs,-j", config.pool_size, "concurrent tool runs")
        ->check(CLI::PositiveNumber);
    test->add_option("--timeout-ms", timeout_ms, "per run timeout, 0 = none")
        ->check(CLI::NonNegativeNumber);
    test->add_option("--repeat", config.repetitions, "runs per test and tool")
        ->check(CLI::PositiveNumber);
    test->add_option(
        "--max-output-bytes",
        config.max_output_bytes,
        "captured output per stream");
    bool unordered_logs = false;
    test->add_flag(
        "--unordered-logs", unordered_logs, "compare logs as a multiset");
    test->add_option("path", test_path, "test vector file or directory")
        ->required()
        ->check(CLI::ExistingPath);

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        int const rc = cli.exit(e);
        return rc == 0 ? EXIT_ALL_PASSED : EXIT_NOT_RUN;
    }

    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    int rc = EXIT_ALL_PASSED;
    if (*reg) {
        rc = register_tool(
            config_file, tool_name, tool_path, reg->remaining(), dialect);
    }
    else if (*unreg) {
        rc = unregister_tool(config_file, tool_name);
    }
    else if (*list) {
        rc = list_tools(config_file);
    }
    else if (*test) {
        config.timeout = std::chrono::milliseconds{timeout_ms};
        config.log_order =
            unordered_logs ? LogOrder::Unordered : LogOrder::Strict;
        rc = run_tests(config_file, test_path, config);
    }

    quill::flush();
    return rc;
}
