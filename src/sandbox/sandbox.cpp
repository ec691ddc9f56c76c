#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

sandbox::~sandbox() {}

runguard_sandbox::runguard_sandbox(sandbox_options options)
    : options(move(options)) {}

static string seconds(int ms) {
    return fmt::format("{:.3f}", ms / 1000.0);
}

vector<string> runguard_sandbox::command_line(const run_request &request, const fs::path &scratch) const {
    int hard_ms = request.time_limit_ms + options.kill_grace_ms;
    vector<string> args = {
        options.runguard.string(),
        "--bind", (scratch / "box").string(),
        "--wall-time", seconds(request.time_limit_ms) + ":" + seconds(hard_ms),
        "--cpu-time", seconds(request.time_limit_ms) + ":" + seconds(hard_ms),
        "--memory-limit", to_string(request.memory_limit_kb),
        "--file-limit", to_string(request.file_limit_kb),
        "--nproc", to_string(request.proc_limit),
        "--stream-size", to_string(request.output_limit_kb),
        "--standard-output-file", (scratch / "program.out").string(),
        "--standard-error-file", (scratch / "program.err").string(),
        "--out-meta", (scratch / "program.meta").string(),
        "--no-core-dumps"};
    if (!options.chroot_dir.empty()) {
        args.push_back("--root");
        args.push_back(options.chroot_dir.string());
    }
    if (!options.run_user.empty()) {
        args.push_back("--user");
        args.push_back(options.run_user);
    }
    if (!options.run_group.empty()) {
        args.push_back("--group");
        args.push_back(options.run_group);
    }
    if (request.input) {
        args.push_back("--standard-input-file");
        args.push_back((scratch / "testdata.in").string());
    }
    if (!request.cpuset.empty()) {
        args.push_back("--cpuset");
        args.push_back(request.cpuset);
    }
    args.push_back("--");
    args.insert(args.end(), request.command.begin(), request.command.end());
    return args;
}

run_outcome classify_run(const runguard_result &result) {
    if (!result.internal_error.empty())
        throw sandbox_error("runguard internal error: " + result.internal_error);
    if (!result.finished)
        throw sandbox_error("runguard did not finish normally");

    run_outcome outcome;
    outcome.exit_code = result.exitcode;
    outcome.signal = max(result.signal, 0);
    outcome.wall_time_ms = (int)lround(max(result.wall_time, 0.0) * 1000);
    outcome.cpu_time_ms = (int)lround(max(result.cpu_time, 0.0) * 1000);
    outcome.peak_memory_kb = (int)(max<int64_t>(result.memory, 0) / 1024);
    outcome.output_truncated = !result.output_truncated.empty();

    bool failed = result.exitcode != 0 || result.signal > 0;
    if (result.memory_result == "oom" || (result.memory_result == "limit-hit" && failed))
        outcome.kind = run_outcome::termination::MEMORY_LIMIT_EXCEEDED;
    else if (!result.time_result.empty())
        outcome.kind = run_outcome::termination::TIME_LIMIT_EXCEEDED;
    else if (result.signal > 0)
        outcome.kind = run_outcome::termination::SIGNALED;
    else
        outcome.kind = run_outcome::termination::EXITED;
    return outcome;
}

run_outcome runguard_sandbox::run(const run_request &request) {
    if (request.command.empty())
        throw sandbox_error("empty command");

    try {
        scoped_directory scratch(options.run_dir, options.keep_scratch);
        fs::path box = scratch.path() / "box";
        fs::create_directories(box);
        if (!request.source_dir.empty())
            fs::copy(request.source_dir, box, fs::copy_options::recursive);
        if (request.input)
            write_file_content(scratch.path() / "testdata.in", *request.input);

        int ret = call_process(command_line(request, scratch.path()));
        DLOG(INFO) << "runguard returned " << ret << " in " << scratch.path();

        run_outcome outcome = classify_run(read_runguard_result(scratch.path() / "program.meta"));

        size_t limit = (size_t)request.output_limit_kb * 1024;
        bool truncated = false;
        if (fs::exists(scratch.path() / "program.out"))
            outcome.stdout_data = read_file_prefix(scratch.path() / "program.out", limit, truncated);
        if (fs::exists(scratch.path() / "program.err"))
            outcome.stderr_data = read_file_prefix(scratch.path() / "program.err", limit, truncated);

        for (auto &name : request.collect) {
            fs::path from = box / assert_safe_path(name);
            if (!fs::exists(from)) continue;
            fs::copy(from, request.collect_dir / name, fs::copy_options::overwrite_existing | fs::copy_options::recursive);
        }
        return outcome;
    } catch (fs::filesystem_error &ex) {
        throw sandbox_error(fmt::format("preparing sandbox directory: {}", ex.what()));
    } catch (system_error &ex) {
        throw sandbox_error(fmt::format("launching runguard: {}", ex.what()));
    }
}

}  // namespace arbiter
