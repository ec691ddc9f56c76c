#include "gtest/gtest.h"
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/sandbox.hpp"

using namespace std;
using namespace std::filesystem;
using namespace arbiter;

class RunguardResultTest : public ::testing::Test {
protected:
    runguard_result parse(const string &content) {
        scoped_directory dir(temp_directory_path());
        write_file_content(dir.path() / "program.meta", content);
        return read_runguard_result(dir.path() / "program.meta");
    }
};

TEST_F(RunguardResultTest, ParseMetaFile) {
    auto result = parse(
        "exitcode: 0\n"
        "wall-time: 0.125\n"
        "cpu-time: 0.100\n"
        "memory-bytes: 4194304\n"
        "memory-result: \n"
        "time-result: \n"
        "output-truncated: stdout\n"
        "stdout-bytes: 1048576\n");
    EXPECT_TRUE(result.finished);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_DOUBLE_EQ(result.wall_time, 0.125);
    EXPECT_EQ(result.memory, 4194304);
    EXPECT_EQ(result.memory_result, "");
    EXPECT_EQ(result.output_truncated, "stdout");

    auto outcome = classify_run(result);
    EXPECT_EQ(outcome.kind, run_outcome::termination::EXITED);
    EXPECT_EQ(outcome.wall_time_ms, 125);
    EXPECT_EQ(outcome.cpu_time_ms, 100);
    EXPECT_EQ(outcome.peak_memory_kb, 4096);
    EXPECT_TRUE(outcome.output_truncated);
}

TEST_F(RunguardResultTest, MissingMetaFileIsSandboxError) {
    auto result = read_runguard_result(temp_directory_path() / "arbiter-no-such-meta-file");
    EXPECT_FALSE(result.finished);
    EXPECT_THROW(classify_run(result), sandbox_error);
}

TEST_F(RunguardResultTest, InternalErrorIsSandboxError) {
    auto result = parse("internal-error: unable to create cgroup\n");
    EXPECT_THROW(classify_run(result), sandbox_error);
}

TEST_F(RunguardResultTest, TimeLimit) {
    auto soft = classify_run(parse("exitcode: 0\nwall-time: 1.200\ntime-result: soft-timelimit\n"));
    EXPECT_EQ(soft.kind, run_outcome::termination::TIME_LIMIT_EXCEEDED);

    auto hard = classify_run(parse("exitcode: 137\nsignal: 9\nwall-time: 1.500\ntime-result: hard-timelimit\n"));
    EXPECT_EQ(hard.kind, run_outcome::termination::TIME_LIMIT_EXCEEDED);
}

TEST_F(RunguardResultTest, MemoryLimit) {
    auto oom = classify_run(parse("exitcode: 137\nsignal: 9\nmemory-result: oom\ntime-result: \n"));
    EXPECT_EQ(oom.kind, run_outcome::termination::MEMORY_LIMIT_EXCEEDED);

    auto failed_allocation = classify_run(parse("exitcode: 1\nmemory-result: limit-hit\n"));
    EXPECT_EQ(failed_allocation.kind, run_outcome::termination::MEMORY_LIMIT_EXCEEDED);

    // 触及上限但正常结束的程序不算超内存
    auto survived = classify_run(parse("exitcode: 0\nmemory-result: limit-hit\n"));
    EXPECT_EQ(survived.kind, run_outcome::termination::EXITED);

    // 同时超时和超内存时以超内存为准
    auto both = classify_run(parse("exitcode: 137\nsignal: 9\nmemory-result: oom\ntime-result: hard-timelimit\n"));
    EXPECT_EQ(both.kind, run_outcome::termination::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(RunguardResultTest, Signaled) {
    auto outcome = classify_run(parse("exitcode: 139\nsignal: 11\n"));
    EXPECT_EQ(outcome.kind, run_outcome::termination::SIGNALED);
    EXPECT_EQ(outcome.signal, 11);
}

TEST(RunguardCommandLineTest, BuildsCommandLine) {
    sandbox_options options;
    options.runguard = "/usr/local/bin/runguard";
    options.run_dir = "/tmp/arbiter";
    options.chroot_dir = "/chroot";
    options.run_user = "nobody";
    options.kill_grace_ms = 500;
    runguard_sandbox box(options);

    run_request request;
    request.command = {"./main", "arg"};
    request.input = "1 2";
    request.time_limit_ms = 1000;
    request.memory_limit_kb = 65536;
    request.cpuset = "2";

    auto args = box.command_line(request, "/tmp/arbiter/abc");
    auto value_of = [&](const string &flag) {
        auto it = find(args.begin(), args.end(), flag);
        return it == args.end() || it + 1 == args.end() ? string() : *(it + 1);
    };

    EXPECT_EQ(args.front(), "/usr/local/bin/runguard");
    EXPECT_EQ(value_of("--bind"), "/tmp/arbiter/abc/box");
    EXPECT_EQ(value_of("--root"), "/chroot");
    EXPECT_EQ(value_of("--user"), "nobody");
    EXPECT_EQ(value_of("--wall-time"), "1.000:1.500");
    EXPECT_EQ(value_of("--memory-limit"), "65536");
    EXPECT_EQ(value_of("--standard-input-file"), "/tmp/arbiter/abc/testdata.in");
    EXPECT_EQ(value_of("--out-meta"), "/tmp/arbiter/abc/program.meta");
    EXPECT_EQ(value_of("--cpuset"), "2");
    EXPECT_EQ(find(args.begin(), args.end(), "--group"), args.end());

    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "--");
    EXPECT_EQ(args[args.size() - 2], "./main");
    EXPECT_EQ(args.back(), "arg");
}
