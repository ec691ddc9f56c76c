#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/programming.hpp"
#include "test/fakes.hpp"

using namespace std;
using std::filesystem::temp_directory_path;
using namespace arbiter;
using namespace arbiter::test;

class ProgrammingJudgerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        languages = language_table::defaults();
    }

    void SetUp() override {
        options.work_dir = temp_directory_path() / "arbiter-test";
        options.max_message_length = 64;
    }

    vector<test_case> make_cases(int count) {
        vector<test_case> cases;
        for (int i = 1; i <= count; ++i) {
            test_case tc;
            tc.id = i;
            tc.input = to_string(i);
            tc.expected_output = to_string(i);
            tc.points = i;
            cases.push_back(tc);
        }
        return cases;
    }

    static language_table languages;
    judge_options options;
    fake_sandbox box;
};

language_table ProgrammingJudgerTest::languages;

TEST_F(ProgrammingJudgerTest, AcceptedTest) {
    programming_judger judger(box, languages, options);
    vector<status> transitions;
    auto report = judger.judge(make_job(1, 1, {1, 2, 3}), make_cases(3),
                               [&](status stat) { transitions.push_back(stat); });

    EXPECT_EQ(report.verdict, status::ACCEPTED);
    EXPECT_EQ(report.tests_passed, 3);
    EXPECT_EQ(report.tests_total, 3);
    EXPECT_EQ(report.score, 6);
    EXPECT_EQ(report.execution_time_ms, 10);
    EXPECT_EQ(report.memory_kb, 1024);
    EXPECT_FALSE(report.error_message);
    EXPECT_EQ(transitions, (vector<status>{status::COMPILING, status::JUDGING}));
    ASSERT_EQ(box.compiles().size(), 1u);
    EXPECT_EQ(box.compiles()[0].command[0], "/usr/bin/g++");
    EXPECT_EQ(box.runs().size(), 3u);
}

TEST_F(ProgrammingJudgerTest, BinaryGradingStopsAtFirstFailure) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &request) {
        return exited(*request.input == "3" ? "wrong" : *request.input);
    };

    auto report = judger.judge(make_job(1, 1, {}), make_cases(10));
    EXPECT_EQ(report.verdict, status::WRONG_ANSWER);
    EXPECT_EQ(report.tests_passed, 2);
    EXPECT_EQ(report.tests_total, 10);
    EXPECT_EQ(report.score, 0);
    EXPECT_EQ(box.runs().size(), 3u);
    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.outcomes[2].test_case_id, 3);
}

TEST_F(ProgrammingJudgerTest, PartialGradingRunsEveryTest) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &request) {
        int id = stoi(*request.input);
        if (id > 6) return exited("wrong");
        return exited(*request.input);
    };

    auto job = make_job(1, 1, {});
    job.grading = grading_mode::PARTIAL;
    auto report = judger.judge(job, make_cases(10));
    EXPECT_EQ(report.verdict, status::WRONG_ANSWER);
    EXPECT_EQ(report.tests_passed, 6);
    EXPECT_EQ(report.score, 1 + 2 + 3 + 4 + 5 + 6);
    EXPECT_EQ(box.runs().size(), 10u);
}

TEST_F(ProgrammingJudgerTest, FirstFailingKindIsTheVerdict) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &request) {
        if (*request.input == "2") return terminated(run_outcome::termination::TIME_LIMIT_EXCEEDED);
        if (*request.input == "3") return terminated(run_outcome::termination::MEMORY_LIMIT_EXCEEDED);
        return exited(*request.input);
    };

    auto job = make_job(1, 1, {});
    job.grading = grading_mode::PARTIAL;
    auto report = judger.judge(job, make_cases(4));
    EXPECT_EQ(report.verdict, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(report.tests_passed, 2);
    EXPECT_EQ(report.score, 1 + 4);
}

TEST_F(ProgrammingJudgerTest, TimeLimitExceededTest) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &) { return terminated(run_outcome::termination::TIME_LIMIT_EXCEEDED); };

    auto job = make_job(1, 1, {});
    job.time_limit_ms = 1500;
    job.memory_limit_mb = 64;
    auto report = judger.judge(job, make_cases(2));
    EXPECT_EQ(report.verdict, status::TIME_LIMIT_EXCEEDED);
    ASSERT_EQ(box.runs().size(), 1u);
    EXPECT_EQ(box.runs()[0].time_limit_ms, 1500);
    EXPECT_EQ(box.runs()[0].memory_limit_kb, 64 * 1024);
}

TEST_F(ProgrammingJudgerTest, MemoryLimitExceededTest) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &) { return terminated(run_outcome::termination::MEMORY_LIMIT_EXCEEDED); };

    auto report = judger.judge(make_job(1, 1, {}), make_cases(2));
    EXPECT_EQ(report.verdict, status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(report.tests_passed, 0);
}

TEST_F(ProgrammingJudgerTest, RuntimeErrorKeepsStderr) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &) {
        auto outcome = exited("", 1);
        outcome.stderr_data = "Segmentation fault";
        return outcome;
    };

    auto report = judger.judge(make_job(1, 1, {}), make_cases(1));
    EXPECT_EQ(report.verdict, status::RUNTIME_ERROR);
    EXPECT_EQ(report.error_message, optional<string>("Segmentation fault"));
}

TEST_F(ProgrammingJudgerTest, CompilationErrorTest) {
    programming_judger judger(box, languages, options);
    box.on_compile = [](const run_request &) {
        auto outcome = exited("", 1);
        outcome.stderr_data = string(200, 'e');
        return outcome;
    };
    vector<status> transitions;

    auto report = judger.judge(make_job(1, 1, {}), make_cases(3),
                               [&](status stat) { transitions.push_back(stat); });
    EXPECT_EQ(report.verdict, status::COMPILATION_ERROR);
    EXPECT_EQ(report.tests_passed, 0);
    EXPECT_EQ(report.score, 0);
    ASSERT_TRUE(report.error_message);
    EXPECT_LE(report.error_message->size(), options.max_message_length);
    EXPECT_NE(report.error_message->find("(truncated)"), string::npos);
    EXPECT_TRUE(box.runs().empty());
    EXPECT_EQ(transitions, vector<status>{status::COMPILING});
}

TEST_F(ProgrammingJudgerTest, CompilationTimeLimitTest) {
    programming_judger judger(box, languages, options);
    box.on_compile = [](const run_request &) { return terminated(run_outcome::termination::TIME_LIMIT_EXCEEDED); };

    auto report = judger.judge(make_job(1, 1, {}), make_cases(1));
    EXPECT_EQ(report.verdict, status::COMPILATION_ERROR);
    EXPECT_EQ(report.error_message, optional<string>("Compilation time limit exceeded"));
}

TEST_F(ProgrammingJudgerTest, InterpretedLanguageSkipsCompilation) {
    programming_judger judger(box, languages, options);
    auto job = make_job(1, 1, {});
    job.language = "python";
    job.source_code = "print(input())";

    auto report = judger.judge(job, make_cases(2));
    EXPECT_EQ(report.verdict, status::ACCEPTED);
    EXPECT_TRUE(box.compiles().empty());
    ASSERT_EQ(box.runs().size(), 2u);
    EXPECT_EQ(box.runs()[0].command, (vector<string>{"/usr/bin/python3", "main.py"}));
}

TEST_F(ProgrammingJudgerTest, TestCasesJudgedInAscendingOrder) {
    programming_judger judger(box, languages, options);
    auto cases = make_cases(5);
    reverse(cases.begin(), cases.end());

    auto report = judger.judge(make_job(1, 1, {}), cases);
    ASSERT_EQ(report.outcomes.size(), 5u);
    for (size_t i = 0; i < report.outcomes.size(); ++i)
        EXPECT_EQ(report.outcomes[i].test_case_id, (int64_t)i + 1);
}

TEST_F(ProgrammingJudgerTest, SandboxFailurePropagates) {
    programming_judger judger(box, languages, options);
    box.on_run = [](const run_request &) -> run_outcome { throw sandbox_error("runguard crashed"); };

    EXPECT_THROW(judger.judge(make_job(1, 1, {}), make_cases(2)), sandbox_error);
}

TEST_F(ProgrammingJudgerTest, UnknownLanguageIsMalformed) {
    programming_judger judger(box, languages, options);
    auto job = make_job(1, 1, {});
    job.language = "brainfuck";
    EXPECT_FALSE(judger.supports("brainfuck"));
    EXPECT_TRUE(judger.supports("java"));
    EXPECT_THROW(judger.judge(job, make_cases(1)), malformed_job_error);
}

TEST_F(ProgrammingJudgerTest, CpusetIsPassedToSandbox) {
    programming_judger judger(box, languages, options);
    judger.judge(make_job(1, 1, {}), make_cases(1), {}, "3");
    EXPECT_EQ(box.compiles()[0].cpuset, "3");
    EXPECT_EQ(box.runs()[0].cpuset, "3");
}
