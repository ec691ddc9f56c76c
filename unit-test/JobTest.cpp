#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/submission.hpp"

using namespace std;
using namespace arbiter;
using nlohmann::json;

class JobTest : public ::testing::Test {
protected:
    json valid_job() {
        return {{"submission_id", 15},
                {"problem_id", 3},
                {"user_id", 9},
                {"contest_id", nullptr},
                {"language", "cpp"},
                {"source_code", "int main() {}"},
                {"time_limit_ms", 1000},
                {"memory_limit_mb", 64},
                {"test_case_refs", {4, 5, 6}}};
    }
};

TEST_F(JobTest, ParseJob) {
    auto job = parse_judge_job(valid_job().dump());
    EXPECT_EQ(job.submission_id, 15);
    EXPECT_EQ(job.problem_id, 3);
    EXPECT_EQ(job.user_id, 9);
    EXPECT_FALSE(job.contest_id);
    EXPECT_EQ(job.time_limit_ms, 1000);
    EXPECT_EQ(job.memory_limit_mb, 64);
    EXPECT_EQ(job.test_case_refs, (vector<int64_t>{4, 5, 6}));
    EXPECT_EQ(job.grading, grading_mode::BINARY);
    EXPECT_EQ(job.comparison, comparison_mode::EXACT);
    EXPECT_DOUBLE_EQ(job.tolerance, 1e-6);
}

TEST_F(JobTest, ParseOptionalFields) {
    auto j = valid_job();
    j["contest_id"] = 8;
    j["grading"] = "partial";
    j["comparison"] = "numeric";
    j["tolerance"] = 0.01;
    j["allow_nonzero_exit"] = true;
    j.erase("time_limit_ms");
    j.erase("memory_limit_mb");

    auto job = parse_judge_job(j.dump());
    EXPECT_EQ(job.contest_id, optional<int64_t>(8));
    EXPECT_EQ(job.grading, grading_mode::PARTIAL);
    EXPECT_EQ(job.comparison, comparison_mode::NUMERIC);
    EXPECT_DOUBLE_EQ(job.tolerance, 0.01);
    EXPECT_TRUE(job.allow_nonzero_exit);
    EXPECT_EQ(job.time_limit_ms, 2000);
    EXPECT_EQ(job.memory_limit_mb, 128);
}

TEST_F(JobTest, RejectMalformedJobs) {
    EXPECT_THROW(parse_judge_job("{"), malformed_job_error);
    EXPECT_THROW(parse_judge_job("[]"), malformed_job_error);

    auto no_code = valid_job();
    no_code["source_code"] = "";
    EXPECT_THROW(parse_judge_job(no_code.dump()), malformed_job_error);

    auto no_cases = valid_job();
    no_cases["test_case_refs"] = json::array();
    EXPECT_THROW(parse_judge_job(no_cases.dump()), malformed_job_error);

    auto bad_limit = valid_job();
    bad_limit["time_limit_ms"] = 0;
    EXPECT_THROW(parse_judge_job(bad_limit.dump()), malformed_job_error);

    auto bad_grading = valid_job();
    bad_grading["grading"] = "icpc";
    EXPECT_THROW(parse_judge_job(bad_grading.dump()), malformed_job_error);

    auto bad_type = valid_job();
    bad_type["problem_id"] = "three";
    EXPECT_THROW(parse_judge_job(bad_type.dump()), malformed_job_error);
}

TEST_F(JobTest, RejectOversizedLimits) {
    auto huge_memory = valid_job();
    huge_memory["memory_limit_mb"] = 3000000;
    EXPECT_THROW(parse_judge_job(huge_memory.dump()), malformed_job_error);

    auto huge_time = valid_job();
    huge_time["time_limit_ms"] = MAX_TIME_LIMIT_MS + 1;
    EXPECT_THROW(parse_judge_job(huge_time.dump()), malformed_job_error);

    auto largest = valid_job();
    largest["time_limit_ms"] = MAX_TIME_LIMIT_MS;
    largest["memory_limit_mb"] = MAX_MEMORY_LIMIT_MB;
    auto job = parse_judge_job(largest.dump());
    EXPECT_EQ(job.memory_limit_mb, MAX_MEMORY_LIMIT_MB);
}

TEST_F(JobTest, PeekSubmissionId) {
    EXPECT_EQ(peek_submission_id(R"({"submission_id": 77, "language": 1})"), optional<int64_t>(77));
    EXPECT_FALSE(peek_submission_id("not json"));
    EXPECT_FALSE(peek_submission_id(R"({"submission_id": "77"})"));
    EXPECT_FALSE(peek_submission_id("[1, 2]"));
}

TEST_F(JobTest, StatusEventJson) {
    judge_report report;
    report.submission_id = 15;
    report.verdict = status::COMPILATION_ERROR;
    report.tests_total = 3;
    report.error_message = "main.cpp:1: error";

    json j = make_status_event(report);
    EXPECT_EQ(j.at("submission_id"), 15);
    EXPECT_EQ(j.at("status"), "Compilation Error");
    EXPECT_EQ(j.at("verdict"), "Compilation Error");
    EXPECT_EQ(j.at("tests_total"), 3);
    EXPECT_EQ(j.at("error_message"), "main.cpp:1: error");

    auto event = j.get<status_event>();
    EXPECT_EQ(event.state, status::COMPILATION_ERROR);
    EXPECT_EQ(event.error_message, report.error_message);

    report.verdict = status::ACCEPTED;
    report.error_message.reset();
    json accepted = make_status_event(report);
    EXPECT_FALSE(accepted.count("error_message"));
}

TEST_F(JobTest, StatusHelpers) {
    EXPECT_STREQ(get_display_message(status::WRONG_ANSWER), "Wrong Answer");
    EXPECT_EQ(parse_status("Time Limit Exceeded"), optional<status>(status::TIME_LIMIT_EXCEEDED));
    EXPECT_FALSE(parse_status("Unknown"));
    EXPECT_FALSE(is_terminal(status::PENDING));
    EXPECT_FALSE(is_terminal(status::JUDGING));
    EXPECT_TRUE(is_terminal(status::INTERNAL_ERROR));
    EXPECT_TRUE(is_user_caused(status::COMPILATION_ERROR));
    EXPECT_FALSE(is_user_caused(status::INTERNAL_ERROR));
    EXPECT_FALSE(is_user_caused(status::ACCEPTED));
}

TEST_F(JobTest, ColumnNames) {
    EXPECT_STREQ(column_name(submission_field::TEST_CASES_PASSED), "test_cases_passed");
    EXPECT_STREQ(column_name(submission_field::JUDGED_AT), "judged_at");
}

TEST(TruncateMessageTest, Truncate) {
    EXPECT_EQ(truncate_message("short", 100), "short");
    string truncated = truncate_message(string(100, 'x'), 40);
    EXPECT_EQ(truncated.size(), 40u);
    EXPECT_EQ(truncated.substr(truncated.size() - 11), "(truncated)");
}
