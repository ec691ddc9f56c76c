#include "judge/submission.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<submission_field, const char *> submission_columns = boost::assign::map_list_of
    (submission_field::ID, "id")
    (submission_field::USER_ID, "user_id")
    (submission_field::PROBLEM_ID, "problem_id")
    (submission_field::CONTEST_ID, "contest_id")
    (submission_field::LANGUAGE, "language")
    (submission_field::CODE, "code")
    (submission_field::STATUS, "status")
    (submission_field::VERDICT, "verdict")
    (submission_field::EXECUTION_TIME, "execution_time")
    (submission_field::MEMORY_USED, "memory_used")
    (submission_field::SCORE, "score")
    (submission_field::TEST_CASES_PASSED, "test_cases_passed")
    (submission_field::TOTAL_TEST_CASES, "total_test_cases")
    (submission_field::ERROR_MESSAGE, "error_message")
    (submission_field::SUBMITTED_AT, "submitted_at")
    (submission_field::JUDGED_AT, "judged_at");
// clang-format on

const char *column_name(submission_field field) {
    return submission_columns.at(field);
}

static grading_mode parse_grading(const string &name) {
    if (name == "binary") return grading_mode::BINARY;
    if (name == "partial") return grading_mode::PARTIAL;
    throw malformed_job_error("unknown grading mode " + name);
}

static comparison_mode parse_comparison(const string &name) {
    if (name == "exact") return comparison_mode::EXACT;
    if (name == "numeric") return comparison_mode::NUMERIC;
    throw malformed_job_error("unknown comparison mode " + name);
}

void from_json(const json &j, judge_job &job) {
    j.at("submission_id").get_to(job.submission_id);
    j.at("problem_id").get_to(job.problem_id);
    if (j.count("user_id"))
        j.at("user_id").get_to(job.user_id);
    if (j.count("contest_id") && !j.at("contest_id").is_null())
        job.contest_id = j.at("contest_id").get<int64_t>();
    else
        job.contest_id = nullopt;
    j.at("language").get_to(job.language);
    j.at("source_code").get_to(job.source_code);
    if (j.count("time_limit_ms"))
        j.at("time_limit_ms").get_to(job.time_limit_ms);
    if (j.count("memory_limit_mb"))
        j.at("memory_limit_mb").get_to(job.memory_limit_mb);
    j.at("test_case_refs").get_to(job.test_case_refs);
    if (j.count("submitted_at"))
        j.at("submitted_at").get_to(job.submitted_at);
    if (j.count("grading"))
        job.grading = parse_grading(j.at("grading").get<string>());
    if (j.count("comparison"))
        job.comparison = parse_comparison(j.at("comparison").get<string>());
    if (j.count("tolerance"))
        j.at("tolerance").get_to(job.tolerance);
    if (j.count("allow_nonzero_exit"))
        j.at("allow_nonzero_exit").get_to(job.allow_nonzero_exit);
}

void to_json(json &j, const judge_job &job) {
    j = {{"submission_id", job.submission_id},
         {"problem_id", job.problem_id},
         {"user_id", job.user_id},
         {"language", job.language},
         {"source_code", job.source_code},
         {"time_limit_ms", job.time_limit_ms},
         {"memory_limit_mb", job.memory_limit_mb},
         {"test_case_refs", job.test_case_refs},
         {"submitted_at", job.submitted_at},
         {"grading", job.grading == grading_mode::PARTIAL ? "partial" : "binary"},
         {"comparison", job.comparison == comparison_mode::NUMERIC ? "numeric" : "exact"},
         {"tolerance", job.tolerance},
         {"allow_nonzero_exit", job.allow_nonzero_exit}};
    if (job.contest_id)
        j["contest_id"] = *job.contest_id;
    else
        j["contest_id"] = nullptr;
}

judge_job parse_judge_job(const string &body) {
    judge_job job;
    try {
        json::parse(body).get_to(job);
    } catch (json::exception &ex) {
        throw malformed_job_error(string("malformed judge job: ") + ex.what());
    }

    if (job.source_code.empty())
        throw malformed_job_error("judge job has empty source code");
    if (job.test_case_refs.empty())
        throw malformed_job_error("judge job has no test cases");
    if (job.time_limit_ms <= 0 || job.memory_limit_mb <= 0)
        throw malformed_job_error("judge job has non-positive limits");
    if (job.time_limit_ms > MAX_TIME_LIMIT_MS || job.memory_limit_mb > MAX_MEMORY_LIMIT_MB)
        throw malformed_job_error("judge job has limits exceeding " + to_string(MAX_TIME_LIMIT_MS) + "ms or " +
                                  to_string(MAX_MEMORY_LIMIT_MB) + "MB");
    if (job.tolerance < 0)
        throw malformed_job_error("judge job has negative tolerance");
    return job;
}

optional<int64_t> peek_submission_id(const string &body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.count("submission_id"))
        return nullopt;
    auto &id = j.at("submission_id");
    if (!id.is_number_integer())
        return nullopt;
    return id.get<int64_t>();
}

status_event make_status_event(const judge_report &report) {
    status_event event;
    event.submission_id = report.submission_id;
    event.state = report.verdict;
    event.verdict = report.verdict;
    event.execution_time_ms = report.execution_time_ms;
    event.memory_kb = report.memory_kb;
    event.score = report.score;
    event.tests_passed = report.tests_passed;
    event.tests_total = report.tests_total;
    event.error_message = report.error_message;
    return event;
}

void to_json(json &j, const status_event &event) {
    j = {{"submission_id", event.submission_id},
         {"status", get_display_message(event.state)},
         {"execution_time_ms", event.execution_time_ms},
         {"memory_kb", event.memory_kb},
         {"score", event.score},
         {"tests_passed", event.tests_passed},
         {"tests_total", event.tests_total}};
    if (event.verdict)
        j["verdict"] = get_display_message(*event.verdict);
    else
        j["verdict"] = nullptr;
    if (event.error_message)
        j["error_message"] = *event.error_message;
}

void from_json(const json &j, status_event &event) {
    j.at("submission_id").get_to(event.submission_id);
    auto state = parse_status(j.at("status").get<string>());
    if (!state) throw invalid_argument("unknown status " + j.at("status").get<string>());
    event.state = *state;
    if (j.count("verdict") && !j.at("verdict").is_null())
        event.verdict = parse_status(j.at("verdict").get<string>());
    else
        event.verdict = nullopt;
    j.at("execution_time_ms").get_to(event.execution_time_ms);
    j.at("memory_kb").get_to(event.memory_kb);
    j.at("score").get_to(event.score);
    j.at("tests_passed").get_to(event.tests_passed);
    j.at("tests_total").get_to(event.tests_total);
    if (j.count("error_message"))
        event.error_message = j.at("error_message").get<string>();
    else
        event.error_message = nullopt;
}

}  // namespace arbiter
