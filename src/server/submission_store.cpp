#include "server/submission_store.hpp"

namespace arbiter::server {

submission_store::~submission_store() {}

terminal_update make_terminal_update(const judge_report &report, std::time_t judged_at) {
    terminal_update update;
    update.verdict = report.verdict;
    update.execution_time = report.execution_time_ms;
    update.memory_used = report.memory_kb;
    update.score = report.score;
    update.test_cases_passed = report.tests_passed;
    update.total_test_cases = report.tests_total;
    // 空信息写为 NULL
    if (report.error_message && !report.error_message->empty())
        update.error_message = report.error_message;
    update.judged_at = judged_at;
    return update;
}

}  // namespace arbiter::server
