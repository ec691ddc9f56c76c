#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <map>

namespace arbiter {
using namespace std;

static const map<worker_state, const char *> state_names = boost::assign::map_list_of
    (worker_state::START, "start")
    (worker_state::IDLE, "idle")
    (worker_state::JUDGING, "judging")
    (worker_state::STOPPED, "stopped")
    (worker_state::CRASHED, "crashed");

const char *get_state_name(worker_state state) {
    return state_names.at(state);
}

monitor::~monitor() {}

void monitor::start_submission(int, const judge_job &) {}

void monitor::end_submission(int, const judge_report &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void log_monitor::start_submission(int worker_id, const judge_job &job) {
    LOG(INFO) << "Worker " << worker_id << " judging submission [" << job.submission_id << "], problem "
              << job.problem_id << ", language " << job.language << ", " << job.test_case_refs.size() << " test cases";
}

void log_monitor::end_submission(int worker_id, const judge_report &report) {
    LOG(INFO) << "Worker " << worker_id << " finished submission [" << report.submission_id << "]: "
              << get_display_message(report.verdict) << ", " << report.tests_passed << "/" << report.tests_total
              << " passed, score " << report.score << ", " << report.execution_time_ms << "ms, "
              << report.memory_kb << "KB";
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << information;
    else
        DLOG(INFO) << "Worker " << worker_id << " is " << get_state_name(state);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << message;
}

}  // namespace arbiter
