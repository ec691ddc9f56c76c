#include "server/mysql_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <set>
#include "common/exceptions.hpp"

namespace arbiter::server {
using namespace std;

template <typename T>
static T column(const mysql_row &row, size_t index, T def = T()) {
    if (index >= row.size() || !row[index]) return def;
    try {
        return boost::lexical_cast<T>(*row[index]);
    } catch (boost::bad_lexical_cast &) {
        throw database_error(fmt::format("MySQL: unexpected value '{}' in column {}", *row[index], index));
    }
}

static string opt_id(const optional<int64_t> &id) {
    return id ? to_string(*id) : "NULL";
}

static const vector<submission_field> record_fields = {
    submission_field::ID, submission_field::USER_ID, submission_field::PROBLEM_ID, submission_field::CONTEST_ID,
    submission_field::LANGUAGE, submission_field::CODE, submission_field::STATUS, submission_field::VERDICT,
    submission_field::EXECUTION_TIME, submission_field::MEMORY_USED, submission_field::SCORE,
    submission_field::TEST_CASES_PASSED, submission_field::TOTAL_TEST_CASES, submission_field::ERROR_MESSAGE,
    submission_field::SUBMITTED_AT, submission_field::JUDGED_AT};

static string select_list() {
    vector<string> columns;
    for (auto field : record_fields) {
        string name = column_name(field);
        if (field == submission_field::SUBMITTED_AT || field == submission_field::JUDGED_AT)
            columns.push_back("UNIX_TIMESTAMP(" + name + ")");
        else
            columns.push_back(name);
    }
    return boost::algorithm::join(columns, ", ");
}

static status status_column(const mysql_row &row, size_t index) {
    string name = column<string>(row, index);
    auto stat = parse_status(name);
    if (!stat) throw database_error("MySQL: unknown submission status " + name);
    return *stat;
}

/**
 * @brief 在 record_result 的事务中读写比赛计分表
 */
struct mysql_ledger : public contest_ledger {
    explicit mysql_ledger(mysql_conn &conn) : conn(conn) {}

    optional<contest_window> lock_contest(int64_t contest_id) override {
        auto rows = conn.query(fmt::format(
            "SELECT id, UNIX_TIMESTAMP(start_time), UNIX_TIMESTAMP(end_time) FROM contests WHERE id = {} FOR UPDATE",
            contest_id));
        if (rows.empty()) return nullopt;
        contest_window window;
        window.id = column<int64_t>(rows[0], 0);
        window.start_time = column<time_t>(rows[0], 1);
        window.end_time = column<time_t>(rows[0], 2);
        return window;
    }

    optional<int> problem_points(int64_t contest_id, int64_t problem_id) override {
        auto rows = conn.query(fmt::format(
            "SELECT points FROM contest_problems WHERE contest_id = {} AND problem_id = {}", contest_id, problem_id));
        if (rows.empty()) return nullopt;
        return column<int>(rows[0], 0);
    }

    problem_attempts load_attempts(int64_t contest_id, int64_t user_id, int64_t problem_id) override {
        problem_attempts attempts;
        attempts.contest_id = contest_id;
        attempts.user_id = user_id;
        attempts.problem_id = problem_id;
        auto rows = conn.query(fmt::format(
            "SELECT wrong_attempts, solved, UNIX_TIMESTAMP(solved_at) FROM contest_problem_attempts "
            "WHERE contest_id = {} AND user_id = {} AND problem_id = {}",
            contest_id, user_id, problem_id));
        if (!rows.empty()) {
            attempts.wrong_attempts = column<int>(rows[0], 0);
            attempts.solved = column<int>(rows[0], 1) != 0;
            if (rows[0][2]) attempts.solved_at = column<time_t>(rows[0], 2);
        }
        return attempts;
    }

    void save_attempts(const problem_attempts &attempts) override {
        string solved_at = attempts.solved_at ? fmt::format("FROM_UNIXTIME({})", *attempts.solved_at) : "NULL";
        conn.execute(fmt::format(
            "INSERT INTO contest_problem_attempts (contest_id, user_id, problem_id, wrong_attempts, solved, solved_at) "
            "VALUES ({}, {}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE wrong_attempts = VALUES(wrong_attempts), solved = VALUES(solved), solved_at = VALUES(solved_at)",
            attempts.contest_id, attempts.user_id, attempts.problem_id, attempts.wrong_attempts,
            attempts.solved ? 1 : 0, solved_at));
    }

    vector<scored_attempt> load_history(int64_t contest_id, int64_t user_id, int64_t problem_id) override {
        vector<scored_attempt> history;
        auto rows = conn.query(fmt::format(
            "SELECT submission_id, verdict, UNIX_TIMESTAMP(submitted_at) FROM contest_problem_submissions "
            "WHERE contest_id = {} AND user_id = {} AND problem_id = {}",
            contest_id, user_id, problem_id));
        for (auto &row : rows) {
            scored_attempt attempt;
            attempt.submission_id = column<int64_t>(row, 0);
            attempt.verdict = status_column(row, 1);
            attempt.submitted_at = column<time_t>(row, 2);
            history.push_back(attempt);
        }
        return history;
    }

    void add_history(int64_t contest_id, int64_t user_id, int64_t problem_id, const scored_attempt &attempt) override {
        conn.execute(fmt::format(
            "INSERT INTO contest_problem_submissions (submission_id, contest_id, user_id, problem_id, verdict, submitted_at) "
            "VALUES ({}, {}, {}, {}, {}, FROM_UNIXTIME({}))",
            attempt.submission_id, contest_id, user_id, problem_id,
            conn.quote(string(get_display_message(attempt.verdict))), attempt.submitted_at));
    }

    contest_participant load_participant(int64_t contest_id, int64_t user_id) override {
        contest_participant participant;
        participant.contest_id = contest_id;
        participant.user_id = user_id;
        auto rows = conn.query(fmt::format(
            "SELECT score, penalty, `rank` FROM contest_participants WHERE contest_id = {} AND user_id = {}",
            contest_id, user_id));
        if (!rows.empty()) {
            participant.score = column<int>(rows[0], 0);
            participant.penalty = column<int>(rows[0], 1);
            participant.rank = column<int>(rows[0], 2);
        }
        return participant;
    }

    void save_participant(const contest_participant &participant) override {
        conn.execute(fmt::format(
            "INSERT INTO contest_participants (contest_id, user_id, score, penalty) VALUES ({}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE score = VALUES(score), penalty = VALUES(penalty)",
            participant.contest_id, participant.user_id, participant.score, participant.penalty));
    }

    vector<contest_participant> participants(int64_t contest_id) override {
        return read_participants(conn, contest_id);
    }

    void save_ranks(const vector<contest_participant> &participants) override {
        for (auto &participant : participants)
            conn.execute(fmt::format(
                "UPDATE contest_participants SET `rank` = {} WHERE contest_id = {} AND user_id = {}",
                participant.rank, participant.contest_id, participant.user_id));
    }

    static vector<contest_participant> read_participants(mysql_conn &conn, int64_t contest_id) {
        vector<contest_participant> result;
        auto rows = conn.query(fmt::format(
            "SELECT user_id, score, penalty, `rank` FROM contest_participants WHERE contest_id = {}", contest_id));
        for (auto &row : rows) {
            contest_participant participant;
            participant.contest_id = contest_id;
            participant.user_id = column<int64_t>(row, 0);
            participant.score = column<int>(row, 1);
            participant.penalty = column<int>(row, 2);
            participant.rank = column<int>(row, 3);
            result.push_back(participant);
        }
        return result;
    }

private:
    mysql_conn &conn;
};

mysql_store::mysql_store(const database &config)
    : conn(config) {}

optional<submission_record> mysql_store::find_submission(int64_t submission_id) {
    lock_guard<mutex> guard(mut);
    conn.ensure_connected();
    auto rows = conn.query(fmt::format("SELECT {} FROM submissions WHERE id = {}", select_list(), submission_id));
    if (rows.empty()) return nullopt;

    auto &row = rows[0];
    submission_record record;
    record.id = column<int64_t>(row, 0);
    record.user_id = column<int64_t>(row, 1);
    record.problem_id = column<int64_t>(row, 2);
    if (row[3]) record.contest_id = column<int64_t>(row, 3);
    record.language = column<string>(row, 4);
    record.code = column<string>(row, 5);
    record.state = status_column(row, 6);
    if (row[7]) record.verdict = status_column(row, 7);
    record.execution_time = column<int>(row, 8);
    record.memory_used = column<int>(row, 9);
    record.score = column<int>(row, 10);
    record.test_cases_passed = column<int>(row, 11);
    record.total_test_cases = column<int>(row, 12);
    if (row[13]) record.error_message = *row[13];
    record.submitted_at = column<time_t>(row, 14);
    if (row[15]) record.judged_at = column<time_t>(row, 15);
    return record;
}

void mysql_store::insert_submission(const judge_job &job, status state) {
    time_t submitted_at = job.submitted_at ? job.submitted_at : time(nullptr);
    conn.execute(fmt::format(
        "INSERT INTO submissions ({}, {}, {}, {}, {}, {}, {}, {}) VALUES ({}, {}, {}, {}, {}, {}, {}, FROM_UNIXTIME({}))",
        column_name(submission_field::ID), column_name(submission_field::USER_ID),
        column_name(submission_field::PROBLEM_ID), column_name(submission_field::CONTEST_ID),
        column_name(submission_field::LANGUAGE), column_name(submission_field::CODE),
        column_name(submission_field::STATUS), column_name(submission_field::SUBMITTED_AT),
        job.submission_id, job.user_id, job.problem_id, opt_id(job.contest_id),
        conn.quote(job.language), conn.quote(job.source_code), conn.quote(string(get_display_message(state))),
        submitted_at));
}

void mysql_store::mark_in_flight(const judge_job &job, status state) {
    lock_guard<mutex> guard(mut);
    conn.ensure_connected();
    uint64_t matched = conn.execute(fmt::format(
        "UPDATE submissions SET {} = {}, {} = NULL, {} = 0, {} = 0, {} = 0, {} = 0, {} = 0, {} = NULL, {} = NULL "
        "WHERE {} = {} AND {} IN ('Pending', 'Compiling', 'Judging')",
        column_name(submission_field::STATUS), conn.quote(string(get_display_message(state))),
        column_name(submission_field::VERDICT), column_name(submission_field::EXECUTION_TIME),
        column_name(submission_field::MEMORY_USED), column_name(submission_field::SCORE),
        column_name(submission_field::TEST_CASES_PASSED), column_name(submission_field::TOTAL_TEST_CASES),
        column_name(submission_field::ERROR_MESSAGE), column_name(submission_field::JUDGED_AT),
        column_name(submission_field::ID), job.submission_id, column_name(submission_field::STATUS)));
    if (matched > 0) return;

    auto rows = conn.query(fmt::format("SELECT 1 FROM submissions WHERE id = {}", job.submission_id));
    if (rows.empty()) {
        LOG(WARNING) << "Submission [" << job.submission_id << "] not found, creating record";
        insert_submission(job, state);
    }
}

vector<test_case> mysql_store::load_test_cases(int64_t problem_id, const vector<int64_t> &refs) {
    set<int64_t> ids(refs.begin(), refs.end());
    vector<string> id_list;
    for (int64_t id : ids) id_list.push_back(to_string(id));

    lock_guard<mutex> guard(mut);
    conn.ensure_connected();
    auto rows = conn.query(fmt::format(
        "SELECT id, input_data, expected_output, is_sample, points FROM test_cases "
        "WHERE problem_id = {} AND id IN ({}) ORDER BY id",
        problem_id, boost::algorithm::join(id_list, ", ")));
    if (rows.size() != ids.size())
        throw internal_error(fmt::format("problem {} has {} of {} referenced test cases", problem_id, rows.size(), ids.size()));

    vector<test_case> result;
    for (auto &row : rows) {
        test_case tc;
        tc.id = column<int64_t>(row, 0);
        if (!row[2]) throw internal_error(fmt::format("expected output of test case {} is unreadable", tc.id));
        tc.input = row[1].value_or("");
        tc.expected_output = *row[2];
        tc.is_sample = column<int>(row, 3) != 0;
        tc.points = column<int>(row, 4, 1);
        result.push_back(move(tc));
    }
    return result;
}

bool mysql_store::record_result(const judge_job &job, const terminal_update &update,
                                const function<void(contest_ledger &)> &scoring) {
    lock_guard<mutex> guard(mut);
    conn.ensure_connected();
    conn.begin();
    try {
        auto rows = conn.query(fmt::format("SELECT status FROM submissions WHERE id = {} FOR UPDATE", job.submission_id));
        if (rows.empty()) {
            insert_submission(job, status::PENDING);
        } else if (is_terminal(status_column(rows[0], 0))) {
            conn.rollback();
            return false;
        }

        conn.execute(fmt::format(
            "UPDATE submissions SET {} = {}, {} = {}, {} = {}, {} = {}, {} = {}, {} = {}, {} = {}, {} = {}, {} = FROM_UNIXTIME({}) "
            "WHERE {} = {}",
            column_name(submission_field::STATUS), conn.quote(string(get_display_message(update.verdict))),
            column_name(submission_field::VERDICT), conn.quote(string(get_display_message(update.verdict))),
            column_name(submission_field::EXECUTION_TIME), update.execution_time,
            column_name(submission_field::MEMORY_USED), update.memory_used,
            column_name(submission_field::SCORE), update.score,
            column_name(submission_field::TEST_CASES_PASSED), update.test_cases_passed,
            column_name(submission_field::TOTAL_TEST_CASES), update.total_test_cases,
            column_name(submission_field::ERROR_MESSAGE), conn.quote(update.error_message),
            column_name(submission_field::JUDGED_AT), update.judged_at,
            column_name(submission_field::ID), job.submission_id));

        if (update.verdict != status::INTERNAL_ERROR && job.problem_id > 0)
            conn.execute(fmt::format(
                "UPDATE problems SET total_submissions = total_submissions + 1, "
                "accepted_submissions = accepted_submissions + {} WHERE id = {}",
                update.verdict == status::ACCEPTED ? 1 : 0, job.problem_id));

        if (scoring) {
            mysql_ledger ledger(conn);
            scoring(ledger);
        }

        conn.commit();
        return true;
    } catch (std::exception &) {
        conn.rollback();
        throw;
    }
}

vector<contest_participant> mysql_store::load_participants(int64_t contest_id) {
    lock_guard<mutex> guard(mut);
    conn.ensure_connected();
    return mysql_ledger::read_participants(conn, contest_id);
}

}  // namespace arbiter::server
