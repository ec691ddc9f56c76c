#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <tuple>
#include <vector>
#include "gmock/gmock.h"
#include "monitor/monitor.hpp"
#include "sandbox/sandbox.hpp"
#include "server/event_channel.hpp"
#include "server/job_queue.hpp"
#include "server/submission_store.hpp"

namespace arbiter::test {

/**
 * @brief 不真正运行程序的沙箱
 * 默认行为：编译总是成功并生成 collect 中的文件；运行时把输入原样输出
 */
struct fake_sandbox : public sandbox {
    using handler = std::function<run_outcome(const run_request &)>;

    run_outcome run(const run_request &request) override;

    handler on_compile;
    handler on_run;

    /**
     * @brief 每次运行前等待的时间，用于观察并发
     */
    std::chrono::milliseconds delay{0};

    std::vector<run_request> compiles();
    std::vector<run_request> runs();
    int max_concurrency() const { return peak; }

private:
    std::mutex mut;
    std::vector<run_request> compile_requests;
    std::vector<run_request> run_requests;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
};

run_outcome exited(const std::string &stdout_data, int exit_code = 0);
run_outcome terminated(run_outcome::termination kind);

/**
 * @brief 内存中的比赛计分数据
 */
struct memory_ledger : public contest_ledger {
    std::optional<contest_window> lock_contest(int64_t contest_id) override;
    std::optional<int> problem_points(int64_t contest_id, int64_t problem_id) override;
    problem_attempts load_attempts(int64_t contest_id, int64_t user_id, int64_t problem_id) override;
    void save_attempts(const problem_attempts &attempts) override;
    std::vector<scored_attempt> load_history(int64_t contest_id, int64_t user_id, int64_t problem_id) override;
    void add_history(int64_t contest_id, int64_t user_id, int64_t problem_id, const scored_attempt &attempt) override;
    contest_participant load_participant(int64_t contest_id, int64_t user_id) override;
    void save_participant(const contest_participant &participant) override;
    std::vector<contest_participant> participants(int64_t contest_id) override;
    void save_ranks(const std::vector<contest_participant> &participants) override;

    void add_contest(int64_t contest_id, std::time_t start_time, std::time_t end_time);
    void add_problem(int64_t contest_id, int64_t problem_id, int points);

    std::map<int64_t, contest_window> contests;
    std::map<std::pair<int64_t, int64_t>, int> points;
    std::map<std::tuple<int64_t, int64_t, int64_t>, problem_attempts> attempts;
    std::map<std::tuple<int64_t, int64_t, int64_t>, std::vector<scored_attempt>> history;
    std::map<std::pair<int64_t, int64_t>, contest_participant> scoreboard;
};

/**
 * @brief 内存中的提交存储，record_result 失败时回滚所有修改
 */
struct memory_store : public server::submission_store {
    std::optional<submission_record> find_submission(int64_t submission_id) override;
    void mark_in_flight(const judge_job &job, status state) override;
    std::vector<test_case> load_test_cases(int64_t problem_id, const std::vector<int64_t> &refs) override;
    bool record_result(const judge_job &job, const server::terminal_update &update,
                       const std::function<void(contest_ledger &)> &scoring) override;
    std::vector<contest_participant> load_participants(int64_t contest_id) override;

    void add_submission(const judge_job &job);
    void add_test_case(int64_t problem_id, const test_case &tc);
    submission_record get(int64_t submission_id);

    /**
     * @brief 接下来这么多次 load_test_cases 抛出 internal_error
     */
    std::atomic<int> failing_loads{0};

    /**
     * @brief 接下来这么多次 record_result 抛出 database_error
     */
    std::atomic<int> failing_records{0};

    /**
     * @brief 为真时 scoring 执行后抛出异常，用于检查回滚
     */
    bool fail_after_scoring = false;

    std::atomic<int> load_calls{0};
    std::atomic<int> record_calls{0};

    std::mutex mut;
    std::map<int64_t, submission_record> submissions;
    std::map<int64_t, std::vector<test_case>> test_cases;
    std::map<int64_t, std::pair<int, int>> problem_statistics;  // total, accepted
    std::vector<std::pair<int64_t, status>> transitions;
    memory_ledger ledger;
};

/**
 * @brief 内存中的至少一次投递队列
 * 取走的消息在可见超时之前不会再次被取走，时钟可以手动拨快
 */
struct memory_job_queue : public server::job_queue {
    explicit memory_job_queue(std::chrono::milliseconds visibility_timeout = std::chrono::seconds(30));

    bool fetch(server::queued_job &job, std::chrono::milliseconds timeout) override;
    void ack(const server::queued_job &job) override;
    void reject(const server::queued_job &job, bool requeue) override;
    void publish(const std::string &body) override;

    /**
     * @brief 拨快时钟，超过可见超时的消息将被重新投递
     */
    void advance(std::chrono::milliseconds duration);

    size_t acked();
    size_t unacked();
    int deliveries(size_t index);
    int rejections();

    /**
     * @brief 为真时 ack 抛出 network_error
     */
    bool fail_ack = false;

private:
    struct message {
        std::string body;
        bool acked = false;
        int deliveries = 0;
        std::chrono::steady_clock::time_point invisible_until;
    };

    bool try_take(server::queued_job &job);
    std::chrono::steady_clock::time_point now() const;

    std::chrono::milliseconds visibility_timeout;
    std::chrono::milliseconds offset{0};
    std::mutex mut;
    std::condition_variable cond;
    std::vector<message> messages;
    int rejected = 0;
};

/**
 * @brief 记录所有发布的事件
 */
struct recording_event_channel : public server::event_channel {
    void publish(const status_event &event) override;

    std::vector<status_event> events();

    /**
     * @brief 为真时 publish 抛出 network_error
     */
    bool fail = false;

private:
    std::mutex mut;
    std::vector<status_event> published;
};

struct mock_monitor : public monitor {
    MOCK_METHOD(void, start_submission, (int, const judge_job &), (override));
    MOCK_METHOD(void, end_submission, (int, const judge_report &), (override));
    MOCK_METHOD(void, worker_state_changed, (int, worker_state, const std::string &), (override));
    MOCK_METHOD(void, report_error, (const std::string &), (override));
};

judge_job make_job(int64_t submission_id, int64_t problem_id, const std::vector<int64_t> &refs);

/**
 * @brief 轮询直到 pred 为真，最多等待 timeout
 */
bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout = std::chrono::seconds(10));

}  // namespace arbiter::test
