#pragma once

#include <mutex>
#include "server/mysql.hpp"
#include "server/submission_store.hpp"

namespace arbiter::server {

/**
 * @brief 基于 MySQL 的提交存储，表结构见 script/schema.sql
 * 所有操作共享一个连接，由互斥锁串行化
 */
struct mysql_store : public submission_store {
    explicit mysql_store(const database &config);

    std::optional<submission_record> find_submission(int64_t submission_id) override;
    void mark_in_flight(const judge_job &job, status state) override;
    std::vector<test_case> load_test_cases(int64_t problem_id, const std::vector<int64_t> &refs) override;
    bool record_result(const judge_job &job, const terminal_update &update,
                       const std::function<void(contest_ledger &)> &scoring) override;
    std::vector<contest_participant> load_participants(int64_t contest_id) override;

private:
    void insert_submission(const judge_job &job, status state);

    std::mutex mut;
    mysql_conn conn;
};

}  // namespace arbiter::server
