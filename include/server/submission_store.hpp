#pragma once

#include <functional>
#include <optional>
#include <vector>
#include "judge/contest.hpp"
#include "judge/submission.hpp"

namespace arbiter::server {

/**
 * @brief 写入 submissions 表的终止状态字段
 */
struct terminal_update {
    status verdict = status::INTERNAL_ERROR;
    int execution_time = 0;
    int memory_used = 0;
    int score = 0;
    int test_cases_passed = 0;
    int total_test_cases = 0;
    std::optional<std::string> error_message;
    std::time_t judged_at = 0;
};

terminal_update make_terminal_update(const judge_report &report, std::time_t judged_at);

/**
 * @brief 提交记录、数据点和比赛计分数据的持久化存储
 * 所有方法都可以被多个工作线程同时调用
 */
struct submission_store {
    virtual ~submission_store();

    virtual std::optional<submission_record> find_submission(int64_t submission_id) = 0;

    /**
     * @brief 将提交标记为 COMPILING 或 JUDGING
     * 同时清空 verdict、judged_at 和评测结果字段，重新评测时覆盖之前的中间状态
     * 记录不存在时根据 job 创建
     */
    virtual void mark_in_flight(const judge_job &job, status state) = 0;

    /**
     * @brief 读取数据点
     * @throw internal_error 有数据点不存在或者无法读取
     */
    virtual std::vector<test_case> load_test_cases(int64_t problem_id, const std::vector<int64_t> &refs) = 0;

    /**
     * @brief 在一个事务内写入终止状态、更新题目统计并执行 scoring
     * 提交已经处于终止状态时什么也不做
     * @param scoring 在同一事务内执行的比赛计分，可以为空
     * @return 是否写入了终止状态
     * @throw database_error 事务失败，所有修改都被回滚
     */
    virtual bool record_result(const judge_job &job, const terminal_update &update,
                               const std::function<void(contest_ledger &)> &scoring) = 0;

    /**
     * @brief 读取比赛的所有选手成绩（不保证排名为最新）
     */
    virtual std::vector<contest_participant> load_participants(int64_t contest_id) = 0;
};

}  // namespace arbiter::server
