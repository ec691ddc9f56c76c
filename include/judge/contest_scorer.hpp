#pragma once

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>
#include "common/status.hpp"
#include "judge/contest.hpp"

namespace arbiter {

/**
 * @brief 一次需要计入比赛成绩的评测结果
 */
struct scoring_event {
    int64_t contest_id = 0;
    int64_t user_id = 0;
    int64_t problem_id = 0;
    int64_t submission_id = 0;
    status verdict = status::PENDING;
    std::time_t submitted_at = 0;
};

/**
 * @brief 按分数降序、罚时升序计算排名，分数和罚时都相同的选手名次相同
 * 名次连续，不因并列而跳过
 */
void assign_ranks(std::vector<contest_participant> &participants);

/**
 * @brief 比赛计分
 * 第一次通过某题时获得该题分数，罚时为提交时距比赛开始的分钟数
 * 加上之前错误提交次数乘以每次错误的罚时。
 * "第一次"和"之前"都按提交时间判断：先提交的结果后评测完时会重新计算该题成绩。
 * 编译错误和内部错误不计入错误次数。
 */
struct contest_scorer {
    explicit contest_scorer(int penalty_per_wrong_minutes = 20);

    /**
     * @brief 同一场比赛的计分必须串行进行，调用 score 前需要持有这个锁
     */
    std::unique_lock<std::mutex> lock(int64_t contest_id);

    /**
     * @brief 在 ledger 所在的事务内更新选手成绩并重新计算排名
     * @return 是否修改了成绩
     */
    bool score(contest_ledger &ledger, const scoring_event &event) const;

    int penalty_per_wrong() const { return penalty_per_wrong_minutes; }

private:
    /**
     * @return 该题带来的分数和罚时
     */
    std::pair<int, int> contribution(const problem_attempts &attempts, int points, std::time_t start_time) const;

    int penalty_per_wrong_minutes;

    std::mutex locks_mut;
    std::map<int64_t, std::unique_ptr<std::mutex>> contest_locks;
};

}  // namespace arbiter
