#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <vector>
#include "common/status.hpp"

namespace arbiter {

/**
 * @brief 比赛的时间窗口，只有窗口内的提交会计分
 */
struct contest_window {
    int64_t id = 0;
    std::time_t start_time = 0;
    std::time_t end_time = 0;

    bool contains(std::time_t t) const;
};

/**
 * @brief contest_participants 表中的一条记录
 */
struct contest_participant {
    int64_t contest_id = 0;
    int64_t user_id = 0;
    int score = 0;

    /**
     * @brief 罚时，单位为分钟
     */
    int penalty = 0;

    /**
     * @brief 排名缓存，以重新计算的结果为准
     */
    int rank = 0;
};

/**
 * @brief 某个选手在某场比赛中对某道题的尝试情况
 */
struct problem_attempts {
    int64_t contest_id = 0;
    int64_t user_id = 0;
    int64_t problem_id = 0;

    /**
     * @brief 第一次通过之前的错误提交次数
     */
    int wrong_attempts = 0;
    bool solved = false;
    std::optional<std::time_t> solved_at;
};

/**
 * @brief 计入比赛的一次提交，按提交时间而不是评测完成的顺序决定先后
 */
struct scored_attempt {
    int64_t submission_id = 0;
    status verdict = status::PENDING;
    std::time_t submitted_at = 0;
};

/**
 * @brief 比赛计分数据的读写接口
 * 只在保存评测结果的事务内有效，所有修改与评测结果一起提交
 */
struct contest_ledger {
    virtual ~contest_ledger();

    /**
     * @brief 读取比赛并锁住，直到事务结束
     * @return 比赛不存在时返回 std::nullopt
     */
    virtual std::optional<contest_window> lock_contest(int64_t contest_id) = 0;

    /**
     * @return 题目不属于该比赛时返回 std::nullopt
     */
    virtual std::optional<int> problem_points(int64_t contest_id, int64_t problem_id) = 0;

    /**
     * @brief 读取尝试情况，不存在时返回全零的记录
     */
    virtual problem_attempts load_attempts(int64_t contest_id, int64_t user_id, int64_t problem_id) = 0;

    virtual void save_attempts(const problem_attempts &attempts) = 0;

    /**
     * @brief 读取选手对某题已计入比赛的全部提交，顺序不限
     */
    virtual std::vector<scored_attempt> load_history(int64_t contest_id, int64_t user_id, int64_t problem_id) = 0;

    virtual void add_history(int64_t contest_id, int64_t user_id, int64_t problem_id, const scored_attempt &attempt) = 0;

    /**
     * @brief 读取选手成绩，不存在时返回全零的记录
     */
    virtual contest_participant load_participant(int64_t contest_id, int64_t user_id) = 0;

    virtual void save_participant(const contest_participant &participant) = 0;

    virtual std::vector<contest_participant> participants(int64_t contest_id) = 0;

    /**
     * @brief 保存重新计算后的排名
     */
    virtual void save_ranks(const std::vector<contest_participant> &participants) = 0;
};

}  // namespace arbiter
