#pragma once

#include <functional>
#include "common/retry.hpp"
#include "judge/contest_scorer.hpp"
#include "server/event_channel.hpp"
#include "server/submission_store.hpp"

namespace arbiter::server {

/**
 * @brief 评测结果的唯一出口
 * 先在一个事务内持久化终止状态和比赛成绩，成功后再发布恰好一个状态变更事件
 */
struct result_sink {
    using clock_function = std::function<std::time_t()>;

    result_sink(submission_store &store, event_channel &events, contest_scorer &scorer,
                retry_policy retry = {}, std::function<void(std::chrono::milliseconds)> sleeper = {},
                clock_function now = {});

    /**
     * @brief 持久化评测结果
     * 同一提交重复调用时只有第一次生效，之后的调用不写入也不发布事件
     * @return 是否写入了评测结果
     * @throw database_error 多次重试后仍然无法写入
     */
    bool record(const judge_job &job, const judge_report &report);

private:
    submission_store &store;
    event_channel &events;
    contest_scorer &scorer;
    retry_policy retry;
    std::function<void(std::chrono::milliseconds)> sleeper;
    clock_function now;
};

/**
 * @brief 读取比赛排行榜，排名在读取时重新计算
 */
std::vector<contest_participant> load_leaderboard(submission_store &store, int64_t contest_id);

}  // namespace arbiter::server
