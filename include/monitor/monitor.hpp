#pragma once

#include <string>
#include "judge/submission.hpp"

namespace arbiter {

/**
 * @brief 工作线程的状态
 */
enum class worker_state {
    START,
    IDLE,
    JUDGING,
    STOPPED,
    CRASHED
};

const char *get_state_name(worker_state state);

/**
 * @brief 执行监控行为，默认实现什么也不做
 * 监控回调可能被多个工作线程同时调用
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个工作线程已经取到一个提交
     */
    virtual void start_submission(int worker_id, const judge_job &job);

    /**
     * @brief 监控上报已经完成一个提交的评测并持久化了结果
     */
    virtual void end_submission(int worker_id, const judge_report &report);

    /**
     * @brief 监控上报当前某个工作线程的状态
     * @param information 如果工作线程崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 上报与具体提交无关的错误，比如消息队列或数据库不可用
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 将监控信息写入日志
 */
struct log_monitor : public monitor {
    void start_submission(int worker_id, const judge_job &job) override;
    void end_submission(int worker_id, const judge_report &report) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace arbiter
