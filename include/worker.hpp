#pragma once

#include <atomic>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/retry.hpp"
#include "judge/programming.hpp"
#include "monitor/monitor.hpp"
#include "server/job_queue.hpp"
#include "server/result_sink.hpp"
#include "server/submission_store.hpp"

/**
 * 评测服务相关函数
 * 一个拉取线程从消息队列中取出评测任务，交给固定数量的 worker 线程评测。
 *
 * 拉取线程只在有空闲 worker 时才会取消息，因此忙碌时消息留在队列中，
 * 由其他评测机消费。消息只有在评测结果持久化之后才会被确认，
 * 评测机崩溃时未确认的消息会被重新投递，worker 发现提交已有终止状态时直接确认消息。
 */
namespace arbiter {

struct dispatcher_options {
    /**
     * @brief worker 线程数，即同时评测的提交数
     */
    size_t workers = 1;

    /**
     * @brief 每次从消息队列等待消息的最长时间
     */
    std::chrono::milliseconds poll_interval{1000};

    retry_policy retry;

    /**
     * @brief 每个 worker 的选手程序可以使用的 CPU 核心，为空时不限制
     */
    std::vector<std::string> cpusets;

    /**
     * @brief 重试等待函数，测试时替换掉以避免真正休眠
     */
    std::function<void(std::chrono::milliseconds)> sleeper;

    /**
     * @brief 当前时间，任务没有提交时间时以出队时间代替
     */
    std::function<std::time_t()> clock;
};

struct dispatcher {
    dispatcher(server::job_queue &queue, server::submission_store &store, const programming_judger &judger,
               server::result_sink &sink, monitor &mon, dispatcher_options options);
    ~dispatcher();

    dispatcher(const dispatcher &) = delete;
    dispatcher &operator=(const dispatcher &) = delete;

    /**
     * @brief 启动拉取线程和 worker 线程
     * @return worker 线程，调用者可以据此设置 CPU 亲和性
     */
    std::vector<std::thread *> start();

    /**
     * @brief 停止拉取新提交，worker 完成手上的提交后退出
     * 可以在任意线程调用
     */
    void stop();

    /**
     * @brief 等待所有线程退出
     */
    void join();

    /**
     * @brief 处理一条消息直到确认，返回是否确认了消息
     * 由 worker 线程调用，公开以便测试模拟崩溃后重新投递的情形
     */
    bool process(int worker_id, server::queued_job &message, const judge_job &job);

    /**
     * @brief 校验消息，不合法的消息直接记为 Internal Error 并确认
     * @return 合法时返回评测任务
     */
    std::optional<judge_job> admit(server::queued_job &message);

private:
    struct pending_job {
        server::queued_job message;
        judge_job job;
    };

    void fetch_loop();
    void worker_loop(int worker_id);
    void release_slot();
    void ack(server::queued_job &message, int64_t submission_id);

    server::job_queue &queue;
    server::submission_store &store;
    const programming_judger &judger;
    server::result_sink &sink;
    monitor &mon;
    dispatcher_options options;

    concurrent_queue<pending_job> tasks;
    std::atomic<bool> stopping{false};

    std::mutex slot_mut;
    std::condition_variable slot_cv;
    size_t busy = 0;

    std::thread fetcher;
    std::vector<std::thread> workers;
};

/**
 * @brief 解析 CPU 列表，如 "0-3,6"
 * @throw std::invalid_argument 格式错误
 */
std::vector<size_t> parse_cpu_list(const std::string &list);

/**
 * @brief 将线程绑定到 CPU 核心上
 * @throw std::system_error 设置失败
 */
void pin_thread(std::thread &thd, size_t core_id);

}  // namespace arbiter
