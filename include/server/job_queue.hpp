#pragma once

#include <any>
#include <chrono>
#include <string>

namespace arbiter::server {

/**
 * @brief 从队列中取出、尚未确认的一条消息
 */
struct queued_job {
    std::string body;

    /**
     * @brief 该消息是否是重新投递的（此前有评测机取走但没有确认）
     */
    bool redelivered = false;

    /**
     * @brief 队列实现自己的消息句柄，确认消息时使用
     */
    std::any handle;
};

/**
 * @brief 至少一次投递的评测任务队列
 * 消息被取走后在确认前对其他消费者不可见；消费者崩溃或者超过可见超时后会被重新投递
 */
struct job_queue {
    virtual ~job_queue();

    /**
     * @brief 取出一条消息，最多等待 timeout
     * @return 是否取到消息
     * @throw network_error 与消息队列的连接无法恢复
     */
    virtual bool fetch(queued_job &job, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 确认消息，消息从队列中删除
     * 只能在评测结果持久化之后调用
     */
    virtual void ack(const queued_job &job) = 0;

    /**
     * @brief 拒绝消息
     * @param requeue 为真时消息立即放回队列等待重新投递，否则丢弃
     */
    virtual void reject(const queued_job &job, bool requeue) = 0;

    /**
     * @brief 发布一条评测任务
     */
    virtual void publish(const std::string &body) = 0;
};

}  // namespace arbiter::server
