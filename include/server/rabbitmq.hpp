#pragma once

#include <chrono>
#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"
#include "server/event_channel.hpp"
#include "server/job_queue.hpp"

namespace arbiter::server {

/**
 * @brief 与 RabbitMQ 交互的类
 */
struct rabbitmq {
    /**
     * @param write 只发送消息时为真；为假时监听队列
     * @param prefetch 未确认消息的最大数量，等于评测机的并发数
     */
    rabbitmq(const amqp &amqp, bool write, uint16_t prefetch = 1);
    bool fetch(AmqpClient::Envelope::ptr_t &envelope, std::chrono::milliseconds timeout);
    void ack(const AmqpClient::Envelope::ptr_t &envelope);
    void reject(const AmqpClient::Envelope::ptr_t &envelope, bool requeue);
    void report(const std::string &message);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    std::string tag;
    amqp queue;
    bool write;
    uint16_t prefetch;
    std::mutex mut;
};

/**
 * @brief 基于 RabbitMQ 的评测任务队列
 * 消息在确认前不会被删除；连接断开后未确认的消息会被 broker 重新投递
 */
struct rabbitmq_job_queue : public job_queue {
    rabbitmq_job_queue(const amqp &amqp, uint16_t prefetch);

    bool fetch(queued_job &job, std::chrono::milliseconds timeout) override;
    void ack(const queued_job &job) override;
    void reject(const queued_job &job, bool requeue) override;
    void publish(const std::string &body) override;

private:
    rabbitmq consumer;
    rabbitmq producer;
};

/**
 * @brief 将状态变更事件以 JSON 形式发送到 AMQP exchange
 */
struct rabbitmq_event_channel : public event_channel {
    explicit rabbitmq_event_channel(const amqp &amqp);

    void publish(const status_event &event) override;

private:
    rabbitmq producer;
};

}  // namespace arbiter::server
