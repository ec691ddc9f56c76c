#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace arbiter::server {
using namespace std;

job_queue::~job_queue() {}

rabbitmq::rabbitmq(const amqp &amqp, bool write, uint16_t prefetch)
    : queue(amqp), write(write), prefetch(prefetch) {
    connect();
}

void rabbitmq::connect() {
    LOG(INFO) << "RabbitMQ: connecting to " << queue.hostname << ":" << queue.port << ", queue " << queue.queue;
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port, queue.username, queue.password, queue.vhost);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    if (!queue.exchange.empty()) {  // 空名称为默认 exchange，无需声明和绑定
        channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
        channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
    }
    if (!write)  // 对于从消息队列读取消息的情况，我们需要监听队列
        tag = channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false,
                                    /* exclusive */ false, /* message_prefetch_count */ prefetch);
}

bool rabbitmq::fetch(AmqpClient::Envelope::ptr_t &envelope, chrono::milliseconds timeout) {
    lock_guard<mutex> guard(mut);
    for (int retry = 1;; ++retry) {
        try {
            return channel->BasicConsumeMessage(tag, envelope, (int)timeout.count());
        } catch (std::exception &e) {
            // 连接断开后未确认的消息已经被 broker 重新放回队列
            if (retry >= 5) throw network_error(string("RabbitMQ: unable to consume message: ") + e.what());
            LOG(WARNING) << "RabbitMQ: consume failed: " << e.what() << ", reconnecting";
            this_thread::sleep_for(chrono::seconds(retry));
            try {
                connect();
            } catch (std::exception &ex) {
                LOG(ERROR) << "RabbitMQ: reconnect failed: " << ex.what();
            }
        }
    }
}

void rabbitmq::ack(const AmqpClient::Envelope::ptr_t &envelope) {
    lock_guard<mutex> guard(mut);
    try {
        channel->BasicAck(envelope);
    } catch (std::exception &e) {
        // 通道已断开，消息会被重新投递，重新评测时将直接确认已完成的提交
        throw network_error(string("RabbitMQ: unable to ack message: ") + e.what());
    }
}

void rabbitmq::reject(const AmqpClient::Envelope::ptr_t &envelope, bool requeue) {
    lock_guard<mutex> guard(mut);
    try {
        channel->BasicReject(envelope, requeue);
    } catch (std::exception &e) {
        throw network_error(string("RabbitMQ: unable to reject message: ") + e.what());
    }
}

void rabbitmq::report(const string &message) {
    lock_guard<mutex> guard(mut);
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
    msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << queue.routing_key << std::endl
               << message;
    for (int retry = 1;; ++retry) {
        try {
            channel->BasicPublish(queue.exchange, queue.routing_key, msg);
            return;
        } catch (std::exception &e) {
            if (retry >= 3) throw network_error(string("RabbitMQ: unable to publish message: ") + e.what());
            LOG(WARNING) << "RabbitMQ: publish failed: " << e.what() << ", reconnecting";
            this_thread::sleep_for(chrono::seconds(retry));
            try {
                connect();
            } catch (std::exception &ex) {
                LOG(ERROR) << "RabbitMQ: reconnect failed: " << ex.what();
            }
        }
    }
}

rabbitmq_job_queue::rabbitmq_job_queue(const amqp &amqp, uint16_t prefetch)
    : consumer(amqp, false, prefetch), producer(amqp, true) {}

bool rabbitmq_job_queue::fetch(queued_job &job, chrono::milliseconds timeout) {
    AmqpClient::Envelope::ptr_t envelope;
    if (!consumer.fetch(envelope, timeout)) return false;
    job.body = envelope->Message()->Body();
    job.redelivered = envelope->Redelivered();
    job.handle = envelope;
    return true;
}

void rabbitmq_job_queue::ack(const queued_job &job) {
    consumer.ack(any_cast<AmqpClient::Envelope::ptr_t>(job.handle));
}

void rabbitmq_job_queue::reject(const queued_job &job, bool requeue) {
    consumer.reject(any_cast<AmqpClient::Envelope::ptr_t>(job.handle), requeue);
}

void rabbitmq_job_queue::publish(const string &body) {
    producer.report(body);
}

rabbitmq_event_channel::rabbitmq_event_channel(const amqp &amqp)
    : producer(amqp, true) {}

void rabbitmq_event_channel::publish(const status_event &event) {
    producer.report(nlohmann::json(event).dump());
}

}  // namespace arbiter::server
