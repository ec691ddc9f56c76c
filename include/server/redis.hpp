#pragma once

#include <cpp_redis/cpp_redis>
#include <future>
#include <mutex>
#include <vector>
#include "server/config.hpp"
#include "server/event_channel.hpp"

namespace arbiter::server {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    explicit redis_conn(const redis &redis_config);

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出 network_error。
     * @param callback 你可以在 callback 内完成 Redis 的操作
     */
    void execute(const std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> &callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

private:
    redis redis_config;
    cpp_redis::client redis_client;
    std::mutex mut;
};

/**
 * @brief 将状态变更事件以 JSON 形式 PUBLISH 到 Redis 频道
 */
struct redis_event_channel : public event_channel {
    explicit redis_event_channel(const redis &redis_config);

    void publish(const status_event &event) override;

private:
    std::string channel;
    redis_conn conn;
};

}  // namespace arbiter::server
