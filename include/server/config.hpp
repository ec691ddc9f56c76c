#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/retry.hpp"
#include "judge/language.hpp"
#include "judge/programming.hpp"

namespace arbiter::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname;

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    std::string username = "guest";
    std::string password = "guest";
    std::string vhost = "/";

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type = "direct";

    /**
     * @brief AMQP 消息队列的队列名
     */
    std::string queue;

    std::string routing_key;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database {
    std::string host;
    int port = 3306;
    std::string user;
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

void from_json(const nlohmann::json &j, database &db);

struct redis {
    std::string host;
    int port = 6379;
    std::string password;

    /**
     * @brief 发布状态变更事件的频道
     */
    std::string channel = "arbiter:submissions";

    /**
     * @brief 重连间隔，单位为毫秒
     */
    int retry_interval = 1000;
};

void from_json(const nlohmann::json &j, redis &redis_config);

/**
 * @brief 评测机的全部配置，从配置文件读入
 */
struct system_config {
    /**
     * @brief 并发评测的提交数，可被命令行参数覆盖
     */
    size_t workers = 1;

    amqp queue;
    database db;

    /**
     * @brief 状态变更事件发往 redis 还是 amqp
     */
    std::string event_transport = "redis";
    std::optional<redis> event_redis;
    std::optional<amqp> event_amqp;

    judge_options judge;

    /**
     * @brief 硬时间限制比时间限制多出的部分，单位为毫秒
     */
    int kill_grace_ms = 500;

    retry_policy retry;

    /**
     * @brief 比赛中每次错误提交的罚时，单位为分钟
     */
    int penalty_per_wrong_minutes = 20;

    /**
     * @brief 覆盖内置语言配置
     */
    std::vector<language> languages;
};

void from_json(const nlohmann::json &j, system_config &config);

/**
 * @brief 读取并解析配置文件
 * @throw std::runtime_error 文件无法读取或格式错误
 */
system_config load_config(const std::string &path);

}  // namespace arbiter::server
