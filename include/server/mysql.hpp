#pragma once

#include <mysql/mysql.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "server/config.hpp"

namespace arbiter::server {

using mysql_row = std::vector<std::optional<std::string>>;

/**
 * @brief 表示一个 MySQL 连接
 * 不是线程安全的，由使用者加锁
 */
struct mysql_conn {
    explicit mysql_conn(const database &config);
    mysql_conn(const mysql_conn &) = delete;
    ~mysql_conn();

    mysql_conn &operator=(const mysql_conn &) = delete;

    /**
     * @brief 确保连接可用，连接断开时重连
     * @throw database_error 无法连接到数据库
     */
    void ensure_connected();

    /**
     * @brief 执行不返回结果的语句
     * @return 匹配到的行数
     */
    uint64_t execute(const std::string &sql);

    std::vector<mysql_row> query(const std::string &sql);

    /**
     * @brief 将字符串转义并加上引号，可直接拼接进 SQL
     */
    std::string quote(const std::string &text);

    /**
     * @brief 可空字符串，空值转为 NULL
     */
    std::string quote(const std::optional<std::string> &text);

    void begin();
    void commit();

    /**
     * @brief 回滚事务，失败时只记录日志，原有的异常会继续传播
     */
    void rollback() noexcept;

private:
    void connect();
    void close();

    [[noreturn]] void fail(const std::string &sql);

    database config;
    MYSQL *conn = nullptr;
};

}  // namespace arbiter::server
