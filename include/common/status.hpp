#pragma once

#include <optional>
#include <string>

namespace arbiter {

/**
 * @brief 表示提交的评测状态，或者单个数据点的评测结果
 * PENDING、COMPILING、JUDGING 为中间状态，其余均为终止状态
 */
enum class status {
    /**
     * @brief 提交正在队列中等待，还未被评测机取走
     */
    PENDING = 0,

    /**
     * @brief 评测机已取走提交，正在编译
     */
    COMPILING = 1,

    /**
     * @brief 编译完成（或者为解释型语言），正在逐个评测数据点
     */
    JUDGING = 2,

    /**
     * @brief 所有数据点均通过
     */
    ACCEPTED = 3,

    /**
     * @brief 答案错误
     * 忽略行末空白字符和换行符差异后仍与标准输出不一致
     */
    WRONG_ANSWER = 4,

    /**
     * @brief 用户程序运行时间超出限制，被 runguard 强制结束
     */
    TIME_LIMIT_EXCEEDED = 5,

    /**
     * @brief 用户程序内存超出 cgroup 限制，被强制结束
     */
    MEMORY_LIMIT_EXCEEDED = 6,

    /**
     * @brief 用户程序返回值非 0 或者因信号崩溃
     */
    RUNTIME_ERROR = 7,

    /**
     * @brief 用户程序编译失败
     */
    COMPILATION_ERROR = 8,

    /**
     * @brief 评测系统内部错误
     * 比如 runguard 启动失败、数据点无法读取，与用户程序无关
     */
    INTERNAL_ERROR = 9
};

/**
 * @brief 返回数据库和事件中使用的状态名，比如 "Wrong Answer"
 */
const char *get_display_message(status);

/**
 * @brief 将状态名解析回 status
 * @return 不认识的状态名返回 std::nullopt
 */
std::optional<status> parse_status(const std::string &name);

/**
 * @brief 判断状态是否为终止状态
 */
bool is_terminal(status);

/**
 * @brief 判断终止状态是否由用户程序导致（而非评测系统故障）
 */
bool is_user_caused(status);

}  // namespace arbiter
