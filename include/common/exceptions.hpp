#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 与用户程序无关，可以重试
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱无法启动或者 runguard 自身出错
 */
struct sandbox_error : public internal_error {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示消息队列或事件总线的网络错误
 */
struct network_error : public judge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public judge_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 表示队列中的评测任务格式不正确
 * 比如没有数据点或者语言不受支持，这种任务不会被重试
 */
struct malformed_job_error : public judge_exception {
    malformed_job_error();
    explicit malformed_job_error(const std::string &message);
};

/**
 * @brief 判断异常是否属于可以重试的基础设施故障
 */
bool is_infrastructure_error(const std::exception &ex);

}  // namespace arbiter
