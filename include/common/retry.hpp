#pragma once

#include <glog/logging.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>
#include "common/exceptions.hpp"

namespace arbiter {

/**
 * @brief 基础设施故障的重试策略：指数退避，并有最大尝试次数
 */
struct retry_policy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{8000};

    /**
     * @brief 第 attempt 次失败后（从 1 开始）应该等待多久
     */
    std::chrono::milliseconds backoff(int attempt) const;
};

/**
 * @brief 执行 func，遇到基础设施故障时按照 policy 等待后重试
 * 用户导致的错误和其他异常会直接抛出；超过最大尝试次数后抛出最后一次的异常
 * @param what 日志中描述该操作
 * @param sleeper 等待函数，测试时可以替换掉以避免真正休眠
 */
template <typename Func>
auto retry_with_backoff(const retry_policy &policy, const std::string &what, Func &&func,
                        const std::function<void(std::chrono::milliseconds)> &sleeper = {}) -> decltype(func()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return func();
        } catch (std::exception &ex) {
            if (!is_infrastructure_error(ex) || attempt >= policy.max_attempts)
                throw;
            auto delay = policy.backoff(attempt);
            LOG(WARNING) << what << " failed (attempt " << attempt << "/" << policy.max_attempts
                         << "): " << ex.what() << ", retrying in " << delay.count() << "ms";
            if (sleeper)
                sleeper(delay);
            else
                std::this_thread::sleep_for(delay);
        }
    }
}

}  // namespace arbiter
