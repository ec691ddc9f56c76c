#pragma once

#include <functional>
#include <mutex>
#include <vector>
#include "judge/submission.hpp"

namespace arbiter::server {

/**
 * @brief 状态变更事件的发布通道
 * 事件只是通知，发布失败不影响已经持久化的评测结果
 */
struct event_channel {
    virtual ~event_channel();

    /**
     * @throw network_error 事件无法送达
     */
    virtual void publish(const status_event &event) = 0;
};

/**
 * @brief 进程内的事件通道，直接回调订阅者
 */
struct local_event_channel : public event_channel {
    using subscriber = std::function<void(const status_event &)>;

    void subscribe(subscriber callback);
    void publish(const status_event &event) override;

private:
    std::mutex mut;
    std::vector<subscriber> subscribers;
};

}  // namespace arbiter::server
