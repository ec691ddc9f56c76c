#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace arbiter {

/**
 * @brief 并发队列，写者读者模型
 * 关闭后 pop 不再阻塞，用于通知工作线程退出
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，队列为空时最多等待 timeout
     * @return 是否成功弹出；超时或者队列已关闭且为空时返回 false
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return !q.empty() || closed; }))
            return false;
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    void push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 关闭队列，唤醒所有等待的线程
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    bool is_closed() {
        std::unique_lock<std::mutex> mlock(mut);
        return closed;
    }

    size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace arbiter
