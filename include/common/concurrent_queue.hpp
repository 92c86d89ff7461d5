#pragma once

#include <condition_variable>
#include <limits>
#include <mutex>
#include <optional>
#include <queue>

namespace codebox {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列关闭后 push 失败，pop 在队列排空后返回空值，用于让消费线程退出
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    explicit concurrent_queue(std::size_t capacity = std::numeric_limits<std::size_t>::max())
        : capacity(capacity) {}

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 队列头元素，队列已关闭且为空时返回 std::nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    /**
     * @brief 尝试向队列中插入一个新元素，不会阻塞
     * @return 队列已满或者已关闭时返回 false，此时元素不会入队
     */
    bool try_push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed || q.size() >= capacity) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的消费者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::size_t capacity;
    bool closed = false;
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace codebox
