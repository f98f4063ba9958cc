#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace codebox {

/**
 * @brief 并发队列，写者读者模型
 * 队列关闭后不再接受新元素，阻塞中的读者在队列取空后返回
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列关闭为止
     * @param element 保存弹出的队头元素
     * @return 若队列已关闭且为空，返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 若队列已关闭，返回 false，元素被丢弃
     */
    bool push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(value);
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    std::size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    bool closed = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace codebox
