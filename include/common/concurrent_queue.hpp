#pragma once

#include <mutex>
#include <queue>

namespace scorer {

/**
 * @brief 并发队列
 * 所有元素在 worker 启动前放入队列，worker 取空队列后退出，因此不需要阻塞等待
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
        std::lock_guard<std::mutex> guard(mut);
        if (q.empty()) return false;
        element = q.front();
        q.pop();
        return true;
    }

    void push(const T &value) {
        std::lock_guard<std::mutex> guard(mut);
        q.push(value);
    }

private:
    std::queue<T> q;
    std::mutex mut;
};

}  // namespace scorer
