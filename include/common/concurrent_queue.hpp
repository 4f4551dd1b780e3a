#pragma once

#include <cstddef>
#include <deque>
#include <mutex>

namespace codify {

/**
 * @brief 并发队列，多生产者多消费者
 * 提交接口将评测任务放入队列，评测 worker 轮询队列取出任务。
 * 队列本身不限制并发评测数，并发数由 admission_controller 控制。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::lock_guard<std::mutex> guard(mut);
        if (items.empty()) return false;
        element = std::move(items.front());
        items.pop_front();
        return true;
    }

    void push(T value) {
        std::lock_guard<std::mutex> guard(mut);
        items.push_back(std::move(value));
    }

    /**
     * @brief 当前排队的元素数，返回后可能立即被其他线程改变
     */
    std::size_t size() const {
        std::lock_guard<std::mutex> guard(mut);
        return items.size();
    }

private:
    std::deque<T> items;
    mutable std::mutex mut;
};

}  // namespace codify
