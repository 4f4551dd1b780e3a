#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace codify {

/**
 * @brief 并发名额控制器，计数信号量
 * 同时最多 max_concurrency 个调用方持有名额，其余调用方按到达顺序排队。
 * 释放名额时直接把名额交给队头的等待者，因此不会出现后来者插队的情况。
 */
struct admission_controller {
    struct snapshot {
        std::size_t max;
        std::size_t current;
        std::size_t queued;
    };

    /**
     * @param max_concurrency 最大并发数，必须大于 0
     * @throw std::invalid_argument max_concurrency 为 0
     */
    explicit admission_controller(std::size_t max_concurrency);

    admission_controller(const admission_controller &) = delete;
    admission_controller &operator=(const admission_controller &) = delete;

    /**
     * @brief 获取一个名额，没有空闲名额时阻塞等待
     */
    void acquire();

    /**
     * @brief 归还一个名额
     * 每次 acquire 必须恰好对应一次 release，建议使用 scoped_admission
     */
    void release();

    snapshot stats() const;

private:
    struct waiter {
        std::condition_variable cond;
        bool granted = false;
    };

    mutable std::mutex mut;
    const std::size_t max_concurrency;
    std::size_t in_flight = 0;
    std::deque<waiter *> waiters;
};

/**
 * @brief 在作用域内持有一个名额，析构时归还
 * 无论评测正常结束还是抛出异常，名额都只会被归还一次
 */
struct scoped_admission {
    explicit scoped_admission(admission_controller &controller);
    scoped_admission(scoped_admission &&other) noexcept;
    ~scoped_admission();

    scoped_admission(const scoped_admission &) = delete;
    scoped_admission &operator=(const scoped_admission &) = delete;

    /**
     * @brief 提前归还名额，重复调用没有效果
     */
    void release();

private:
    admission_controller *controller;
};

}  // namespace codify
