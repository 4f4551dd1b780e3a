#pragma once

#include <ctime>
#include <mutex>
#include "judge/submission.hpp"
#include "server/data_store.hpp"

namespace codify {

/**
 * @brief 提交评测完成后更新题目和比赛的统计数据
 *
 * 非比赛提交更新题目的提交数和通过数；比赛提交更新比赛的提交数、
 * 选手的提交数和最后活动时间、选手在该题的尝试次数和最高分，
 * 以及比赛题目的尝试人次和通过人次。
 * 选手在一道题的得分只在严格高于之前最高分时更新，总分增加差值。
 *
 * 统计数据更新失败只记录日志，不会影响提交的评测结果。
 */
struct statistics_updater {
    explicit statistics_updater(server::data_store &store);

    /**
     * @brief 更新统计数据，不会抛出异常
     * @param submit 已经评测完成的提交
     */
    void apply(const submission &submit) noexcept;

    /**
     * @brief 更新题库中题目的统计数据
     * @throw not_found_error 题目不存在
     */
    void update_problem_stats(const submission &submit);

    /**
     * @brief 更新比赛的统计数据
     * @param now 本次更新的时间
     * @throw not_found_error 比赛不存在
     */
    void update_contest_stats(const submission &submit, std::time_t now);

private:
    server::data_store &store;

    // 读取-修改-保存需要串行化，否则并发的评测会丢失更新
    std::mutex mut;
};

}  // namespace codify
