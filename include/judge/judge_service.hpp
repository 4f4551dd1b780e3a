#pragma once

#include <string>
#include <vector>
#include "common/admission_controller.hpp"
#include "common/concurrent_queue.hpp"
#include "judge/process_runner.hpp"
#include "judge/statistics.hpp"
#include "judge/submission.hpp"
#include "judge/test_harness.hpp"
#include "judge/toolchain.hpp"
#include "judge/workspace.hpp"
#include "server/data_store.hpp"

namespace codify {

/**
 * @brief 提交评测的请求
 */
struct submit_request {
    std::string user_id;
    std::string problem_id;

    /**
     * @brief 比赛 id，非比赛提交为空
     */
    std::string contest_id;

    std::string code;
    std::string language;
};

/**
 * @brief 提交成功后立即返回的回执，评测结果需要之后查询
 */
struct submit_ack {
    std::string submission_id;
    submission_status status;
    std::size_t total_test_cases;
    std::string message;
};

/**
 * @brief 在线运行的结果
 */
struct run_result {
    std::string language;
    outcome_kind kind;
    error_type fault;
    std::string output;
    std::string error;
    int execution_time;
    long memory_used;

    bool success() const;
};

/**
 * @brief 等待评测的任务
 * 测试数据在提交时读取，之后题目被修改不影响已经提交的评测
 */
struct judge_job {
    std::string submission_id;
    std::vector<test_case> test_cases;
    int max_score = 100;
};

/**
 * @brief 评测服务
 *
 * 提交评测：submit 校验请求并保存 pending 状态的提交，将任务放入队列后立即返回。
 * worker 从队列中取出任务调用 process：获取评测名额后将提交标记为 running，
 * 编译运行所有测试数据，保存终态并归还名额，最后更新统计数据。
 *
 * 在线运行：compile_and_run 使用独立的名额，不保存任何数据。
 */
struct judge_service {
    judge_service(server::data_store &store,
                  const toolchain_registry &registry,
                  const workspace_manager &workspaces,
                  std::size_t interactive_concurrency,
                  std::size_t judging_concurrency,
                  const execution_limits &interactive_limits,
                  const execution_limits &judging_limits);

    /**
     * @brief 提交代码评测
     * @throw validation_error 请求不合法
     * @throw not_found_error 用户、题目或比赛不存在
     */
    submit_ack submit(const submit_request &request);

    /**
     * @brief 查询提交
     * @throw not_found_error 提交不存在
     */
    submission get_submission(const std::string &submission_id);

    /**
     * @brief 在线编译运行，不评测
     * @throw validation_error 缺少代码或语言不支持
     * @throw configuration_error 评测环境缺少该语言的编译器或解释器
     */
    run_result compile_and_run(const std::string &code, const std::string &language, const std::string &input);

    /**
     * @brief 评测一个任务，不会抛出异常
     * 评测过程中出现的任何错误都会将提交标记为 runtime_error，
     * 保证提交不会一直停留在 pending 或 running 状态
     */
    void process(const judge_job &job) noexcept;

    /**
     * @brief 从队列中取出一个任务并评测
     * @return 队列为空时返回 false
     */
    bool process_next();

    concurrent_queue<judge_job> &jobs();

    admission_controller::snapshot interactive_stats() const;
    admission_controller::snapshot judging_stats() const;

    const toolchain_registry &toolchains() const;

private:
    /**
     * @brief 读取提交需要评测的测试数据和满分
     */
    judge_job prepare_job(const submit_request &request, const std::string &language);

    void evaluate(const judge_job &job, scoped_admission &slot);

    /**
     * @brief 评测出现意外错误时，将提交标记为 runtime_error
     * 每组测试数据都记为 error，错误信息为 reason
     */
    void fail(const judge_job &job, const std::string &reason) noexcept;

    server::data_store &store;
    const toolchain_registry &registry;
    process_runner runner;
    test_harness harness;
    statistics_updater statistics;
    admission_controller interactive;
    admission_controller judging;
    execution_limits interactive_limits;
    execution_limits judging_limits;
    concurrent_queue<judge_job> queue;
};

}  // namespace codify
