#pragma once

#include <optional>
#include <string>
#include "judge/submission.hpp"
#include "server/documents.hpp"

namespace codify::server {

/**
 * @brief 比赛题目的评测配置
 */
struct contest_problem_config {
    std::vector<test_case> test_cases;

    /**
     * @brief 题目分值，即提交的满分
     */
    int points = 100;
};

/**
 * @brief 持久化存储
 * 保存用户、题目、比赛和提交。评测系统只通过这个接口访问存储，
 * 实现需要保证每个方法都是线程安全的，读取返回的是副本。
 */
struct data_store {
    virtual ~data_store();

    virtual std::optional<user> load_user(const std::string &user_id) = 0;

    virtual std::optional<problem> load_problem(const std::string &problem_id) = 0;

    virtual void save_problem(const problem &p) = 0;

    virtual std::optional<contest> load_contest(const std::string &contest_id) = 0;

    virtual void save_contest(const contest &c) = 0;

    /**
     * @brief 读取比赛题目的测试数据和分值
     * 比赛中直接给出了测试数据时使用比赛中的数据，否则使用题库中的数据
     * @return 比赛或题目不存在时返回 std::nullopt
     */
    virtual std::optional<contest_problem_config> load_contest_problem(const std::string &contest_id, const std::string &problem_id);

    /**
     * @brief 分配一个新的提交 id
     */
    virtual std::string next_submission_id() = 0;

    /**
     * @brief 保存提交，已存在则覆盖
     */
    virtual void persist_submission(const submission &submit) = 0;

    virtual std::optional<submission> load_submission(const std::string &submission_id) = 0;
};

}  // namespace codify::server
