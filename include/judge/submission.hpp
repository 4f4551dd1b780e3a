#pragma once

#include <ctime>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace codify {

/**
 * @brief 一组测试数据
 */
struct test_case {
    std::string input;
    std::string output;

    /**
     * @brief 隐藏的测试数据不向选手展示输入输出
     */
    bool hidden = false;
};

/**
 * @brief 一组测试数据的评测结果
 */
struct test_case_result {
    /**
     * @brief 测试数据的下标，从 0 开始
     */
    std::size_t index = 0;

    std::string input;
    std::string expected_output;

    /**
     * @brief 选手程序的 stdout，已去掉首尾空白字符
     */
    std::string actual_output;

    test_case_status status = test_case_status::FAILED;
    error_type error = error_type::NONE;

    /**
     * @brief 运行时间（毫秒）
     */
    int execution_time = 0;

    /**
     * @brief 峰值内存（字节）
     */
    long memory_used = 0;

    /**
     * @brief 出错或超时时的 stderr 或错误描述
     */
    std::string error_message;
};

/**
 * @brief 一个选手提交
 */
struct submission {
    std::string id;
    std::string user_id;
    std::string problem_id;

    /**
     * @brief 提交所属比赛 id，如果不存在比赛则为空
     */
    std::string contest_id;

    std::string code;

    /**
     * @brief 规范化后的语言标识
     */
    std::string language;

    submission_status status = submission_status::PENDING;

    std::size_t total_test_cases = 0;
    std::size_t passed_test_cases = 0;

    int score = 0;

    /**
     * @brief 满分，非比赛提交为 100，比赛提交为题目分值
     */
    int max_score = 100;

    std::vector<test_case_result> test_case_results;

    /**
     * @brief 编译器输出，只有编译失败时才有内容
     */
    std::string compilation_output;

    /**
     * @brief 所有测试数据运行时间之和（毫秒）
     */
    int execution_time = 0;

    /**
     * @brief 所有测试数据中的峰值内存（字节）
     */
    long memory_used = 0;

    bool is_public = true;

    std::time_t submitted_at = 0;
    std::time_t evaluated_at = 0;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.id << ":" << submit.user_id << "-" << submit.problem_id << "]";
    return os;
}

/**
 * @brief 根据所有测试数据的结果计算提交的最终状态
 * 优先级：编译错误 > 运行错误 > 超时 > 全部通过为 accepted，否则为 wrong_answer
 */
submission_status summarize_status(const std::vector<test_case_result> &results);

/**
 * @brief 计算得分，floor(passed / total * max_score)，total 为 0 时得 0 分
 */
int compute_score(std::size_t passed, std::size_t total, int max_score);

/**
 * @brief 比较选手输出和标准输出，忽略首尾空白字符
 */
bool output_matches(const std::string &actual, const std::string &expected);

void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const test_case_result &result);
void from_json(const nlohmann::json &j, test_case_result &result);

void to_json(nlohmann::json &j, const submission &submit);
void from_json(const nlohmann::json &j, submission &submit);

}  // namespace codify
