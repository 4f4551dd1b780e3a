#pragma once

#include <string>

namespace codify {

/**
 * @brief 表示整个提交的评测状态
 * PENDING -> RUNNING -> 终态，终态之后不会再变化
 */
enum class submission_status {
    /**
     * @brief 提交已经保存，正在等待评测名额
     */
    PENDING = 0,

    /**
     * @brief 已经获取到评测名额，正在编译或运行测试数据
     */
    RUNNING = 1,

    /**
     * @brief 所有测试数据均通过
     */
    ACCEPTED = 2,

    /**
     * @brief 至少有一组测试数据输出不正确，且没有出现错误或超时
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 选手程序无法通过编译
     */
    COMPILATION_ERROR = 4,

    /**
     * @brief 选手程序运行出错，或者评测环境缺少解释器，
     * 或者评测过程中出现了意外错误
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 至少有一组测试数据超时被强制终止
     */
    TIME_LIMIT_EXCEEDED = 6,

    /**
     * @brief 内存超限，目前不限制内存，不会产生该状态
     */
    MEMORY_LIMIT_EXCEEDED = 7
};

/**
 * @brief 单个测试点的评测结果
 */
enum class test_case_status {
    PASSED = 0,
    FAILED = 1,
    ERROR = 2,
    TIMEOUT = 3
};

/**
 * @brief 测试点失败的具体原因
 */
enum class error_type {
    NONE = 0,
    COMPILATION = 1,   // 编译失败
    RUNTIME = 2,       // 非零返回值或被信号终止
    TIMEOUT = 3,       // 超时被强制终止
    OUTPUT_LIMIT = 4,  // 输出超出缓冲区限制
    CONFIGURATION = 5  // 评测环境缺少编译器或解释器
};

/**
 * @brief 人类可读的状态，比如 "Wrong Answer"
 */
const char *get_display_message(submission_status);

/**
 * @brief 存储和接口中使用的状态名，比如 "wrong_answer"
 */
const char *get_status_name(submission_status);

/**
 * @brief 将 get_status_name 的结果解析回枚举
 * @throw std::invalid_argument 状态名不合法
 */
submission_status parse_submission_status(const std::string &name);

const char *get_status_name(test_case_status);
test_case_status parse_test_case_status(const std::string &name);

const char *get_error_type_name(error_type);
error_type parse_error_type(const std::string &name);

/**
 * @brief 是否为终态，终态的提交不会再被修改
 */
bool is_terminal(submission_status);

}  // namespace codify
