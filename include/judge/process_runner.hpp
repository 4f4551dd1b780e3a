#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/toolchain.hpp"
#include "judge/workspace.hpp"

namespace codify {

/**
 * @brief 启动子进程的参数
 */
struct process_options {
    std::vector<std::string> argv;
    std::filesystem::path workdir;

    /**
     * @brief 写入子进程 stdin 的内容，写完后关闭 stdin
     */
    std::string input;

    /**
     * @brief 时间限制（毫秒），超时后强制终止整个进程组
     */
    int time_limit;

    /**
     * @brief stdout 和 stderr 各自的最大字节数，超出后强制终止
     */
    std::size_t output_limit;
};

/**
 * @brief 子进程的原始运行结果
 */
struct process_result {
    bool spawn_failed = false;
    int spawn_errno = 0;
    bool timed_out = false;
    bool output_limit_exceeded = false;
    int exit_code = 0;
    int term_signal = 0;
    std::string output;
    std::string error;
    int elapsed = 0;      // 毫秒
    long memory_used = 0; // 字节，子进程的峰值常驻内存
};

/**
 * @brief 启动子进程，写入 stdin 并收集 stdout 和 stderr
 * 不经过 shell，参数原样传递给 execvp
 * @throw std::system_error fork 或 pipe 失败
 */
process_result run_process(const process_options &options);

enum class outcome_kind {
    SUCCESS,
    COMPILE_ERROR,
    RUNTIME_ERROR,
    TIMEOUT
};

const char *get_outcome_name(outcome_kind kind);

/**
 * @brief 编译或运行一次的分类结果
 * kind 为 TIMEOUT 当且仅当运行步骤因超时被强制终止
 */
struct execution_outcome {
    outcome_kind kind = outcome_kind::SUCCESS;
    error_type fault = error_type::NONE;
    std::string output;
    std::string error;
    int elapsed = 0;
    int exit_code = 0;
    int term_signal = 0;
    long memory_used = 0;

    bool success() const;
};

/**
 * @brief 编译和运行的时间与输出限制
 */
struct execution_limits {
    int compile_time_limit;
    std::size_t compile_output_limit;
    int run_time_limit;
    std::size_t run_output_limit;

    /**
     * @brief 提交评测使用的限制，来自全局配置
     */
    static execution_limits judging();

    /**
     * @brief 在线运行使用的限制，来自全局配置
     */
    static execution_limits interactive();
};

/**
 * @brief 在工作区中编译和运行选手程序
 */
struct process_runner {
    explicit process_runner(const workspace_manager &workspaces);

    /**
     * @brief 编译工作区中的源代码，解释型语言直接返回成功
     * 编译器不存在时 fault 为 CONFIGURATION
     */
    execution_outcome compile(const workspace &ws, const toolchain &tc, int time_limit, std::size_t output_limit) const;

    /**
     * @brief 运行已经编译好的程序
     * 解释器不存在时 fault 为 CONFIGURATION
     */
    execution_outcome run(const workspace &ws, const toolchain &tc, const std::string &input, int time_limit, std::size_t output_limit) const;

    /**
     * @brief 创建工作区，编译并运行一次，最后删除工作区
     */
    execution_outcome execute(const toolchain &tc, const std::string &code, const std::string &input, const execution_limits &limits) const;

    /**
     * @brief 将命令模板中的占位符替换为工作区中的路径
     */
    static std::vector<std::string> expand(const std::vector<std::string> &command, const workspace &ws);

private:
    const workspace_manager &workspaces;
};

}  // namespace codify
