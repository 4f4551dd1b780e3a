#pragma once

#include <string>
#include <vector>
#include "judge/process_runner.hpp"
#include "judge/submission.hpp"
#include "judge/toolchain.hpp"
#include "judge/workspace.hpp"

namespace codify {

/**
 * @brief 一次评测的结果
 */
struct evaluation {
    /**
     * @brief 每组测试数据的结果，与输入的测试数据一一对应
     */
    std::vector<test_case_result> results;

    /**
     * @brief 编译失败时的编译器输出，只保存一次
     * 编译器不存在时为空
     */
    std::string compilation_output;

    bool compilation_failed = false;
};

/**
 * @brief 评测一份代码
 * 只编译一次，然后按顺序运行所有测试数据，结束后删除工作区
 */
struct test_harness {
    test_harness(const workspace_manager &workspaces, const process_runner &runner);

    /**
     * @brief 编译代码并运行所有测试数据
     * @param code 选手代码
     * @param tc 语言
     * @param cases 测试数据
     * @param limits 编译和运行的时间与输出限制
     */
    evaluation evaluate(const std::string &code, const toolchain &tc, const std::vector<test_case> &cases, const execution_limits &limits) const;

private:
    const workspace_manager &workspaces;
    const process_runner &runner;
};

}  // namespace codify
