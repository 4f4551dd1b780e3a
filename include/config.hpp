#pragma once

#include <cstddef>
#include <filesystem>

namespace codify {

/**
 * @brief 选手程序编译及运行的临时目录
 * 每次评测或在线运行都会在这里创建一个独立的工作区，结束后删除：
 *
 * TEMP_DIR
 * ├── 2f1c...e9 // 随机生成的 uuid，Java 程序的工作区为一个文件夹
 * │   ├── Main.java // 类名由代码决定
 * │   └── Main.class
 * ├── 7ab4...01.cpp // 其他语言的工作区只有源文件
 * ├── 7ab4...01 // 编译型语言的可执行文件
 * └── ...
 */
extern std::filesystem::path TEMP_DIR;

/**
 * @brief 在线运行（不评测）的最大并发数
 */
extern std::size_t COMPILE_CONCURRENCY;

/**
 * @brief 提交评测的最大并发数
 */
extern std::size_t JUDGE_CONCURRENCY;

/**
 * @brief 评测 worker 线程数
 */
extern std::size_t JUDGE_WORKERS;

// 以下时间限制均以毫秒为单位
extern int COMPILE_TIME_LIMIT;
extern int RUN_TIME_LIMIT;
extern int INTERACTIVE_TIME_LIMIT;

// 以下输出限制均以字节为单位，分别作用于 stdout 和 stderr
extern std::size_t COMPILE_OUTPUT_LIMIT;
extern std::size_t RUN_OUTPUT_LIMIT;
extern std::size_t INTERACTIVE_OUTPUT_LIMIT;

/**
 * @brief 提交代码的最大长度（字符数）
 */
extern std::size_t MAX_CODE_LENGTH;

/**
 * @brief 非比赛提交的满分
 */
extern int STANDALONE_MAX_SCORE;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后会输出每次启动子进程的命令行
 */
extern bool DEBUG;

}  // namespace codify
