#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <vector>

namespace codify {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param program 程序名，如果包含 '/' 则直接检查该路径
 * @return 是否能找到可执行的文件
 */
bool find_in_path(const std::string &program);

/**
 * @brief 当前的 UNIX 时间戳（秒）
 */
std::time_t current_time();

/**
 * @brief 计时器，使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codify
