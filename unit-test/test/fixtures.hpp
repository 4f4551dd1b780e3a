#pragma once

#include <ctime>
#include <nlohmann/json.hpp>
#include <string>

namespace codify {

/**
 * @brief 测试用的数据：
 * 用户 alice、bob、carol；题目 echo（原样输出）和 sum（两数之和）以及没有测试数据的 empty；
 * 比赛 live（进行中，alice 和 bob 报名，sum 题 50 分，manual 题使用比赛中给出的数据），
 * 比赛 future（未开始），比赛 restricted（只允许 python）。
 */
nlohmann::json make_seed(std::time_t now);

}  // namespace codify
