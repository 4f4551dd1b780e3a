#pragma once

#include <thread>
#include "judge/judge_service.hpp"

/**
 * 评测 worker 相关函数
 *
 * 提交接口将评测任务放进 judge_service 的任务队列后立即返回，
 * worker 线程不断从队列中取出任务并调用 judge_service::process 完成评测。
 * 同时评测的提交数由 judge_service 的评测名额限制，与 worker 数量无关。
 */
namespace codify {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 循环时会检查标记，
 * 如果停止，则在没有评测任务时退出。
 */
void stop_workers();

/**
 * @brief 清除停止标记，之后启动的 worker 可以正常运行
 */
void resume_workers();

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 编号，只用于日志
 * @param service 评测服务，必须比 worker 线程存活更久
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, judge_service &service);

}  // namespace codify
