#pragma once

#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "judge/scorer.hpp"

/**
 * 评测 worker
 * 批量评测开始时，评测的每个测试点都会被放入评测队列中，
 * 然后启动若干个 worker 线程。每个 worker 不断从评测队列中取出测试点进行评测，
 * 评测队列为空时 worker 退出。因为评测开始后不会再有新的测试点加入评测队列，
 * 所以 worker 退出时所有测试点都已经被取出。
 */
namespace scorer {

/**
 * @brief 启动评测 worker 线程
 * 调用方负责 join 返回的线程，task_queue 和 judger 在线程结束前必须有效
 *
 * @param worker_id worker 编号，用于日志
 * @param task_queue 评测队列
 * @param judger 评测测试点的评测器
 * @return worker 线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<message::scoring_task> &task_queue, const batch_scorer &judger);

}  // namespace scorer
