#include "worker.hpp"
#include <glog/logging.h>

namespace scorer {
using namespace std;

/**
 * @brief 评测 worker 的主循环
 * 从评测队列中取出测试点进行评测，直到评测队列为空
 * @param worker_id worker 编号
 * @param task_queue 评测队列
 */
static void worker_loop(size_t worker_id, concurrent_queue<message::scoring_task> &task_queue, const batch_scorer &judger) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    size_t count = 0;
    message::scoring_task task;
    while (task_queue.try_pop(task)) {
        judger.judge(task);
        ++count;
    }

    DLOG(INFO) << "Worker " << worker_id << " stopped after " << count << " test cases";
}

thread start_worker(size_t worker_id, concurrent_queue<message::scoring_task> &task_queue, const batch_scorer &judger) {
    return thread([worker_id, &task_queue, &judger] {
        worker_loop(worker_id, task_queue, judger);
    });
}

}  // namespace scorer
