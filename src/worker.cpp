#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include <chrono>

namespace codify {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

void resume_workers() {
    stop = false;
}

static void worker_loop(size_t worker_id, judge_service &service) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        try {
            if (!service.process_next()) {
                if (stop) {
                    // 队列已经为空，stop 之后可能仍有新提交，由其他 worker 或调用方处理
                    break;
                }
                // 10ms，这里必须等待，不可以忙等
                this_thread::sleep_for(chrono::milliseconds(10));
            }
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, judge_service &service) {
    return thread([worker_id, &service] {
        worker_loop(worker_id, service);
    });
}

}  // namespace codify
